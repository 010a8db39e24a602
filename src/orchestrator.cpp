/**
 * @file orchestrator.cpp
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#include <unistd.h>

#include <algorithm>
#include <exception>

#include "log.h"
#include "utils.h"
#include "orchestrator.h"

const char* const Orchestrator::REASON_NO_HEALTHY_ADDRESS = "no_healthy_address";
const char* const Orchestrator::REASON_UNRESOLVABLE = "unresolvable";
const char* const Orchestrator::REASON_ERROR = "error";

Orchestrator::Orchestrator(HostsFileWriter* writer,
                           MetricsReporter* reporter,
                           int interval_s) :
  _writer(writer),
  _reporter(reporter),
  _interval_s(interval_s),
  _variables()
{
}

Orchestrator::~Orchestrator()
{
  for (std::vector<MonitoredVariable*>::iterator it = _variables.begin();
       it != _variables.end();
       ++it)
  {
    delete *it;
  }
  _variables.clear();
}

void Orchestrator::add_variable(MonitoredVariable* variable)
{
  _variables.push_back(variable);
}

FailureCounts Orchestrator::run_pass()
{
  uint64_t start_ms = Utils::get_time();
  HostMappings mappings;
  FailureCounts failures;

  try
  {
    for (std::vector<MonitoredVariable*>::const_iterator it = _variables.begin();
         it != _variables.end();
         ++it)
    {
      process(*it, mappings, failures);
    }

    if (_writer->reconcile(mappings) == HostsFileWriter::IO_ERROR)
    {
      TRC_ERROR("Failed to update %s", _writer->path().c_str());
      failures[std::make_pair(std::string(), std::string(REASON_ERROR))]++;
    }
  }
  catch (const std::exception& e)
  {
    TRC_ERROR("Pass failed: %s", e.what());
    failures[std::make_pair(std::string(), std::string(REASON_ERROR))]++;
  }

  if (failures.empty())
  {
    _reporter->report_success();
  }
  else
  {
    _reporter->report_failures(failures);
  }

  TRC_DEBUG("Pass complete in %llu ms with %d failure type(s)",
            (unsigned long long)(Utils::get_time() - start_ms),
            (int)failures.size());

  return failures;
}

void Orchestrator::run()
{
  TRC_STATUS("Monitoring %d variable(s) every %d seconds",
             (int)_variables.size(), _interval_s);

  while (true)
  {
    run_pass();
    sleep(_interval_s);
  }
}

void Orchestrator::process(MonitoredVariable* variable,
                           HostMappings& mappings,
                           FailureCounts& failures)
{
  try
  {
    HealthGate::Selection selection = variable->gate()->first_healthy();

    if (selection.found())
    {
      TRC_DEBUG("%s: using %s (%s)",
                variable->name().c_str(),
                selection.address.c_str(),
                HealthGate::source_to_string(selection.source));

      std::vector<std::string>& addresses = mappings[variable->hostname()];
      if (std::find(addresses.begin(), addresses.end(), selection.address) ==
          addresses.end())
      {
        addresses.push_back(selection.address);
      }
    }
    else
    {
      const char* reason = (selection.source == HealthGate::UNRESOLVABLE) ?
                             REASON_UNRESOLVABLE : REASON_NO_HEALTHY_ADDRESS;
      failures[std::make_pair(variable->name(), std::string(reason))]++;
    }
  }
  catch (const std::exception& e)
  {
    TRC_ERROR("%s: failed to select an address: %s",
              variable->name().c_str(), e.what());
    failures[std::make_pair(variable->name(), std::string(REASON_ERROR))]++;
  }
}
