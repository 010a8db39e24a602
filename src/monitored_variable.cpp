/**
 * @file monitored_variable.cpp
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#include "log.h"
#include "monitored_variable.h"

MonitoredVariable::MonitoredVariable(const std::string& name,
                                     const std::string& hostname,
                                     RecencyCache* cache,
                                     HealthGate* gate) :
  _name(name),
  _hostname(hostname),
  _cache(cache),
  _gate(gate)
{
}

MonitoredVariable::~MonitoredVariable()
{
  // The gate refers to the cache, so goes first.
  _gate.reset();
  _cache.reset();
}

MonitoredVariable* MonitoredVariable::create(const MonitoredVariableConfig& config,
                                             NameResolver* name_resolver,
                                             ServiceRecordResolver* srv_resolver,
                                             HealthProbe* probe)
{
  RecencyCache::Lookup lookup;

  if (config.use_srv())
  {
    std::string srv_name = config.srv_name;
    PriorityFilter filter = config.filter;
    lookup = [srv_resolver, srv_name, filter]()
    {
      return srv_resolver->resolve(srv_name, filter);
    };
  }
  else
  {
    std::string hostname = config.hostname;
    lookup = [name_resolver, hostname]()
    {
      return name_resolver->resolve(hostname);
    };
  }

  RecencyCache* cache = new RecencyCache(config.name, lookup);
  HealthGate* gate = new HealthGate(config.name, cache, probe);

  return new MonitoredVariable(config.name, config.hostname, cache, gate);
}
