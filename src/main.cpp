/**
 * @file main.cpp  hostguard: keeps critical service hostnames pinned to
 * healthy addresses in the hosts file.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#include <signal.h>
#include <stdlib.h>

#include <memory>

#include "log.h"
#include "utils.h"
#include "config_error.h"
#include "hostguard_config.h"
#include "dns_client.h"
#include "name_resolver.h"
#include "srv_resolver.h"
#include "datastore_probe.h"
#include "kvstore_probe.h"
#include "hosts_file.h"
#include "metrics_reporter.h"
#include "monitored_variable.h"
#include "orchestrator.h"

int main(int argc, char** argv)
{
  HostguardConfig config;

  try
  {
    EnvironmentConfigReader reader;
    reader.read_config(config);
  }
  catch (const ConfigError& e)
  {
    TRC_ERROR("Invalid configuration: %s", e.what());
    return 1;
  }

  Utils::log_setup(argv[0], config.log_directory, config.log_level);
  TRC_STATUS("hostguard starting, maintaining %s", config.hosts_file.c_str());

  // Probe connections that the peer drops must not kill the process.
  signal(SIGPIPE, SIG_IGN);

  DnsClient dns_client(config.dns_servers);
  NameResolver name_resolver(&dns_client);
  ServiceRecordResolver srv_resolver(&dns_client, &name_resolver);

  DatastoreProbe datastore_probe(config.datastore);
  KeyValueStoreProbe kvstore_probe(config.kvstore);

  HostsFileWriter writer(config.hosts_file);
  MetricsConnection metrics_connection(config.metrics_port);
  MetricsReporter reporter(&metrics_connection);

  Orchestrator orchestrator(&writer, &reporter);

  for (std::vector<MonitoredVariableConfig>::const_iterator it = config.variables.begin();
       it != config.variables.end();
       ++it)
  {
    HealthProbe* probe = &kvstore_probe;
    if (it->probe == DATASTORE_PROBE)
    {
      probe = &datastore_probe;
    }

    orchestrator.add_variable(MonitoredVariable::create(*it,
                                                        &name_resolver,
                                                        &srv_resolver,
                                                        probe));
  }

  orchestrator.run();

  return 0;
}
