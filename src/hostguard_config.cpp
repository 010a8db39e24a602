/**
 * @file hostguard_config.cpp
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include "log.h"
#include "utils.h"
#include "config_error.h"
#include "hostguard_config.h"

const char* const EnvironmentConfigReader::DEFAULT_HOSTS_FILE = "/etc/hosts";

HostguardConfig::HostguardConfig() :
  variables(),
  datastore(),
  kvstore(),
  hosts_file(EnvironmentConfigReader::DEFAULT_HOSTS_FILE),
  metrics_port(EnvironmentConfigReader::DEFAULT_METRICS_PORT),
  dns_servers(),
  log_level(EnvironmentConfigReader::DEFAULT_LOG_LEVEL),
  log_directory()
{}

EnvironmentConfigReader::EnvironmentConfigReader(Environment env) :
  _env(env)
{}

EnvironmentConfigReader::~EnvironmentConfigReader() {}

void EnvironmentConfigReader::read_config(HostguardConfig& config)
{
  config = HostguardConfig();

  // Monitored variables, in the order they are processed on each pass.
  read_variable("DATABASE_HOST", DATASTORE_PROBE, config.variables);
  read_variable("DATABASE_READ_REPLICA_HOST", DATASTORE_PROBE, config.variables);
  read_variable("KVSTORE_HOST", KVSTORE_PROBE, config.variables);
  read_variable("KVSTORE_READ_REPLICA_HOST", KVSTORE_PROBE, config.variables);

  config.datastore.user = get("DATABASE_USER");
  config.datastore.password = get("DATABASE_PASSWORD");
  config.datastore.database = get("DATABASE_NAME");
  config.datastore.port = get_int("DATABASE_PORT", config.datastore.port, 1, 65535);

  config.kvstore.username = get("KVSTORE_USERNAME");
  config.kvstore.password = get("KVSTORE_PASSWORD");
  config.kvstore.port = get_int("KVSTORE_PORT", config.kvstore.port, 1, 65535);
  config.kvstore.tls = get_bool("KVSTORE_TLS");

  if (!config.kvstore.authenticates() && !config.kvstore.password.empty())
  {
    TRC_WARNING("KVSTORE_PASSWORD is set without KVSTORE_USERNAME, so key-value "
                "store probes connect unauthenticated");
  }

  std::string hosts_file = get("HOSTGUARD_HOSTS_FILE");
  if (!hosts_file.empty())
  {
    config.hosts_file = hosts_file;
  }

  config.metrics_port = get_int("HOSTGUARD_METRICS_PORT", DEFAULT_METRICS_PORT, 1, 65535);
  Utils::split_string(get("HOSTGUARD_DNS_SERVERS"), ',', config.dns_servers, true);
  config.log_level = get_int("HOSTGUARD_LOG_LEVEL", DEFAULT_LOG_LEVEL, 0, 5);
  config.log_directory = get("HOSTGUARD_LOG_DIR");

  if (config.variables.empty())
  {
    TRC_WARNING("No monitored variables are set");
  }
}

void EnvironmentConfigReader::read_variable(const std::string& name,
                                            ProbeKind probe,
                                            std::vector<MonitoredVariableConfig>& variables)
{
  MonitoredVariableConfig variable;
  variable.name = name;
  variable.hostname = get(name);
  variable.srv_name = get(name + "_SRV");
  variable.probe = probe;

  // The bounds are validated even if the variable ends up excluded, so a
  // typo is never silently ignored.
  int min = get_int(name + "_SRV_PRIORITY_GE",
                    PriorityFilter::MIN_PRIORITY,
                    PriorityFilter::MIN_PRIORITY,
                    PriorityFilter::MAX_PRIORITY);
  int max = get_int(name + "_SRV_PRIORITY_LE",
                    PriorityFilter::MAX_PRIORITY,
                    PriorityFilter::MIN_PRIORITY,
                    PriorityFilter::MAX_PRIORITY);
  variable.filter = PriorityFilter(min, max);

  if (variable.hostname.empty())
  {
    TRC_INFO("%s is not set, not monitoring it", name.c_str());
    return;
  }

  if (Utils::is_ip_literal(variable.hostname))
  {
    TRC_STATUS("%s is the IP address %s, not monitoring it",
               name.c_str(), variable.hostname.c_str());
    return;
  }

  if (variable.use_srv())
  {
    TRC_STATUS("Monitoring %s (%s) via SRV %s, priorities %s",
               name.c_str(),
               variable.hostname.c_str(),
               variable.srv_name.c_str(),
               variable.filter.to_string().c_str());
  }
  else
  {
    TRC_STATUS("Monitoring %s (%s)", name.c_str(), variable.hostname.c_str());
  }

  variables.push_back(variable);
}

std::string EnvironmentConfigReader::get(const std::string& name)
{
  const char* value = _env(name.c_str());
  std::string str = (value != NULL) ? value : "";
  return Utils::trim(str);
}

int EnvironmentConfigReader::get_int(const std::string& name,
                                     int default_value,
                                     int min,
                                     int max)
{
  std::string str = get(name);

  if (str.empty())
  {
    return default_value;
  }

  int value;

  try
  {
    value = boost::lexical_cast<int>(str);
  }
  catch (const boost::bad_lexical_cast&)
  {
    throw ConfigError(name + " is not an integer: '" + str + "'");
  }

  if ((value < min) || (value > max))
  {
    throw ConfigError(name + " must be between " + std::to_string(min) +
                      " and " + std::to_string(max) + ", got " + str);
  }

  return value;
}

bool EnvironmentConfigReader::get_bool(const std::string& name)
{
  std::string str = boost::algorithm::to_lower_copy(get(name));
  return ((str == "1") || (str == "true") || (str == "yes") || (str == "on"));
}
