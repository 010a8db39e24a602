/**
 * @file hostguard_config.h  Startup configuration, read from the environment.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef HOSTGUARD_CONFIG_H__
#define HOSTGUARD_CONFIG_H__

#include <stdlib.h>

#include <functional>
#include <string>
#include <vector>

#include "priority_filter.h"
#include "datastore_probe.h"
#include "kvstore_probe.h"

/// Which health probe guards a variable.
enum ProbeKind
{
  DATASTORE_PROBE,
  KVSTORE_PROBE
};

/// One critical-service slot to keep resolvable.
struct MonitoredVariableConfig
{
  /// The environment variable, e.g. DATABASE_HOST. Used to label metrics.
  std::string name;

  /// The hostname it holds, which is also the name maintained in the hosts
  /// file.
  std::string hostname;

  /// SRV name to discover addresses through. Empty means the hostname is
  /// resolved directly.
  std::string srv_name;

  /// Accepted SRV priorities. Unused without an SRV name.
  PriorityFilter filter;

  ProbeKind probe;

  bool use_srv() const { return !srv_name.empty(); }
};

/// Structure holding all hostguard configuration.
struct HostguardConfig
{
  /// The variables to monitor, in processing order. Unset, empty and IP
  /// literal values have already been excluded.
  std::vector<MonitoredVariableConfig> variables;

  DatastoreCredentials datastore;
  KvStoreCredentials kvstore;

  std::string hosts_file;
  int metrics_port;

  /// Empty means use the system resolver configuration.
  std::vector<std::string> dns_servers;

  int log_level;

  /// Empty means log to stdout.
  std::string log_directory;

  HostguardConfig();
};

/// Reads the configuration from environment variables.
class EnvironmentConfigReader
{
public:
  /// Looks up a variable, returning NULL if it is not set.
  typedef std::function<const char*(const char*)> Environment;

  EnvironmentConfigReader(Environment env = getenv);
  ~EnvironmentConfigReader();

  /// Throws ConfigError if any setting is malformed.
  void read_config(HostguardConfig& config);

  static const char* const DEFAULT_HOSTS_FILE;
  static const int DEFAULT_METRICS_PORT = 9091;
  static const int DEFAULT_LOG_LEVEL = 4;

private:
  std::string get(const std::string& name);
  int get_int(const std::string& name, int default_value, int min, int max);
  bool get_bool(const std::string& name);

  void read_variable(const std::string& name,
                     ProbeKind probe,
                     std::vector<MonitoredVariableConfig>& variables);

  Environment _env;
};

#endif
