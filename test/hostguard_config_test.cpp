/**
 * @file hostguard_config_test.cpp  Configuration unit tests.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#include <map>
#include <string>

#include "gtest/gtest.h"

#include "config_error.h"
#include "hostguard_config.h"
#include "fakelogger.h"

class HostguardConfigTest : public ::testing::Test
{
public:
  HostguardConfigTest() :
    _reader([this](const char* name) { return lookup(name); })
  {
  }

  const char* lookup(const char* name)
  {
    std::map<std::string, std::string>::const_iterator it = _env.find(name);
    return (it != _env.end()) ? it->second.c_str() : NULL;
  }

  HostguardConfig read()
  {
    HostguardConfig config;
    _reader.read_config(config);
    return config;
  }

  std::map<std::string, std::string> _env;
  EnvironmentConfigReader _reader;
};

TEST_F(HostguardConfigTest, Defaults)
{
  HostguardConfig config = read();

  EXPECT_TRUE(config.variables.empty());
  EXPECT_EQ("/etc/hosts", config.hosts_file);
  EXPECT_EQ(9091, config.metrics_port);
  EXPECT_TRUE(config.dns_servers.empty());
  EXPECT_EQ(4, config.log_level);
  EXPECT_EQ("", config.log_directory);
  EXPECT_EQ(5432, config.datastore.port);
  EXPECT_EQ(11211, config.kvstore.port);
  EXPECT_FALSE(config.kvstore.tls);
}

TEST_F(HostguardConfigTest, VariablesInOrder)
{
  _env["KVSTORE_READ_REPLICA_HOST"] = "kv-ro.example.com";
  _env["DATABASE_HOST"] = "db.example.com";
  _env["KVSTORE_HOST"] = "kv.example.com";
  _env["DATABASE_READ_REPLICA_HOST"] = "db-ro.example.com";

  HostguardConfig config = read();

  ASSERT_EQ(4u, config.variables.size());
  EXPECT_EQ("DATABASE_HOST", config.variables[0].name);
  EXPECT_EQ("db.example.com", config.variables[0].hostname);
  EXPECT_EQ(DATASTORE_PROBE, config.variables[0].probe);
  EXPECT_EQ("DATABASE_READ_REPLICA_HOST", config.variables[1].name);
  EXPECT_EQ(DATASTORE_PROBE, config.variables[1].probe);
  EXPECT_EQ("KVSTORE_HOST", config.variables[2].name);
  EXPECT_EQ(KVSTORE_PROBE, config.variables[2].probe);
  EXPECT_EQ("KVSTORE_READ_REPLICA_HOST", config.variables[3].name);
  EXPECT_EQ("kv-ro.example.com", config.variables[3].hostname);
  EXPECT_EQ(KVSTORE_PROBE, config.variables[3].probe);
  EXPECT_FALSE(config.variables[0].use_srv());
}

TEST_F(HostguardConfigTest, IPLiteralExcluded)
{
  _env["DATABASE_HOST"] = "10.0.0.5";
  _env["DATABASE_READ_REPLICA_HOST"] = "fd00::5";
  _env["KVSTORE_HOST"] = "kv.example.com";

  HostguardConfig config = read();

  ASSERT_EQ(1u, config.variables.size());
  EXPECT_EQ("KVSTORE_HOST", config.variables[0].name);
}

TEST_F(HostguardConfigTest, IPLiteralExcludedEvenWithSrv)
{
  _env["DATABASE_HOST"] = "10.0.0.5";
  _env["DATABASE_HOST_SRV"] = "_postgresql._tcp.example.com";

  EXPECT_TRUE(read().variables.empty());
}

TEST_F(HostguardConfigTest, EmptyValueExcluded)
{
  _env["DATABASE_HOST"] = "   ";
  EXPECT_TRUE(read().variables.empty());
}

TEST_F(HostguardConfigTest, SrvWithPriorities)
{
  _env["DATABASE_HOST"] = "db.example.com";
  _env["DATABASE_HOST_SRV"] = "_postgresql._tcp.example.com";
  _env["DATABASE_HOST_SRV_PRIORITY_LE"] = "50";
  _env["DATABASE_HOST_SRV_PRIORITY_GE"] = "10";

  HostguardConfig config = read();

  ASSERT_EQ(1u, config.variables.size());
  const MonitoredVariableConfig& variable = config.variables[0];
  EXPECT_TRUE(variable.use_srv());
  EXPECT_EQ("_postgresql._tcp.example.com", variable.srv_name);
  EXPECT_EQ(10, variable.filter.min());
  EXPECT_EQ(50, variable.filter.max());
}

TEST_F(HostguardConfigTest, SrvPriorityDefaults)
{
  _env["KVSTORE_HOST"] = "kv.example.com";
  _env["KVSTORE_HOST_SRV"] = "_memcache._tcp.example.com";
  _env["KVSTORE_HOST_SRV_PRIORITY_LE"] = "50";

  HostguardConfig config = read();

  ASSERT_EQ(1u, config.variables.size());
  EXPECT_EQ(0, config.variables[0].filter.min());
  EXPECT_EQ(50, config.variables[0].filter.max());
}

TEST_F(HostguardConfigTest, NonIntegerPriority)
{
  _env["DATABASE_HOST"] = "db.example.com";
  _env["DATABASE_HOST_SRV_PRIORITY_LE"] = "fifty";
  EXPECT_THROW(read(), ConfigError);
}

TEST_F(HostguardConfigTest, PriorityOutOfRange)
{
  _env["DATABASE_HOST"] = "db.example.com";
  _env["DATABASE_HOST_SRV_PRIORITY_LE"] = "65536";
  EXPECT_THROW(read(), ConfigError);
}

TEST_F(HostguardConfigTest, NegativePriority)
{
  _env["DATABASE_HOST"] = "db.example.com";
  _env["DATABASE_HOST_SRV_PRIORITY_GE"] = "-1";
  EXPECT_THROW(read(), ConfigError);
}

TEST_F(HostguardConfigTest, PriorityBoundsInverted)
{
  _env["DATABASE_HOST"] = "db.example.com";
  _env["DATABASE_HOST_SRV_PRIORITY_GE"] = "60";
  _env["DATABASE_HOST_SRV_PRIORITY_LE"] = "50";
  EXPECT_THROW(read(), ConfigError);
}

TEST_F(HostguardConfigTest, Credentials)
{
  _env["DATABASE_USER"] = "hostguard";
  _env["DATABASE_PASSWORD"] = "secret";
  _env["DATABASE_NAME"] = "app";
  _env["DATABASE_PORT"] = "6432";
  _env["KVSTORE_USERNAME"] = "kvuser";
  _env["KVSTORE_PASSWORD"] = "kvsecret";
  _env["KVSTORE_PORT"] = "6379";
  _env["KVSTORE_TLS"] = "TRUE";

  HostguardConfig config = read();

  EXPECT_EQ("hostguard", config.datastore.user);
  EXPECT_EQ("secret", config.datastore.password);
  EXPECT_EQ("app", config.datastore.database);
  EXPECT_EQ(6432, config.datastore.port);
  EXPECT_EQ("kvuser", config.kvstore.username);
  EXPECT_EQ("kvsecret", config.kvstore.password);
  EXPECT_EQ(6379, config.kvstore.port);
  EXPECT_TRUE(config.kvstore.tls);
}

TEST_F(HostguardConfigTest, KvStorePasswordWithoutUsername)
{
  CapturingTestLogger log;
  _env["KVSTORE_PASSWORD"] = "kvsecret";

  HostguardConfig config = read();

  EXPECT_EQ("", config.kvstore.username);
  EXPECT_EQ("kvsecret", config.kvstore.password);
  EXPECT_FALSE(config.kvstore.authenticates());
  EXPECT_TRUE(log.contains("KVSTORE_PASSWORD is set without KVSTORE_USERNAME"));
}

TEST_F(HostguardConfigTest, TlsFlagValues)
{
  const char* truthy[] = {"1", "true", "Yes", "ON"};
  for (size_t ii = 0; ii < sizeof(truthy) / sizeof(truthy[0]); ii++)
  {
    _env["KVSTORE_TLS"] = truthy[ii];
    EXPECT_TRUE(read().kvstore.tls) << truthy[ii];
  }

  const char* falsy[] = {"0", "false", "no", "enabled", ""};
  for (size_t ii = 0; ii < sizeof(falsy) / sizeof(falsy[0]); ii++)
  {
    _env["KVSTORE_TLS"] = falsy[ii];
    EXPECT_FALSE(read().kvstore.tls) << falsy[ii];
  }
}

TEST_F(HostguardConfigTest, BadPort)
{
  _env["DATABASE_PORT"] = "5432x";
  EXPECT_THROW(read(), ConfigError);
}

TEST_F(HostguardConfigTest, DaemonSettings)
{
  _env["HOSTGUARD_HOSTS_FILE"] = "/tmp/hosts";
  _env["HOSTGUARD_METRICS_PORT"] = "9100";
  _env["HOSTGUARD_DNS_SERVERS"] = "10.0.0.53, fd00::53";
  _env["HOSTGUARD_LOG_LEVEL"] = "5";
  _env["HOSTGUARD_LOG_DIR"] = "/var/log/hostguard";

  HostguardConfig config = read();

  EXPECT_EQ("/tmp/hosts", config.hosts_file);
  EXPECT_EQ(9100, config.metrics_port);
  ASSERT_EQ(2u, config.dns_servers.size());
  EXPECT_EQ("10.0.0.53", config.dns_servers[0]);
  EXPECT_EQ("fd00::53", config.dns_servers[1]);
  EXPECT_EQ(5, config.log_level);
  EXPECT_EQ("/var/log/hostguard", config.log_directory);
}

TEST_F(HostguardConfigTest, BadLogLevel)
{
  _env["HOSTGUARD_LOG_LEVEL"] = "9";
  EXPECT_THROW(read(), ConfigError);
}
