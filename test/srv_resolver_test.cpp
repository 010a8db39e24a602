/**
 * @file srv_resolver_test.cpp  ServiceRecordResolver unit tests.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "srv_resolver.h"
#include "fake_dns_client.h"

class ServiceRecordResolverTest : public ::testing::Test
{
public:
  ServiceRecordResolverTest() :
    _name_resolver(&_dns_client),
    _resolver(&_dns_client, &_name_resolver)
  {
    _dns_client.add_a("a.example.com", "10.0.0.1");
    _dns_client.add_a("b.example.com", "10.0.0.2");
    _dns_client.add_aaaa("b.example.com", "fd00::2");
    _dns_client.add_a("c.example.com", "10.0.0.3");
  }

  bool queried(const std::string& domain)
  {
    for (size_t ii = 0; ii < _dns_client.queries.size(); ii++)
    {
      if (_dns_client.queries[ii].first == domain)
      {
        return true;
      }
    }
    return false;
  }

  FakeDnsClient _dns_client;
  NameResolver _name_resolver;
  ServiceRecordResolver _resolver;
};

TEST_F(ServiceRecordResolverTest, AllTargets)
{
  _dns_client.add_srv("_db._tcp.example.com", 90, 10, 5432, "b.example.com");
  _dns_client.add_srv("_db._tcp.example.com", 10, 10, 5432, "a.example.com");

  std::vector<std::string> addresses =
    _resolver.resolve("_db._tcp.example.com", PriorityFilter());

  // Lower priority values first.
  ASSERT_EQ(3u, addresses.size());
  EXPECT_EQ("10.0.0.1", addresses[0]);
  EXPECT_EQ("10.0.0.2", addresses[1]);
  EXPECT_EQ("fd00::2", addresses[2]);
}

TEST_F(ServiceRecordResolverTest, PriorityFilterApplied)
{
  _dns_client.add_srv("_db._tcp.example.com", 10, 10, 5432, "a.example.com");
  _dns_client.add_srv("_db._tcp.example.com", 90, 10, 5432, "b.example.com");

  std::vector<std::string> addresses =
    _resolver.resolve("_db._tcp.example.com", PriorityFilter(0, 50));

  ASSERT_EQ(1u, addresses.size());
  EXPECT_EQ("10.0.0.1", addresses[0]);

  // The filtered target is never looked up.
  EXPECT_FALSE(queried("b.example.com"));
}

TEST_F(ServiceRecordResolverTest, LowerBound)
{
  _dns_client.add_srv("_db._tcp.example.com", 10, 10, 5432, "a.example.com");
  _dns_client.add_srv("_db._tcp.example.com", 90, 10, 5432, "b.example.com");

  std::vector<std::string> addresses =
    _resolver.resolve("_db._tcp.example.com", PriorityFilter(90, 65535));

  ASSERT_EQ(2u, addresses.size());
  EXPECT_EQ("10.0.0.2", addresses[0]);
  EXPECT_EQ("fd00::2", addresses[1]);
}

TEST_F(ServiceRecordResolverTest, NothingWithinFilter)
{
  _dns_client.add_srv("_db._tcp.example.com", 10, 10, 5432, "a.example.com");

  std::vector<std::string> addresses =
    _resolver.resolve("_db._tcp.example.com", PriorityFilter(20, 30));

  EXPECT_TRUE(addresses.empty());
}

TEST_F(ServiceRecordResolverTest, SharedAddressesUnioned)
{
  _dns_client.add_a("d.example.com", "10.0.0.1");
  _dns_client.add_srv("_db._tcp.example.com", 10, 10, 5432, "a.example.com");
  _dns_client.add_srv("_db._tcp.example.com", 20, 10, 5432, "d.example.com");
  _dns_client.add_srv("_db._tcp.example.com", 30, 10, 5433, "a.example.com");

  std::vector<std::string> addresses =
    _resolver.resolve("_db._tcp.example.com", PriorityFilter());

  ASSERT_EQ(1u, addresses.size());
  EXPECT_EQ("10.0.0.1", addresses[0]);
}

TEST_F(ServiceRecordResolverTest, SrvQueryFails)
{
  _dns_client.set_status("_db._tcp.example.com", ns_t_srv, ARES_ESERVFAIL);

  try
  {
    _resolver.resolve("_db._tcp.example.com", PriorityFilter());
    FAIL() << "Expected DnsError";
  }
  catch (const DnsError& e)
  {
    EXPECT_EQ(ARES_ESERVFAIL, e.status());
  }
}

TEST_F(ServiceRecordResolverTest, FailingTargetSkipped)
{
  _dns_client.add_srv("_db._tcp.example.com", 10, 10, 5432, "gone.example.com");
  _dns_client.add_srv("_db._tcp.example.com", 20, 10, 5432, "c.example.com");

  std::vector<std::string> addresses =
    _resolver.resolve("_db._tcp.example.com", PriorityFilter());

  ASSERT_EQ(1u, addresses.size());
  EXPECT_EQ("10.0.0.3", addresses[0]);
}

TEST_F(ServiceRecordResolverTest, AllTargetsFail)
{
  _dns_client.add_srv("_db._tcp.example.com", 10, 10, 5432, "gone.example.com");
  _dns_client.add_srv("_db._tcp.example.com", 20, 10, 5432, "c.example.com");
  _dns_client.set_status("c.example.com", ns_t_a, ARES_ETIMEOUT);
  _dns_client.set_status("c.example.com", ns_t_aaaa, ARES_ETIMEOUT);

  try
  {
    _resolver.resolve("_db._tcp.example.com", PriorityFilter());
    FAIL() << "Expected DnsError";
  }
  catch (const DnsError& e)
  {
    EXPECT_EQ(ARES_ETIMEOUT, e.status());
    EXPECT_EQ("_db._tcp.example.com", e.domain());
  }
}
