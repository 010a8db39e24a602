/**
 * @file health_gate_test.cpp  HealthGate unit tests.
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
#include "gmock/gmock.h"

#include "dns_client.h"
#include "health_gate.h"
#include "name_resolver.h"
#include "fake_dns_client.h"
#include "mock_health_probe.h"
#include "test_interposer.hpp"

using ::testing::_;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;

class HealthGateTest : public ::testing::Test
{
public:
  HealthGateTest() :
    _fail(false),
    _cache("db.example.com", [this]() { return lookup(); }),
    _gate("DATABASE_HOST", &_cache, &_probe)
  {
    cwtest_completely_control_time();
  }

  virtual ~HealthGateTest()
  {
    cwtest_reset_time();
  }

  std::vector<std::string> lookup()
  {
    if (_fail)
    {
      throw DnsError("db.example.com", ARES_ENOTFOUND);
    }
    return _answer;
  }

  std::vector<std::string> _answer;
  bool _fail;
  NiceMock<MockHealthProbe> _probe;
  RecencyCache _cache;
  HealthGate _gate;
};

TEST_F(HealthGateTest, FirstHealthyIsFresh)
{
  _answer.push_back("10.0.0.1");

  EXPECT_CALL(_probe, probe("10.0.0.1")).WillOnce(Return(ProbeResult::healthy()));

  HealthGate::Selection selection = _gate.first_healthy();
  EXPECT_TRUE(selection.found());
  EXPECT_EQ("10.0.0.1", selection.address);
  EXPECT_EQ(HealthGate::FRESH, selection.source);
  EXPECT_EQ("10.0.0.1", _gate.last_healthy());
}

TEST_F(HealthGateTest, ProbesLazilyNewestFirst)
{
  std::vector<std::string> candidates;
  _answer.push_back("10.0.0.1");
  _cache.resolve(candidates);

  cwtest_advance_time_ms(30000);
  _answer.push_back("10.0.0.2");
  _answer.push_back("10.0.0.3");

  // 10.0.0.2 and 10.0.0.3 are newest. 10.0.0.3 is never probed because
  // 10.0.0.2 passes.
  EXPECT_CALL(_probe, probe("10.0.0.2")).WillOnce(Return(ProbeResult::healthy()));
  EXPECT_CALL(_probe, probe("10.0.0.3")).Times(0);
  EXPECT_CALL(_probe, probe("10.0.0.1")).Times(0);

  HealthGate::Selection selection = _gate.first_healthy();
  EXPECT_EQ("10.0.0.2", selection.address);
  EXPECT_EQ(HealthGate::FRESH, selection.source);
}

TEST_F(HealthGateTest, SkipsUnhealthy)
{
  _answer.push_back("10.0.0.1");
  _answer.push_back("10.0.0.2");

  {
    InSequence seq;
    EXPECT_CALL(_probe, probe("10.0.0.1"))
      .WillOnce(Return(ProbeResult::unhealthy("connection refused")));
    EXPECT_CALL(_probe, probe("10.0.0.2"))
      .WillOnce(Return(ProbeResult::healthy()));
  }

  HealthGate::Selection selection = _gate.first_healthy();
  EXPECT_EQ("10.0.0.2", selection.address);
  EXPECT_EQ(HealthGate::FRESH, selection.source);
}

TEST_F(HealthGateTest, StickyAfterSuccess)
{
  _answer.push_back("10.0.0.1");

  EXPECT_CALL(_probe, probe("10.0.0.1"))
    .WillOnce(Return(ProbeResult::healthy()))
    .WillRepeatedly(Return(ProbeResult::unhealthy("timed out")));

  EXPECT_EQ(HealthGate::FRESH, _gate.first_healthy().source);

  HealthGate::Selection selection = _gate.first_healthy();
  EXPECT_EQ("10.0.0.1", selection.address);
  EXPECT_EQ(HealthGate::STICKY, selection.source);

  // Even once the lookup fails and the address has aged out of the cache,
  // the last healthy address is kept.
  _fail = true;
  cwtest_advance_time_ms((RecencyCache::EXPIRY_SECONDS + 60) * 1000L);

  selection = _gate.first_healthy();
  EXPECT_EQ("10.0.0.1", selection.address);
  EXPECT_EQ(HealthGate::STICKY, selection.source);
}

TEST_F(HealthGateTest, NewHealthyAddressReplacesOld)
{
  _answer.push_back("10.0.0.1");
  EXPECT_CALL(_probe, probe("10.0.0.1"))
    .WillRepeatedly(Return(ProbeResult::healthy()));
  EXPECT_EQ("10.0.0.1", _gate.first_healthy().address);

  cwtest_advance_time_ms(30000);
  _answer.push_back("10.0.0.2");
  EXPECT_CALL(_probe, probe("10.0.0.2"))
    .WillOnce(Return(ProbeResult::healthy()));

  HealthGate::Selection selection = _gate.first_healthy();
  EXPECT_EQ("10.0.0.2", selection.address);
  EXPECT_EQ("10.0.0.2", _gate.last_healthy());
}

TEST_F(HealthGateTest, NoneWhenNothingEverPassed)
{
  _answer.push_back("10.0.0.1");
  EXPECT_CALL(_probe, probe("10.0.0.1"))
    .WillOnce(Return(ProbeResult::unhealthy("authentication failed")));

  HealthGate::Selection selection = _gate.first_healthy();
  EXPECT_FALSE(selection.found());
  EXPECT_EQ(HealthGate::NONE, selection.source);
}

TEST_F(HealthGateTest, NoneWhenLookupReturnsNothing)
{
  EXPECT_CALL(_probe, probe(_)).Times(0);

  HealthGate::Selection selection = _gate.first_healthy();
  EXPECT_FALSE(selection.found());
  EXPECT_EQ(HealthGate::NONE, selection.source);
}

TEST_F(HealthGateTest, UnresolvableWhenLookupFailsWithEmptyCache)
{
  _fail = true;
  EXPECT_CALL(_probe, probe(_)).Times(0);

  HealthGate::Selection selection = _gate.first_healthy();
  EXPECT_FALSE(selection.found());
  EXPECT_EQ(HealthGate::UNRESOLVABLE, selection.source);
}

TEST_F(HealthGateTest, LookupFailureStillProbesCachedCandidates)
{
  _answer.push_back("10.0.0.1");
  EXPECT_CALL(_probe, probe("10.0.0.1"))
    .WillOnce(Return(ProbeResult::unhealthy("refused")))
    .WillOnce(Return(ProbeResult::healthy()));

  EXPECT_EQ(HealthGate::NONE, _gate.first_healthy().source);

  _fail = true;
  HealthGate::Selection selection = _gate.first_healthy();
  EXPECT_EQ("10.0.0.1", selection.address);
  EXPECT_EQ(HealthGate::FRESH, selection.source);
}

TEST_F(HealthGateTest, SourceNames)
{
  EXPECT_STREQ("fresh", HealthGate::source_to_string(HealthGate::FRESH));
  EXPECT_STREQ("sticky", HealthGate::source_to_string(HealthGate::STICKY));
  EXPECT_STREQ("none", HealthGate::source_to_string(HealthGate::NONE));
  EXPECT_STREQ("unresolvable", HealthGate::source_to_string(HealthGate::UNRESOLVABLE));
}

TEST(HealthGateResolverTest, PartialDnsFailureIsUnresolvable)
{
  // A fails outright while AAAA has no records.
  FakeDnsClient dns_client;
  dns_client.add_srv("db.example.com", 10, 10, 5432, "db1.example.com");
  dns_client.set_status("db.example.com", ns_t_a, ARES_ESERVFAIL);

  NameResolver resolver(&dns_client);
  NiceMock<MockHealthProbe> probe;
  RecencyCache cache("db.example.com",
                     [&resolver]() { return resolver.resolve("db.example.com"); });
  HealthGate gate("DATABASE_HOST", &cache, &probe);

  EXPECT_CALL(probe, probe(_)).Times(0);

  HealthGate::Selection selection = gate.first_healthy();
  EXPECT_FALSE(selection.found());
  EXPECT_EQ(HealthGate::UNRESOLVABLE, selection.source);
}
