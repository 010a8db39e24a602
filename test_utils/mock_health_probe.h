/**
 * @file mock_health_probe.h
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef MOCK_HEALTH_PROBE_H__
#define MOCK_HEALTH_PROBE_H__

#include "gmock/gmock.h"
#include "health_probe.h"

class MockHealthProbe : public HealthProbe
{
public:
  MockHealthProbe()
  {
    ON_CALL(*this, protocol()).WillByDefault(::testing::Return("mock"));
  }
  virtual ~MockHealthProbe() {}

  MOCK_METHOD1(probe, ProbeResult(const std::string& address));
  MOCK_CONST_METHOD0(protocol, std::string());
};

#endif
