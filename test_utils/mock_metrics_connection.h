/**
 * @file mock_metrics_connection.h
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef MOCK_METRICS_CONNECTION_H__
#define MOCK_METRICS_CONNECTION_H__

#include "gmock/gmock.h"
#include "metrics_reporter.h"

class MockMetricsConnection : public MetricsConnection
{
public:
  MockMetricsConnection() : MetricsConnection(0) {}
  ~MockMetricsConnection() {}

  MOCK_METHOD2(send_post, long(const std::string& path, const std::string& body));
};

class MockMetricsReporter : public MetricsReporter
{
public:
  MockMetricsReporter() : MetricsReporter(nullptr) {}
  ~MockMetricsReporter() {}

  MOCK_METHOD0(report_success, void());
  MOCK_METHOD1(report_failures, void(const FailureCounts& failures));
};

#endif
