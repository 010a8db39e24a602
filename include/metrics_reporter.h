/**
 * @file metrics_reporter.h  Pushes pass outcomes to the local metrics
 * collector.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef METRICS_REPORTER_H__
#define METRICS_REPORTER_H__

#include <map>
#include <string>
#include <utility>

#include <curl/curl.h>

/// Failure counts keyed by (variable, reason).
typedef std::map<std::pair<std::string, std::string>, int> FailureCounts;

/// Posts JSON documents to an HTTP endpoint on the loopback interface.
class MetricsConnection
{
public:
  MetricsConnection(int port);
  virtual ~MetricsConnection();

  /// Sends body to path. Returns the HTTP status code, or 0 if no response
  /// was received.
  virtual long send_post(const std::string& path, const std::string& body);

  static const long CONNECT_TIMEOUT_MS = 1000;
  static const long TIMEOUT_MS = 2000;

private:
  static size_t discard(char* ptr, size_t size, size_t nmemb, void* userdata);

  int _port;
};

class MetricsReporter
{
public:
  MetricsReporter(MetricsConnection* connection);
  virtual ~MetricsReporter();

  /// Records a pass in which every variable found a healthy address.
  virtual void report_success();

  /// Sends one counter update per (variable, reason) entry.
  virtual void report_failures(const FailureCounts& failures);

  /// The JSON body of a single counter update.
  static std::string counter_json(const std::string& name,
                                  const std::string& description,
                                  const std::map<std::string, std::string>& labels,
                                  int value);

  static const char* const METRICS_PATH;
  static const char* const SUCCESS_COUNTER;
  static const char* const FAILURE_COUNTER;

private:
  void send(const std::string& body);

  MetricsConnection* _connection;
};

#endif
