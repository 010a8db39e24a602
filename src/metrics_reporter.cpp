/**
 * @file metrics_reporter.cpp
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#include <memory>

#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

#include "log.h"
#include "metrics_reporter.h"

typedef std::unique_ptr<CURL, void(*)(CURL*)> CurlPtr;
typedef std::unique_ptr<struct curl_slist, void(*)(struct curl_slist*)> CurlHeadersPtr;

const char* const MetricsReporter::METRICS_PATH = "/metrics";
const char* const MetricsReporter::SUCCESS_COUNTER = "hostguard_pass_success_total";
const char* const MetricsReporter::FAILURE_COUNTER = "hostguard_pass_failure_total";

static const char* const JSON_TYPE = "type";
static const char* const JSON_NAME = "name";
static const char* const JSON_DESCRIPTION = "description";
static const char* const JSON_LABELS = "labels";
static const char* const JSON_VALUE = "value";

MetricsConnection::MetricsConnection(int port) :
  _port(port)
{
  curl_global_init(CURL_GLOBAL_DEFAULT);
}

MetricsConnection::~MetricsConnection()
{
}

long MetricsConnection::send_post(const std::string& path, const std::string& body)
{
  CurlPtr curl(curl_easy_init(), curl_easy_cleanup);

  if (!curl)
  {
    TRC_ERROR("Failed to allocate CURL handle");
    return 0;
  }

  std::string url = "http://127.0.0.1:" + std::to_string(_port) + path;

  CurlHeadersPtr headers(curl_slist_append(NULL, "Content-Type: application/json"),
                         curl_slist_free_all);
  // Stop cURL waiting for a 100 Continue.
  headers.reset(curl_slist_append(headers.release(), "Expect:"));

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, (long)body.size());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &MetricsConnection::discard);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, TIMEOUT_MS);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, CONNECT_TIMEOUT_MS);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  CURLcode rc = curl_easy_perform(curl.get());

  if (rc != CURLE_OK)
  {
    TRC_WARNING("Failed to POST to %s: %s (%d)",
                url.c_str(), curl_easy_strerror(rc), rc);
    return 0;
  }

  long http_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
  return http_code;
}

size_t MetricsConnection::discard(char*, size_t size, size_t nmemb, void*)
{
  return size * nmemb;
}

MetricsReporter::MetricsReporter(MetricsConnection* connection) :
  _connection(connection)
{
}

MetricsReporter::~MetricsReporter()
{
}

void MetricsReporter::report_success()
{
  TRC_DEBUG("Reporting successful pass");
  send(counter_json(SUCCESS_COUNTER,
                    "Passes in which every monitored variable had a healthy address",
                    std::map<std::string, std::string>(),
                    1));
}

void MetricsReporter::report_failures(const FailureCounts& failures)
{
  for (FailureCounts::const_iterator failure = failures.begin();
       failure != failures.end();
       ++failure)
  {
    TRC_DEBUG("Reporting %d failure(s) for '%s' (%s)",
              failure->second,
              failure->first.first.c_str(),
              failure->first.second.c_str());

    std::map<std::string, std::string> labels;
    labels["variable"] = failure->first.first;
    labels["reason"] = failure->first.second;

    send(counter_json(FAILURE_COUNTER,
                      "Monitored variables without a healthy address, by reason",
                      labels,
                      failure->second));
  }
}

std::string MetricsReporter::counter_json(const std::string& name,
                                          const std::string& description,
                                          const std::map<std::string, std::string>& labels,
                                          int value)
{
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);

  writer.StartObject();
  {
    writer.String(JSON_TYPE); writer.String("counter");
    writer.String(JSON_NAME); writer.String(name.c_str());
    writer.String(JSON_DESCRIPTION); writer.String(description.c_str());

    writer.String(JSON_LABELS);
    writer.StartObject();
    for (std::map<std::string, std::string>::const_iterator label = labels.begin();
         label != labels.end();
         ++label)
    {
      writer.String(label->first.c_str());
      writer.String(label->second.c_str());
    }
    writer.EndObject();

    writer.String(JSON_VALUE); writer.Int(value);
  }
  writer.EndObject();

  return sb.GetString();
}

void MetricsReporter::send(const std::string& body)
{
  long http_code = _connection->send_post(METRICS_PATH, body);

  if (http_code != 200)
  {
    TRC_WARNING("Metrics collector did not accept update (HTTP %ld): %s",
                http_code, body.c_str());
  }
}
