/**
 * @file dns_client.h Definitions for the synchronous c-ares DNS client.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef DNS_CLIENT_H__
#define DNS_CLIENT_H__

#include <pthread.h>

#include <string>
#include <vector>
#include <stdexcept>

#include <arpa/nameser.h>
#include <ares.h>

#include "utils.h"
#include "dnsrrecords.h"

/// Raised by the resolvers when a lookup fails outright (NXDOMAIN, SERVFAIL,
/// timeout, ...). Carries the c-ares status code.
class DnsError : public std::runtime_error
{
public:
  DnsError(const std::string& domain, int status);

  const std::string& domain() const { return _domain; }
  int status() const { return _status; }

private:
  std::string _domain;
  int _status;
};

/// The answer to a single query. Owns its records.
class DnsResult
{
public:
  DnsResult(const std::string& domain, int dnstype, int status);
  DnsResult(const std::string& domain,
            int dnstype,
            int status,
            const std::vector<DnsRRecord*>& records,
            int ttl);
  DnsResult(const DnsResult &obj);
  DnsResult(DnsResult &&obj);
  ~DnsResult();

  const std::string& domain() const { return _domain; }
  int dnstype() const { return _dnstype; }
  int status() const { return _status; }
  const std::vector<DnsRRecord*>& records() const { return _records; }
  int ttl() const { return _ttl; }

  /// True if the query completed: either with records or with a definite
  /// "no records of this type" (ARES_ENODATA).
  bool succeeded() const
  {
    return ((_status == ARES_SUCCESS) || (_status == ARES_ENODATA));
  }

  /// Takes ownership of a record.
  void add_record(DnsRRecord* record) { _records.push_back(record); }

  void set_status(int status) { _status = status; }

private:
  std::string _domain;
  int _dnstype;
  int _status;
  std::vector<DnsRRecord*> _records;
  int _ttl;
};

/// Issues DNS queries through c-ares and blocks until every reply (or
/// timeout) has been processed. There is no caching: every call goes to the
/// server.
class DnsClient
{
public:
  /// @param dns_servers Up to three server IP addresses. If empty, the system
  ///                    resolver configuration is used.
  DnsClient(const std::vector<std::string>& dns_servers);
  virtual ~DnsClient();

  /// Queries several record types for one domain in parallel. One result is
  /// appended to results per entry in dnstypes, in the same order.
  virtual void dns_query(const std::string& domain,
                         const std::vector<int>& dnstypes,
                         std::vector<DnsResult>& results);

  /// Queries a single record type.
  DnsResult dns_query(const std::string& domain, int dnstype);

  /// Per-query timeout, and the number of tries per server.
  static const int QUERY_TIMEOUT_MS = 2000;
  static const int QUERY_TRIES = 1;

private:
  struct DnsChannel
  {
    ares_channel channel;
    int pending_queries;
  };

  class DnsTsx
  {
  public:
    DnsTsx(DnsChannel* channel, DnsResult* result);
    ~DnsTsx();
    void execute();
    static void ares_callback(void* arg, int status, int timeouts, unsigned char* abuf, int alen);
    void ares_callback(int status, int timeouts, unsigned char* abuf, int alen);

  private:
    DnsChannel* _channel;
    DnsResult* _result;
  };

  DnsChannel* get_dns_channel();
  void wait_for_replies(DnsChannel* channel);
  static void destroy_dns_channel(DnsChannel* channel);

  static int parse_response(DnsResult* result, unsigned char* abuf, int alen);

  struct ares_addr_node _ares_addrs[3];
  std::vector<IP46Address> _dns_servers;

  // Thread-local store of DnsChannels.
  pthread_key_t _thread_local;
};

#endif
