/**
 * @file fake_dns_client.h  DnsClient that answers from canned records.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef FAKE_DNS_CLIENT_H__
#define FAKE_DNS_CLIENT_H__

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "dns_client.h"

/// Answers queries from records added by the test. A query for a domain
/// with no records of the requested type gets ARES_ENODATA if the domain has
/// other records, and ARES_ENOTFOUND otherwise, unless a status has been set
/// explicitly with set_status.
class FakeDnsClient : public DnsClient
{
public:
  typedef std::pair<std::string, int> Query;

  FakeDnsClient() : DnsClient(std::vector<std::string>()) {}

  virtual ~FakeDnsClient()
  {
    for (std::map<Query, std::vector<DnsRRecord*> >::iterator it = _records.begin();
         it != _records.end();
         ++it)
    {
      for (size_t ii = 0; ii < it->second.size(); ii++)
      {
        delete it->second[ii];
      }
    }
  }

  using DnsClient::dns_query;

  virtual void dns_query(const std::string& domain,
                         const std::vector<int>& dnstypes,
                         std::vector<DnsResult>& results)
  {
    for (std::vector<int>::const_iterator type = dnstypes.begin();
         type != dnstypes.end();
         ++type)
    {
      Query query(domain, *type);
      queries.push_back(query);

      std::map<Query, int>::const_iterator status = _statuses.find(query);
      std::map<Query, std::vector<DnsRRecord*> >::const_iterator records =
        _records.find(query);

      if (status != _statuses.end())
      {
        results.push_back(DnsResult(domain, *type, status->second));
      }
      else if (records != _records.end())
      {
        results.push_back(DnsResult(domain, *type, ARES_SUCCESS, records->second, 300));
      }
      else if (has_domain(domain))
      {
        results.push_back(DnsResult(domain, *type, ARES_ENODATA));
      }
      else
      {
        results.push_back(DnsResult(domain, *type, ARES_ENOTFOUND));
      }
    }
  }

  void add_a(const std::string& domain, const std::string& address)
  {
    struct in_addr addr;
    inet_pton(AF_INET, address.c_str(), &addr);
    _records[Query(domain, ns_t_a)].push_back(new DnsARecord(domain, 300, addr));
  }

  void add_aaaa(const std::string& domain, const std::string& address)
  {
    struct in6_addr addr;
    inet_pton(AF_INET6, address.c_str(), &addr);
    _records[Query(domain, ns_t_aaaa)].push_back(new DnsAAAARecord(domain, 300, addr));
  }

  void add_srv(const std::string& domain,
               int priority,
               int weight,
               int port,
               const std::string& target)
  {
    _records[Query(domain, ns_t_srv)].push_back(
      new DnsSrvRecord(domain, 300, priority, weight, port, target));
  }

  /// Makes every query for (domain, dnstype) complete with status.
  void set_status(const std::string& domain, int dnstype, int status)
  {
    _statuses[Query(domain, dnstype)] = status;
  }

  void clear_status(const std::string& domain, int dnstype)
  {
    _statuses.erase(Query(domain, dnstype));
  }

  /// Removes every record for the domain.
  void remove(const std::string& domain)
  {
    std::map<Query, std::vector<DnsRRecord*> >::iterator it = _records.begin();
    while (it != _records.end())
    {
      if (it->first.first == domain)
      {
        for (size_t ii = 0; ii < it->second.size(); ii++)
        {
          delete it->second[ii];
        }
        _records.erase(it++);
      }
      else
      {
        ++it;
      }
    }
  }

  /// Every query issued, in order.
  std::vector<Query> queries;

private:
  bool has_domain(const std::string& domain) const
  {
    for (std::map<Query, std::vector<DnsRRecord*> >::const_iterator it = _records.begin();
         it != _records.end();
         ++it)
    {
      if (it->first.first == domain)
      {
        return true;
      }
    }
    return false;
  }

  std::map<Query, std::vector<DnsRRecord*> > _records;
  std::map<Query, int> _statuses;
};

#endif
