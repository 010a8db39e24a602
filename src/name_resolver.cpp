/**
 * @file name_resolver.cpp  Resolves hostnames to IPv4 and IPv6 addresses.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#include <algorithm>

#include "log.h"
#include "name_resolver.h"

NameResolver::NameResolver(DnsClient* dns_client) :
  _dns_client(dns_client)
{
}

NameResolver::~NameResolver()
{
}

std::vector<std::string> NameResolver::resolve(const std::string& hostname)
{
  std::vector<int> dnstypes;
  dnstypes.push_back(ns_t_a);
  dnstypes.push_back(ns_t_aaaa);

  std::vector<DnsResult> results;
  _dns_client->dns_query(hostname, dnstypes, results);

  std::vector<std::string> addresses;

  for (std::vector<DnsResult>::const_iterator result = results.begin();
       result != results.end();
       ++result)
  {
    if (!result->succeeded())
    {
      // ENODATA counts as success, so this is a real error.
      TRC_INFO("%s lookup of %s failed: %s",
               DnsRRecord::rrtype_to_string(result->dnstype()).c_str(),
               hostname.c_str(),
               ares_strerror(result->status()));
      throw DnsError(hostname, result->status());
    }

    for (std::vector<DnsRRecord*>::const_iterator rr = result->records().begin();
         rr != result->records().end();
         ++rr)
    {
      if (((*rr)->rrtype() != ns_t_a) && ((*rr)->rrtype() != ns_t_aaaa))
      {
        continue;
      }

      std::string address = ((DnsAddressRecord*)(*rr))->address_str();

      if ((!address.empty()) &&
          (std::find(addresses.begin(), addresses.end(), address) == addresses.end()))
      {
        addresses.push_back(address);
      }
    }
  }

  TRC_DEBUG("Resolved %s to [%s]",
            hostname.c_str(),
            Utils::join(addresses, ", ").c_str());

  return addresses;
}
