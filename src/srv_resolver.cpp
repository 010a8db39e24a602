/**
 * @file srv_resolver.cpp  Resolves SRV records to target addresses.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#include <algorithm>
#include <set>

#include "log.h"
#include "srv_resolver.h"

ServiceRecordResolver::ServiceRecordResolver(DnsClient* dns_client,
                                             NameResolver* name_resolver) :
  _dns_client(dns_client),
  _name_resolver(name_resolver)
{
}

ServiceRecordResolver::~ServiceRecordResolver()
{
}

std::vector<std::string> ServiceRecordResolver::resolve(const std::string& srv_name,
                                                        const PriorityFilter& filter)
{
  DnsResult result = _dns_client->dns_query(srv_name, ns_t_srv);

  if (!result.succeeded())
  {
    throw DnsError(srv_name, result.status());
  }

  TRC_DEBUG("SRV query for %s returned %d records",
            srv_name.c_str(), (int)result.records().size());

  // Arrange the accepted records into a priority list.
  SRVPriorityList srv_list;

  for (std::vector<DnsRRecord*>::const_iterator i = result.records().begin();
       i != result.records().end();
       ++i)
  {
    if ((*i)->rrtype() != ns_t_srv)
    {
      continue;
    }

    DnsSrvRecord* srv_record = (DnsSrvRecord*)(*i);

    if (!filter.within_threshold(srv_record->priority()))
    {
      TRC_DEBUG("Ignoring SRV target %s with priority %d outside %s",
                srv_record->target().c_str(),
                srv_record->priority(),
                filter.to_string().c_str());
      continue;
    }

    std::vector<SRV>& plist = srv_list[srv_record->priority()];
    plist.push_back(SRV());
    SRV& srv = plist.back();
    srv.target = srv_record->target();
    srv.port = srv_record->port();
    srv.priority = srv_record->priority();
  }

  std::vector<std::string> addresses;
  std::set<std::string> resolved_targets;
  int targets_resolved = 0;
  int targets_failed = 0;
  int last_failure = ARES_SUCCESS;

  for (SRVPriorityList::const_iterator p = srv_list.begin();
       p != srv_list.end();
       ++p)
  {
    for (std::vector<SRV>::const_iterator srv = p->second.begin();
         srv != p->second.end();
         ++srv)
    {
      if (!resolved_targets.insert(srv->target).second)
      {
        // Already resolved this target at a better priority.
        continue;
      }

      try
      {
        std::vector<std::string> target_addresses = _name_resolver->resolve(srv->target);
        ++targets_resolved;

        for (std::vector<std::string>::const_iterator a = target_addresses.begin();
             a != target_addresses.end();
             ++a)
        {
          if (std::find(addresses.begin(), addresses.end(), *a) == addresses.end())
          {
            addresses.push_back(*a);
          }
        }
      }
      catch (DnsError& e)
      {
        TRC_WARNING("Skipping SRV target %s of %s: %s",
                    srv->target.c_str(), srv_name.c_str(), e.what());
        ++targets_failed;
        last_failure = e.status();
      }
    }
  }

  if ((targets_resolved == 0) && (targets_failed > 0))
  {
    throw DnsError(srv_name, last_failure);
  }

  TRC_DEBUG("SRV %s resolved to [%s]",
            srv_name.c_str(),
            Utils::join(addresses, ", ").c_str());

  return addresses;
}
