/**
 * @file srv_resolver.h  Resolves SRV records to target addresses.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef SRV_RESOLVER_H__
#define SRV_RESOLVER_H__

#include <map>
#include <string>
#include <vector>

#include "dns_client.h"
#include "name_resolver.h"
#include "priority_filter.h"

class ServiceRecordResolver
{
public:
  ServiceRecordResolver(DnsClient* dns_client, NameResolver* name_resolver);
  virtual ~ServiceRecordResolver();

  /// Looks up the SRV records for srv_name, drops targets whose priority is
  /// outside the filter, and returns the union of the addresses of the
  /// remaining targets.
  ///
  /// Weights are ignored. Throws DnsError if the SRV query fails, or if every
  /// accepted target fails to resolve.
  virtual std::vector<std::string> resolve(const std::string& srv_name,
                                           const PriorityFilter& filter);

private:
  struct SRV
  {
    std::string target;
    int port;
    int priority;
  };

  /// SRV records grouped by priority, lowest (most preferred) first.
  typedef std::map<int, std::vector<SRV> > SRVPriorityList;

  DnsClient* _dns_client;
  NameResolver* _name_resolver;
};

#endif
