/**
 * @file name_resolver.h  Resolves hostnames to IPv4 and IPv6 addresses.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef NAME_RESOLVER_H__
#define NAME_RESOLVER_H__

#include <string>
#include <vector>

#include "dns_client.h"

class NameResolver
{
public:
  NameResolver(DnsClient* dns_client);
  virtual ~NameResolver();

  /// Looks up the A and AAAA records for a hostname in parallel and returns
  /// the distinct addresses found (IPv4 first). The result may be empty.
  ///
  /// Throws DnsError with the status of the first failed lookup if either
  /// family fails. A family with no records (ENODATA) is not a failure.
  virtual std::vector<std::string> resolve(const std::string& hostname);

private:
  DnsClient* _dns_client;
};

#endif
