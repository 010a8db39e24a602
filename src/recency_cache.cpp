/**
 * @file recency_cache.cpp
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
#include "utils.h"
#include "dns_client.h"
#include "recency_cache.h"

RecencyCache::RecencyCache(const std::string& name, Lookup lookup) :
  _name(name),
  _lookup(lookup),
  _entries(),
  _next_sequence(0)
{
}

RecencyCache::~RecencyCache()
{
}

RecencyCache::ResolveStatus RecencyCache::resolve(std::vector<std::string>& addresses)
{
  ResolveStatus status = RESOLVED;

  {
    ExpiryGuard guard(this);

    try
    {
      std::vector<std::string> found = _lookup();
      observe(found, time(NULL));
    }
    catch (DnsError& e)
    {
      TRC_WARNING("Lookup for %s failed, using cached addresses: %s",
                  _name.c_str(), e.what());
      status = LOOKUP_FAILED;
    }
  }

  ordered_addresses(addresses);

  TRC_DEBUG("Candidates for %s: [%s]",
            _name.c_str(),
            Utils::join(addresses, ", ").c_str());

  return status;
}

void RecencyCache::observe(const std::vector<std::string>& addresses, time_t now)
{
  for (std::vector<std::string>::const_iterator address = addresses.begin();
       address != addresses.end();
       ++address)
  {
    Entries::iterator entry = _entries.find(*address);

    if (entry != _entries.end())
    {
      entry->second.last_seen = now;
    }
    else
    {
      TRC_INFO("New address %s for %s", address->c_str(), _name.c_str());
      Entry new_entry;
      new_entry.first_seen = now;
      new_entry.last_seen = now;
      new_entry.sequence = _next_sequence++;
      _entries[*address] = new_entry;
    }
  }
}

void RecencyCache::expire(time_t now)
{
  Entries::iterator entry = _entries.begin();

  while (entry != _entries.end())
  {
    if (now - entry->second.last_seen > EXPIRY_SECONDS)
    {
      TRC_INFO("Evicting %s for %s - not seen for %d seconds",
               entry->first.c_str(),
               _name.c_str(),
               (int)(now - entry->second.last_seen));
      _entries.erase(entry++);
    }
    else
    {
      ++entry;
    }
  }
}

void RecencyCache::ordered_addresses(std::vector<std::string>& addresses) const
{
  std::vector<std::pair<const Entry*, const std::string*> > ordered;

  for (Entries::const_iterator entry = _entries.begin();
       entry != _entries.end();
       ++entry)
  {
    ordered.push_back(std::make_pair(&entry->second, &entry->first));
  }

  // Newest first, with addresses first seen together kept in the order they
  // were observed.
  std::sort(ordered.begin(),
            ordered.end(),
            [](const std::pair<const Entry*, const std::string*>& lhs,
               const std::pair<const Entry*, const std::string*>& rhs)
            {
              if (lhs.first->first_seen != rhs.first->first_seen)
              {
                return lhs.first->first_seen > rhs.first->first_seen;
              }
              return lhs.first->sequence < rhs.first->sequence;
            });

  addresses.clear();
  for (size_t ii = 0; ii < ordered.size(); ii++)
  {
    addresses.push_back(*ordered[ii].second);
  }
}
