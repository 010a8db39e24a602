/**
 * @file recency_cache.h  Cache of recently resolved addresses for one name.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef RECENCY_CACHE_H__
#define RECENCY_CACHE_H__

#include <time.h>
#include <stdint.h>

#include <functional>
#include <map>
#include <string>
#include <vector>

/// Remembers every address a name has resolved to within the last 30
/// minutes, so that a transient DNS failure (or an answer that has briefly
/// lost an address) doesn't lose candidates that were recently valid.
///
/// Each call to resolve() runs the lookup once, refreshes the addresses it
/// returned, evicts anything not seen for EXPIRY_SECONDS, and hands back the
/// surviving addresses newest-first (by the time they were first seen).
class RecencyCache
{
public:
  /// A lookup returns the current addresses for the name, or throws DnsError.
  typedef std::function<std::vector<std::string>()> Lookup;

  enum ResolveStatus
  {
    RESOLVED,
    LOOKUP_FAILED
  };

  RecencyCache(const std::string& name, Lookup lookup);
  virtual ~RecencyCache();

  /// Runs the lookup and fills addresses with the tracked addresses, newest
  /// first. addresses is filled whatever the status.
  ///
  /// DnsError from the lookup is reported as LOOKUP_FAILED. Any other
  /// exception propagates, but expired entries are still evicted first.
  virtual ResolveStatus resolve(std::vector<std::string>& addresses);

  size_t size() const { return _entries.size(); }

  /// How long an address survives without being seen again.
  static const int EXPIRY_SECONDS = 30 * 60;

private:
  struct Entry
  {
    time_t first_seen;
    time_t last_seen;
    uint64_t sequence;
  };

  typedef std::map<std::string, Entry> Entries;

  void observe(const std::vector<std::string>& addresses, time_t now);
  void expire(time_t now);
  void ordered_addresses(std::vector<std::string>& addresses) const;

  // Evicts expired entries when it goes out of scope.
  class ExpiryGuard
  {
  public:
    ExpiryGuard(RecencyCache* cache) : _cache(cache) {}
    ~ExpiryGuard() { _cache->expire(time(NULL)); }

  private:
    RecencyCache* _cache;
  };

  std::string _name;
  Lookup _lookup;
  Entries _entries;
  uint64_t _next_sequence;
};

#endif
