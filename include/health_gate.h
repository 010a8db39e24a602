/**
 * @file health_gate.h  Selects the newest healthy address for a name.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef HEALTH_GATE_H__
#define HEALTH_GATE_H__

#include <string>

#include "recency_cache.h"
#include "health_probe.h"

class HealthGate
{
public:
  /// Where a selected address came from.
  enum Source
  {
    FRESH,          // a current candidate just passed its probe
    STICKY,         // no candidate passed; this is the last one that did
    NONE,           // no candidate has ever passed
    UNRESOLVABLE    // as NONE, but there were no candidates because the lookup failed
  };

  struct Selection
  {
    std::string address;
    Source source;

    bool found() const { return !address.empty(); }
  };

  HealthGate(const std::string& name, RecencyCache* cache, HealthProbe* probe);
  virtual ~HealthGate();

  /// Resolves candidates through the cache and probes them newest-first,
  /// stopping at the first healthy one. Once any address has passed, the
  /// returned address is never empty again.
  virtual Selection first_healthy();

  const std::string& last_healthy() const { return _last_healthy; }

  static const char* source_to_string(Source source);

private:
  std::string _name;
  RecencyCache* _cache;
  HealthProbe* _probe;
  std::string _last_healthy;
};

#endif
