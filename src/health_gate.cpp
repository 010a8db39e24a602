/**
 * @file health_gate.cpp
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#include <vector>

#include "log.h"
#include "candidate_iterator.h"
#include "health_gate.h"

HealthGate::HealthGate(const std::string& name,
                       RecencyCache* cache,
                       HealthProbe* probe) :
  _name(name),
  _cache(cache),
  _probe(probe),
  _last_healthy()
{
}

HealthGate::~HealthGate()
{
}

HealthGate::Selection HealthGate::first_healthy()
{
  std::vector<std::string> candidates;
  RecencyCache::ResolveStatus status = _cache->resolve(candidates);

  Selection selection;
  SimpleCandidateIterator iter(candidates);
  std::string candidate;

  while (iter.next(candidate))
  {
    ProbeResult result = _probe->probe(candidate);

    if (result.is_healthy())
    {
      if (candidate != _last_healthy)
      {
        TRC_STATUS("%s: %s is healthy, replacing %s",
                   _name.c_str(),
                   candidate.c_str(),
                   _last_healthy.empty() ? "nothing" : _last_healthy.c_str());
      }

      _last_healthy = candidate;
      selection.address = candidate;
      selection.source = FRESH;
      return selection;
    }

    TRC_INFO("%s: %s failed %s health check: %s",
             _name.c_str(),
             candidate.c_str(),
             _probe->protocol().c_str(),
             result.reason().c_str());
  }

  selection.address = _last_healthy;

  if (!_last_healthy.empty())
  {
    TRC_WARNING("%s: no healthy candidate among %d, keeping %s",
                _name.c_str(), (int)candidates.size(), _last_healthy.c_str());
    selection.source = STICKY;
  }
  else if ((candidates.empty()) && (status == RecencyCache::LOOKUP_FAILED))
  {
    TRC_ERROR("%s: cannot be resolved and has no cached addresses", _name.c_str());
    selection.source = UNRESOLVABLE;
  }
  else
  {
    TRC_ERROR("%s: no healthy address among %d candidates",
              _name.c_str(), (int)candidates.size());
    selection.source = NONE;
  }

  return selection;
}

const char* HealthGate::source_to_string(Source source)
{
  switch (source)
  {
    case FRESH: return "fresh";
    case STICKY: return "sticky";
    case NONE: return "none";
    case UNRESOLVABLE: return "unresolvable";
    default:
      break;
  }
  return "unknown";
}
