/**
 * @file monitored_variable.h
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef MONITORED_VARIABLE_H__
#define MONITORED_VARIABLE_H__

#include <memory>
#include <string>

#include "hostguard_config.h"
#include "name_resolver.h"
#include "srv_resolver.h"
#include "recency_cache.h"
#include "health_gate.h"

/// The per-variable state kept across passes: the recency cache of
/// candidate addresses and the health gate that picks between them.
class MonitoredVariable
{
public:
  /// Takes ownership of cache and gate. gate must refer to cache.
  MonitoredVariable(const std::string& name,
                    const std::string& hostname,
                    RecencyCache* cache,
                    HealthGate* gate);
  ~MonitoredVariable();

  /// Builds a variable whose cache looks up config's hostname, or its SRV
  /// name when one is configured, and whose gate checks candidates with
  /// probe. The resolvers and probe are not owned and must outlive it.
  static MonitoredVariable* create(const MonitoredVariableConfig& config,
                                   NameResolver* name_resolver,
                                   ServiceRecordResolver* srv_resolver,
                                   HealthProbe* probe);

  const std::string& name() const { return _name; }
  const std::string& hostname() const { return _hostname; }
  HealthGate* gate() const { return _gate.get(); }

private:
  std::string _name;
  std::string _hostname;
  std::unique_ptr<RecencyCache> _cache;
  std::unique_ptr<HealthGate> _gate;
};

#endif
