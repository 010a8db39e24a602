/**
 * @file health_probe.h  Interface for protocol-specific reachability checks.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef HEALTH_PROBE_H__
#define HEALTH_PROBE_H__

#include <string>

/// Outcome of a single probe. A failed probe is an expected result, not an
/// error, so it is returned rather than thrown.
class ProbeResult
{
public:
  static ProbeResult healthy()
  {
    return ProbeResult(true, "");
  }

  static ProbeResult unhealthy(const std::string& reason)
  {
    return ProbeResult(false, reason);
  }

  bool is_healthy() const { return _healthy; }
  const std::string& reason() const { return _reason; }

private:
  ProbeResult(bool healthy, const std::string& reason) :
    _healthy(healthy),
    _reason(reason)
  {
  }

  bool _healthy;
  std::string _reason;
};

class HealthProbe
{
public:
  virtual ~HealthProbe() {}

  /// Opens a fresh connection to address, performs a minimal roundtrip and
  /// closes the connection again. Must not throw, and must not block beyond
  /// the probe's own timeouts.
  virtual ProbeResult probe(const std::string& address) = 0;

  /// Short name of the protocol, for logs.
  virtual std::string protocol() const = 0;
};

#endif
