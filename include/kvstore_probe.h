/**
 * @file kvstore_probe.h  Health probe for the memcached key-value store.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef KVSTORE_PROBE_H__
#define KVSTORE_PROBE_H__

#include <string>

#include "health_probe.h"

struct KvStoreCredentials
{
  std::string username;
  std::string password;
  int port;
  bool tls;

  KvStoreCredentials() : port(11211), tls(false) {}

  /// Memcached authenticates a user, not a bare password, so nothing is
  /// sent without a username.
  bool authenticates() const { return !username.empty(); }
};

/// Checks a memcached-protocol server is alive by asking for its version.
///
/// Plain connections go through libmemcached, authenticating with SASL (over
/// the binary protocol) when a username is configured. TLS connections are
/// made directly with OpenSSL, without certificate verification, and use the
/// text protocol's "set"-based authentication.
class KeyValueStoreProbe : public HealthProbe
{
public:
  KeyValueStoreProbe(const KvStoreCredentials& credentials,
                     int timeout_ms = DEFAULT_TIMEOUT_MS);
  virtual ~KeyValueStoreProbe();

  virtual ProbeResult probe(const std::string& address);
  virtual std::string protocol() const { return "key-value store"; }

  static const int DEFAULT_TIMEOUT_MS = 1000;

  /// Builds the text-protocol command that authenticates a connection.
  static std::string auth_command(const std::string& username,
                                  const std::string& password);

private:
  ProbeResult probe_plain(const std::string& address);
  ProbeResult probe_tls(const std::string& address);

  KvStoreCredentials _credentials;
  int _timeout_ms;
};

#endif
