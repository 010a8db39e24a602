/**
 * @file datastore_probe.h  Health probe for the SQL datastore.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef DATASTORE_PROBE_H__
#define DATASTORE_PROBE_H__

#include <string>

#include "health_probe.h"

struct DatastoreCredentials
{
  std::string user;
  std::string password;
  std::string database;
  int port;

  DatastoreCredentials() : port(5432) {}
};

/// Connects to a PostgreSQL server at the candidate address with the
/// configured credentials and runs "SELECT 1".
class DatastoreProbe : public HealthProbe
{
public:
  DatastoreProbe(const DatastoreCredentials& credentials,
                 int connect_timeout_s = DEFAULT_CONNECT_TIMEOUT_S);
  virtual ~DatastoreProbe();

  virtual ProbeResult probe(const std::string& address);
  virtual std::string protocol() const { return "datastore"; }

  static const int DEFAULT_CONNECT_TIMEOUT_S = 2;

private:
  DatastoreCredentials _credentials;
  int _connect_timeout_s;
};

#endif
