/**
 * @file datastore_probe.cpp
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#include <memory>

#include <libpq-fe.h>

#include "log.h"
#include "utils.h"
#include "datastore_probe.h"

typedef std::unique_ptr<PGconn, void(*)(PGconn*)> PGconnPtr;
typedef std::unique_ptr<PGresult, void(*)(PGresult*)> PGresultPtr;

DatastoreProbe::DatastoreProbe(const DatastoreCredentials& credentials,
                               int connect_timeout_s) :
  _credentials(credentials),
  _connect_timeout_s(connect_timeout_s)
{
}

DatastoreProbe::~DatastoreProbe()
{
}

ProbeResult DatastoreProbe::probe(const std::string& address)
{
  std::string port = std::to_string(_credentials.port);
  std::string connect_timeout = std::to_string(_connect_timeout_s);

  // Bound the query as well as the connect, so a wedged server can't stall
  // the pass.
  std::string options = "-c statement_timeout=" +
                        std::to_string(_connect_timeout_s * 1000);

  // hostaddr skips name resolution: we are testing this exact address.
  const char* keywords[] = {"hostaddr",
                            "port",
                            "user",
                            "password",
                            "dbname",
                            "connect_timeout",
                            "options",
                            "application_name",
                            NULL};
  const char* values[] = {address.c_str(),
                          port.c_str(),
                          _credentials.user.c_str(),
                          _credentials.password.c_str(),
                          _credentials.database.c_str(),
                          connect_timeout.c_str(),
                          options.c_str(),
                          "hostguard",
                          NULL};

  TRC_DEBUG("Probing datastore at %s:%s", address.c_str(), port.c_str());
  uint64_t start_ms = Utils::get_time();

  PGconnPtr conn(PQconnectdbParams(keywords, values, 0), PQfinish);

  if (!conn)
  {
    return ProbeResult::unhealthy("unable to allocate connection");
  }

  if (PQstatus(conn.get()) != CONNECTION_OK)
  {
    std::string error = PQerrorMessage(conn.get());
    Utils::trim(error);
    return ProbeResult::unhealthy("connect failed: " + error);
  }

  PGresultPtr result(PQexec(conn.get(), "SELECT 1"), PQclear);

  if ((!result) || (PQresultStatus(result.get()) != PGRES_TUPLES_OK))
  {
    std::string error = PQerrorMessage(conn.get());
    Utils::trim(error);
    return ProbeResult::unhealthy("query failed: " + error);
  }

  if (PQntuples(result.get()) != 1)
  {
    return ProbeResult::unhealthy("unexpected response to SELECT 1");
  }

  TRC_DEBUG("Datastore at %s healthy (%llu ms)",
            address.c_str(),
            (unsigned long long)(Utils::get_time() - start_ms));

  return ProbeResult::healthy();
}
