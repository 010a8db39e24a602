/**
 * @file dnsrrecords.h  The DNS resource records hostguard understands.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef DNSRRECORDS_H__
#define DNSRRECORDS_H__

#include <string>

#include <netinet/in.h>
#include <arpa/inet.h>
#include <arpa/nameser.h>

/// A record from an answer section. Only A, AAAA and SRV are ever built.
class DnsRRecord
{
public:
  DnsRRecord(const std::string& rrname, int rrtype, int ttl) :
    _rrname(rrname), _rrtype(rrtype), _ttl(ttl) {}
  virtual ~DnsRRecord() {}

  const std::string& rrname() const { return _rrname; }
  int rrtype() const { return _rrtype; }
  int ttl() const { return _ttl; }

  virtual DnsRRecord* clone() const = 0;

  /// Name of a query type, for logs.
  static std::string rrtype_to_string(int rrtype)
  {
    return (rrtype == ns_t_a) ? "A" :
           (rrtype == ns_t_aaaa) ? "AAAA" :
           (rrtype == ns_t_srv) ? "SRV" : "type " + std::to_string(rrtype);
  }

private:
  std::string _rrname;
  int _rrtype;
  int _ttl;
};

/// An A or AAAA record.
class DnsAddressRecord : public DnsRRecord
{
public:
  DnsAddressRecord(const std::string& rrname, int rrtype, int ttl) :
    DnsRRecord(rrname, rrtype, ttl) {}

  /// The address as an IP literal, e.g. "10.0.0.1" or "fd00::1".
  virtual std::string address_str() const = 0;

protected:
  static std::string ntop(int af, const void* address)
  {
    char buf[INET6_ADDRSTRLEN];
    return (inet_ntop(af, address, buf, sizeof(buf)) != NULL) ? buf : "";
  }
};

class DnsARecord : public DnsAddressRecord
{
public:
  DnsARecord(const std::string& rrname, int ttl, const struct in_addr& address) :
    DnsAddressRecord(rrname, ns_t_a, ttl), _address(address) {}

  const struct in_addr& address() const { return _address; }
  DnsARecord* clone() const { return new DnsARecord(*this); }
  std::string address_str() const { return ntop(AF_INET, &_address); }

private:
  struct in_addr _address;
};

class DnsAAAARecord : public DnsAddressRecord
{
public:
  DnsAAAARecord(const std::string& rrname, int ttl, const struct in6_addr& address) :
    DnsAddressRecord(rrname, ns_t_aaaa, ttl), _address(address) {}

  const struct in6_addr& address() const { return _address; }
  DnsAAAARecord* clone() const { return new DnsAAAARecord(*this); }
  std::string address_str() const { return ntop(AF_INET6, &_address); }

private:
  struct in6_addr _address;
};

/// An SRV record. The target is a hostname still to be resolved.
class DnsSrvRecord : public DnsRRecord
{
public:
  DnsSrvRecord(const std::string& rrname,
               int ttl,
               int priority,
               int weight,
               int port,
               const std::string& target) :
    DnsRRecord(rrname, ns_t_srv, ttl),
    _priority(priority),
    _weight(weight),
    _port(port),
    _target(target)
  {
  }

  int priority() const { return _priority; }
  int weight() const { return _weight; }
  int port() const { return _port; }
  const std::string& target() const { return _target; }

  DnsSrvRecord* clone() const { return new DnsSrvRecord(*this); }

private:
  int _priority;
  int _weight;
  int _port;
  std::string _target;
};

#endif
