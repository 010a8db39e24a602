/**
 * @file dns_client.cpp Synchronous c-ares DNS client.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#include <poll.h>
#include <string.h>

#include "log.h"
#include "dns_client.h"

DnsError::DnsError(const std::string& domain, int status) :
  std::runtime_error("DNS lookup of " + domain + " failed: " + ares_strerror(status)),
  _domain(domain),
  _status(status)
{
}

DnsResult::DnsResult(const std::string& domain,
                     int dnstype,
                     int status) :
  _domain(domain),
  _dnstype(dnstype),
  _status(status),
  _records(),
  _ttl(0)
{
}

DnsResult::DnsResult(const std::string& domain,
                     int dnstype,
                     int status,
                     const std::vector<DnsRRecord*>& records,
                     int ttl) :
  _domain(domain),
  _dnstype(dnstype),
  _status(status),
  _records(),
  _ttl(ttl)
{
  // Clone the records to the result.
  for (std::vector<DnsRRecord*>::const_iterator i = records.begin();
       i != records.end();
       ++i)
  {
    _records.push_back((*i)->clone());
  }
}

DnsResult::DnsResult(const DnsResult &res) :
  _domain(res._domain),
  _dnstype(res._dnstype),
  _status(res._status),
  _records(),
  _ttl(res._ttl)
{
  for (std::vector<DnsRRecord*>::const_iterator i = res._records.begin();
       i != res._records.end();
       ++i)
  {
    _records.push_back((*i)->clone());
  }
}

DnsResult::DnsResult(DnsResult &&res) :
  _domain(res._domain),
  _dnstype(res._dnstype),
  _status(res._status),
  _records(res._records),
  _ttl(res._ttl)
{
  // The records now belong to us.
  res._records.clear();
}

DnsResult::~DnsResult()
{
  while (!_records.empty())
  {
    delete _records.back();
    _records.pop_back();
  }
}

DnsClient::DnsClient(const std::vector<std::string>& dns_servers)
{
  // Initialize the ares library.  This might have already been done by curl
  // but it's safe to do it twice.
  ares_library_init(ARES_LIB_INIT_ALL);

  if (dns_servers.empty())
  {
    TRC_STATUS("Creating DNS client using the system resolver configuration");
  }
  else
  {
    TRC_STATUS("Creating DNS client using servers:");
  }

  for (size_t i = 0; i < dns_servers.size(); i++)
  {
    IP46Address addr;
    if (Utils::parse_ip_target(dns_servers[i], addr))
    {
      TRC_STATUS("    %s", dns_servers[i].c_str());
      _dns_servers.push_back(addr);
    }
    else
    {
      TRC_ERROR("Failed to parse '%s' as IP address - ignoring it", dns_servers[i].c_str());
    }
  }

  if (_dns_servers.size() > 3)
  {
    TRC_WARNING("%d DNS servers provided, only using the first 3", (int)_dns_servers.size());
    _dns_servers.resize(3);
  }

  // Each thread gets its own channel.
  pthread_key_create(&_thread_local, (void(*)(void*))&destroy_dns_channel);
}

DnsClient::~DnsClient()
{
  DnsChannel* channel = (DnsChannel*)pthread_getspecific(_thread_local);
  if (channel != NULL)
  {
    pthread_setspecific(_thread_local, NULL);
    destroy_dns_channel(channel);
  }
  pthread_key_delete(_thread_local);
}

DnsResult DnsClient::dns_query(const std::string& domain, int dnstype)
{
  std::vector<DnsResult> results;
  dns_query(domain, std::vector<int>(1, dnstype), results);

  // One result is always returned per requested type, so front() is safe.
  return results.front();
}

void DnsClient::dns_query(const std::string& domain,
                          const std::vector<int>& dnstypes,
                          std::vector<DnsResult>& results)
{
  // Reserve up front so the DnsTsx pointers into results stay valid.
  size_t first = results.size();
  results.reserve(first + dnstypes.size());

  DnsChannel* channel = get_dns_channel();

  for (std::vector<int>::const_iterator dnstype = dnstypes.begin();
       dnstype != dnstypes.end();
       ++dnstype)
  {
    TRC_VERBOSE("Query %s for %s records",
                domain.c_str(),
                DnsRRecord::rrtype_to_string(*dnstype).c_str());

    if (channel != NULL)
    {
      results.push_back(DnsResult(domain, *dnstype, ARES_ETIMEOUT));
      DnsTsx* tsx = new DnsTsx(channel, &results.back());
      tsx->execute();
    }
    else
    {
      results.push_back(DnsResult(domain, *dnstype, ARES_ECONNREFUSED));
    }
  }

  if (channel != NULL)
  {
    TRC_DEBUG("Wait for query responses");
    wait_for_replies(channel);
    TRC_DEBUG("Received all query responses");
  }

  for (size_t ii = first; ii < results.size(); ii++)
  {
    const DnsResult& result = results[ii];

    if (result.succeeded())
    {
      TRC_DEBUG("%d %s records for %s",
                (int)result.records().size(),
                DnsRRecord::rrtype_to_string(result.dnstype()).c_str(),
                domain.c_str());
    }
    else
    {
      TRC_WARNING("Failed to retrieve %s record for %s: %s",
                  DnsRRecord::rrtype_to_string(result.dnstype()).c_str(),
                  domain.c_str(),
                  ares_strerror(result.status()));
    }
  }
}

/// Parses an answer into the result's records. Returns the status to record
/// against the query.
int DnsClient::parse_response(DnsResult* result, unsigned char* abuf, int alen)
{
  int status;

  if (result->dnstype() == ns_t_a)
  {
    struct ares_addrttl addrttls[32];
    int naddrttls = 32;
    status = ares_parse_a_reply(abuf, alen, NULL, addrttls, &naddrttls);

    if (status == ARES_SUCCESS)
    {
      for (int ii = 0; ii < naddrttls; ii++)
      {
        result->add_record(new DnsARecord(result->domain(),
                                          addrttls[ii].ttl,
                                          addrttls[ii].ipaddr));
      }
    }
  }
  else if (result->dnstype() == ns_t_aaaa)
  {
    struct ares_addr6ttl addrttls[32];
    int naddrttls = 32;
    status = ares_parse_aaaa_reply(abuf, alen, NULL, addrttls, &naddrttls);

    if (status == ARES_SUCCESS)
    {
      for (int ii = 0; ii < naddrttls; ii++)
      {
        struct in6_addr addr;
        memcpy(&addr, &addrttls[ii].ip6addr, sizeof(addr));
        result->add_record(new DnsAAAARecord(result->domain(),
                                             addrttls[ii].ttl,
                                             addr));
      }
    }
  }
  else if (result->dnstype() == ns_t_srv)
  {
    struct ares_srv_reply* srv_out = NULL;
    status = ares_parse_srv_reply(abuf, alen, &srv_out);

    if (status == ARES_SUCCESS)
    {
      for (struct ares_srv_reply* srv = srv_out; srv != NULL; srv = srv->next)
      {
        result->add_record(new DnsSrvRecord(result->domain(),
                                            0,
                                            srv->priority,
                                            srv->weight,
                                            srv->port,
                                            srv->host));
      }
      ares_free_data(srv_out);
    }
  }
  else
  {
    TRC_WARNING("Ignoring %s answer - only A, AAAA and SRV are supported",
                DnsRRecord::rrtype_to_string(result->dnstype()).c_str());
    status = ARES_ENOTIMP;
  }

  return status;
}

/// Waits for replies to outstanding DNS queries on the specified channel.
void DnsClient::wait_for_replies(DnsChannel* channel)
{
  while (channel->pending_queries > 0)
  {
    // Call into ares to get details of the sockets it's using.
    ares_socket_t scks[ARES_GETSOCK_MAXNUM];
    int rw_bits = ares_getsock(channel->channel, scks, ARES_GETSOCK_MAXNUM);

    // Translate these sockets into pollfd structures.
    int num_fds = 0;
    struct pollfd fds[ARES_GETSOCK_MAXNUM];
    for (int fd_idx = 0; fd_idx < ARES_GETSOCK_MAXNUM; fd_idx++)
    {
      struct pollfd* fd = &fds[fd_idx];
      fd->fd = scks[fd_idx];
      fd->events = 0;
      fd->revents = 0;
      if (ARES_GETSOCK_READABLE(rw_bits, fd_idx))
      {
        fd->events |= POLLRDNORM | POLLIN;
      }
      if (ARES_GETSOCK_WRITABLE(rw_bits, fd_idx))
      {
        fd->events |= POLLWRNORM | POLLOUT;
      }
      if (fd->events != 0)
      {
        num_fds++;
      }
    }

    // Calculate the timeout.
    struct timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 0;
    (void)ares_timeout(channel->channel, NULL, &tv);

    if (poll(fds, num_fds, tv.tv_sec * 1000 + tv.tv_usec / 1000) > 0)
    {
      for (int fd_idx = 0; fd_idx < num_fds; fd_idx++)
      {
        struct pollfd* fd = &fds[fd_idx];
        if (fd->revents != 0)
        {
          // ares wants separate read and write descriptors, or
          // ARES_SOCKET_BAD where no event has occurred.
          ares_process_fd(channel->channel,
                          fd->revents & (POLLRDNORM | POLLIN) ? fd->fd : ARES_SOCKET_BAD,
                          fd->revents & (POLLWRNORM | POLLOUT) ? fd->fd : ARES_SOCKET_BAD);
        }
      }
    }
    else
    {
      // No events, so just let ares handle timeouts.
      ares_process_fd(channel->channel, ARES_SOCKET_BAD, ARES_SOCKET_BAD);
    }
  }
}

DnsClient::DnsChannel* DnsClient::get_dns_channel()
{
  DnsChannel* channel = (DnsChannel*)pthread_getspecific(_thread_local);

  if (channel == NULL)
  {
    channel = new DnsChannel;
    channel->pending_queries = 0;
    struct ares_options options;
    memset(&options, 0, sizeof(options));

    options.flags = ARES_FLAG_STAYOPEN;
    options.timeout = QUERY_TIMEOUT_MS;
    options.tries = QUERY_TRIES;

    // Without ARES_OPT_SERVERS c-ares reads /etc/resolv.conf.
    int optmask = ARES_OPT_FLAGS | ARES_OPT_TIMEOUTMS | ARES_OPT_TRIES;
    int rc = ares_init_options(&channel->channel, &options, optmask);

    if (rc != ARES_SUCCESS)
    {
      TRC_ERROR("Failed to initialise DNS channel: %s", ares_strerror(rc));
      delete channel;
      return NULL;
    }

    if (!_dns_servers.empty())
    {
      // Convert our vector of IP46Addresses into the linked list of
      // ares_addr_nodes which ares_set_servers takes.  We must use
      // ares_set_servers rather than the options for IPv6 support.
      for (size_t ii = 0; ii < _dns_servers.size(); ii++)
      {
        const IP46Address& server = _dns_servers[ii];
        struct ares_addr_node* ares_addr = &_ares_addrs[ii];
        memset(ares_addr, 0, sizeof(struct ares_addr_node));
        if (ii > 0)
        {
          _ares_addrs[ii - 1].next = ares_addr;
        }

        ares_addr->family = server.af;
        if (server.af == AF_INET)
        {
          memcpy(&ares_addr->addr.addr4, &server.addr.ipv4, sizeof(ares_addr->addr.addr4));
        }
        else
        {
          memcpy(&ares_addr->addr.addr6, &server.addr.ipv6, sizeof(ares_addr->addr.addr6));
        }
      }

      rc = ares_set_servers(channel->channel, _ares_addrs);
      if (rc != ARES_SUCCESS)
      {
        TRC_ERROR("Failed to set DNS servers: %s", ares_strerror(rc));
      }
    }

    pthread_setspecific(_thread_local, channel);
  }

  return channel;
}

void DnsClient::destroy_dns_channel(DnsChannel* channel)
{
  ares_destroy(channel->channel);
  delete channel;
}

DnsClient::DnsTsx::DnsTsx(DnsChannel* channel, DnsResult* result) :
  _channel(channel),
  _result(result)
{
}

DnsClient::DnsTsx::~DnsTsx()
{
}

void DnsClient::DnsTsx::execute()
{
  // In error cases ares_query can call the callback synchronously, so
  // increment pending_queries first to stop it going negative.
  ++_channel->pending_queries;

  ares_query(_channel->channel,
             _result->domain().c_str(),
             ns_c_in,
             _result->dnstype(),
             DnsTsx::ares_callback,
             this);
}

void DnsClient::DnsTsx::ares_callback(void* arg,
                                      int status,
                                      int timeouts,
                                      unsigned char* abuf,
                                      int alen)
{
  ((DnsTsx*)arg)->ares_callback(status, timeouts, abuf, alen);
}

void DnsClient::DnsTsx::ares_callback(int status, int timeouts, unsigned char* abuf, int alen)
{
  if (status == ARES_SUCCESS)
  {
    status = DnsClient::parse_response(_result, abuf, alen);
  }

  _result->set_status(status);
  --_channel->pending_queries;
  delete this;
}
