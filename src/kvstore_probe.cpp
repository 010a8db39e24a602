/**
 * @file kvstore_probe.cpp
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#include <errno.h>
#include <stdint.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <string.h>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/types.h>

#include <memory>

#include <libmemcached/memcached.h>
#include <openssl/ssl.h>
#include <openssl/err.h>

#include "log.h"
#include "utils.h"
#include "kvstore_probe.h"

typedef std::unique_ptr<memcached_st, void(*)(memcached_st*)> MemcachedPtr;

/// Key used for the text-protocol authentication "set". The server never
/// stores it.
static const char* const AUTH_KEY = "hostguard";

/// Longest reply line we are prepared to read.
static const size_t MAX_REPLY_LENGTH = 4096;

namespace
{

std::string openssl_error()
{
  unsigned long code = ERR_get_error();
  if (code == 0)
  {
    return "unknown TLS error";
  }

  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  return buf;
}

/// A TLS connection to a single server. Everything it holds is released on
/// destruction, whichever way the probe exits.
class TlsConnection
{
public:
  TlsConnection(int timeout_ms) :
    _timeout_ms(timeout_ms),
    _fd(-1),
    _ctx(NULL),
    _ssl(NULL)
  {
  }

  ~TlsConnection()
  {
    if (_ssl != NULL)
    {
      SSL_shutdown(_ssl);
      SSL_free(_ssl);
    }

    if (_ctx != NULL)
    {
      SSL_CTX_free(_ctx);
    }

    if (_fd >= 0)
    {
      close(_fd);
    }
  }

  bool connect(const std::string& address, int port, std::string& error)
  {
    return (tcp_connect(address, port, error) && tls_handshake(error));
  }

  bool send(const std::string& data, std::string& error)
  {
    int rc = SSL_write(_ssl, data.data(), (int)data.size());
    if (rc <= 0)
    {
      error = "write failed: " + openssl_error();
      return false;
    }
    return true;
  }

  /// Reads one CRLF-terminated line, without the CRLF.
  bool read_line(std::string& line, std::string& error)
  {
    size_t eol;
    while ((eol = _buffer.find("\r\n")) == std::string::npos)
    {
      if (_buffer.size() > MAX_REPLY_LENGTH)
      {
        error = "reply too long";
        return false;
      }

      char buf[512];
      int rc = SSL_read(_ssl, buf, sizeof(buf));
      if (rc <= 0)
      {
        error = "read failed: " + openssl_error();
        return false;
      }
      _buffer.append(buf, rc);
    }

    line = _buffer.substr(0, eol);
    _buffer.erase(0, eol + 2);
    return true;
  }

private:
  bool tcp_connect(const std::string& address, int port, std::string& error)
  {
    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICHOST | AI_NUMERICSERV;

    struct addrinfo* ai = NULL;
    std::string port_str = std::to_string(port);
    int rc = getaddrinfo(address.c_str(), port_str.c_str(), &hints, &ai);
    if (rc != 0)
    {
      error = std::string("bad address: ") + gai_strerror(rc);
      return false;
    }
    std::unique_ptr<struct addrinfo, void(*)(struct addrinfo*)> ai_ptr(ai, freeaddrinfo);

    _fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (_fd < 0)
    {
      error = std::string("socket failed: ") + strerror(errno);
      return false;
    }

    // Connect without blocking so the connect timeout can be enforced.
    int flags = fcntl(_fd, F_GETFL, 0);
    fcntl(_fd, F_SETFL, flags | O_NONBLOCK);

    rc = ::connect(_fd, ai->ai_addr, ai->ai_addrlen);
    if ((rc < 0) && (errno != EINPROGRESS))
    {
      error = std::string("connect failed: ") + strerror(errno);
      return false;
    }

    if (rc < 0)
    {
      struct pollfd pfd;
      pfd.fd = _fd;
      pfd.events = POLLOUT;
      pfd.revents = 0;

      rc = poll(&pfd, 1, _timeout_ms);
      if (rc == 0)
      {
        error = "connect timed out";
        return false;
      }
      else if (rc < 0)
      {
        error = std::string("poll failed: ") + strerror(errno);
        return false;
      }

      int so_error = 0;
      socklen_t len = sizeof(so_error);
      getsockopt(_fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
      if (so_error != 0)
      {
        error = std::string("connect failed: ") + strerror(so_error);
        return false;
      }
    }

    // Back to blocking, with timeouts on every read and write.
    fcntl(_fd, F_SETFL, flags);
    struct timeval tv;
    tv.tv_sec = _timeout_ms / 1000;
    tv.tv_usec = (_timeout_ms % 1000) * 1000;
    setsockopt(_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    return true;
  }

  bool tls_handshake(std::string& error)
  {
    _ctx = SSL_CTX_new(TLS_client_method());
    if (_ctx == NULL)
    {
      error = "SSL_CTX_new failed: " + openssl_error();
      return false;
    }

    // Servers are addressed by IP and typically carry certificates for their
    // hostname, so the certificate is not verified.
    SSL_CTX_set_verify(_ctx, SSL_VERIFY_NONE, NULL);

    _ssl = SSL_new(_ctx);
    if (_ssl == NULL)
    {
      error = "SSL_new failed: " + openssl_error();
      return false;
    }

    SSL_set_fd(_ssl, _fd);

    if (SSL_connect(_ssl) != 1)
    {
      error = "TLS handshake failed: " + openssl_error();
      return false;
    }

    return true;
  }

  int _timeout_ms;
  int _fd;
  SSL_CTX* _ctx;
  SSL* _ssl;
  std::string _buffer;
};

} // namespace

KeyValueStoreProbe::KeyValueStoreProbe(const KvStoreCredentials& credentials,
                                       int timeout_ms) :
  _credentials(credentials),
  _timeout_ms(timeout_ms)
{
}

KeyValueStoreProbe::~KeyValueStoreProbe()
{
}

ProbeResult KeyValueStoreProbe::probe(const std::string& address)
{
  TRC_DEBUG("Probing key-value store at %s:%d%s",
            address.c_str(),
            _credentials.port,
            _credentials.tls ? " (TLS)" : "");

  return (_credentials.tls) ? probe_tls(address) : probe_plain(address);
}

std::string KeyValueStoreProbe::auth_command(const std::string& username,
                                             const std::string& password)
{
  std::string data = username + " " + password;
  return std::string("set ") + AUTH_KEY + " 0 0 " + std::to_string(data.size()) +
         "\r\n" + data + "\r\n";
}

ProbeResult KeyValueStoreProbe::probe_plain(const std::string& address)
{
  MemcachedPtr conn(memcached_create(NULL), memcached_free);

  if (!conn)
  {
    return ProbeResult::unhealthy("unable to allocate connection");
  }

  memcached_behavior_set(conn.get(),
                         MEMCACHED_BEHAVIOR_CONNECT_TIMEOUT,
                         _timeout_ms);
  memcached_behavior_set(conn.get(),
                         MEMCACHED_BEHAVIOR_POLL_TIMEOUT,
                         _timeout_ms);

  // Send and receive timeouts are in microseconds.
  memcached_behavior_set(conn.get(),
                         MEMCACHED_BEHAVIOR_SND_TIMEOUT,
                         _timeout_ms * 1000);
  memcached_behavior_set(conn.get(),
                         MEMCACHED_BEHAVIOR_RCV_TIMEOUT,
                         _timeout_ms * 1000);
  memcached_behavior_set(conn.get(),
                         MEMCACHED_BEHAVIOR_TCP_NODELAY,
                         true);

  memcached_return_t rc;

  if (_credentials.authenticates())
  {
    // SASL is only available over the binary protocol.
    memcached_behavior_set(conn.get(),
                           MEMCACHED_BEHAVIOR_BINARY_PROTOCOL,
                           true);
    rc = memcached_set_sasl_auth_data(conn.get(),
                                      _credentials.username.c_str(),
                                      _credentials.password.c_str());
    if (!memcached_success(rc))
    {
      return ProbeResult::unhealthy(std::string("failed to set credentials: ") +
                                    memcached_strerror(conn.get(), rc));
    }
  }

  rc = memcached_server_add(conn.get(), address.c_str(), _credentials.port);
  if (!memcached_success(rc))
  {
    return ProbeResult::unhealthy(std::string("bad server address: ") +
                                  memcached_strerror(conn.get(), rc));
  }

  rc = memcached_version(conn.get());
  if (!memcached_success(rc))
  {
    return ProbeResult::unhealthy(std::string("version request failed: ") +
                                  memcached_strerror(conn.get(), rc));
  }

  memcached_server_instance_st instance =
    memcached_server_instance_by_position(conn.get(), 0);

  if ((instance == NULL) ||
      (memcached_server_major_version(instance) == UINT8_MAX))
  {
    return ProbeResult::unhealthy("server did not report a version");
  }

  return ProbeResult::healthy();
}

ProbeResult KeyValueStoreProbe::probe_tls(const std::string& address)
{
  TlsConnection conn(_timeout_ms);
  std::string error;
  std::string line;

  if (!conn.connect(address, _credentials.port, error))
  {
    return ProbeResult::unhealthy(error);
  }

  if (_credentials.authenticates())
  {
    if ((!conn.send(auth_command(_credentials.username, _credentials.password), error)) ||
        (!conn.read_line(line, error)))
    {
      return ProbeResult::unhealthy("authentication failed: " + error);
    }

    if (line != "STORED")
    {
      return ProbeResult::unhealthy("authentication rejected: " + line);
    }
  }

  if ((!conn.send("version\r\n", error)) ||
      (!conn.read_line(line, error)))
  {
    return ProbeResult::unhealthy("version request failed: " + error);
  }

  if (line.compare(0, 8, "VERSION ") != 0)
  {
    return ProbeResult::unhealthy("unexpected reply: " + line);
  }

  TRC_DEBUG("Key-value store at %s reports %s", address.c_str(), line.c_str());
  return ProbeResult::healthy();
}
