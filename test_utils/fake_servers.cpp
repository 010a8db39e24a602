/**
 * @file fake_servers.cpp
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <stdint.h>
#include <string.h>
#include <unistd.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/x509.h>

#include "fake_servers.h"

LoopbackServer::LoopbackServer() :
  _listen_fd(-1),
  _port(0),
  _running(false),
  _started(false)
{
  pthread_mutex_init(&_lock, NULL);
}

LoopbackServer::~LoopbackServer()
{
  stop();
  pthread_mutex_destroy(&_lock);
}

bool LoopbackServer::start()
{
  // A client hanging up mid-reply must not kill the test run.
  signal(SIGPIPE, SIG_IGN);

  _listen_fd = socket(AF_INET, SOCK_STREAM, 0);
  if (_listen_fd < 0)
  {
    return false;
  }

  int on = 1;
  setsockopt(_listen_fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));

  struct sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;

  socklen_t len = sizeof(addr);
  if ((bind(_listen_fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) ||
      (listen(_listen_fd, 4) < 0) ||
      (getsockname(_listen_fd, (struct sockaddr*)&addr, &len) < 0))
  {
    close(_listen_fd);
    _listen_fd = -1;
    return false;
  }

  _port = ntohs(addr.sin_port);

  _running = true;
  if (pthread_create(&_thread, NULL, &LoopbackServer::thread_fn, this) != 0)
  {
    _running = false;
    return false;
  }

  _started = true;
  return true;
}

void LoopbackServer::stop()
{
  pthread_mutex_lock(&_lock);
  _running = false;
  pthread_mutex_unlock(&_lock);

  if (_started)
  {
    pthread_join(_thread, NULL);
    _started = false;
  }

  if (_listen_fd >= 0)
  {
    close(_listen_fd);
    _listen_fd = -1;
  }
}

std::vector<std::string> LoopbackServer::received()
{
  pthread_mutex_lock(&_lock);
  std::vector<std::string> copy = _received;
  pthread_mutex_unlock(&_lock);
  return copy;
}

void LoopbackServer::record(const std::string& item)
{
  pthread_mutex_lock(&_lock);
  _received.push_back(item);
  pthread_mutex_unlock(&_lock);
}

bool LoopbackServer::running()
{
  pthread_mutex_lock(&_lock);
  bool running = _running;
  pthread_mutex_unlock(&_lock);
  return running;
}

bool LoopbackServer::send_all(int fd, const std::string& data)
{
  size_t sent = 0;
  while (sent < data.size())
  {
    ssize_t rc = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (rc <= 0)
    {
      return false;
    }
    sent += rc;
  }
  return true;
}

bool LoopbackServer::read_exact(int fd, char* buf, size_t len)
{
  size_t got = 0;
  while (got < len)
  {
    ssize_t rc = recv(fd, buf + got, len - got, 0);
    if (rc <= 0)
    {
      return false;
    }
    got += rc;
  }
  return true;
}

void* LoopbackServer::thread_fn(void* server)
{
  ((LoopbackServer*)server)->accept_loop();
  return NULL;
}

void LoopbackServer::accept_loop()
{
  while (running())
  {
    struct pollfd pfd;
    pfd.fd = _listen_fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    if ((poll(&pfd, 1, 50) <= 0) || !(pfd.revents & POLLIN))
    {
      continue;
    }

    int fd = accept(_listen_fd, NULL, NULL);
    if (fd < 0)
    {
      continue;
    }

    // A client that goes quiet can't wedge the server.
    struct timeval tv;
    tv.tv_sec = 2;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    serve(fd);
    close(fd);
  }
}

// A context with a freshly generated P-256 key and a self-signed
// certificate for it, valid for an hour either side of now.
static SSL_CTX* self_signed_context()
{
  SSL_CTX* ctx = SSL_CTX_new(TLS_server_method());
  if (ctx == NULL)
  {
    return NULL;
  }

  EVP_PKEY* pkey = NULL;
  EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_EC, NULL);
  if ((pctx == NULL) ||
      (EVP_PKEY_keygen_init(pctx) <= 0) ||
      (EVP_PKEY_CTX_set_ec_paramgen_curve_nid(pctx, NID_X9_62_prime256v1) <= 0) ||
      (EVP_PKEY_keygen(pctx, &pkey) <= 0))
  {
    EVP_PKEY_CTX_free(pctx);
    SSL_CTX_free(ctx);
    return NULL;
  }
  EVP_PKEY_CTX_free(pctx);

  X509* cert = X509_new();
  X509_set_version(cert, 2);
  ASN1_INTEGER_set(X509_get_serialNumber(cert), 1);
  X509_gmtime_adj(X509_getm_notBefore(cert), -3600);
  X509_gmtime_adj(X509_getm_notAfter(cert), 3600);
  X509_set_pubkey(cert, pkey);

  X509_NAME* name = X509_get_subject_name(cert);
  X509_NAME_add_entry_by_txt(name,
                             "CN",
                             MBSTRING_ASC,
                             (const unsigned char*)"localhost",
                             -1,
                             -1,
                             0);
  X509_set_issuer_name(cert, name);
  X509_sign(cert, pkey, EVP_sha256());

  SSL_CTX_use_certificate(ctx, cert);
  SSL_CTX_use_PrivateKey(ctx, pkey);

  X509_free(cert);
  EVP_PKEY_free(pkey);
  return ctx;
}

FakeMemcachedServer::FakeMemcachedServer(bool tls) :
  LoopbackServer(),
  version_reply("VERSION 1.6.21"),
  set_reply("STORED"),
  _tls(tls),
  _ctx(tls ? self_signed_context() : NULL)
{
}

FakeMemcachedServer::~FakeMemcachedServer()
{
  stop();

  if (_ctx != NULL)
  {
    SSL_CTX_free(_ctx);
  }
}

bool FakeMemcachedServer::read_line(int fd,
                                    SSL* ssl,
                                    std::string& buffer,
                                    std::string& line)
{
  size_t eol;
  while ((eol = buffer.find("\r\n")) == std::string::npos)
  {
    char buf[512];
    int rc = (ssl != NULL) ? SSL_read(ssl, buf, sizeof(buf)) :
                             (int)recv(fd, buf, sizeof(buf), 0);
    if (rc <= 0)
    {
      return false;
    }
    buffer.append(buf, rc);
  }

  line = buffer.substr(0, eol);
  buffer.erase(0, eol + 2);
  return true;
}

bool FakeMemcachedServer::reply(int fd, SSL* ssl, const std::string& line)
{
  std::string data = line + "\r\n";

  if (ssl != NULL)
  {
    return (SSL_write(ssl, data.data(), (int)data.size()) == (int)data.size());
  }

  return send_all(fd, data);
}

void FakeMemcachedServer::serve(int fd)
{
  SSL* ssl = NULL;

  if (_tls)
  {
    if (_ctx == NULL)
    {
      return;
    }

    ssl = SSL_new(_ctx);
    SSL_set_fd(ssl, fd);

    if (SSL_accept(ssl) != 1)
    {
      SSL_free(ssl);
      return;
    }
  }

  std::string buffer;
  std::string line;

  while (read_line(fd, ssl, buffer, line))
  {
    record(line);

    if (line == "quit")
    {
      break;
    }
    else if (line == "version")
    {
      if (!reply(fd, ssl, version_reply))
      {
        break;
      }
    }
    else if (line.compare(0, 4, "set ") == 0)
    {
      std::string data;
      if (!read_line(fd, ssl, buffer, data))
      {
        break;
      }
      record(data);

      if (!reply(fd, ssl, set_reply))
      {
        break;
      }
    }
    else if (!reply(fd, ssl, "ERROR"))
    {
      break;
    }
  }

  if (ssl != NULL)
  {
    SSL_shutdown(ssl);
    SSL_free(ssl);
  }
}

static const int PG_SSL_REQUEST = 80877103;
static const int PG_GSSENC_REQUEST = 80877104;
static const int PG_MAX_MESSAGE = 64 * 1024;

static int be32(const char* data)
{
  const unsigned char* p = (const unsigned char*)data;
  return (int)(((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) |
               ((uint32_t)p[2] << 8) | (uint32_t)p[3]);
}

FakePostgresServer::FakePostgresServer() :
  LoopbackServer(),
  reject_startup()
{
}

FakePostgresServer::~FakePostgresServer()
{
  stop();
}

std::string FakePostgresServer::int16(int value)
{
  std::string out(2, '\0');
  out[0] = (char)((value >> 8) & 0xff);
  out[1] = (char)(value & 0xff);
  return out;
}

std::string FakePostgresServer::int32(int value)
{
  uint32_t v = (uint32_t)value;
  std::string out(4, '\0');
  out[0] = (char)((v >> 24) & 0xff);
  out[1] = (char)((v >> 16) & 0xff);
  out[2] = (char)((v >> 8) & 0xff);
  out[3] = (char)(v & 0xff);
  return out;
}

std::string FakePostgresServer::message(char type, const std::string& body)
{
  return std::string(1, type) + int32((int)body.size() + 4) + body;
}

void FakePostgresServer::serve(int fd)
{
  char header[4];
  std::string body;

  // The startup packet, possibly preceded by encryption requests, which are
  // all declined.
  while (true)
  {
    if (!read_exact(fd, header, 4))
    {
      return;
    }

    int len = be32(header);
    if ((len < 8) || (len > PG_MAX_MESSAGE))
    {
      return;
    }

    body.assign(len - 4, '\0');
    if (!read_exact(fd, &body[0], len - 4))
    {
      return;
    }

    int code = be32(body.data());
    if ((code == PG_SSL_REQUEST) || (code == PG_GSSENC_REQUEST))
    {
      if (!send_all(fd, "N"))
      {
        return;
      }
      continue;
    }

    break;
  }

  record("startup");

  if (!reject_startup.empty())
  {
    std::string error;
    error += 'S'; error += "FATAL"; error += '\0';
    error += 'V'; error += "FATAL"; error += '\0';
    error += 'C'; error += "28P01"; error += '\0';
    error += 'M'; error += reject_startup; error += '\0';
    error += '\0';
    send_all(fd, message('E', error));
    return;
  }

  std::string ready = message('R', int32(0));
  ready += message('S', std::string("server_version\0" "16.0\0", 20));
  ready += message('S', std::string("client_encoding\0" "UTF8\0", 21));
  ready += message('S', std::string("standard_conforming_strings\0" "on\0", 31));
  ready += message('K', int32(4242) + int32(1234));
  ready += message('Z', "I");

  if (!send_all(fd, ready))
  {
    return;
  }

  while (true)
  {
    char type;
    if ((!read_exact(fd, &type, 1)) ||
        (!read_exact(fd, header, 4)))
    {
      return;
    }

    int len = be32(header);
    if ((len < 4) || (len > PG_MAX_MESSAGE))
    {
      return;
    }

    body.assign(len - 4, '\0');
    if ((len > 4) && (!read_exact(fd, &body[0], len - 4)))
    {
      return;
    }

    if (type != 'Q')
    {
      // Terminate, or something this server doesn't speak.
      return;
    }

    record(body.c_str());

    std::string row_description = int16(1) +
                                  std::string("?column?", 8) + '\0' +
                                  int32(0) +       // table OID
                                  int16(0) +       // column number
                                  int32(23) +      // int4
                                  int16(4) +       // type size
                                  int32(-1) +      // type modifier
                                  int16(0);        // text format
    std::string data_row = int16(1) + int32(1) + "1";

    std::string response = message('T', row_description) +
                           message('D', data_row) +
                           message('C', std::string("SELECT 1", 8) + '\0') +
                           message('Z', "I");

    if (!send_all(fd, response))
    {
      return;
    }
  }
}
