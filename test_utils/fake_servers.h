/**
 * @file fake_servers.h  Scripted servers on the loopback interface, for
 * tests that drive real client connections.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef FAKE_SERVERS_H__
#define FAKE_SERVERS_H__

#include <pthread.h>

#include <string>
#include <vector>

#include <openssl/ssl.h>

/// Listens on 127.0.0.1 on an ephemeral port and serves connections, one at
/// a time, on a background thread until stopped.
///
/// Subclasses must call stop() in their destructor.
class LoopbackServer
{
public:
  LoopbackServer();
  virtual ~LoopbackServer();

  /// Binds and starts serving. Returns false if the socket can't be set up.
  bool start();
  void stop();

  int port() const { return _port; }

  /// Everything the server has recorded so far, in order.
  std::vector<std::string> received();

protected:
  /// Handles one accepted connection. The fd is closed afterwards.
  virtual void serve(int fd) = 0;

  void record(const std::string& item);

  /// Sends all of data, without raising SIGPIPE.
  static bool send_all(int fd, const std::string& data);

  /// Reads exactly len bytes. Returns false on EOF, error or timeout.
  static bool read_exact(int fd, char* buf, size_t len);

private:
  static void* thread_fn(void* server);
  void accept_loop();
  bool running();

  int _listen_fd;
  int _port;
  bool _running;
  bool _started;
  pthread_t _thread;
  pthread_mutex_t _lock;
  std::vector<std::string> _received;
};

/// Speaks enough of the memcached text protocol for version requests and
/// "set"-based authentication, optionally over TLS with a throwaway
/// self-signed certificate. Records each command line, and the data line of
/// each "set".
class FakeMemcachedServer : public LoopbackServer
{
public:
  FakeMemcachedServer(bool tls);
  virtual ~FakeMemcachedServer();

  /// Reply line to "version", without the CRLF.
  std::string version_reply;

  /// Reply line to "set", without the CRLF.
  std::string set_reply;

protected:
  virtual void serve(int fd);

private:
  bool read_line(int fd, SSL* ssl, std::string& buffer, std::string& line);
  bool reply(int fd, SSL* ssl, const std::string& line);

  bool _tls;
  SSL_CTX* _ctx;
};

/// Speaks enough of the PostgreSQL frontend/backend protocol (version 3) to
/// accept a startup without authentication and answer simple queries with a
/// single row. Declines SSL and GSS encryption. Records each query.
class FakePostgresServer : public LoopbackServer
{
public:
  FakePostgresServer();
  virtual ~FakePostgresServer();

  /// If set, the startup is rejected with this FATAL message.
  std::string reject_startup;

protected:
  virtual void serve(int fd);

private:
  static std::string message(char type, const std::string& body);
  static std::string int16(int value);
  static std::string int32(int value);
};

#endif
