/**
 * @file fakelogger.h  Loggers for unit tests.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef FAKELOGGER_H__
#define FAKELOGGER_H__

#include <pthread.h>

#include <string>

#include "log.h"
#include "logger.h"

const int DEFAULT_LOGGING_LEVEL = 4;

/// Installs itself as the process logger for its lifetime and, if the NOISY
/// environment variable starts with T or Y, echoes logs to stdout. NOISY=T:5
/// also sets the log level to 5.
class BaseTestLogger : public Logger
{
public:
  BaseTestLogger();
  virtual ~BaseTestLogger() {}

  virtual void write(const char* data);
  virtual void flush() {}

  bool isPrinting() const { return _noisy; }
  void setPrinting(bool printing) { _noisy = printing; }

protected:
  void take_over();
  void relinquish_control();

  bool _noisy;
  Logger* _last_logger;
  int _last_logging_level;
};

/// The logger for tests that don't care what is logged.
/// PrintingTestLogger::DEFAULT should be the only instance needed.
class PrintingTestLogger : public BaseTestLogger
{
public:
  PrintingTestLogger();
  virtual ~PrintingTestLogger();

  static PrintingTestLogger DEFAULT;
};

/// Also keeps everything logged, for tests that check a log was written.
/// Logs at every level while in scope, so keep the scope small.
class CapturingTestLogger : public BaseTestLogger
{
public:
  CapturingTestLogger();
  virtual ~CapturingTestLogger();

  virtual void write(const char* data);
  bool contains(const char* fragment);

private:
  std::string _logged;
  pthread_mutex_t _logger_lock;
};

#endif
