/**
 * @file logger.h  Log sink for hostguard.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef LOGGER_H__
#define LOGGER_H__

#include <stdio.h>
#include <time.h>
#include <pthread.h>

#include <string>

/// Destination for formatted log lines.
///
/// The default constructor writes to stdout. The directory form writes one
/// file per UTC day, <directory>/<name>_<YYYYMMDD>.txt, opening the next one
/// when the day changes. If a file cannot be opened, lines are counted and
/// dropped until a retry succeeds.
class Logger
{
public:
  Logger();
  Logger(const std::string& directory, const std::string& name);
  virtual ~Logger();

  static const int ADD_TIMESTAMPS = 1;
  static const int FLUSH_ON_WRITE = 2;

  int get_flags() const { return _flags; }
  void set_flags(int flags) { _flags = flags; }

  virtual void write(const char* data);
  virtual void flush();

  /// Seconds to wait before trying again to open a file that failed.
  static const int REOPEN_INTERVAL_S = 5;

protected:
  virtual void gettime(struct timespec* ts);
  virtual void gettime_monotonic(struct timespec* ts);

private:
  bool file_due(const struct tm& now);
  void open_file(const struct tm& now);
  void emit(const char* data, const struct tm& now, int msec);

  static void unlock(void* logger);

  int _flags;
  bool _to_file;
  std::string _directory;
  std::string _name;
  FILE* _file;
  int _open_day;
  time_t _last_open_attempt;
  int _dropped;
  int _open_errno;
  pthread_mutex_t _lock;
};

#endif
