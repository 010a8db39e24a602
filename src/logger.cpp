/**
 * @file logger.cpp
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#include <errno.h>
#include <string.h>

#include "logger.h"

Logger::Logger() :
  _flags(ADD_TIMESTAMPS),
  _to_file(false),
  _directory(),
  _name(),
  _file(stdout),
  _open_day(-1),
  _last_open_attempt(0),
  _dropped(0),
  _open_errno(0)
{
  pthread_mutex_init(&_lock, NULL);
}

Logger::Logger(const std::string& directory, const std::string& name) :
  _flags(ADD_TIMESTAMPS),
  _to_file(true),
  _directory(directory),
  _name(name),
  _file(NULL),
  _open_day(-1),
  _last_open_attempt(0),
  _dropped(0),
  _open_errno(0)
{
  pthread_mutex_init(&_lock, NULL);
}

Logger::~Logger()
{
  if (_to_file && (_file != NULL))
  {
    fclose(_file);
  }

  pthread_mutex_destroy(&_lock);
}

void Logger::gettime(struct timespec* ts)
{
  clock_gettime(CLOCK_REALTIME, ts);
}

void Logger::gettime_monotonic(struct timespec* ts)
{
  clock_gettime(CLOCK_MONOTONIC, ts);
}

void Logger::unlock(void* logger)
{
  pthread_mutex_unlock(&((Logger*)logger)->_lock);
}

void Logger::write(const char* data)
{
  struct timespec wallclock;
  gettime(&wallclock);
  struct tm now;
  gmtime_r(&wallclock.tv_sec, &now);
  int msec = (int)(wallclock.tv_nsec / 1000000);

  pthread_mutex_lock(&_lock);
  pthread_cleanup_push(Logger::unlock, this);

  if (_to_file && file_due(now))
  {
    open_file(now);

    if ((_file != NULL) && (_dropped > 0))
    {
      char notice[128];
      snprintf(notice, sizeof(notice),
               "Dropped %d log line(s) while the log file was unavailable (%s)\n",
               _dropped, strerror(_open_errno));
      emit(notice, now, msec);
      _dropped = 0;
    }
  }

  if (_file != NULL)
  {
    emit(data, now, msec);
  }
  else
  {
    _dropped++;
  }

  pthread_cleanup_pop(0);
  pthread_mutex_unlock(&_lock);
}

void Logger::flush()
{
  pthread_mutex_lock(&_lock);
  if (_file != NULL)
  {
    fflush(_file);
  }
  pthread_mutex_unlock(&_lock);
}

// A file is due when the day has moved on, or when there is no file and the
// last attempt to open one was long enough ago.
bool Logger::file_due(const struct tm& now)
{
  if (_file != NULL)
  {
    return (now.tm_yday != _open_day);
  }

  struct timespec mono;
  gettime_monotonic(&mono);
  return ((_last_open_attempt == 0) ||
          (mono.tv_sec - _last_open_attempt >= REOPEN_INTERVAL_S));
}

void Logger::open_file(const struct tm& now)
{
  if (_file != NULL)
  {
    fclose(_file);
  }

  char day[16];
  strftime(day, sizeof(day), "%Y%m%d", &now);
  std::string path = _directory + "/" + _name + "_" + day + ".txt";

  _file = fopen(path.c_str(), "a");
  _open_day = now.tm_yday;

  struct timespec mono;
  gettime_monotonic(&mono);
  _last_open_attempt = mono.tv_sec;

  if (_file == NULL)
  {
    _open_errno = errno;
  }
}

void Logger::emit(const char* data, const struct tm& now, int msec)
{
  if (_flags & ADD_TIMESTAMPS)
  {
    char stamp[32];
    strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &now);
    fprintf(_file, "%s.%03d UTC ", stamp, msec);
  }

  fputs(data, _file);

  if (_flags & FLUSH_ON_WRITE)
  {
    fflush(_file);
  }

  if (_to_file && ferror(_file))
  {
    // Give up on this file. The next write retries after the reopen interval.
    fclose(_file);
    _file = NULL;
    _open_errno = EIO;
  }
}
