/**
 * @file log.cpp
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#include <stdio.h>
#include <string.h>
#include <pthread.h>

#include "log.h"

namespace Log
{
  int loggingLevel = 4;

  static Logger stdout_logger;
  static Logger* sink = &stdout_logger;
  static pthread_mutex_t sink_lock = PTHREAD_MUTEX_INITIALIZER;

  static const char* const LEVEL_NAMES[] =
    {"Error", "Warning", "Status", "Info", "Verbose", "Debug"};

  static const size_t MAX_LINE = 8192;
  static const char TRUNCATED[] = " <truncated>\n";

  static void unlock_sink(void*)
  {
    pthread_mutex_unlock(&sink_lock);
  }

  // Builds "[<thread>] <Level> <file>:<line>: <message>\n" into buf. A
  // message too long for the buffer is cut short and marked.
  static void format_line(char* buf,
                          int level,
                          const char* file,
                          int line,
                          const char* fmt,
                          va_list args)
  {
    const char* basename = strrchr(file, '/');
    basename = (basename != NULL) ? basename + 1 : file;

    size_t room = MAX_LINE - sizeof(TRUNCATED);
    int prefix = snprintf(buf, room, "[%lx] %s %s:%d: ",
                          (unsigned long)pthread_self(),
                          LEVEL_NAMES[level],
                          basename,
                          line);
    size_t used = ((size_t)prefix < room) ? (size_t)prefix : room - 1;

    int body = vsnprintf(buf + used, room - used, fmt, args);

    if ((body >= 0) && (used + (size_t)body < room))
    {
      used += body;
      strcpy(buf + used, "\n");
    }
    else
    {
      strcpy(buf + room - 1, TRUNCATED);
    }
  }
}

void Log::setLoggingLevel(int level)
{
  if (level < ERROR_LEVEL)
  {
    level = ERROR_LEVEL;
  }
  else if (level > DEBUG_LEVEL)
  {
    level = DEBUG_LEVEL;
  }

  loggingLevel = level;
}

Logger* Log::setLogger(Logger* logger)
{
  pthread_mutex_lock(&sink_lock);
  Logger* previous = sink;
  sink = logger;

  if (sink != NULL)
  {
    sink->set_flags(Logger::ADD_TIMESTAMPS | Logger::FLUSH_ON_WRITE);
  }

  pthread_mutex_unlock(&sink_lock);
  return previous;
}

void Log::printf_write(int level, const char* file, int line, const char* fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  vwrite(level, file, line, fmt, args);
  va_end(args);
}

void Log::vwrite(int level, const char* file, int line, const char* fmt, va_list args)
{
  if ((level > loggingLevel) || (level < ERROR_LEVEL))
  {
    return;
  }

  char buf[MAX_LINE];
  format_line(buf, level, file, line, fmt, args);

  pthread_mutex_lock(&sink_lock);
  pthread_cleanup_push(unlock_sink, NULL);

  if (sink != NULL)
  {
    sink->write(buf);
  }

  pthread_cleanup_pop(0);
  pthread_mutex_unlock(&sink_lock);
}
