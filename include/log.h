/**
 * @file log.h  Levelled, printf-style logging.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef LOG_H__
#define LOG_H__

#include <stdarg.h>

#include <string>

#include "logger.h"

#define TRC_LOG(LEVEL, ...)                                                    \
  do                                                                           \
  {                                                                            \
    if (Log::enabled(LEVEL))                                                   \
    {                                                                          \
      Log::write(LEVEL, __FILE__, __LINE__, __VA_ARGS__);                      \
    }                                                                          \
  } while (0)

#define TRC_ERROR(...) TRC_LOG(Log::ERROR_LEVEL, __VA_ARGS__)
#define TRC_WARNING(...) TRC_LOG(Log::WARNING_LEVEL, __VA_ARGS__)
#define TRC_STATUS(...) TRC_LOG(Log::STATUS_LEVEL, __VA_ARGS__)
#define TRC_INFO(...) TRC_LOG(Log::INFO_LEVEL, __VA_ARGS__)
#define TRC_VERBOSE(...) TRC_LOG(Log::VERBOSE_LEVEL, __VA_ARGS__)
#define TRC_DEBUG(...) TRC_LOG(Log::DEBUG_LEVEL, __VA_ARGS__)

namespace Log
{
  const int ERROR_LEVEL = 0;
  const int WARNING_LEVEL = 1;
  const int STATUS_LEVEL = 2;
  const int INFO_LEVEL = 3;
  const int VERBOSE_LEVEL = 4;
  const int DEBUG_LEVEL = 5;

  extern int loggingLevel;

  /// Clamps the level to ERROR_LEVEL..DEBUG_LEVEL.
  void setLoggingLevel(int level);

  /// Installs a new sink and returns the old one. The caller owns both.
  Logger* setLogger(Logger* logger);

  inline bool enabled(int level)
  {
#ifdef UNIT_TEST
    // Evaluate every log statement's arguments under test.
    return true;
#else
    return (level <= loggingLevel);
#endif
  }

  void vwrite(int level, const char* file, int line, const char* fmt, va_list args);
  void printf_write(int level, const char* file, int line, const char* fmt, ...);

  // Lets callers pass std::string straight to a %s.
  template<class T>
  T loggable(T arg) { return arg; }

  inline const char* loggable(const std::string& arg) { return arg.c_str(); }

  template<typename... Args>
  void write(int level, const char* file, int line, const char* fmt, Args... args)
  {
    printf_write(level, file, line, fmt, loggable(args)...);
  }
}

#endif
