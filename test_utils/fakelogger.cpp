/**
 * @file fakelogger.cpp
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#include <stdlib.h>
#include <string.h>

#include <iostream>

#include "fakelogger.h"

PrintingTestLogger PrintingTestLogger::DEFAULT;

BaseTestLogger::BaseTestLogger() :
  _noisy(false),
  _last_logger(NULL),
  _last_logging_level(DEFAULT_LOGGING_LEVEL)
{
}

void BaseTestLogger::take_over()
{
  _last_logging_level = Log::loggingLevel;
  _last_logger = Log::setLogger(this);

  const char* val = getenv("NOISY");
  int level = DEFAULT_LOGGING_LEVEL;
  _noisy = ((val != NULL) && (strchr("TtYy", val[0]) != NULL));

  if (val != NULL)
  {
    const char* colon = strchr(val, ':');
    if (colon != NULL)
    {
      level = strtol(colon + 1, NULL, 10);
    }
  }

  Log::setLoggingLevel(level);
}

void BaseTestLogger::relinquish_control()
{
  Log::setLoggingLevel(_last_logging_level);
  Log::setLogger(_last_logger);
}

void BaseTestLogger::write(const char* data)
{
  if (_noisy)
  {
    std::string line(data);
    if (line.empty() || (*line.rbegin() != '\n'))
    {
      line.push_back('\n');
    }
    std::cout << line;
  }
}

PrintingTestLogger::PrintingTestLogger() : BaseTestLogger()
{
  take_over();
}

PrintingTestLogger::~PrintingTestLogger()
{
  relinquish_control();
}

CapturingTestLogger::CapturingTestLogger() : BaseTestLogger()
{
  pthread_mutex_init(&_logger_lock, NULL);
  take_over();
  Log::setLoggingLevel(99);
}

CapturingTestLogger::~CapturingTestLogger()
{
  relinquish_control();
  pthread_mutex_destroy(&_logger_lock);
}

void CapturingTestLogger::write(const char* data)
{
  pthread_mutex_lock(&_logger_lock);
  _logged.append(data);
  pthread_mutex_unlock(&_logger_lock);

  BaseTestLogger::write(data);
}

bool CapturingTestLogger::contains(const char* fragment)
{
  pthread_mutex_lock(&_logger_lock);
  bool result = (_logged.find(fragment) != std::string::npos);
  pthread_mutex_unlock(&_logger_lock);
  return result;
}
