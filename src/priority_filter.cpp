/**
 * @file priority_filter.cpp
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#include "config_error.h"
#include "priority_filter.h"

PriorityFilter::PriorityFilter() :
  _min(MIN_PRIORITY),
  _max(MAX_PRIORITY)
{
}

PriorityFilter::PriorityFilter(int min, int max) :
  _min(min),
  _max(max)
{
  if ((min < MIN_PRIORITY) || (min > MAX_PRIORITY) ||
      (max < MIN_PRIORITY) || (max > MAX_PRIORITY))
  {
    throw ConfigError("SRV priority bounds must be between 0 and 65535, got [" +
                      std::to_string(min) + "," + std::to_string(max) + "]");
  }

  if (min > max)
  {
    throw ConfigError("SRV priority lower bound " + std::to_string(min) +
                      " is greater than upper bound " + std::to_string(max));
  }
}

std::string PriorityFilter::to_string() const
{
  return "[" + std::to_string(_min) + "," + std::to_string(_max) + "]";
}
