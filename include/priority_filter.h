/**
 * @file priority_filter.h  Inclusive acceptance window for SRV priorities.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef PRIORITY_FILTER_H__
#define PRIORITY_FILTER_H__

#include <string>

class PriorityFilter
{
public:
  static const int MIN_PRIORITY = 0;
  static const int MAX_PRIORITY = 65535;

  /// Accepts every priority.
  PriorityFilter();

  /// Accepts priorities in [min, max]. Throws ConfigError unless
  /// 0 <= min <= max <= 65535.
  PriorityFilter(int min, int max);

  bool within_threshold(int priority) const
  {
    return ((priority >= _min) && (priority <= _max));
  }

  int min() const { return _min; }
  int max() const { return _max; }

  std::string to_string() const;

private:
  int _min;
  int _max;
};

#endif
