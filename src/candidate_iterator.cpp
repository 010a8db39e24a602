/**
 * @file candidate_iterator.cpp
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#include <algorithm>

#include "candidate_iterator.h"

bool CandidateIterator::next(std::string& candidate)
{
  bool value_set;
  std::vector<std::string> next_one = take(1);

  if (!next_one.empty())
  {
    candidate = next_one.front();
    value_set = true;
  }
  else
  {
    value_set = false;
  }

  return value_set;
}

std::vector<std::string> SimpleCandidateIterator::take(int num_requested)
{
  size_t remaining = _candidates.size() - _position;
  size_t num_to_return = std::min((size_t)std::max(num_requested, 0), remaining);

  std::vector<std::string> candidates(_candidates.begin() + _position,
                                      _candidates.begin() + _position + num_to_return);
  _position += num_to_return;

  return candidates;
}
