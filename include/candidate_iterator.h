/**
 * @file candidate_iterator.h  Lazy iteration over candidate addresses.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef CANDIDATE_ITERATOR_H__
#define CANDIDATE_ITERATOR_H__

#include <string>
#include <vector>

class CandidateIterator
{
public:
  CandidateIterator() {}
  virtual ~CandidateIterator() {}

  /// Should return a vector containing at most num_requested candidates.
  virtual std::vector<std::string> take(int num_requested) = 0;

  /// If any unused candidates remain, sets candidate to the next one and
  /// returns true. Otherwise returns false and leaves candidate unchanged.
  virtual bool next(std::string& candidate);
};

// Candidate iterator that simply returns the candidates it is given in
// sequence.
class SimpleCandidateIterator : public CandidateIterator
{
public:
  SimpleCandidateIterator(const std::vector<std::string>& candidates) :
    _candidates(candidates),
    _position(0)
  {}
  virtual ~SimpleCandidateIterator() {}

  virtual std::vector<std::string> take(int num_requested);

private:
  std::vector<std::string> _candidates;
  size_t _position;
};

#endif
