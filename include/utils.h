/**
 * @file utils.h Utility functions.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef UTILS_H__
#define UTILS_H__

#include <time.h>
#include <stdint.h>
#include <arpa/inet.h>

#include <string>
#include <vector>

/// An IPv4 or IPv6 address, as parsed from a nameserver setting.
struct IP46Address
{
  int af;
  union
  {
    struct in_addr ipv4;
    struct in6_addr ipv6;
  } addr;

  /// The address as a literal, or "unknown" if it can't be rendered.
  std::string to_string() const;
};

namespace Utils
{
  /// Strips leading and trailing whitespace in place, returning s.
  std::string& trim(std::string& s);

  /// Appends the delimiter-separated tokens of str to tokens. Empty tokens
  /// are skipped, after trimming if trim is set.
  void split_string(const std::string& str,
                    char delimiter,
                    std::vector<std::string>& tokens,
                    bool trim = false);

  /// Splits a line into its whitespace-delimited tokens (spaces and tabs).
  std::vector<std::string> split_whitespace(const std::string& line);

  std::string join(const std::vector<std::string>& items, const std::string& separator);

  enum IPAddressType {
    IPV4_ADDRESS,
    IPV6_ADDRESS,
    IPV6_ADDRESS_BRACKETED,
    INVALID
  };

  IPAddressType parse_ip_address(const std::string& address);

  /// True for "10.0.0.1", "fd00::1" and "[fd00::1]".
  bool is_ip_literal(const std::string& address);

  /// Parses an IP literal, which may be bracketed or padded with whitespace.
  /// Returns false for anything else, such as a hostname.
  bool parse_ip_target(const std::string& target, IP46Address& address);

  /// Milliseconds on the given clock.
  uint64_t get_time(clockid_t clock = CLOCK_MONOTONIC);

  /// e.g. 2024-01-31T12:00:00Z
  std::string iso8601_utc(time_t t);

  /// Sets the log level and, if log_directory isn't empty, sends logs to
  /// daily files there named after the program.
  void log_setup(const char* argv0,
                 const std::string& log_directory,
                 int log_level);
}

#endif
