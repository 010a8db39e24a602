/**
 * @file utils.cpp Utility functions.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#include <ctype.h>
#include <string.h>
#include <time.h>

#include <string>
#include <vector>

#include "log.h"
#include "logger.h"
#include "utils.h"

std::string IP46Address::to_string() const
{
  char buf[INET6_ADDRSTRLEN];
  return (inet_ntop(af, &addr, buf, sizeof(buf)) != NULL) ? buf : "unknown";
}

std::string& Utils::trim(std::string& s)
{
  size_t end = s.size();
  while ((end > 0) && isspace((unsigned char)s[end - 1]))
  {
    --end;
  }

  size_t start = 0;
  while ((start < end) && isspace((unsigned char)s[start]))
  {
    ++start;
  }

  s = s.substr(start, end - start);
  return s;
}

void Utils::split_string(const std::string& str,
                         char delimiter,
                         std::vector<std::string>& tokens,
                         bool trim)
{
  size_t start = 0;

  while (start <= str.size())
  {
    size_t end = str.find(delimiter, start);
    if (end == std::string::npos)
    {
      end = str.size();
    }

    std::string token = str.substr(start, end - start);
    if (trim)
    {
      Utils::trim(token);
    }

    if (!token.empty())
    {
      tokens.push_back(token);
    }

    start = end + 1;
  }
}

std::vector<std::string> Utils::split_whitespace(const std::string& line)
{
  std::vector<std::string> tokens;
  size_t pos = 0;

  while (pos < line.size())
  {
    size_t start = line.find_first_not_of(" \t\r", pos);
    if (start == std::string::npos)
    {
      break;
    }

    size_t end = line.find_first_of(" \t\r", start);
    if (end == std::string::npos)
    {
      end = line.size();
    }

    tokens.push_back(line.substr(start, end - start));
    pos = end;
  }

  return tokens;
}

std::string Utils::join(const std::vector<std::string>& items,
                        const std::string& separator)
{
  std::string joined;

  for (std::vector<std::string>::const_iterator it = items.begin();
       it != items.end();
       ++it)
  {
    if (it != items.begin())
    {
      joined.append(separator);
    }
    joined.append(*it);
  }

  return joined;
}

// Strips one pair of enclosing square brackets, if present.
static bool unbracket(std::string& host)
{
  if ((host.size() >= 2) && (host[0] == '[') && (host[host.size() - 1] == ']'))
  {
    host = host.substr(1, host.size() - 2);
    return true;
  }

  return false;
}

Utils::IPAddressType Utils::parse_ip_address(const std::string& address)
{
  IP46Address parsed;
  std::string host = address;
  bool bracketed = unbracket(host);

  if (inet_pton(AF_INET6, host.c_str(), &parsed.addr.ipv6) == 1)
  {
    return bracketed ? IPV6_ADDRESS_BRACKETED : IPV6_ADDRESS;
  }

  if ((!bracketed) && (inet_pton(AF_INET, host.c_str(), &parsed.addr.ipv4) == 1))
  {
    return IPV4_ADDRESS;
  }

  return INVALID;
}

bool Utils::is_ip_literal(const std::string& address)
{
  return (parse_ip_address(address) != INVALID);
}

bool Utils::parse_ip_target(const std::string& target, IP46Address& address)
{
  std::string host = target;
  Utils::trim(host);

  switch (parse_ip_address(host))
  {
    case IPV4_ADDRESS:
      address.af = AF_INET;
      return (inet_pton(AF_INET, host.c_str(), &address.addr.ipv4) == 1);

    case IPV6_ADDRESS:
    case IPV6_ADDRESS_BRACKETED:
      unbracket(host);
      address.af = AF_INET6;
      return (inet_pton(AF_INET6, host.c_str(), &address.addr.ipv6) == 1);

    default:
      return false;
  }
}

uint64_t Utils::get_time(clockid_t clock)
{
  struct timespec ts;
  clock_gettime(clock, &ts);
  uint64_t timestamp = ((uint64_t)ts.tv_sec * 1000) + (ts.tv_nsec / 1000000);
  return timestamp;
}

std::string Utils::iso8601_utc(time_t t)
{
  struct tm dt;
  gmtime_r(&t, &dt);
  char buf[32];
  strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &dt);
  return buf;
}

void Utils::log_setup(const char* argv0,
                      const std::string& log_directory,
                      int log_level)
{
  // Work out the program name from argv[0], stripping anything before the
  // final slash.
  const char* prog_name = argv0;
  const char* slash_ptr = strrchr(argv0, '/');
  if (slash_ptr != NULL)
  {
    prog_name = slash_ptr + 1;
  }

  Log::setLoggingLevel(log_level);

  if (log_directory != "")
  {
    // The previous logger is the static default, so there's nothing to free.
    Log::setLogger(new Logger(log_directory, prog_name));
  }

  TRC_STATUS("Log level set to %d", log_level);
}
