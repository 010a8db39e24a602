/**
 * @file hosts_file.cpp
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
#include <time.h>

#include <fstream>
#include <sstream>

#include "log.h"
#include "utils.h"
#include "hosts_file.h"

const char* const HostsFileWriter::AUTO_GENERATED_MARKER = "# AUTO GENERATED:";

HostsFileWriter::HostsFileWriter(const std::string& path) :
  _path(path)
{
}

HostsFileWriter::~HostsFileWriter()
{
}

HostsFileWriter::Outcome HostsFileWriter::reconcile(const HostMappings& mappings)
{
  std::string content;
  if (!read(content))
  {
    return IO_ERROR;
  }

  std::string timestamp = Utils::iso8601_utc(time(NULL));
  bool changed = false;

  for (HostMappings::const_iterator mapping = mappings.begin();
       mapping != mappings.end();
       ++mapping)
  {
    const std::string& hostname = mapping->first;
    std::set<std::string> current = addresses_for(content, hostname);
    std::set<std::string> desired(mapping->second.begin(), mapping->second.end());

    if (current == desired)
    {
      TRC_DEBUG("%s unchanged", hostname.c_str());
      continue;
    }

    TRC_STATUS("Updating %s in %s to [%s]",
               hostname.c_str(),
               _path.c_str(),
               Utils::join(mapping->second, ", ").c_str());
    content = rewrite(content, hostname, mapping->second, timestamp);
    changed = true;
  }

  if (!changed)
  {
    return UNCHANGED;
  }

  return write(content) ? UPDATED : IO_ERROR;
}

std::string HostsFileWriter::rewrite(const std::string& content,
                                     const std::string& hostname,
                                     const std::vector<std::string>& addresses,
                                     const std::string& timestamp)
{
  std::vector<std::string> lines = split_lines(content);
  std::string rewritten;

  for (std::vector<std::string>::const_iterator line = lines.begin();
       line != lines.end();
       ++line)
  {
    if (owned_by(*line, hostname))
    {
      continue;
    }

    rewritten.append(*line);
    rewritten.append("\n");
  }

  for (std::vector<std::string>::const_iterator address = addresses.begin();
       address != addresses.end();
       ++address)
  {
    rewritten.append(*address + " " + hostname + " " +
                     AUTO_GENERATED_MARKER + " " + timestamp + "\n");
  }

  return rewritten;
}

std::set<std::string> HostsFileWriter::addresses_for(const std::string& content,
                                                     const std::string& hostname)
{
  std::set<std::string> addresses;
  std::vector<std::string> lines = split_lines(content);

  for (std::vector<std::string>::const_iterator line = lines.begin();
       line != lines.end();
       ++line)
  {
    if (owned_by(*line, hostname))
    {
      addresses.insert(Utils::split_whitespace(*line)[0]);
    }
  }

  return addresses;
}

bool HostsFileWriter::is_comment(const std::string& line)
{
  size_t first = line.find_first_not_of(" \t");
  return ((first != std::string::npos) && (line[first] == '#'));
}

bool HostsFileWriter::owned_by(const std::string& line, const std::string& hostname)
{
  if (is_comment(line))
  {
    return false;
  }

  std::vector<std::string> tokens = Utils::split_whitespace(line);
  return ((tokens.size() >= 2) && (tokens[1] == hostname));
}

/// Splits on newlines. A trailing newline does not produce an empty final
/// line.
std::vector<std::string> HostsFileWriter::split_lines(const std::string& content)
{
  std::vector<std::string> lines;
  size_t start = 0;

  while (start < content.size())
  {
    size_t end = content.find('\n', start);
    if (end == std::string::npos)
    {
      lines.push_back(content.substr(start));
      break;
    }

    lines.push_back(content.substr(start, end - start));
    start = end + 1;
  }

  return lines;
}

bool HostsFileWriter::read(std::string& content)
{
  std::ifstream fs(_path.c_str(), std::ios::in | std::ios::binary);

  if (!fs.is_open())
  {
    TRC_ERROR("Failed to open %s for reading: %s", _path.c_str(), strerror(errno));
    return false;
  }

  std::stringstream ss;
  ss << fs.rdbuf();

  if (fs.bad())
  {
    TRC_ERROR("Failed to read %s", _path.c_str());
    return false;
  }

  content = ss.str();
  return true;
}

bool HostsFileWriter::write(const std::string& content)
{
  std::ofstream fs(_path.c_str(), std::ios::out | std::ios::trunc | std::ios::binary);

  if (!fs.is_open())
  {
    TRC_ERROR("Failed to open %s for writing: %s", _path.c_str(), strerror(errno));
    return false;
  }

  fs << content;
  fs.close();

  if (fs.fail())
  {
    TRC_ERROR("Failed to write %s", _path.c_str());
    return false;
  }

  return true;
}
