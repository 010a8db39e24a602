/**
 * @file hosts_file.h  Maintains hostguard's entries in the hosts file.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef HOSTS_FILE_H__
#define HOSTS_FILE_H__

#include <map>
#include <set>
#include <string>
#include <vector>

/// Desired addresses, keyed by hostname.
typedef std::map<std::string, std::vector<std::string> > HostMappings;

class HostsFileWriter
{
public:
  enum Outcome
  {
    UNCHANGED,
    UPDATED,
    IO_ERROR
  };

  HostsFileWriter(const std::string& path);
  virtual ~HostsFileWriter();

  /// Reads the file once and, for every hostname whose current set of
  /// addresses differs from the desired one, replaces its lines. The file is
  /// written only if at least one hostname changed.
  virtual Outcome reconcile(const HostMappings& mappings);

  const std::string& path() const { return _path; }

  /// Drops every non-comment line whose second token is hostname, keeping
  /// every other line byte-for-byte and in order, then appends one line per
  /// address: "<address> <hostname> # AUTO GENERATED: <timestamp>".
  static std::string rewrite(const std::string& content,
                             const std::string& hostname,
                             const std::vector<std::string>& addresses,
                             const std::string& timestamp);

  /// The addresses currently mapped to hostname.
  static std::set<std::string> addresses_for(const std::string& content,
                                             const std::string& hostname);

  static const char* const AUTO_GENERATED_MARKER;

private:
  static bool is_comment(const std::string& line);
  static bool owned_by(const std::string& line, const std::string& hostname);
  static std::vector<std::string> split_lines(const std::string& content);

  bool read(std::string& content);
  bool write(const std::string& content);

  std::string _path;
};

#endif
