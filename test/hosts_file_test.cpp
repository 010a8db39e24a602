/**
 * @file hosts_file_test.cpp  HostsFileWriter unit tests.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#include <stdlib.h>
#include <unistd.h>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "hosts_file.h"
#include "test_interposer.hpp"

static const std::string BASE_CONTENT =
  "127.0.0.1\tlocalhost\n"
  "# The following lines are desirable for IPv6 capable hosts\n"
  "::1     ip6-localhost ip6-loopback\n"
  "\n"
  "#10.0.0.9 db.example.com\n"
  "192.168.1.1 router.local   # home\n";

static std::vector<std::string> addrs(const std::string& a1,
                                      const std::string& a2 = "")
{
  std::vector<std::string> addresses;
  addresses.push_back(a1);
  if (!a2.empty())
  {
    addresses.push_back(a2);
  }
  return addresses;
}

class HostsFileTest : public ::testing::Test
{
public:
  HostsFileTest()
  {
    char path[] = "/tmp/hostguard_hosts_XXXXXX";
    int fd = mkstemp(path);
    if (fd >= 0)
    {
      close(fd);
    }
    _path = path;
    write_file(BASE_CONTENT);

    // Freeze time at the epoch so timestamps are predictable.
    cwtest_completely_control_time(true);
  }

  virtual ~HostsFileTest()
  {
    cwtest_reset_time();
    unlink(_path.c_str());
  }

  void write_file(const std::string& content)
  {
    std::ofstream fs(_path.c_str(), std::ios::out | std::ios::trunc);
    fs << content;
  }

  std::string read_file()
  {
    std::ifstream fs(_path.c_str());
    std::stringstream ss;
    ss << fs.rdbuf();
    return ss.str();
  }

  std::string _path;
};

TEST_F(HostsFileTest, RewriteAppendsLines)
{
  std::string content = HostsFileWriter::rewrite(BASE_CONTENT,
                                                 "db.example.com",
                                                 addrs("10.0.0.1", "fd00::1"),
                                                 "2024-01-31T12:00:00Z");

  EXPECT_EQ(BASE_CONTENT +
            "10.0.0.1 db.example.com # AUTO GENERATED: 2024-01-31T12:00:00Z\n"
            "fd00::1 db.example.com # AUTO GENERATED: 2024-01-31T12:00:00Z\n",
            content);
}

TEST_F(HostsFileTest, RewriteReplacesOwnedLines)
{
  std::string content = BASE_CONTENT +
                        "10.0.0.1 db.example.com # AUTO GENERATED: 2024-01-31T12:00:00Z\n"
                        "172.16.0.1 kv.example.com\n"
                        "10.0.0.7   db.example.com\n";

  content = HostsFileWriter::rewrite(content,
                                     "db.example.com",
                                     addrs("10.0.0.2"),
                                     "2024-02-01T00:00:00Z");

  EXPECT_EQ(BASE_CONTENT +
            "172.16.0.1 kv.example.com\n"
            "10.0.0.2 db.example.com # AUTO GENERATED: 2024-02-01T00:00:00Z\n",
            content);
}

TEST_F(HostsFileTest, RewriteOnlyMatchesHostnameToken)
{
  // Aliases and partial matches are not ours.
  std::string content = "10.0.0.1 other.example.com db.example.com\n"
                        "10.0.0.2 db.example.com.au\n";

  EXPECT_EQ(content + "10.0.0.3 db.example.com # AUTO GENERATED: t\n",
            HostsFileWriter::rewrite(content, "db.example.com", addrs("10.0.0.3"), "t"));
}

TEST_F(HostsFileTest, RewriteWithoutTrailingNewline)
{
  EXPECT_EQ("127.0.0.1 localhost\n10.0.0.1 db # AUTO GENERATED: t\n",
            HostsFileWriter::rewrite("127.0.0.1 localhost", "db", addrs("10.0.0.1"), "t"));
}

TEST_F(HostsFileTest, AddressesFor)
{
  std::string content = BASE_CONTENT +
                        "10.0.0.1 db.example.com # AUTO GENERATED: t\n"
                        "  fd00::1\tdb.example.com\n"
                        "172.16.0.1 kv.example.com\n";

  std::set<std::string> addresses =
    HostsFileWriter::addresses_for(content, "db.example.com");

  // The commented-out 10.0.0.9 doesn't count.
  ASSERT_EQ(2u, addresses.size());
  EXPECT_EQ(1u, addresses.count("10.0.0.1"));
  EXPECT_EQ(1u, addresses.count("fd00::1"));

  EXPECT_TRUE(HostsFileWriter::addresses_for(content, "missing.example.com").empty());
}

TEST_F(HostsFileTest, ReconcileRoundTrip)
{
  HostsFileWriter writer(_path);
  HostMappings mappings;

  mappings["db.example.com"] = addrs("10.0.0.1");
  EXPECT_EQ(HostsFileWriter::UPDATED, writer.reconcile(mappings));

  mappings["db.example.com"] = addrs("10.0.0.2");
  EXPECT_EQ(HostsFileWriter::UPDATED, writer.reconcile(mappings));

  // Exactly one line for the hostname, everything else untouched.
  EXPECT_EQ(BASE_CONTENT +
            "10.0.0.2 db.example.com # AUTO GENERATED: 1970-01-01T00:00:00Z\n",
            read_file());
}

TEST_F(HostsFileTest, ReconcileUnchangedDoesNotWrite)
{
  HostsFileWriter writer(_path);
  HostMappings mappings;
  mappings["db.example.com"] = addrs("10.0.0.1");
  EXPECT_EQ(HostsFileWriter::UPDATED, writer.reconcile(mappings));
  std::string written = read_file();

  // A later pass with the same addresses leaves the file, and the old
  // timestamp, alone.
  cwtest_advance_time_ms(3600 * 1000);
  EXPECT_EQ(HostsFileWriter::UNCHANGED, writer.reconcile(mappings));
  EXPECT_EQ(written, read_file());
}

TEST_F(HostsFileTest, ReconcileIgnoresAddressOrder)
{
  write_file(BASE_CONTENT +
             "fd00::1 db.example.com\n"
             "10.0.0.1 db.example.com\n");

  HostsFileWriter writer(_path);
  HostMappings mappings;
  mappings["db.example.com"] = addrs("10.0.0.1", "fd00::1");

  EXPECT_EQ(HostsFileWriter::UNCHANGED, writer.reconcile(mappings));
}

TEST_F(HostsFileTest, ReconcileSeveralHosts)
{
  HostsFileWriter writer(_path);
  HostMappings mappings;
  mappings["db.example.com"] = addrs("10.0.0.1");
  mappings["kv.example.com"] = addrs("10.0.1.1");

  EXPECT_EQ(HostsFileWriter::UPDATED, writer.reconcile(mappings));

  std::string content = read_file();
  EXPECT_EQ(1u, HostsFileWriter::addresses_for(content, "db.example.com").count("10.0.0.1"));
  EXPECT_EQ(1u, HostsFileWriter::addresses_for(content, "kv.example.com").count("10.0.1.1"));
  EXPECT_EQ(0u, content.find(BASE_CONTENT));
}

TEST_F(HostsFileTest, ReconcileEmptyMappings)
{
  HostsFileWriter writer(_path);
  EXPECT_EQ(HostsFileWriter::UNCHANGED, writer.reconcile(HostMappings()));
  EXPECT_EQ(BASE_CONTENT, read_file());
}

TEST_F(HostsFileTest, ReconcileMissingFile)
{
  HostsFileWriter writer("/nonexistent/hostguard/hosts");
  HostMappings mappings;
  mappings["db.example.com"] = addrs("10.0.0.1");

  EXPECT_EQ(HostsFileWriter::IO_ERROR, writer.reconcile(mappings));
}
