/**
 * @file utils_test.cpp  Utils unit tests.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "utils.h"

TEST(UtilsTest, SplitString)
{
  std::vector<std::string> tokens;
  Utils::split_string(" 10.0.0.1, 10.0.0.2 ,,fd00::1", ',', tokens, true);

  ASSERT_EQ(3u, tokens.size());
  EXPECT_EQ("10.0.0.1", tokens[0]);
  EXPECT_EQ("10.0.0.2", tokens[1]);
  EXPECT_EQ("fd00::1", tokens[2]);
}

TEST(UtilsTest, SplitStringEmpty)
{
  std::vector<std::string> tokens;
  Utils::split_string("", ',', tokens, true);
  EXPECT_TRUE(tokens.empty());
}

TEST(UtilsTest, SplitWhitespace)
{
  std::vector<std::string> tokens =
    Utils::split_whitespace("  10.0.0.1\tdb.example.com   # comment\r");

  ASSERT_EQ(4u, tokens.size());
  EXPECT_EQ("10.0.0.1", tokens[0]);
  EXPECT_EQ("db.example.com", tokens[1]);
  EXPECT_EQ("#", tokens[2]);
  EXPECT_EQ("comment", tokens[3]);
}

TEST(UtilsTest, Join)
{
  std::vector<std::string> items;
  EXPECT_EQ("", Utils::join(items, ", "));
  items.push_back("a");
  EXPECT_EQ("a", Utils::join(items, ", "));
  items.push_back("b");
  EXPECT_EQ("a, b", Utils::join(items, ", "));
}

TEST(UtilsTest, IPLiterals)
{
  EXPECT_TRUE(Utils::is_ip_literal("10.0.0.5"));
  EXPECT_TRUE(Utils::is_ip_literal("fd00::5"));
  EXPECT_TRUE(Utils::is_ip_literal("[fd00::5]"));
  EXPECT_FALSE(Utils::is_ip_literal("db.example.com"));
  EXPECT_FALSE(Utils::is_ip_literal("10.0.0"));
  EXPECT_FALSE(Utils::is_ip_literal(""));

  EXPECT_EQ(Utils::IPV4_ADDRESS, Utils::parse_ip_address("10.0.0.5"));
  EXPECT_EQ(Utils::IPV6_ADDRESS, Utils::parse_ip_address("fd00::5"));
  EXPECT_EQ(Utils::IPV6_ADDRESS_BRACKETED, Utils::parse_ip_address("[fd00::5]"));
}

TEST(UtilsTest, ParseIPTarget)
{
  IP46Address address;

  ASSERT_TRUE(Utils::parse_ip_target(" 10.0.0.5 ", address));
  EXPECT_EQ(AF_INET, address.af);
  EXPECT_EQ("10.0.0.5", address.to_string());

  ASSERT_TRUE(Utils::parse_ip_target("[fd00::5]", address));
  EXPECT_EQ(AF_INET6, address.af);
  EXPECT_EQ("fd00::5", address.to_string());

  EXPECT_FALSE(Utils::parse_ip_target("dns.example.com", address));
}

TEST(UtilsTest, ISO8601)
{
  EXPECT_EQ("1970-01-01T00:00:00Z", Utils::iso8601_utc(0));
  EXPECT_EQ("2024-01-31T12:00:00Z", Utils::iso8601_utc(1706702400));
}
