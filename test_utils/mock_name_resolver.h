/**
 * @file mock_name_resolver.h
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef MOCK_NAME_RESOLVER_H__
#define MOCK_NAME_RESOLVER_H__

#include "gmock/gmock.h"
#include "name_resolver.h"
#include "srv_resolver.h"

class MockNameResolver : public NameResolver
{
public:
  MockNameResolver() : NameResolver(nullptr) {}
  ~MockNameResolver() {}

  MOCK_METHOD1(resolve, std::vector<std::string>(const std::string& hostname));
};

class MockServiceRecordResolver : public ServiceRecordResolver
{
public:
  MockServiceRecordResolver() : ServiceRecordResolver(nullptr, nullptr) {}
  ~MockServiceRecordResolver() {}

  MOCK_METHOD2(resolve, std::vector<std::string>(const std::string& srv_name,
                                                 const PriorityFilter& filter));
};

#endif
