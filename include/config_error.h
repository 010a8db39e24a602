/**
 * @file config_error.h  Exception for invalid startup configuration.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef CONFIG_ERROR_H__
#define CONFIG_ERROR_H__

#include <string>
#include <stdexcept>

/// Raised while reading configuration. The process must not start.
class ConfigError : public std::runtime_error
{
public:
  ConfigError(const std::string& what) : std::runtime_error(what) {}
};

#endif
