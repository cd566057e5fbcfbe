//===-- log.cpp - logging implementation ----------------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of tek-koboclient, under the GNU General Public License v3.0 or later
// See https://github.com/teknology-hub/tek-koboclient/blob/main/COPYING for
//    license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of logging functions.
///
//===----------------------------------------------------------------------===//
#include "log.hpp"

#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>

namespace tek::koboclient::log {

namespace {

//===-- Private functions -------------------------------------------------===//

static std::string resolve_level() {
  if (const char *level = std::getenv("TEK_KC_LOG_LEVEL")) {
    return level;
  }
  return "warn";
}

static std::string resolve_pattern() {
  if (const char *pattern = std::getenv("TEK_KC_LOG_PATTERN")) {
    return pattern;
  }
  return "%Y-%m-%dT%H:%M:%S.%e%z [%n] [%^%l%$] %v";
}

static std::string serialize_fields(std::initializer_list<field> fields) {
  std::string res;
  for (const auto &field : fields) {
    if (!res.empty()) {
      res.push_back(' ');
    }
    res.append(field.key).append(1, '=').append(field.value);
  }
  return res;
}

} // namespace

//===-- Internal functions ------------------------------------------------===//

field str_field(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

field int_field(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

field bool_field(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void init() {
  const std::string name(logger_name);
  if (spdlog::get(name)) {
    return;
  }
  const auto logger = spdlog::stderr_color_mt(name);
  logger->set_pattern(resolve_pattern());
  logger->set_level(spdlog::level::from_str(resolve_level()));
  logger->flush_on(spdlog::level::warn);
}

void shutdown() { spdlog::drop(std::string(logger_name)); }

void write(spdlog::level::level_enum level, std::string_view message,
           std::initializer_list<field> fields) {
  const auto logger = spdlog::get(std::string(logger_name));
  if (!logger || !logger->should_log(level)) {
    return;
  }
  if (const auto serialized = serialize_fields(fields); !serialized.empty()) {
    logger->log(level, "{} {}", message, serialized);
    return;
  }
  logger->log(level, "{}", message);
}

} // namespace tek::koboclient::log
