//===-- log.hpp - logging declarations ------------------------------------===//
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
/// Declarations of logging functions writing to the library's spdlog logger.
///
//===----------------------------------------------------------------------===//
#pragma once

#include <cstdint>
#include <initializer_list>
#include <spdlog/common.h>
#include <string>
#include <string_view>

namespace tek::koboclient::log {

/// Name of the spdlog logger owned by the library.
constexpr std::string_view logger_name{"tek-koboclient"};

/// Key-value pair appended to a log message.
struct field {
  std::string key;
  std::string value;
};

field str_field(std::string_view key, std::string_view value);
field int_field(std::string_view key, std::int64_t value);
field bool_field(std::string_view key, bool value);

/// Create the library logger. Level and pattern are read from
///    `TEK_KC_LOG_LEVEL` and `TEK_KC_LOG_PATTERN` environment variables.
void init();
/// Drop the library logger.
void shutdown();

/// Write a message to the library logger, if it has been created.
void write(spdlog::level::level_enum level, std::string_view message,
           std::initializer_list<field> fields = {});

inline void debug(std::string_view message,
                  std::initializer_list<field> fields = {}) {
  write(spdlog::level::debug, message, fields);
}

inline void info(std::string_view message,
                 std::initializer_list<field> fields = {}) {
  write(spdlog::level::info, message, fields);
}

inline void warn(std::string_view message,
                 std::initializer_list<field> fields = {}) {
  write(spdlog::level::warn, message, fields);
}

} // namespace tek::koboclient::log
