//===-- directory.hpp - store API endpoint directory ----------------------===//
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
/// Declaration of the endpoint directory mapping logical resource names to
///    URLs and URL templates.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "tek-koboclient/base.h"
#include "tek-koboclient/error.h"

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace tek::koboclient {

/// Endpoint directory, populated once per session from the `Resources` object
///    of the initialization document and read-only afterwards.
class [[gnu::visibility("internal")]] endpoint_directory {
public:
  /// Populate the directory from an initialization response body.
  /// Non-string members of `Resources` are skipped.
  ///
  /// @param json
  ///    Response body of the initialization endpoint.
  /// @return A @ref tek_kc_err indicating the result of operation.
  tek_kc_err load(std::string_view json);

  /// Check whether the directory has been populated.
  bool loaded() const noexcept { return is_loaded; }

  /// Get URL of a resource.
  ///
  /// @param op
  ///    Primary error code for returned errors.
  /// @param name
  ///    Name of the resource.
  /// @param [out] url
  ///    Receives the URL on success.
  /// @return A @ref tek_kc_err indicating the result of operation.
  tek_kc_err get(tek_kc_errc op, std::string_view name, std::string &url) const;

  /// Get URL of a resource with `{ProductId}` placeholders substituted.
  ///
  /// @param op
  ///    Primary error code for returned errors.
  /// @param name
  ///    Name of the resource.
  /// @param product_id
  ///    Product ID to substitute.
  /// @param [out] url
  ///    Receives the URL on success.
  /// @return A @ref tek_kc_err indicating the result of operation.
  tek_kc_err expand(tek_kc_errc op, std::string_view name,
                    std::string_view product_id, std::string &url) const;

  /// Get number of resources in the directory.
  std::size_t size() const noexcept { return resources.size(); }

private:
  /// Resource names mapped to URLs.
  std::map<std::string, std::string, std::less<>> resources;
  /// Value indicating whether @ref load has succeeded.
  bool is_loaded = false;
};

} // namespace tek::koboclient
