//===-- directory.cpp - endpoint directory implementation -----------------===//
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
/// Implementation of @ref tek::koboclient::endpoint_directory.
///
//===----------------------------------------------------------------------===//
#include "directory.hpp"

#include "api.hpp"
#include "common/error.h"
#include "tek-koboclient/error.h"
#include "utils.h"

#include <rapidjson/document.h>
#include <rapidjson/reader.h>
#include <string>
#include <string_view>

namespace tek::koboclient {

tek_kc_err endpoint_directory::load(std::string_view json) {
  rapidjson::Document doc;
  doc.Parse<rapidjson::kParseStopWhenDoneFlag>(json.data(), json.length());
  if (doc.HasParseError() || !doc.IsObject()) {
    return tkc_err_sub(TEK_KC_ERRC_get_directory, TEK_KC_ERRC_json_parse);
  }
  const auto res = doc.FindMember("Resources");
  if (res == doc.MemberEnd() || !res->value.IsObject()) {
    return tkc_err_sub(TEK_KC_ERRC_get_directory, TEK_KC_ERRC_invalid_data);
  }
  resources.clear();
  for (const auto &[name, value] : res->value.GetObject()) {
    if (!value.IsString()) {
      continue;
    }
    resources.emplace(std::string{name.GetString(), name.GetStringLength()},
                      std::string{value.GetString(), value.GetStringLength()});
  }
  is_loaded = true;
  return tkc_err_ok();
}

tek_kc_err endpoint_directory::get(tek_kc_errc op, std::string_view name,
                                   std::string &url) const {
  if (!is_loaded) {
    return tkc_err_sub(op, TEK_KC_ERRC_directory_not_loaded);
  }
  const auto it = resources.find(name);
  if (it == resources.end()) {
    auto err = tkc_err_sub(op, TEK_KC_ERRC_directory_no_resource);
    err.uri = tkci_u_strdup(name.data(), name.length());
    return err;
  }
  url = it->second;
  return tkc_err_ok();
}

tek_kc_err endpoint_directory::expand(tek_kc_errc op, std::string_view name,
                                      std::string_view product_id,
                                      std::string &url) const {
  if (auto res = get(op, name, url); !tek_kc_err_success(&res)) {
    return res;
  }
  for (auto pos = url.find(api::product_id_placeholder);
       pos != std::string::npos;
       pos = url.find(api::product_id_placeholder, pos + product_id.length())) {
    url.replace(pos, api::product_id_placeholder.length(), product_id);
  }
  return tkc_err_ok();
}

} // namespace tek::koboclient
