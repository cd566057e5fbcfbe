//===-- http.cpp - HTTP request/response helpers --------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of tek-koboclient, under the GNU General Public License v3.0 or later
// See https://github.com/teknology-hub/tek-koboclient/blob/main/COPYING for
//    license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "http.hpp"

#include "tek-koboclient/error.h"
#include "utils.h"

#include <algorithm>
#include <curl/curl.h>
#include <string>
#include <string_view>

namespace tek::koboclient {

void http_request::set_header(std::string_view name, std::string_view value) {
  std::erase_if(headers, [name](const auto &hdr) { return hdr.first == name; });
  headers.emplace_back(name, value);
}

const std::string *http_response::header(std::string_view name) const noexcept {
  const auto it = std::ranges::find(headers, name, [](const auto &hdr) {
    return std::string_view{hdr.first};
  });
  return it == headers.end() ? nullptr : &it->second;
}

tek_kc_err http_status_err(tek_kc_errc prim, const http_request &req,
                           const http_response &resp) {
  return {.type = TEK_KC_ERR_TYPE_curle,
          .primary = prim,
          .auxiliary = CURLE_HTTP_RETURNED_ERROR,
          .extra = static_cast<int>(resp.status),
          .uri = tkci_u_strdup(req.url.data(), req.url.length()),
          .detail = nullptr};
}

} // namespace tek::koboclient
