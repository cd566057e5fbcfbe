//===-- auth_transport.cpp - authorized request executor implementation ---===//
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
/// Implementation of @ref tek::koboclient::auth_transport.
///
//===----------------------------------------------------------------------===//
#include "auth_transport.hpp"

#include "common/error.h"
#include "http.hpp"
#include "log.hpp"
#include "tek-koboclient/error.h"

#include <string>

namespace tek::koboclient {

tek_kc_err auth_transport::perform(tek_kc_errc op, http_request req,
                                   http_response &resp) {
  for (;;) {
    req.set_header("Authorization",
                   std::string{"Bearer "}.append(state.access_token));
    if (auto res = transport.perform(op, req, resp);
        !tek_kc_err_success(&res)) {
      return res;
    }
    if (resp.ok()) {
      return tkc_err_ok();
    }
    if (resp.status != 401 || !req.repairable) {
      return http_status_err(op, req, resp);
    }
    resp.body.clear();
    resp.body.shrink_to_fit();
    log::info("Refreshing expired authentication token",
              {log::str_field("url", req.url)});
    if (auto res = refresh(); !tek_kc_err_success(&res)) {
      return res;
    }
    req.repairable = false;
  }
}

} // namespace tek::koboclient
