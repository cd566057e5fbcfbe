//===-- auth_transport.hpp - authorized request executor ------------------===//
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
/// Declaration of the decorator that authorizes store API requests and
///    repairs an expired access token once per request.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "creds.hpp"
#include "http.hpp"
#include "tek-koboclient/base.h"
#include "tek-koboclient/error.h"

#include <functional>
#include <utility>

namespace tek::koboclient {

/// Executor of authorized requests.
/// Every request gets `Authorization: Bearer <access token>` header. If the
///    server responds with 401 to a repairable request, the refresh function
///    is called and the original request is resent exactly once with the new
///    token, marked non-repairable.
class [[gnu::visibility("internal")]] auth_transport {
public:
  /// Function refreshing the tokens in the credential state.
  using refresh_fn = std::function<tek_kc_err()>;

  /// @param [in] transport
  ///    Transport to send requests through.
  /// @param [in] state
  ///    Credential state to take the access token from. The current token is
  ///    read on every send.
  /// @param refresh
  ///    Function to call on 401 responses.
  auth_transport(http_transport &transport, const creds &state,
                 refresh_fn refresh)
      : transport(transport), state(state), refresh(std::move(refresh)) {}

  /// Send an authorized request.
  ///
  /// @param op
  ///    Primary error code for returned errors.
  /// @param req
  ///    The request to send. Its `Authorization` header is set by this
  ///    function.
  /// @param [out] resp
  ///    Receives the 2xx response on success.
  /// @return A @ref tek_kc_err indicating the result of operation. Non-2xx
  ///    responses other than a repaired 401 are returned as
  ///    @ref TEK_KC_ERR_TYPE_curle errors with HTTP status code in `extra`.
  tek_kc_err perform(tek_kc_errc op, http_request req, http_response &resp);

private:
  http_transport &transport;
  const creds &state;
  refresh_fn refresh;
};

} // namespace tek::koboclient
