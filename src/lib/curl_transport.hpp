//===-- curl_transport.hpp - libcurl HTTP transport -----------------------===//
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
/// Declarations of the libcurl implementation of @ref
///    tek::koboclient::http_transport and the curl callbacks it installs.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "http.hpp"
#include "tek-koboclient/error.h"

#include <cstddef>
#include <curl/curl.h>
#include <memory>
#include <string>

namespace tek::koboclient {

/// HTTP transport using a single libcurl easy handle.
/// Connections and cookies are kept in the handle between requests, which
///    the sign-in flow relies on.
class [[gnu::visibility("internal")]] curl_transport final
    : public http_transport {
public:
  /// Create a transport.
  ///
  /// @param [out] transport
  ///    Receives the created transport on success.
  /// @return A @ref tek_kc_err indicating the result of operation.
  static tek_kc_err create(std::unique_ptr<curl_transport> &transport);

  tek_kc_err perform(tek_kc_errc op, const http_request &req,
                     http_response &resp) override;

private:
  explicit curl_transport(CURL *_Nonnull curl) noexcept
      : curl(curl, curl_easy_cleanup) {}

  /// curl easy handle that performs requests.
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl;
};

/// Transfer context passed to curl callbacks.
struct transfer_ctx {
  /// The request being performed.
  const http_request &req;
  /// The response being received. Its status is updated from status lines as
  ///    they arrive.
  http_response &resp;
};

/// curl write data callback that passes body of 2xx responses to the
///    request's sink, or stores the body in the response otherwise.
///
/// @param [in] buf
///    Pointer to the buffer containing downloaded content chunk.
/// @param size
///    Size of the chunk, in bytes.
/// @param [in, out] ctx
///    Transfer context.
/// @return @p size, or `CURL_WRITEFUNC_ERROR` if the sink has aborted the
///    transfer.
[[gnu::visibility("internal")]]
std::size_t write_body(const char *_Nonnull buf, std::size_t, std::size_t size,
                       transfer_ctx &ctx);

/// curl header callback that collects headers of the final response with
///    lowercase names. A status line starts a new response, discarding
///    headers of redirects and interim responses.
///
/// @param [in] buf
///    Pointer to the buffer containing the header line.
/// @param size
///    Size of the header line, in bytes.
/// @param [in, out] ctx
///    Transfer context.
/// @return @p size.
[[gnu::visibility("internal")]]
std::size_t write_header(const char *_Nonnull buf, std::size_t,
                         std::size_t size, transfer_ctx &ctx);

/// Build the full request URL with URL-encoded query parameters appended.
///
/// @param op
///    Primary error code for returned errors.
/// @param [in] req
///    The request to build the URL for.
/// @param [out] url
///    Receives the URL.
/// @return A @ref tek_kc_err indicating the result of operation.
[[gnu::visibility("internal")]]
tek_kc_err build_url(tek_kc_errc op, const http_request &req,
                     std::string &url);

} // namespace tek::koboclient
