//===-- http.hpp - HTTP transport interface -------------------------------===//
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
/// Declarations of HTTP request/response types and the synchronous transport
///    interface that all store API calls go through.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "tek-koboclient/base.h"
#include "tek-koboclient/error.h"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tek::koboclient {

/// HTTP request methods used by the store API.
enum class http_method { get, post };

/// List of name-value pairs, used for headers and query parameters.
using http_fields = std::vector<std::pair<std::string, std::string>>;

/// Function receiving response body content as it arrives.
/// Returns `false` to abort the transfer.
using http_body_sink = std::function<bool(const char *data, std::size_t size)>;

/// HTTP request descriptor.
struct http_request {
  /// Request method.
  http_method method = http_method::get;
  /// URL of the request, without the parameters listed in @ref query.
  std::string url;
  /// Query parameters appended to @ref url, URL-encoded by the transport.
  http_fields query;
  /// Extra request headers.
  http_fields headers;
  /// Request body for POST requests.
  std::string body;
  /// Value of Content-Type header for @ref body.
  std::string content_type;
  /// If set, body of a 2xx response is passed to this function instead of
  ///    being stored in @ref http_response::body.
  http_body_sink sink;
  /// Value indicating whether an authorized request may be refreshed and
  ///    resent after a 401 response. Cleared on the resent request.
  bool repairable = true;

  /// Set a header, replacing previous values of the same header.
  void set_header(std::string_view name, std::string_view value);
};

/// HTTP response descriptor.
struct http_response {
  /// HTTP status code.
  long status = 0;
  /// Response headers of the final response, with lowercase names.
  http_fields headers;
  /// Response body, unless the request had a sink.
  std::string body;

  /// Find a header by its lowercase name.
  ///
  /// @return Pointer to the value of the first header with @p name, or
  ///    `nullptr` if there is none.
  const std::string *_Nullable header(std::string_view name) const noexcept;
  /// Check whether status code is 2xx.
  bool ok() const noexcept { return status >= 200 && status < 300; }
};

/// Synchronous HTTP transport.
class http_transport {
public:
  virtual ~http_transport() = default;

  /// Perform an HTTP request and receive the full response.
  ///
  /// @param op
  ///    Primary error code for returned errors, naming the operation that the
  ///    request belongs to.
  /// @param [in] req
  ///    Request to perform.
  /// @param [out] resp
  ///    Receives the response. Non-2xx responses are not errors at this
  ///    level.
  /// @return A @ref tek_kc_err indicating the result of the transfer itself.
  virtual tek_kc_err perform(tek_kc_errc op, const http_request &req,
                             http_response &resp) = 0;
};

/// Create a @ref TEK_KC_ERR_TYPE_curle error for a non-2xx response.
///
/// @param prim
///    Primary error code.
/// @param [in] req
///    The request that has failed.
/// @param [in] resp
///    The response with non-2xx status.
/// @return A @ref tek_kc_err with `CURLE_HTTP_RETURNED_ERROR` auxiliary code,
///    the status code in `extra`, and the request URL in `uri`.
[[gnu::visibility("internal")]]
tek_kc_err http_status_err(tek_kc_errc prim, const http_request &req,
                           const http_response &resp);

} // namespace tek::koboclient
