//===-- curl_transport.cpp - libcurl HTTP transport implementation --------===//
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
/// Implementation of @ref tek::koboclient::curl_transport.
///
//===----------------------------------------------------------------------===//
#include "curl_transport.hpp"

#include "common/error.h"
#include "config.h"
#include "http.hpp"
#include "log.hpp"
#include "tek-koboclient/error.h"
#include "utils.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <curl/curl.h>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace tek::koboclient {

//===-- Internal functions ------------------------------------------------===//

std::size_t write_body(const char *buf, std::size_t, std::size_t size,
                       transfer_ctx &ctx) {
  if (ctx.req.sink && ctx.resp.ok()) {
    return ctx.req.sink(buf, size) ? size : CURL_WRITEFUNC_ERROR;
  }
  ctx.resp.body.append(buf, size);
  return size;
}

std::size_t write_header(const char *buf, std::size_t, std::size_t size,
                         transfer_ctx &ctx) {
  std::string_view line{buf, size};
  if (line.starts_with("HTTP/")) {
    ctx.resp.headers.clear();
    ctx.resp.status = 0;
    if (const auto space = line.find(' '); space != std::string_view::npos) {
      const auto code = line.substr(space + 1, 3);
      long status;
      if (const auto [ptr, ec] =
              std::from_chars(code.data(), code.data() + code.length(), status);
          ec == std::errc{} && ptr == code.data() + code.length()) {
        ctx.resp.status = status;
      }
    }
    return size;
  }
  const auto colon = line.find(':');
  if (colon == std::string_view::npos) {
    return size;
  }
  std::string name{line.substr(0, colon)};
  std::ranges::transform(name, name.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  auto value = line.substr(colon + 1);
  value.remove_prefix(std::min(value.find_first_not_of(" \t"), value.size()));
  if (const auto end = value.find_last_not_of(" \t\r\n");
      end != std::string_view::npos) {
    value = value.substr(0, end + 1);
  } else {
    value = {};
  }
  ctx.resp.headers.emplace_back(std::move(name), value);
  return size;
}

tek_kc_err build_url(tek_kc_errc op, const http_request &req,
                     std::string &url) {
  if (req.query.empty()) {
    url = req.url;
    return tkc_err_ok();
  }
  const std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> curlu{
      curl_url(), curl_url_cleanup};
  if (!curlu) {
    return tkc_err_sub(op, TEK_KC_ERRC_curl_url);
  }
  if (curl_url_set(curlu.get(), CURLUPART_URL, req.url.data(), 0) !=
      CURLUE_OK) {
    auto err = tkc_err_sub(op, TEK_KC_ERRC_invalid_url);
    err.uri = tkci_u_strdup(req.url.data(), req.url.length());
    return err;
  }
  for (const auto &[name, value] : req.query) {
    const auto param = std::string{name}.append(1, '=').append(value);
    if (curl_url_set(curlu.get(), CURLUPART_QUERY, param.data(),
                     CURLU_APPENDQUERY | CURLU_URLENCODE) != CURLUE_OK) {
      return tkc_err_sub(op, TEK_KC_ERRC_curl_url);
    }
  }
  char *full_url;
  if (curl_url_get(curlu.get(), CURLUPART_URL, &full_url, 0) != CURLUE_OK) {
    return tkc_err_sub(op, TEK_KC_ERRC_curl_url);
  }
  url = full_url;
  curl_free(full_url);
  return tkc_err_ok();
}

//===-- Public functions --------------------------------------------------===//

tek_kc_err curl_transport::create(std::unique_ptr<curl_transport> &transport) {
  const auto curl = curl_easy_init();
  if (!curl) {
    return tkc_err_basic(TEK_KC_ERRC_curle_init);
  }
  transport.reset(new curl_transport(curl));
  return tkc_err_ok();
}

tek_kc_err curl_transport::perform(tek_kc_errc op, const http_request &req,
                                   http_response &resp) {
  std::string url;
  if (auto res = build_url(op, req, url); !tek_kc_err_success(&res)) {
    return res;
  }
  resp.status = 0;
  resp.headers.clear();
  resp.body.clear();
  const auto curl = this->curl.get();
  curl_easy_reset(curl);
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers{
      nullptr, curl_slist_free_all};
  const auto append_header = [&headers](std::string_view name,
                                        std::string_view value) {
    const auto line = std::string{name}.append(": ").append(value);
    const auto list = curl_slist_append(headers.get(), line.data());
    if (list) {
      headers.release();
      headers.reset(list);
    }
    return list != nullptr;
  };
  for (const auto &[name, value] : req.headers) {
    if (!append_header(name, value)) {
      return tkc_err_sub(op, TEK_KC_ERRC_curle_init);
    }
  }
  if (req.method == http_method::post && !req.content_type.empty() &&
      !append_header("Content-Type", req.content_type)) {
    return tkc_err_sub(op, TEK_KC_ERRC_curle_init);
  }
  transfer_ctx ctx{.req = req, .resp = resp};
  // An empty file name enables the cookie engine without loading anything,
  //    cookies received earlier are kept in the handle across resets
  curl_easy_setopt(curl, CURLOPT_COOKIEFILE, "");
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 8000L);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, TEK_KC_UA);
  curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(curl, CURLOPT_URL, url.data());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, write_header);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
  if (req.method == http_method::post) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(req.body.length()));
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, req.body.data());
  }
  log::debug("Sending request",
             {log::str_field("method",
                             req.method == http_method::post ? "POST" : "GET"),
              log::str_field("url", req.url)});
  const auto res = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
  if (res != CURLE_OK) {
    return {.type = TEK_KC_ERR_TYPE_curle,
            .primary = op,
            .auxiliary = res,
            .extra = static_cast<int>(resp.status),
            .uri = tkci_u_strdup(req.url.data(), req.url.length()),
            .detail = nullptr};
  }
  log::debug("Received response", {log::str_field("url", req.url),
                                   log::int_field("status", resp.status)});
  return tkc_err_ok();
}

} // namespace tek::koboclient
