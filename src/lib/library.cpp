//===-- library.cpp - library, wishlist and book information --------------===//
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
/// Implementation of @ref tek::koboclient::client catalog methods.
///
//===----------------------------------------------------------------------===//
#include "client.hpp"

#include "api.hpp"
#include "common/error.h"
#include "content.hpp"
#include "http.hpp"
#include "log.hpp"
#include "tek-koboclient/error.h"
#include "utils.h"

#include <rapidjson/document.h>
#include <rapidjson/reader.h>
#include <string>
#include <vector>

namespace tek::koboclient {

namespace {

//===-- Private functions -------------------------------------------------===//

/// Parse a response body into a document.
///
/// @param op
///    Primary error code for returned errors.
/// @param [in] resp
///    The response to parse body of.
/// @param [out] doc
///    Document to parse into.
/// @return A @ref tek_kc_err indicating the result of operation.
static tek_kc_err parse_body(tek_kc_errc op, const http_response &resp,
                             rapidjson::Document &doc) {
  doc.Parse<rapidjson::kParseStopWhenDoneFlag>(resp.body.data(),
                                               resp.body.length());
  if (doc.HasParseError()) {
    return tkc_err_sub(op, TEK_KC_ERRC_json_parse);
  }
  return tkc_err_ok();
}

} // namespace

//===-- Public functions --------------------------------------------------===//

tek_kc_err client::list_library_entries(rapidjson::Document &entries) {
  if (!state.auth_settings_set()) {
    auto err =
        tkc_err_sub(TEK_KC_ERRC_get_library, TEK_KC_ERRC_not_authenticated);
    if (!state.email.empty()) {
      err.uri = tkci_u_strdup(state.email.data(), state.email.length());
    }
    return err;
  }
  http_request req;
  if (auto res = dir.get(TEK_KC_ERRC_get_library, api::res::library_sync,
                         req.url);
      !tek_kc_err_success(&res)) {
    return res;
  }
  entries.SetArray();
  auto &alloc = entries.GetAllocator();
  std::string sync_token;
  int num_pages = 0;
  for (;;) {
    req.headers.clear();
    if (!sync_token.empty()) {
      req.set_header(api::hdr_sync_token, sync_token);
    }
    http_response resp;
    if (auto res = authorized.perform(TEK_KC_ERRC_get_library, req, resp);
        !tek_kc_err_success(&res)) {
      return res;
    }
    // Page values share the allocator of the result so they can be moved
    rapidjson::Document page(&alloc);
    if (auto res = parse_body(TEK_KC_ERRC_get_library, resp, page);
        !tek_kc_err_success(&res)) {
      return res;
    }
    if (!page.IsArray()) {
      return tkc_err_sub(TEK_KC_ERRC_get_library, TEK_KC_ERRC_invalid_data);
    }
    for (auto &entry : page.GetArray()) {
      entries.PushBack(entry.Move(), alloc);
    }
    ++num_pages;
    sync_token.clear();
    if (const auto sync = resp.header(api::hdr_sync);
        sync && *sync == "continue") {
      if (const auto token = resp.header(api::hdr_sync_token); token) {
        sync_token = *token;
      }
    }
    if (sync_token.empty()) {
      break;
    }
    log::debug("Library sync continues", {log::int_field("page", num_pages)});
  }
  log::debug("Library sync complete",
             {log::int_field("pages", num_pages),
              log::int_field("entries", entries.Size())});
  return tkc_err_ok();
}

tek_kc_err client::list_owned_books(std::vector<book> &books) {
  rapidjson::Document entries;
  if (auto res = list_library_entries(entries); !tek_kc_err_success(&res)) {
    return res;
  }
  books = entries_to_books(entries, &state);
  return tkc_err_ok();
}

tek_kc_err client::list_wishlist(rapidjson::Document &items) {
  http_request req;
  if (auto res = dir.get(TEK_KC_ERRC_get_wishlist, api::res::user_wishlist,
                         req.url);
      !tek_kc_err_success(&res)) {
    return res;
  }
  items.SetArray();
  auto &alloc = items.GetAllocator();
  for (int page_index = 0;;) {
    req.query = {{"PageIndex", std::to_string(page_index)},
                 {"PageSize", std::to_string(api::wishlist_page_size)}};
    http_response resp;
    if (auto res = authorized.perform(TEK_KC_ERRC_get_wishlist, req, resp);
        !tek_kc_err_success(&res)) {
      return res;
    }
    rapidjson::Document page(&alloc);
    if (auto res = parse_body(TEK_KC_ERRC_get_wishlist, resp, page);
        !tek_kc_err_success(&res)) {
      return res;
    }
    if (!page.IsObject()) {
      return tkc_err_sub(TEK_KC_ERRC_get_wishlist, TEK_KC_ERRC_invalid_data);
    }
    const auto total_pages = page.FindMember("TotalPageCount");
    if (total_pages == page.MemberEnd() || !total_pages->value.IsInt()) {
      return tkc_err_sub(TEK_KC_ERRC_get_wishlist, TEK_KC_ERRC_invalid_data);
    }
    const int num_pages = total_pages->value.GetInt();
    if (num_pages <= 0) {
      break;
    }
    const auto page_items = page.FindMember("Items");
    if (page_items == page.MemberEnd() || !page_items->value.IsArray()) {
      return tkc_err_sub(TEK_KC_ERRC_get_wishlist, TEK_KC_ERRC_invalid_data);
    }
    for (auto &item : page_items->value.GetArray()) {
      items.PushBack(item.Move(), alloc);
    }
    if (++page_index >= num_pages) {
      break;
    }
  }
  log::debug("Wishlist loaded", {log::int_field("items", items.Size())});
  return tkc_err_ok();
}

tek_kc_err client::get_book_info(std::string_view product_id,
                                 rapidjson::Document &info) {
  http_request req;
  if (auto res = dir.expand(TEK_KC_ERRC_get_book_info, api::res::book,
                            product_id, req.url);
      !tek_kc_err_success(&res)) {
    return res;
  }
  http_response resp;
  if (auto res = authorized.perform(TEK_KC_ERRC_get_book_info, req, resp);
      !tek_kc_err_success(&res)) {
    return res;
  }
  return parse_body(TEK_KC_ERRC_get_book_info, resp, info);
}

} // namespace tek::koboclient
