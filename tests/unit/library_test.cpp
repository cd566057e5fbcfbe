//===-- library_test.cpp - library sync, wishlist and book info tests -----===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of tek-koboclient, under the GNU General Public License v3.0 or later
// See https://github.com/teknology-hub/tek-koboclient/blob/main/COPYING for
//    license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "client.hpp"

#include <cassert>
#include <cstddef>
#include <curl/curl.h>
#include <iostream>
#include <rapidjson/document.h>
#include <string>
#include <utility>
#include <vector>

#include "content.hpp"
#include "creds.hpp"
#include "fake_transport.hpp"
#include "tek-koboclient/error.h"

namespace {

using tek::koboclient::book;
using tek::koboclient::client;
using tek::koboclient::creds;
using tek::koboclient::test::directory_json;
using tek::koboclient::test::fake_transport;
using tek::koboclient::test::make_creds;
using tek::koboclient::test::scripted_response;

void LoadDirectory(client& cl, fake_transport& transport) {
  transport.push_json(std::string(directory_json));
  auto res = cl.load_directory();
  assert(tek_kc_err_success(&res));
}

scripted_response SyncPage(std::string body, const char* sync, const char* token) {
  scripted_response resp;
  resp.body = std::move(body);
  if (sync) {
    resp.headers.emplace_back("x-kobo-sync", sync);
  }
  if (token) {
    resp.headers.emplace_back("x-kobo-synctoken", token);
  }
  return resp;
}

void TestNotAuthenticatedMakesNoRequests() {
  fake_transport transport;
  creds          state;
  state.email = "reader@example.com";
  client cl(transport, state);

  rapidjson::Document entries;
  auto                res = cl.list_library_entries(entries);
  assert(res.type == TEK_KC_ERR_TYPE_sub);
  assert(res.primary == TEK_KC_ERRC_get_library);
  assert(res.auxiliary == TEK_KC_ERRC_not_authenticated);
  assert(std::string(res.uri) == "reader@example.com");
  assert(transport.requests.empty());
  tek_kc_err_release(&res);

  std::vector<book> books;
  res = cl.list_owned_books(books);
  assert(res.auxiliary == TEK_KC_ERRC_not_authenticated);
  assert(transport.requests.empty());
  tek_kc_err_release(&res);
}

void TestLibraryFollowsSyncTokens() {
  fake_transport transport;
  creds          state = make_creds();
  client         cl(transport, state);
  LoadDirectory(cl, transport);

  transport.push(SyncPage(R"([{"n":1},{"n":2}])", "continue", "token-1"));
  transport.push(SyncPage(R"([{"n":3}])", "continue", "token-2"));
  transport.push(SyncPage(R"([])", nullptr, "token-3"));
  rapidjson::Document entries;
  auto                res = cl.list_library_entries(entries);

  assert(tek_kc_err_success(&res));
  assert(entries.IsArray());
  assert(entries.Size() == 3);
  for (int i = 0; i < 3; ++i) {
    assert(entries[i]["n"].GetInt() == i + 1);
  }

  assert(transport.requests.size() == 4);
  for (std::size_t i = 1; i < 4; ++i) {
    const auto& req = transport.requests[i];
    assert(req.op == TEK_KC_ERRC_get_library);
    assert(req.req.url == "https://storeapi.kobo.com/v1/library/sync");
    assert(fake_transport::header(req.req, "Authorization") == "Bearer access-1");
  }
  assert(fake_transport::header(transport.requests[1].req, "x-kobo-synctoken").empty());
  assert(fake_transport::header(transport.requests[2].req, "x-kobo-synctoken") == "token-1");
  assert(fake_transport::header(transport.requests[3].req, "x-kobo-synctoken") == "token-2");
}

void TestLibraryStopsWithoutToken() {
  fake_transport transport;
  creds          state = make_creds();
  client         cl(transport, state);
  LoadDirectory(cl, transport);

  transport.push(SyncPage(R"([{"n":1}])", "continue", nullptr));
  transport.push(SyncPage(R"([{"n":2}])", nullptr, nullptr));
  rapidjson::Document entries;
  auto                res = cl.list_library_entries(entries);

  assert(tek_kc_err_success(&res));
  assert(entries.Size() == 1);
  assert(transport.requests.size() == 2);
  assert(transport.responses.size() == 1);
}

void TestLibraryErrors() {
  fake_transport transport;
  creds          state = make_creds();
  client         cl(transport, state);

  rapidjson::Document entries;
  auto                res = cl.list_library_entries(entries);
  assert(res.auxiliary == TEK_KC_ERRC_directory_not_loaded);
  assert(transport.requests.empty());

  LoadDirectory(cl, transport);
  transport.push_json("", 500);
  res = cl.list_library_entries(entries);
  assert(res.type == TEK_KC_ERR_TYPE_curle);
  assert(res.primary == TEK_KC_ERRC_get_library);
  assert(res.auxiliary == CURLE_HTTP_RETURNED_ERROR);
  assert(res.extra == 500);
  tek_kc_err_release(&res);

  transport.push_json(R"({"not":"an array"})");
  res = cl.list_library_entries(entries);
  assert(res.type == TEK_KC_ERR_TYPE_sub);
  assert(res.auxiliary == TEK_KC_ERRC_invalid_data);

  transport.push_json("[{");
  res = cl.list_library_entries(entries);
  assert(res.auxiliary == TEK_KC_ERRC_json_parse);
}

void TestOwnedBooks() {
  fake_transport transport;
  creds          state = make_creds();
  client         cl(transport, state);
  LoadDirectory(cl, transport);

  transport.push(SyncPage(R"([{"NewEntitlement":{"BookMetadata":{"RevisionId":"rev-1","Title":"One",)"
                          R"("ContributorRoles":[{"Name":"Ann","Role":"Author"}]}}}])",
                          "continue", "token-1"));
  transport.push(SyncPage(R"([{"ChangedReadingState":{}},)"
                          R"({"ChangedEntitlement":{"BookEntitlement":{"IsRemoved":true},)"
                          R"("BookMetadata":{"RevisionId":"rev-2","Title":"Two"}}}])",
                          nullptr, nullptr));
  std::vector<book> books;
  auto              res = cl.list_owned_books(books);

  assert(tek_kc_err_success(&res));
  assert(books.size() == 2);
  assert(books[0].revision_id == "rev-1");
  assert(books[0].title == "One");
  assert(books[0].author == "Ann");
  assert(!books[0].archived);
  assert(books[0].owner == &state);
  assert(books[1].revision_id == "rev-2");
  assert(books[1].archived);
}

void TestWishlistPagination() {
  fake_transport transport;
  creds          state = make_creds();
  client         cl(transport, state);
  LoadDirectory(cl, transport);

  transport.push_json(R"({"Items":[{"n":1},{"n":2}],"TotalPageCount":2})");
  transport.push_json(R"({"Items":[{"n":3}],"TotalPageCount":2})");
  rapidjson::Document items;
  auto                res = cl.list_wishlist(items);

  assert(tek_kc_err_success(&res));
  assert(items.Size() == 3);
  assert(items[2]["n"].GetInt() == 3);
  assert(transport.requests.size() == 3);
  for (std::size_t i = 1; i < 3; ++i) {
    const auto& req = transport.requests[i];
    assert(req.op == TEK_KC_ERRC_get_wishlist);
    assert(req.req.url == "https://storeapi.kobo.com/v1/user/wishlist");
    assert(fake_transport::query(req.req, "PageIndex") == std::to_string(i - 1));
    assert(fake_transport::query(req.req, "PageSize") == "100");
    assert(fake_transport::header(req.req, "Authorization") == "Bearer access-1");
  }
}

void TestEmptyWishlist() {
  fake_transport transport;
  creds          state = make_creds();
  client         cl(transport, state);
  LoadDirectory(cl, transport);

  transport.push_json(R"({"Items":[],"TotalPageCount":0})");
  rapidjson::Document items;
  auto                res = cl.list_wishlist(items);
  assert(tek_kc_err_success(&res));
  assert(items.IsArray());
  assert(items.Empty());
  assert(transport.requests.size() == 2);

  transport.push_json(R"({"Items":[{"n":1}]})");
  res = cl.list_wishlist(items);
  assert(res.type == TEK_KC_ERR_TYPE_sub);
  assert(res.primary == TEK_KC_ERRC_get_wishlist);
  assert(res.auxiliary == TEK_KC_ERRC_invalid_data);
}

void TestGetBookInfo() {
  fake_transport transport;
  creds          state = make_creds();
  client         cl(transport, state);
  LoadDirectory(cl, transport);

  transport.push_json(R"({"Title":"Some Book","CrossRevisionId":"cr-1"})");
  rapidjson::Document info;
  auto                res = cl.get_book_info("pid-42", info);

  assert(tek_kc_err_success(&res));
  assert(std::string(info["Title"].GetString()) == "Some Book");
  assert(transport.requests.size() == 2);
  assert(transport.requests[1].op == TEK_KC_ERRC_get_book_info);
  assert(transport.requests[1].req.url == "https://storeapi.kobo.com/v1/products/books/pid-42");

  transport.push_json("", 404);
  res = cl.get_book_info("missing", info);
  assert(res.type == TEK_KC_ERR_TYPE_curle);
  assert(res.primary == TEK_KC_ERRC_get_book_info);
  assert(res.extra == 404);
  assert(std::string(res.uri) == "https://storeapi.kobo.com/v1/products/books/missing");
  tek_kc_err_release(&res);
}

} // namespace

int main() {
  TestNotAuthenticatedMakesNoRequests();
  TestLibraryFollowsSyncTokens();
  TestLibraryStopsWithoutToken();
  TestLibraryErrors();
  TestOwnedBooks();
  TestWishlistPagination();
  TestEmptyWishlist();
  TestGetBookInfo();

  std::cout << "library_test: pass\n";
  return 0;
}
