//===-- auth_transport_test.cpp - authorized request executor tests -------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of tek-koboclient, under the GNU General Public License v3.0 or later
// See https://github.com/teknology-hub/tek-koboclient/blob/main/COPYING for
//    license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "auth_transport.hpp"

#include <cassert>
#include <curl/curl.h>
#include <iostream>
#include <string>

#include "creds.hpp"
#include "fake_transport.hpp"
#include "http.hpp"
#include "tek-koboclient/error.h"

namespace {

using tek::koboclient::auth_transport;
using tek::koboclient::creds;
using tek::koboclient::http_request;
using tek::koboclient::http_response;
using tek::koboclient::test::fake_transport;
using tek::koboclient::test::make_creds;

tek_kc_err Ok() {
  return {.type = TEK_KC_ERR_TYPE_basic,
          .primary = TEK_KC_ERRC_ok,
          .auxiliary = 0,
          .extra = 0,
          .uri = nullptr,
          .detail = nullptr};
}

http_request MakeRequest() {
  http_request req;
  req.url = "https://storeapi.kobo.com/v1/library/sync";
  return req;
}

void TestAddsBearerHeader() {
  fake_transport transport;
  creds          state = make_creds();
  int            refreshes = 0;
  auth_transport authorized(transport, state, [&refreshes] {
    ++refreshes;
    return Ok();
  });

  transport.push_json("[]");
  http_response resp;
  auto          res = authorized.perform(TEK_KC_ERRC_get_library, MakeRequest(), resp);

  assert(tek_kc_err_success(&res));
  assert(resp.status == 200);
  assert(resp.body == "[]");
  assert(refreshes == 0);
  assert(transport.requests.size() == 1);
  assert(fake_transport::header(transport.requests[0].req, "Authorization") == "Bearer access-1");
}

void TestRepairsUnauthorizedOnce() {
  fake_transport transport;
  creds          state = make_creds();
  int            refreshes = 0;
  auth_transport authorized(transport, state, [&] {
    ++refreshes;
    state.access_token = "access-2";
    return Ok();
  });

  transport.push_json("expired", 401);
  transport.push_json("[1]");
  http_response resp;
  auto          res = authorized.perform(TEK_KC_ERRC_get_library, MakeRequest(), resp);

  assert(tek_kc_err_success(&res));
  assert(resp.body == "[1]");
  assert(refreshes == 1);
  assert(transport.requests.size() == 2);
  assert(transport.requests[0].req.repairable);
  assert(fake_transport::header(transport.requests[1].req, "Authorization") == "Bearer access-2");
  assert(!transport.requests[1].req.repairable);
  assert(transport.requests[1].req.url == transport.requests[0].req.url);
}

void TestSecondUnauthorizedIsReturned() {
  fake_transport transport;
  creds          state = make_creds();
  int            refreshes = 0;
  auth_transport authorized(transport, state, [&refreshes] {
    ++refreshes;
    return Ok();
  });

  transport.push_json("expired", 401);
  transport.push_json("still expired", 401);
  http_response resp;
  auto          res = authorized.perform(TEK_KC_ERRC_get_wishlist, MakeRequest(), resp);

  assert(!tek_kc_err_success(&res));
  assert(res.type == TEK_KC_ERR_TYPE_curle);
  assert(res.primary == TEK_KC_ERRC_get_wishlist);
  assert(res.auxiliary == CURLE_HTTP_RETURNED_ERROR);
  assert(res.extra == 401);
  assert(std::string(res.uri) == "https://storeapi.kobo.com/v1/library/sync");
  assert(refreshes == 1);
  assert(transport.requests.size() == 2);
  tek_kc_err_release(&res);
}

void TestNonRepairableRequestIsNotRefreshed() {
  fake_transport transport;
  creds          state = make_creds();
  int            refreshes = 0;
  auth_transport authorized(transport, state, [&refreshes] {
    ++refreshes;
    return Ok();
  });

  auto req = MakeRequest();
  req.repairable = false;
  transport.push_json("expired", 401);
  http_response resp;
  auto          res = authorized.perform(TEK_KC_ERRC_get_library, req, resp);

  assert(res.type == TEK_KC_ERR_TYPE_curle);
  assert(res.extra == 401);
  assert(refreshes == 0);
  assert(transport.requests.size() == 1);
  tek_kc_err_release(&res);
}

void TestOtherStatusIsNotRepaired() {
  fake_transport transport;
  creds          state = make_creds();
  int            refreshes = 0;
  auth_transport authorized(transport, state, [&refreshes] {
    ++refreshes;
    return Ok();
  });

  transport.push_json("oops", 500);
  http_response resp;
  auto          res = authorized.perform(TEK_KC_ERRC_get_book_info, MakeRequest(), resp);

  assert(res.type == TEK_KC_ERR_TYPE_curle);
  assert(res.primary == TEK_KC_ERRC_get_book_info);
  assert(res.auxiliary == CURLE_HTTP_RETURNED_ERROR);
  assert(res.extra == 500);
  assert(refreshes == 0);
  assert(transport.requests.size() == 1);
  tek_kc_err_release(&res);
}

void TestRefreshFailureIsPropagated() {
  fake_transport transport;
  creds          state = make_creds();
  auth_transport authorized(transport, state, [] {
    return tek_kc_err{.type = TEK_KC_ERR_TYPE_sub,
                      .primary = TEK_KC_ERRC_auth_refresh,
                      .auxiliary = TEK_KC_ERRC_unsupported_token_type,
                      .extra = 0,
                      .uri = nullptr,
                      .detail = nullptr};
  });

  transport.push_json("expired", 401);
  transport.push_json("[]");
  http_response resp;
  auto          res = authorized.perform(TEK_KC_ERRC_get_library, MakeRequest(), resp);

  assert(res.type == TEK_KC_ERR_TYPE_sub);
  assert(res.primary == TEK_KC_ERRC_auth_refresh);
  assert(res.auxiliary == TEK_KC_ERRC_unsupported_token_type);
  assert(transport.requests.size() == 1);
  assert(transport.responses.size() == 1);
}

void TestTransportFailureIsPropagated() {
  fake_transport transport;
  creds          state = make_creds();
  int            refreshes = 0;
  auth_transport authorized(transport, state, [&refreshes] {
    ++refreshes;
    return Ok();
  });

  transport.push({.status = 0, .headers = {}, .body = {}, .curl_error = CURLE_COULDNT_RESOLVE_HOST});
  http_response resp;
  auto          res = authorized.perform(TEK_KC_ERRC_get_directory, MakeRequest(), resp);

  assert(res.type == TEK_KC_ERR_TYPE_curle);
  assert(res.primary == TEK_KC_ERRC_get_directory);
  assert(res.auxiliary == CURLE_COULDNT_RESOLVE_HOST);
  assert(refreshes == 0);
}

} // namespace

int main() {
  TestAddsBearerHeader();
  TestRepairsUnauthorizedOnce();
  TestSecondUnauthorizedIsReturned();
  TestNonRepairableRequestIsNotRefreshed();
  TestOtherStatusIsNotRepaired();
  TestRefreshFailureIsPropagated();
  TestTransportFailureIsPropagated();

  std::cout << "auth_transport_test: pass\n";
  return 0;
}
