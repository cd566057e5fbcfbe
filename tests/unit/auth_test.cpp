//===-- auth_test.cpp - device registration, sign-in and refresh tests ----===//
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
#include <curl/curl.h>
#include <iostream>
#include <rapidjson/document.h>
#include <string>
#include <string_view>

#include "creds.hpp"
#include "fake_transport.hpp"
#include "http.hpp"
#include "tek-koboclient/error.h"

namespace {

using tek::koboclient::client;
using tek::koboclient::creds;
using tek::koboclient::http_method;
using tek::koboclient::test::directory_json;
using tek::koboclient::test::fake_transport;
using tek::koboclient::test::make_creds;
using tek::koboclient::test::memory_creds_store;
using tek::koboclient::test::token_json;

constexpr std::string_view kClientKey = "MDAwMDAwMDAtMDAwMC0wMDAwLTAwMDAtMDAwMDAwMDA0MDAw";
constexpr std::string_view kWorkflowId = "abcdefab-1234-4678-9abc-def012345678";

std::string GetString(const rapidjson::Document& doc, const char* name) {
  const auto it = doc.FindMember(name);
  assert(it != doc.MemberEnd());
  assert(it->value.IsString());
  return {it->value.GetString(), it->value.GetStringLength()};
}

rapidjson::Document ParseBody(const std::string& body) {
  rapidjson::Document doc;
  doc.Parse(body.data(), body.length());
  assert(!doc.HasParseError());
  assert(doc.IsObject());
  return doc;
}

std::string SignInPage() {
  return std::string(R"(<html><body><form action="/ww/en/signin/signin?workflowId=)")
      .append(kWorkflowId)
      .append(R"(&amp;returnUrl=x" method="post">)"
              R"(<input name="__RequestVerificationToken" type="hidden" value="tok&amp;en/+=" />)"
              R"(</form></body></html>)");
}

constexpr std::string_view kSignedInPage =
    R"(<html><script>window.location.href = )"
    R"('kobo://UserAuthenticated?userId=user%2B42&userKey=secret+key&email=reader%40example.com';)"
    R"(</script></html>)";

void TestRegisterDeviceGeneratesDeviceId() {
  fake_transport     transport;
  memory_creds_store store;
  creds              state;
  client             cl(transport, state, &store);
  assert(!state.auth_settings_set());

  transport.push_json(token_json("access-a", "refresh-a"));
  auto res = cl.register_device();

  assert(tek_kc_err_success(&res));
  assert(state.auth_settings_set());
  assert(state.device_id.size() == 36);
  for (const auto pos : {8, 13, 18, 23}) {
    assert(state.device_id[pos] == '-');
  }
  assert(state.device_id[14] == '4');
  assert(state.access_token == "access-a");
  assert(state.refresh_token == "refresh-a");
  assert(state.user_key.empty());
  assert(store.saved.size() == 1);
  assert(store.saved[0].device_id == state.device_id);
  assert(store.saved[0].access_token == "access-a");

  assert(transport.requests.size() == 1);
  const auto& req = transport.requests[0];
  assert(req.op == TEK_KC_ERRC_auth_device);
  assert(req.req.method == http_method::post);
  assert(req.req.url == "https://storeapi.kobo.com/v1/auth/device");
  assert(req.req.content_type == "application/json");
  assert(fake_transport::header(req.req, "Authorization").empty());
  const auto body = ParseBody(req.req.body);
  assert(GetString(body, "AffiliateName") == "Kobo");
  assert(GetString(body, "AppVersion") == "8.11.24971");
  assert(GetString(body, "ClientKey") == kClientKey);
  assert(GetString(body, "DeviceId") == state.device_id);
  assert(GetString(body, "PlatformId") == "00000000-0000-0000-0000-000000004000");
  assert(!body.HasMember("UserKey"));
}

void TestRegisterDeviceKeepsDeviceIdAndTakesUserKey() {
  fake_transport     transport;
  memory_creds_store store;
  creds              state = make_creds();
  client             cl(transport, state, &store);

  transport.push_json(token_json("access-b", "refresh-b"));
  auto res = cl.register_device("user-key-in");

  assert(tek_kc_err_success(&res));
  assert(state.device_id == "11111111-2222-4333-8444-555555555555");
  assert(state.user_key == "server-user-key");
  assert(state.access_token == "access-b");
  const auto body = ParseBody(transport.requests[0].req.body);
  assert(GetString(body, "DeviceId") == state.device_id);
  assert(GetString(body, "UserKey") == "user-key-in");
  assert(store.saved.size() == 1);
  assert(store.saved[0].user_key == "server-user-key");
}

void TestRegisterDeviceRejectsTokenType() {
  fake_transport     transport;
  memory_creds_store store;
  creds              state = make_creds();
  client             cl(transport, state, &store);

  transport.push_json(token_json("access-c", "refresh-c", "Basic"));
  auto res = cl.register_device();

  assert(res.type == TEK_KC_ERR_TYPE_sub);
  assert(res.primary == TEK_KC_ERRC_auth_device);
  assert(res.auxiliary == TEK_KC_ERRC_unsupported_token_type);
  assert(std::string(res.detail) == "Basic");
  assert(state.access_token == "access-1");
  assert(store.saved.empty());
  tek_kc_err_release(&res);
}

void TestRegisterDeviceRequiresBothTokens() {
  fake_transport     transport;
  memory_creds_store store;
  creds              state = make_creds();
  client             cl(transport, state, &store);

  transport.push_json(token_json("", "refresh-d"));
  auto res = cl.register_device();

  assert(res.type == TEK_KC_ERR_TYPE_sub);
  assert(res.auxiliary == TEK_KC_ERRC_auth_settings_not_set);
  assert(!state.auth_settings_set());
  assert(store.saved.empty());
}

void TestRegisterDeviceHttpError() {
  fake_transport transport;
  creds          state = make_creds();
  client         cl(transport, state);

  transport.push_json("{}", 403);
  auto res = cl.register_device();

  assert(res.type == TEK_KC_ERR_TYPE_curle);
  assert(res.primary == TEK_KC_ERRC_auth_device);
  assert(res.auxiliary == CURLE_HTTP_RETURNED_ERROR);
  assert(res.extra == 403);
  tek_kc_err_release(&res);
}

void TestExpiredTokenIsRefreshed() {
  fake_transport     transport;
  memory_creds_store store;
  creds              state = make_creds();
  client             cl(transport, state, &store);

  transport.push_json("", 401);
  transport.push_json(token_json("access-2", "refresh-2"));
  transport.push_json(std::string(directory_json));
  auto res = cl.load_directory();

  assert(tek_kc_err_success(&res));
  assert(cl.directory().loaded());
  assert(transport.requests.size() == 3);
  assert(transport.requests[0].req.url == "https://storeapi.kobo.com/v1/initialization");
  assert(fake_transport::header(transport.requests[0].req, "Authorization") == "Bearer access-1");

  const auto& refresh = transport.requests[1];
  assert(refresh.op == TEK_KC_ERRC_auth_refresh);
  assert(refresh.req.method == http_method::post);
  assert(refresh.req.url == "https://storeapi.kobo.com/v1/auth/refresh");
  assert(!refresh.req.repairable);
  assert(fake_transport::header(refresh.req, "Authorization") == "Bearer access-1");
  const auto body = ParseBody(refresh.req.body);
  assert(GetString(body, "RefreshToken") == "refresh-1");
  assert(GetString(body, "ClientKey") == kClientKey);
  assert(GetString(body, "AppVersion") == "8.11.24971");
  assert(GetString(body, "PlatformId") == "00000000-0000-0000-0000-000000004000");

  assert(fake_transport::header(transport.requests[2].req, "Authorization") == "Bearer access-2");
  assert(state.access_token == "access-2");
  assert(state.refresh_token == "refresh-2");
  assert(state.user_key == "key-1");
  assert(store.saved.size() == 1);
  assert(store.saved[0].access_token == "access-2");
}

void TestFailedRefreshKeepsCredentials() {
  fake_transport     transport;
  memory_creds_store store;
  creds              state = make_creds();
  client             cl(transport, state, &store);

  transport.push_json("", 401);
  transport.push_json("{}", 400);
  auto res = cl.load_directory();

  assert(res.type == TEK_KC_ERR_TYPE_curle);
  assert(res.primary == TEK_KC_ERRC_auth_refresh);
  assert(res.extra == 400);
  assert(transport.requests.size() == 2);
  assert(state.access_token == "access-1");
  assert(state.refresh_token == "refresh-1");
  assert(store.saved.empty());
  assert(!cl.directory().loaded());
  tek_kc_err_release(&res);
}

void TestLoginFlow() {
  fake_transport     transport;
  memory_creds_store store;
  creds              state = make_creds();
  state.email.clear();
  state.user_id.clear();
  client cl(transport, state, &store);

  transport.push_json(std::string(directory_json));
  auto res = cl.load_directory();
  assert(tek_kc_err_success(&res));

  transport.push_json(SignInPage());
  transport.push_json(std::string(kSignedInPage));
  transport.push_json(token_json("access-l", "refresh-l"));
  res = cl.login("reader@example.com", "p@ss w", "captcha-token");

  assert(tek_kc_err_success(&res));
  assert(transport.requests.size() == 4);

  const auto& page = transport.requests[1].req;
  assert(transport.requests[1].op == TEK_KC_ERRC_login);
  assert(page.method == http_method::get);
  assert(page.url == "https://authorize.kobo.com/signin?foo=bar");
  assert(fake_transport::query(page, "wsa") == "Kobo");
  assert(fake_transport::query(page, "pwsav") == "8.11.24971");
  assert(fake_transport::query(page, "pwspid") == "00000000-0000-0000-0000-000000004000");
  assert(fake_transport::query(page, "pwsdid") == "11111111-2222-4333-8444-555555555555");
  assert(fake_transport::header(page, "Authorization").empty());

  const auto& form = transport.requests[2].req;
  assert(form.method == http_method::post);
  assert(form.url == "https://authorize.kobo.com/ww/en/signin/signin/kobo");
  assert(form.content_type == "application/x-www-form-urlencoded");
  assert(form.body == std::string("LogInModel.WorkflowId=")
                          .append(kWorkflowId)
                          .append("&LogInModel.Provider=Kobo"
                                  "&ReturnUrl="
                                  "&__RequestVerificationToken=tok%26en%2F%2B%3D"
                                  "&LogInModel.UserName=reader%40example.com"
                                  "&LogInModel.Password=p%40ss%20w"
                                  "&g-recaptcha-response=captcha-token"));

  const auto& device = transport.requests[3].req;
  assert(device.url == "https://storeapi.kobo.com/v1/auth/device");
  const auto body = ParseBody(device.body);
  assert(GetString(body, "UserKey") == "secret key");
  assert(GetString(body, "DeviceId") == "11111111-2222-4333-8444-555555555555");

  assert(state.email == "reader@example.com");
  assert(state.user_id == "user+42");
  assert(state.user_key == "server-user-key");
  assert(state.access_token == "access-l");
  assert(store.saved.size() == 1);
  assert(store.saved[0].email == "reader@example.com");
  assert(store.saved[0].user_id == "user+42");
}

void TestLoginRequiresDirectory() {
  fake_transport transport;
  creds          state = make_creds();
  client         cl(transport, state);

  auto res = cl.login("reader@example.com", "password", "captcha");

  assert(res.type == TEK_KC_ERR_TYPE_sub);
  assert(res.primary == TEK_KC_ERRC_login);
  assert(res.auxiliary == TEK_KC_ERRC_directory_not_loaded);
  assert(transport.requests.empty());
}

void TestLoginMissingWorkflowId() {
  fake_transport transport;
  creds          state = make_creds();
  client         cl(transport, state);

  transport.push_json(std::string(directory_json));
  auto res = cl.load_directory();
  assert(tek_kc_err_success(&res));

  transport.push_json("<html><body>Service unavailable</body></html>");
  res = cl.login("reader@example.com", "password", "captcha");

  assert(res.type == TEK_KC_ERR_TYPE_sub);
  assert(res.primary == TEK_KC_ERRC_login);
  assert(res.auxiliary == TEK_KC_ERRC_login_workflow_id);
  assert(transport.requests.size() == 2);
}

void TestLoginMissingUserUrl() {
  fake_transport     transport;
  memory_creds_store store;
  creds              state = make_creds();
  client             cl(transport, state, &store);

  transport.push_json(std::string(directory_json));
  auto res = cl.load_directory();
  assert(tek_kc_err_success(&res));

  transport.push_json(SignInPage());
  transport.push_json("<html><body>Invalid email or password</body></html>");
  res = cl.login("reader@example.com", "wrong", "captcha");

  assert(res.type == TEK_KC_ERR_TYPE_sub);
  assert(res.auxiliary == TEK_KC_ERRC_login_user_url);
  assert(transport.requests.size() == 3);
  assert(state.user_id == "user-1");
  assert(store.saved.empty());
}

} // namespace

int main() {
  TestRegisterDeviceGeneratesDeviceId();
  TestRegisterDeviceKeepsDeviceIdAndTakesUserKey();
  TestRegisterDeviceRejectsTokenType();
  TestRegisterDeviceRequiresBothTokens();
  TestRegisterDeviceHttpError();
  TestExpiredTokenIsRefreshed();
  TestFailedRefreshKeepsCredentials();
  TestLoginFlow();
  TestLoginRequiresDirectory();
  TestLoginMissingWorkflowId();
  TestLoginMissingUserUrl();

  std::cout << "auth_test: pass\n";
  return 0;
}
