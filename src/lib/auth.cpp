//===-- auth.cpp - device registration, sign-in and token refresh ---------===//
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
/// Implementation of @ref tek::koboclient::client construction, authentication
///    methods and endpoint directory loading.
///
//===----------------------------------------------------------------------===//
#include "client.hpp"

#include "api.hpp"
#include "common/error.h"
#include "http.hpp"
#include "log.hpp"
#include "scrape.hpp"
#include "tek-koboclient/error.h"
#include "utils.h"

#include <curl/curl.h>
#include <memory>
#include <rapidjson/document.h>
#include <rapidjson/reader.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <string>
#include <string_view>
#include <utility>

namespace tek::koboclient {

namespace {

//===-- Private functions -------------------------------------------------===//

/// Write a string key-value pair to a JSON object.
static void write_str(rapidjson::Writer<rapidjson::StringBuffer> &writer,
                      std::string_view key, std::string_view value) {
  writer.Key(key.data(), key.length());
  writer.String(value.data(), value.length());
}

/// Write the fields identifying the application to a JSON object.
static void write_app_fields(rapidjson::Writer<rapidjson::StringBuffer> &writer) {
  // Client key is Base64 encoding of the platform ID string
  char client_key[(api::platform_id.length() + 2) / 3 * 4 + 1];
  tkci_u_base64_encode(
      reinterpret_cast<const unsigned char *>(api::platform_id.data()),
      static_cast<int>(api::platform_id.length()), client_key);
  write_str(writer, "AppVersion", api::app_version);
  write_str(writer, "ClientKey", client_key);
  write_str(writer, "PlatformId", api::platform_id);
}

/// Append a URL-encoded form field to a form body.
static void append_form_field(std::string &body, std::string_view name,
                              std::string_view value) {
  const auto append_escaped = [&body](std::string_view str) {
    // curl_easy_escape() treats zero length as a null-terminated string
    if (str.empty()) {
      return;
    }
    const std::unique_ptr<char, decltype(&curl_free)> escaped{
        curl_easy_escape(nullptr, str.data(), static_cast<int>(str.length())),
        curl_free};
    if (escaped) {
      body.append(escaped.get());
    }
  };
  if (!body.empty()) {
    body.push_back('&');
  }
  append_escaped(name);
  body.push_back('=');
  append_escaped(value);
}

/// Build the sign-in form submission URL from the sign-in page URL.
///
/// @param [in] page_url
///    URL of the sign-in page.
/// @param [out] url
///    Receives the submission URL on success.
/// @return A @ref tek_kc_err indicating the result of operation.
static tek_kc_err get_submit_url(const std::string &page_url,
                                 std::string &url) {
  const std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> curlu{
      curl_url(), curl_url_cleanup};
  if (!curlu) {
    return tkc_err_sub(TEK_KC_ERRC_login, TEK_KC_ERRC_curl_url);
  }
  const std::string path{api::sign_in_submit_path};
  if (curl_url_set(curlu.get(), CURLUPART_URL, page_url.data(), 0) !=
          CURLUE_OK ||
      curl_url_set(curlu.get(), CURLUPART_PATH, path.data(), 0) != CURLUE_OK ||
      curl_url_set(curlu.get(), CURLUPART_QUERY, nullptr, 0) != CURLUE_OK ||
      curl_url_set(curlu.get(), CURLUPART_FRAGMENT, nullptr, 0) != CURLUE_OK) {
    auto err = tkc_err_sub(TEK_KC_ERRC_login, TEK_KC_ERRC_invalid_url);
    err.uri = tkci_u_strdup(page_url.data(), page_url.length());
    return err;
  }
  char *res;
  if (curl_url_get(curlu.get(), CURLUPART_URL, &res, 0) != CURLUE_OK) {
    return tkc_err_sub(TEK_KC_ERRC_login, TEK_KC_ERRC_curl_url);
  }
  url = res;
  curl_free(res);
  return tkc_err_ok();
}

} // namespace

//===-- Public functions --------------------------------------------------===//

client::client(http_transport &transport, creds &state, creds_store *store,
               drm_remover *remover)
    : transport(transport), state(state), store(store), remover(remover),
      authorized(transport, state, [this] { return refresh(); }) {}

tek_kc_err client::register_device(std::string_view user_key) {
  if (state.device_id.empty()) {
    char device_id[36];
    if (!tkci_u_gen_uuid(device_id)) {
      return tkc_err_sub(TEK_KC_ERRC_auth_device, TEK_KC_ERRC_rand);
    }
    state.device_id.assign(device_id, sizeof device_id);
    state.access_token.clear();
    state.refresh_token.clear();
    log::info("Generated new device ID",
              {log::str_field("device_id", state.device_id)});
  }
  rapidjson::StringBuffer buf;
  rapidjson::Writer writer(buf);
  writer.StartObject();
  write_str(writer, "AffiliateName", api::affiliate);
  write_app_fields(writer);
  write_str(writer, "DeviceId", state.device_id);
  if (!user_key.empty()) {
    write_str(writer, "UserKey", user_key);
  }
  writer.EndObject();
  http_request req;
  req.method = http_method::post;
  req.url = api::url_auth_device;
  req.body.assign(buf.GetString(), buf.GetSize());
  req.content_type = "application/json";
  http_response resp;
  if (auto res = transport.perform(TEK_KC_ERRC_auth_device, req, resp);
      !tek_kc_err_success(&res)) {
    return res;
  }
  if (!resp.ok()) {
    return http_status_err(TEK_KC_ERRC_auth_device, req, resp);
  }
  if (auto res = apply_tokens(TEK_KC_ERRC_auth_device, resp, user_key);
      !tek_kc_err_success(&res)) {
    return res;
  }
  log::info("Device registered", {log::bool_field("user", !user_key.empty())});
  return save_creds(TEK_KC_ERRC_auth_device);
}

tek_kc_err client::login(std::string_view email, std::string_view password,
                         std::string_view captcha) {
  http_request req;
  if (auto res = dir.get(TEK_KC_ERRC_login, api::res::sign_in_page, req.url);
      !tek_kc_err_success(&res)) {
    return res;
  }
  req.query = {{"wsa", std::string{api::affiliate}},
               {"pwsav", std::string{api::app_version}},
               {"pwspid", std::string{api::platform_id}},
               {"pwsdid", state.device_id}};
  http_response resp;
  if (auto res = transport.perform(TEK_KC_ERRC_login, req, resp);
      !tek_kc_err_success(&res)) {
    return res;
  }
  if (!resp.ok()) {
    return http_status_err(TEK_KC_ERRC_login, req, resp);
  }
  scrape::sign_in_form form;
  if (auto res = scrape::parse_sign_in_page(resp.body, form);
      !tek_kc_err_success(&res)) {
    return res;
  }
  http_request submit_req;
  if (auto res = get_submit_url(req.url, submit_req.url);
      !tek_kc_err_success(&res)) {
    return res;
  }
  submit_req.method = http_method::post;
  submit_req.content_type = "application/x-www-form-urlencoded";
  append_form_field(submit_req.body, "LogInModel.WorkflowId", form.workflow_id);
  append_form_field(submit_req.body, "LogInModel.Provider", api::affiliate);
  append_form_field(submit_req.body, "ReturnUrl", "");
  append_form_field(submit_req.body, "__RequestVerificationToken",
                    form.verification_token);
  append_form_field(submit_req.body, "LogInModel.UserName", email);
  append_form_field(submit_req.body, "LogInModel.Password", password);
  append_form_field(submit_req.body, "g-recaptcha-response", captcha);
  if (auto res = transport.perform(TEK_KC_ERRC_login, submit_req, resp);
      !tek_kc_err_success(&res)) {
    return res;
  }
  if (!resp.ok()) {
    return http_status_err(TEK_KC_ERRC_login, submit_req, resp);
  }
  std::string user_url;
  if (auto res = scrape::find_user_url(resp.body, user_url);
      !tek_kc_err_success(&res)) {
    return res;
  }
  scrape::user_identity identity;
  if (auto res = scrape::parse_user_url(user_url, identity);
      !tek_kc_err_success(&res)) {
    return res;
  }
  // Credentials are saved by register_device() if it succeeds
  state.user_id = std::move(identity.user_id);
  state.email = email;
  log::info("Signed in", {log::str_field("email", email)});
  return register_device(identity.user_key);
}

tek_kc_err client::load_directory() {
  if (dir.loaded()) {
    return tkc_err_ok();
  }
  http_request req;
  req.url = api::url_initialization;
  http_response resp;
  if (auto res = authorized.perform(TEK_KC_ERRC_get_directory, req, resp);
      !tek_kc_err_success(&res)) {
    return res;
  }
  if (auto res = dir.load(resp.body); !tek_kc_err_success(&res)) {
    return res;
  }
  log::debug("Endpoint directory loaded",
             {log::int_field("resources", static_cast<int>(dir.size()))});
  return tkc_err_ok();
}

//===-- Private functions -------------------------------------------------===//

tek_kc_err client::refresh() {
  rapidjson::StringBuffer buf;
  rapidjson::Writer writer(buf);
  writer.StartObject();
  write_app_fields(writer);
  write_str(writer, "RefreshToken", state.refresh_token);
  writer.EndObject();
  http_request req;
  req.method = http_method::post;
  req.url = api::url_auth_refresh;
  req.body.assign(buf.GetString(), buf.GetSize());
  req.content_type = "application/json";
  // The refresh request is authorized with the expired token and is never
  //    repaired itself
  req.set_header("Authorization",
                 std::string{"Bearer "}.append(state.access_token));
  req.repairable = false;
  http_response resp;
  if (auto res = transport.perform(TEK_KC_ERRC_auth_refresh, req, resp);
      !tek_kc_err_success(&res)) {
    return res;
  }
  if (!resp.ok()) {
    return http_status_err(TEK_KC_ERRC_auth_refresh, req, resp);
  }
  if (auto res = apply_tokens(TEK_KC_ERRC_auth_refresh, resp, {});
      !tek_kc_err_success(&res)) {
    return res;
  }
  return save_creds(TEK_KC_ERRC_auth_refresh);
}

tek_kc_err client::apply_tokens(tek_kc_errc op, const http_response &resp,
                                std::string_view user_key) {
  rapidjson::Document doc;
  doc.Parse<rapidjson::kParseStopWhenDoneFlag>(resp.body.data(),
                                               resp.body.length());
  if (doc.HasParseError() || !doc.IsObject()) {
    return tkc_err_sub(op, TEK_KC_ERRC_json_parse);
  }
  const auto get_str = [&doc](const char *_Nonnull name) -> std::string_view {
    const auto it = doc.FindMember(name);
    if (it == doc.MemberEnd() || !it->value.IsString()) {
      return {};
    }
    return {it->value.GetString(), it->value.GetStringLength()};
  };
  if (const auto token_type = get_str("TokenType"); token_type != "Bearer") {
    auto err = tkc_err_sub(op, TEK_KC_ERRC_unsupported_token_type);
    err.detail = tkci_u_strdup(token_type.data(), token_type.length());
    return err;
  }
  state.access_token = get_str("AccessToken");
  state.refresh_token = get_str("RefreshToken");
  if (!state.auth_settings_set()) {
    return tkc_err_sub(op, TEK_KC_ERRC_auth_settings_not_set);
  }
  if (!user_key.empty()) {
    const auto it = doc.FindMember("UserKey");
    if (it == doc.MemberEnd() || !it->value.IsString()) {
      return tkc_err_sub(op, TEK_KC_ERRC_invalid_data);
    }
    state.user_key.assign(it->value.GetString(), it->value.GetStringLength());
  }
  return tkc_err_ok();
}

tek_kc_err client::save_creds(tek_kc_errc op) {
  if (!store) {
    return tkc_err_ok();
  }
  auto res = store->save(state);
  if (!tek_kc_err_success(&res)) {
    log::warn("Failed to save credentials",
              {log::int_field("operation", op),
               log::str_field("email", state.email)});
  }
  return res;
}

} // namespace tek::koboclient
