//===-- client.cpp - Kobo store API client C interface --------------------===//
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
/// Implementation of @ref tek_kc_client and the `tek_kc_client_*` functions.
///
//===----------------------------------------------------------------------===//
#include "client.hpp"

#include "common/error.h"
#include "content.hpp"
#include "creds.hpp"
#include "curl_transport.hpp"
#include "http.hpp"
#include "log.hpp"
#include "tek-koboclient/client.h"
#include "tek-koboclient/content.h"
#include "tek-koboclient/creds.h"
#include "tek-koboclient/error.h"
#include "utils.h"

#include <memory>
#include <new>
#include <optional>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

tek_kc_client::tek_kc_client(
    std::unique_ptr<tek::koboclient::http_transport> &&transport,
    const tek_kc_client_desc &desc)
    : transport(std::move(transport)),
      state(desc.creds ? tek::koboclient::creds_from_c(*desc.creds)
                       : tek::koboclient::creds{}),
      store(desc.store ? std::make_optional<tek::koboclient::c_creds_store>(
                             *desc.store)
                       : std::nullopt),
      remover(desc.drm_remover
                  ? std::make_optional<tek::koboclient::c_drm_remover>(
                        *desc.drm_remover)
                  : std::nullopt),
      cl(*this->transport, state, store ? &*store : nullptr,
         remover ? &*remover : nullptr),
      c_creds(tek::koboclient::creds_view(state)) {}

namespace tek::koboclient {

namespace {

//===-- Private functions -------------------------------------------------===//

/// Serialize a JSON value into a heap-allocated string.
///
/// @param op
///    Primary error code for returned errors.
/// @param [in] value
///    Value to serialize.
/// @param [out] json
///    Address of variable that receives pointer to the string on success.
/// @return A @ref tek_kc_err indicating the result of operation.
tek_kc_err write_json(tek_kc_errc op, const rapidjson::Value &value,
                      char *_Nullable *_Nonnull json) {
  rapidjson::StringBuffer buf;
  rapidjson::Writer<rapidjson::StringBuffer> writer(buf);
  value.Accept(writer);
  const auto str = tkci_u_strdup(buf.GetString(), buf.GetSize());
  if (!str) {
    return tkc_err_sub(op, TEK_KC_ERRC_mem_alloc);
  }
  *json = str;
  return tkc_err_ok();
}

/// Copy books into a C array owned by the caller.
///
/// @param op
///    Primary error code for returned errors.
/// @param [in] client
///    Client handle whose credentials become the books' owner.
/// @param [in] books
///    Books to copy.
/// @param [out] c_books
///    Address of variable that receives pointer to the array.
/// @param [out] num_books
///    Address of variable that receives the number of books.
/// @return A @ref tek_kc_err indicating the result of operation.
tek_kc_err output_books(tek_kc_errc op, const tek_kc_client &client,
                        std::span<const book> books,
                        tek_kc_book *_Nullable *_Nonnull c_books,
                        int *_Nonnull num_books) {
  const auto array = books_to_c(books, &client.c_creds);
  if (!array && !books.empty()) {
    return tkc_err_sub(op, TEK_KC_ERRC_mem_alloc);
  }
  *c_books = array;
  *num_books = static_cast<int>(books.size());
  return tkc_err_ok();
}

} // namespace

//===-- Internal functions ------------------------------------------------===//

tek_kc_client *create_client(std::unique_ptr<http_transport> &&transport,
                             const tek_kc_client_desc &desc) {
  return new (std::nothrow) tek_kc_client(std::move(transport), desc);
}

//===-- Public functions --------------------------------------------------===//

extern "C" {

//===--- Create/destroy ---------------------------------------------------===//

tek_kc_client *tek_kc_client_create(const tek_kc_client_desc *desc) {
  std::unique_ptr<curl_transport> transport;
  auto res = curl_transport::create(transport);
  if (!tek_kc_err_success(&res)) {
    log::warn("Failed to create HTTP transport",
              {log::int_field("error", res.auxiliary)});
    tek_kc_err_release(&res);
    return nullptr;
  }
  return create_client(std::move(transport), *desc);
}

void tek_kc_client_destroy(tek_kc_client *client) { delete client; }

//===--- Credentials ------------------------------------------------------===//

const tek_kc_creds *tek_kc_client_get_creds(const tek_kc_client *client) {
  return &client->c_creds;
}

//===--- Authentication ---------------------------------------------------===//

tek_kc_err tek_kc_client_register_device(tek_kc_client *client,
                                         const char *user_key) {
  const auto res =
      client->cl.register_device(user_key ? user_key : std::string_view{});
  client->sync_creds();
  return res;
}

tek_kc_err tek_kc_client_login(tek_kc_client *client, const char *email,
                               const char *password, const char *captcha) {
  const auto res = client->cl.login(email, password, captcha);
  client->sync_creds();
  return res;
}

//===--- Endpoint directory -----------------------------------------------===//

tek_kc_err tek_kc_client_load_directory(tek_kc_client *client) {
  const auto res = client->cl.load_directory();
  client->sync_creds();
  return res;
}

//===--- Library ----------------------------------------------------------===//

tek_kc_err tek_kc_client_list_library_entries(tek_kc_client *client,
                                              char **json) {
  rapidjson::Document entries;
  const auto res = client->cl.list_library_entries(entries);
  client->sync_creds();
  if (!tek_kc_err_success(&res)) {
    return res;
  }
  return write_json(TEK_KC_ERRC_get_library, entries, json);
}

tek_kc_err tek_kc_client_list_owned_books(tek_kc_client *client,
                                          tek_kc_book **books,
                                          int *num_books) {
  std::vector<book> owned;
  const auto res = client->cl.list_owned_books(owned);
  client->sync_creds();
  if (!tek_kc_err_success(&res)) {
    return res;
  }
  return output_books(TEK_KC_ERRC_get_library, *client, owned, books,
                      num_books);
}

tek_kc_err tek_kc_client_list_wishlist(tek_kc_client *client, char **json) {
  rapidjson::Document items;
  const auto res = client->cl.list_wishlist(items);
  client->sync_creds();
  if (!tek_kc_err_success(&res)) {
    return res;
  }
  return write_json(TEK_KC_ERRC_get_wishlist, items, json);
}

tek_kc_err tek_kc_client_list_wishlist_books(tek_kc_client *client,
                                             tek_kc_book **books,
                                             int *num_books) {
  rapidjson::Document items;
  const auto res = client->cl.list_wishlist(items);
  client->sync_creds();
  if (!tek_kc_err_success(&res)) {
    return res;
  }
  return output_books(TEK_KC_ERRC_get_wishlist, *client,
                      wishlist_to_books(items, &client->state), books,
                      num_books);
}

tek_kc_err tek_kc_client_get_book_info(tek_kc_client *client,
                                       const char *product_id, char **json) {
  rapidjson::Document info;
  const auto res = client->cl.get_book_info(product_id, info);
  client->sync_creds();
  if (!tek_kc_err_success(&res)) {
    return res;
  }
  return write_json(TEK_KC_ERRC_get_book_info, info, json);
}

//===--- Content ----------------------------------------------------------===//

tek_kc_err tek_kc_client_download(tek_kc_client *client,
                                  const char *product_id,
                                  const char *output_path,
                                  char **result_path) {
  std::string path;
  const auto res = client->cl.download(product_id, output_path, path);
  client->sync_creds();
  if (!tek_kc_err_success(&res)) {
    return res;
  }
  const auto str = tkci_u_strdup(path.data(), path.length());
  if (!str) {
    return tkc_err_sub(TEK_KC_ERRC_download, TEK_KC_ERRC_mem_alloc);
  }
  *result_path = str;
  return tkc_err_ok();
}

} // extern "C"

} // namespace tek::koboclient
