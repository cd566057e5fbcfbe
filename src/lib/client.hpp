//===-- client.hpp - Kobo store API client --------------------------------===//
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
/// Declarations of the store API client and of the @ref tek_kc_client handle
///    wrapping it.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "auth_transport.hpp"
#include "content.hpp"
#include "creds.hpp"
#include "directory.hpp"
#include "http.hpp"
#include "tek-koboclient/base.h"
#include "tek-koboclient/client.h"
#include "tek-koboclient/creds.h"
#include "tek-koboclient/error.h"

#include <memory>
#include <optional>
#include <rapidjson/document.h>
#include <string>
#include <string_view>
#include <vector>

namespace tek::koboclient {

/// Kobo store API client bound to a single credential state.
/// All operations are synchronous. The credential state is updated in place
///    by authentication operations and saved to the credential store, if one
///    is provided, after every successful update.
class [[gnu::visibility("internal")]] client {
public:
  /// @param [in] transport
  ///    Transport to send requests through.
  /// @param [in, out] state
  ///    Credential state to authenticate with and update.
  /// @param [in] store
  ///    Optional credential store to save @p state to.
  /// @param [in] remover
  ///    Optional DRM remover, required for downloading DRM-protected books.
  client(http_transport &transport, creds &state,
         creds_store *_Nullable store = nullptr,
         drm_remover *_Nullable remover = nullptr);

  client(const client &) = delete;
  client &operator=(const client &) = delete;

  //===-- Authentication --------------------------------------------------===//

  /// Register the device and obtain a device-scoped token pair. A new device
  ///    ID is generated if the credential state doesn't have one yet.
  ///
  /// @param user_key
  ///    User key to bind the tokens to, obtained by @ref login. If it is
  ///    empty, the tokens are not bound to any user.
  /// @return A @ref tek_kc_err indicating the result of operation.
  tek_kc_err register_device(std::string_view user_key = {});

  /// Sign in with email and password. Requires the endpoint directory to be
  ///    loaded. On success, the user ID and email are set and the device is
  ///    registered again with the obtained user key.
  ///
  /// @param email
  ///    Email of the user.
  /// @param password
  ///    Password of the user.
  /// @param captcha
  ///    reCAPTCHA response token.
  /// @return A @ref tek_kc_err indicating the result of operation.
  tek_kc_err login(std::string_view email, std::string_view password,
                   std::string_view captcha);

  //===-- Endpoint directory ----------------------------------------------===//

  /// Load the endpoint directory. Does nothing if it's already loaded.
  ///
  /// @return A @ref tek_kc_err indicating the result of operation.
  tek_kc_err load_directory();

  /// Get the endpoint directory.
  const endpoint_directory &directory() const noexcept { return dir; }

  //===-- Library ---------------------------------------------------------===//

  /// Get all library sync entries of the user, following sync tokens until
  ///    the server stops requesting continuation.
  ///
  /// @param [out] entries
  ///    Receives an array of all entries in server order.
  /// @return A @ref tek_kc_err indicating the result of operation.
  tek_kc_err list_library_entries(rapidjson::Document &entries);

  /// Get books owned by the user.
  ///
  /// @param [out] books
  ///    Receives the books in server order.
  /// @return A @ref tek_kc_err indicating the result of operation.
  tek_kc_err list_owned_books(std::vector<book> &books);

  /// Get all wishlist items of the user.
  ///
  /// @param [out] items
  ///    Receives an array of all items in server order.
  /// @return A @ref tek_kc_err indicating the result of operation.
  tek_kc_err list_wishlist(rapidjson::Document &items);

  /// Get information about a book.
  ///
  /// @param product_id
  ///    Product ID of the book.
  /// @param [out] info
  ///    Receives the book information document.
  /// @return A @ref tek_kc_err indicating the result of operation.
  tek_kc_err get_book_info(std::string_view product_id,
                           rapidjson::Document &info);

  //===-- Content ---------------------------------------------------------===//

  /// Download a book. Either the output file is fully written, or neither it
  ///    nor the temporary file exists after the call.
  ///
  /// @param product_id
  ///    Product ID of the book.
  /// @param output_path
  ///    Path to the output file, as a UTF-8 string.
  /// @param [out] result_path
  ///    Receives the path to the written file on success.
  /// @return A @ref tek_kc_err indicating the result of operation.
  tek_kc_err download(std::string_view product_id, std::string_view output_path,
                      std::string &result_path);

private:
  /// Refresh the token pair. Used as the refresh function of @ref authorized.
  tek_kc_err refresh();

  /// Apply a token response to the credential state.
  ///
  /// @param op
  ///    Primary error code for returned errors.
  /// @param [in] resp
  ///    Response of the device authentication or refresh endpoint.
  /// @param user_key
  ///    If not empty, `UserKey` is also taken from the response.
  /// @return A @ref tek_kc_err indicating the result of operation.
  tek_kc_err apply_tokens(tek_kc_errc op, const http_response &resp,
                          std::string_view user_key);

  /// Save the credential state to the store, if there is one.
  tek_kc_err save_creds(tek_kc_errc op);

  /// Perform the download steps, leaving cleanup to the caller.
  tek_kc_err download_to(std::string_view product_id,
                         const std::string &output_path,
                         const std::string &tmp_path);

  /// Stream content from a URL into a file.
  tek_kc_err download_file(const std::string &url, const std::string &path);

  http_transport &transport;
  creds &state;
  creds_store *_Nullable store;
  drm_remover *_Nullable remover;
  /// Executor for authorized requests, refreshing via @ref refresh.
  auth_transport authorized;
  endpoint_directory dir;
};

} // namespace tek::koboclient

/// Kobo store API client handle.
struct [[gnu::visibility("internal")]] tek_kc_client {
  /// Transport that all requests are sent through.
  std::unique_ptr<tek::koboclient::http_transport> transport;
  /// Credential state of the client.
  tek::koboclient::creds state;
  /// Adapter of the credential store callback, if one was provided.
  std::optional<tek::koboclient::c_creds_store> store;
  /// Adapter of the DRM remover callback, if one was provided.
  std::optional<tek::koboclient::c_drm_remover> remover;
  tek::koboclient::client cl;
  /// C view of @ref state, updated after every operation.
  tek_kc_creds c_creds;

  tek_kc_client(std::unique_ptr<tek::koboclient::http_transport> &&transport,
                const tek_kc_client_desc &desc);

  /// Update @ref c_creds to point to the current @ref state strings.
  void sync_creds() noexcept { c_creds = tek::koboclient::creds_view(state); }
};

namespace tek::koboclient {

/// Create a client handle sending requests through a specified transport.
///
/// @param [in] transport
///    Transport to send requests through.
/// @param [in] desc
///    Client creation parameters.
/// @return Pointer to the created handle, or `nullptr` on allocation failure.
[[gnu::visibility("internal")]]
tek_kc_client *_Nullable create_client(
    std::unique_ptr<http_transport> &&transport,
    const tek_kc_client_desc &desc);

} // namespace tek::koboclient
