//===-- client.h - Kobo store API client interface ------------------------===//
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
/// Declarations of the Kobo store API client and its operations.
/// All operations are synchronous and a client must not be used by multiple
///    threads at the same time.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "base.h"
#include "content.h"
#include "creds.h"
#include "error.h"

//===-- Types -------------------------------------------------------------===//

/// Opaque Kobo store API client type.
typedef struct tek_kc_client tek_kc_client;

/// Client creation parameters.
typedef struct tek_kc_client_desc tek_kc_client_desc;
/// @copydoc tek_kc_client_desc
struct tek_kc_client_desc {
  /// Optional pointer to the initial credentials. The client copies them.
  const tek_kc_creds *_Nullable creds;
  /// Optional pointer to the credential store to save credentials to after
  ///    every successful change. The client copies the structure.
  const tek_kc_creds_store *_Nullable store;
  /// Optional pointer to the DRM remover, required for downloading
  ///    DRM-protected books. The client copies the structure.
  const tek_kc_drm_remover *_Nullable drm_remover;
};

//===-- Functions ---------------------------------------------------------===//

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

//===--- Create/destroy ---------------------------------------------------===//

/// Create a Kobo store API client.
///
/// @param [in] desc
///    Pointer to the creation parameters.
/// @return Pointer to the created client, which must be destroyed with
///    @ref tek_kc_client_destroy after use. `nullptr` is returned if the
///    client couldn't be created.
[[gnu::TEK_KC_API, gnu::nonnull(1), gnu::access(read_only, 1)]]
tek_kc_client *_Nullable tek_kc_client_create(
    const tek_kc_client_desc *_Nonnull desc);

/// Destroy a Kobo store API client.
///
/// @param [in, out] client
///    Pointer to the client to destroy.
[[gnu::TEK_KC_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void tek_kc_client_destroy(tek_kc_client *_Nonnull client);

//===--- Credentials ------------------------------------------------------===//

/// Get the current credentials of a client.
///
/// @param [in] client
///    Pointer to the client.
/// @return Pointer to the credentials. They are owned by the client and stay
///    valid until the next operation on it.
[[gnu::TEK_KC_API, gnu::nonnull(1), gnu::access(read_only, 1),
  gnu::returns_nonnull]]
const tek_kc_creds *_Nonnull tek_kc_client_get_creds(
    const tek_kc_client *_Nonnull client);

//===--- Authentication ---------------------------------------------------===//

/// Register the device and obtain a device-scoped token pair. A new device
///    ID is generated if the credentials don't have one yet.
///
/// @param [in, out] client
///    Pointer to the client.
/// @param [in] user_key
///    Optional user key to bind the tokens to, obtained by
///    @ref tek_kc_client_login, as a null-terminated UTF-8 string.
/// @return A @ref tek_kc_err indicating the result of operation.
[[gnu::TEK_KC_API, gnu::nonnull(1), gnu::access(read_write, 1),
  gnu::access(read_only, 2)]]
tek_kc_err tek_kc_client_register_device(tek_kc_client *_Nonnull client,
                                         const char *_Nullable user_key);

/// Sign in with email and password. Requires the endpoint directory to be
///    loaded. On success, the user ID and email are set and the device is
///    registered again with the obtained user key.
///
/// @param [in, out] client
///    Pointer to the client.
/// @param [in] email
///    Email of the user, as a null-terminated UTF-8 string.
/// @param [in] password
///    Password of the user, as a null-terminated UTF-8 string.
/// @param [in] captcha
///    reCAPTCHA response token, as a null-terminated UTF-8 string.
/// @return A @ref tek_kc_err indicating the result of operation.
[[gnu::TEK_KC_API, gnu::nonnull(1, 2, 3, 4), gnu::access(read_write, 1),
  gnu::access(read_only, 2), gnu::access(read_only, 3),
  gnu::access(read_only, 4), gnu::null_terminated_string_arg(2),
  gnu::null_terminated_string_arg(3), gnu::null_terminated_string_arg(4)]]
tek_kc_err tek_kc_client_login(tek_kc_client *_Nonnull client,
                               const char *_Nonnull email,
                               const char *_Nonnull password,
                               const char *_Nonnull captcha);

//===--- Endpoint directory -----------------------------------------------===//

/// Load the endpoint directory. Does nothing if it's already loaded.
///
/// @param [in, out] client
///    Pointer to the client.
/// @return A @ref tek_kc_err indicating the result of operation.
[[gnu::TEK_KC_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
tek_kc_err tek_kc_client_load_directory(tek_kc_client *_Nonnull client);

//===--- Library ----------------------------------------------------------===//

/// Get all library sync entries of the user.
///
/// @param [in, out] client
///    Pointer to the client.
/// @param [out] json
///    Address of variable that receives pointer to the JSON array of entries
///    in server order, as a null-terminated UTF-8 string, on success. It
///    must be freed with `free` after use.
/// @return A @ref tek_kc_err indicating the result of operation.
[[gnu::TEK_KC_API, gnu::nonnull(1, 2), gnu::access(read_write, 1),
  gnu::access(write_only, 2)]]
tek_kc_err tek_kc_client_list_library_entries(tek_kc_client *_Nonnull client,
                                              char *_Nullable *_Nonnull json);

/// Get books owned by the user.
///
/// @param [in, out] client
///    Pointer to the client.
/// @param [out] books
///    Address of variable that receives pointer to the array of books in
///    server order on success. Strings are located in the same buffer as the
///    array, which must be freed with `free` after use. `owner` of every book
///    points to the credentials of @p client.
/// @param [out] num_books
///    Address of variable that receives the number of books.
/// @return A @ref tek_kc_err indicating the result of operation.
[[gnu::TEK_KC_API, gnu::nonnull(1, 2, 3), gnu::access(read_write, 1),
  gnu::access(write_only, 2), gnu::access(write_only, 3)]]
tek_kc_err tek_kc_client_list_owned_books(
    tek_kc_client *_Nonnull client, tek_kc_book *_Nullable *_Nonnull books,
    int *_Nonnull num_books);

/// Get all wishlist items of the user.
///
/// @param [in, out] client
///    Pointer to the client.
/// @param [out] json
///    Address of variable that receives pointer to the JSON array of items in
///    server order, as a null-terminated UTF-8 string, on success. It must be
///    freed with `free` after use.
/// @return A @ref tek_kc_err indicating the result of operation.
[[gnu::TEK_KC_API, gnu::nonnull(1, 2), gnu::access(read_write, 1),
  gnu::access(write_only, 2)]]
tek_kc_err tek_kc_client_list_wishlist(tek_kc_client *_Nonnull client,
                                       char *_Nullable *_Nonnull json);

/// Get wishlist items of the user as books. Items without product metadata
///    are skipped.
///
/// @param [in, out] client
///    Pointer to the client.
/// @param [out] books
///    Address of variable that receives pointer to the array of books in
///    server order on success. Strings are located in the same buffer as the
///    array, which must be freed with `free` after use.
/// @param [out] num_books
///    Address of variable that receives the number of books.
/// @return A @ref tek_kc_err indicating the result of operation.
[[gnu::TEK_KC_API, gnu::nonnull(1, 2, 3), gnu::access(read_write, 1),
  gnu::access(write_only, 2), gnu::access(write_only, 3)]]
tek_kc_err tek_kc_client_list_wishlist_books(
    tek_kc_client *_Nonnull client, tek_kc_book *_Nullable *_Nonnull books,
    int *_Nonnull num_books);

/// Get information about a book.
///
/// @param [in, out] client
///    Pointer to the client.
/// @param [in] product_id
///    Product ID of the book, as a null-terminated UTF-8 string.
/// @param [out] json
///    Address of variable that receives pointer to the book information JSON
///    document, as a null-terminated UTF-8 string, on success. It must be
///    freed with `free` after use.
/// @return A @ref tek_kc_err indicating the result of operation.
[[gnu::TEK_KC_API, gnu::nonnull(1, 2, 3), gnu::access(read_write, 1),
  gnu::access(read_only, 2), gnu::access(write_only, 3),
  gnu::null_terminated_string_arg(2)]]
tek_kc_err tek_kc_client_get_book_info(tek_kc_client *_Nonnull client,
                                       const char *_Nonnull product_id,
                                       char *_Nullable *_Nonnull json);

//===--- Content ----------------------------------------------------------===//

/// Download a book. Either the output file is fully written, or neither it
///    nor the temporary file exists after the call.
///
/// @param [in, out] client
///    Pointer to the client.
/// @param [in] product_id
///    Product ID of the book, as a null-terminated UTF-8 string.
/// @param [in] output_path
///    Path to the output file, as a null-terminated UTF-8 string.
/// @param [out] result_path
///    Address of variable that receives pointer to the path of the written
///    file, as a null-terminated UTF-8 string, on success. It must be freed
///    with `free` after use.
/// @return A @ref tek_kc_err indicating the result of operation.
[[gnu::TEK_KC_API, gnu::nonnull(1, 2, 3, 4), gnu::access(read_write, 1),
  gnu::access(read_only, 2), gnu::access(read_only, 3),
  gnu::access(write_only, 4), gnu::null_terminated_string_arg(2),
  gnu::null_terminated_string_arg(3)]]
tek_kc_err tek_kc_client_download(tek_kc_client *_Nonnull client,
                                  const char *_Nonnull product_id,
                                  const char *_Nonnull output_path,
                                  char *_Nullable *_Nonnull result_path);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
