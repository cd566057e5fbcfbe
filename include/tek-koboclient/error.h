//===-- error.h - TEK Kobo Client error type and function declarations ----===//
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
/// Declarations of error-related types and functions used in TEK Kobo Client.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "base.h"

//===-- Types -------------------------------------------------------------===//

/// TEK Kobo Client error type values.
/// This type identifies the error domain and which fields in
///    @ref tek_kc_err are set, as well as their types. `primary` is set for all
///    error types.
enum tek_kc_err_type {
  /// Library internal error, only `primary` code is set. Some codes also set
  ///    `uri` and `detail`, see @ref tek_kc_errc.
  TEK_KC_ERR_TYPE_basic,
  /// Compound library internal error with a sub-operation defined by
  ///    `auxiliary` code, which has type @ref tek_kc_errc.
  TEK_KC_ERR_TYPE_sub,
  /// System call error, `auxiliary` code is an `errno` value. `extra` is set
  ///    to a non-zero @ref tek_kc_err_io_type and `uri` to path to the
  ///    affected file.
  TEK_KC_ERR_TYPE_os,
  /// libcurl-easy interface error, `auxiliary` code is a `CURLcode`. If
  ///    `auxiliary` is `CURLE_HTTP_RETURNED_ERROR`, `extra` is set to the HTTP
  ///    response status code. `uri` may be set to the URL of the failed
  ///    request.
  TEK_KC_ERR_TYPE_curle,
  /// SQLite error, `auxiliary` code is an `int` with a `SQLITE_*` value.
  ///    Connection open errors may also set `uri` to the path to the database
  ///    file.
  TEK_KC_ERR_TYPE_sqlite
};
/// @copydoc tek_kc_err_type
typedef enum tek_kc_err_type tek_kc_err_type;

/// TEK Kobo Client error codes.
enum tek_kc_errc {
  /// (0) Operation completed successfully.
  TEK_KC_ERRC_ok,
  /// (1) Server response is not a Bearer token. `detail` is set to the token
  ///    type that was received.
  TEK_KC_ERRC_unsupported_token_type,
  /// (2) Credentials are not authenticated after a successful token response.
  TEK_KC_ERRC_auth_settings_not_set,
  /// (3) Failed to register the device.
  TEK_KC_ERRC_auth_device,
  /// (4) Failed to refresh authentication tokens.
  TEK_KC_ERRC_auth_refresh,
  /// (5) Failed to load the credential store.
  TEK_KC_ERRC_creds_load,
  /// (6) Failed to open the credential store.
  TEK_KC_ERRC_creds_open,
  /// (7) No credentials are stored for the email. `uri` is set to the email.
  TEK_KC_ERRC_creds_not_found,
  /// (8) Failed to remove credentials from the store.
  TEK_KC_ERRC_creds_remove,
  /// (9) Failed to save credentials to the store.
  TEK_KC_ERRC_creds_save,
  /// (10) curl_easy_init() returned nullptr.
  TEK_KC_ERRC_curle_init,
  /// (11) curl_url() returned nullptr.
  TEK_KC_ERRC_curl_url,
  /// (12) Endpoint directory has not been loaded yet.
  TEK_KC_ERRC_directory_not_loaded,
  /// (13) Endpoint directory doesn't have the requested resource. `uri` is set
  ///    to the resource name.
  TEK_KC_ERRC_directory_no_resource,
  /// (14) Failed to download a book. Errors in the content access document
  ///    set `uri` to the product ID.
  TEK_KC_ERRC_download,
  /// (15) Download URL list is empty, which happens for archived books.
  ///    `uri` is set to the product ID.
  TEK_KC_ERRC_download_url_list_empty,
  /// (16) Failed to remove DRM from the downloaded file.
  TEK_KC_ERRC_drm_remove,
  /// (17) Failed to get book information.
  TEK_KC_ERRC_get_book_info,
  /// (18) Failed to get content access information. A response that is not
  ///    JSON sets `uri` to the product ID.
  TEK_KC_ERRC_get_content_access,
  /// (19) Failed to load the endpoint directory.
  TEK_KC_ERRC_get_directory,
  /// (20) Failed to get the library sync list.
  TEK_KC_ERRC_get_library,
  /// (21) Failed to get the wishlist.
  TEK_KC_ERRC_get_wishlist,
  /// (22) Encountered invalid data.
  TEK_KC_ERRC_invalid_data,
  /// (23) Invalid URL was specified.
  TEK_KC_ERRC_invalid_url,
  /// (24) JSON parsing error.
  TEK_KC_ERRC_json_parse,
  /// (25) Failed to sign in.
  TEK_KC_ERRC_login,
  /// (26) Authenticated user URL can't be found in the sign-in response.
  TEK_KC_ERRC_login_user_url,
  /// (27) Authenticated user URL lacks the user ID or the user key.
  TEK_KC_ERRC_login_user_params,
  /// (28) Request verification token can't be found in the sign-in page.
  TEK_KC_ERRC_login_verification_token,
  /// (29) Workflow ID can't be found in the sign-in page.
  TEK_KC_ERRC_login_workflow_id,
  /// (30) Memory allocation error.
  TEK_KC_ERRC_mem_alloc,
  /// (31) Content access response doesn't have a download URL list. `uri` is
  ///    set to the product ID.
  TEK_KC_ERRC_no_download_url,
  /// (32) The book requires DRM removal, but no DRM remover was provided.
  TEK_KC_ERRC_no_drm_remover,
  /// (33) None of the download URLs has a supported format. `uri` is set to
  ///    the product ID, `detail` to the list of available formats.
  TEK_KC_ERRC_no_supported_format,
  /// (34) Credentials are not authenticated. `uri` is set to the email, if
  ///    it's known.
  TEK_KC_ERRC_not_authenticated,
  /// (35) Random number generation error.
  TEK_KC_ERRC_rand
};
/// @copydoc tek_kc_errc
typedef enum tek_kc_errc tek_kc_errc;

/// Types of I/O operations that may fail.
enum tek_kc_err_io_type {
  /// Not an I/O operation.
  TEK_KC_ERR_IO_TYPE_none,
  /// Creating or opening a file or directory.
  TEK_KC_ERR_IO_TYPE_open,
  /// Writing data to a file.
  TEK_KC_ERR_IO_TYPE_write,
  /// Closing a file.
  TEK_KC_ERR_IO_TYPE_close,
  /// Moving a file.
  TEK_KC_ERR_IO_TYPE_move,
  /// Deleting a file.
  TEK_KC_ERR_IO_TYPE_delete
};
/// @copydoc tek_kc_err_io_type
typedef enum tek_kc_err_io_type tek_kc_err_io_type;

/// TEK Kobo Client error description structure.
typedef struct tek_kc_err tek_kc_err;
/// @copydoc tek_kc_err
struct tek_kc_err {
  // Type of the error. Defines which fields are set.
  tek_kc_err_type type;
  /// Primary error code. Defines the outermost operation that has failed.
  tek_kc_errc primary;
  /// Auxiliary error code, the value and type depend on @ref type.
  int auxiliary;
  /// Extra information value, the value and type depend on @ref type.
  int extra;
  /// May be set by certain errors to provide a file path, a URL or an
  ///    identifier, as a null-terminated UTF-8 string.
  /// If set, must be freed with `free` after use.
  const char *_Nullable uri;
  /// May be set by certain errors to provide values observed in the server
  ///    response, as a null-terminated UTF-8 string.
  /// If set, must be freed with `free` after use.
  const char *_Nullable detail;
};

/// Human-readable messages for @ref tek_kc_err fields.
typedef struct tek_kc_err_msgs tek_kc_err_msgs;
/// @copydoc tek_kc_err_msgs
struct tek_kc_err_msgs {
  // Type of the error that the messages were produced for.
  tek_kc_err_type type;
  /// String representation of @ref type.
  const char *_Nonnull type_str;
  /// Message for the primary error code.
  const char *_Nonnull primary;
  /// Message for the auxiliary error code, if the error has one.
  const char *_Nullable auxiliary;
  /// Message for the extra error code, if the error has one.
  const char *_Nullable extra;
  /// Message identifying type of string that `uri` refers to.
  const char *_Nullable uri_type;
};

//===-- Functions ---------------------------------------------------------===//

/// Check whether specified error structure indicates success.
///
/// @param [in] err
///    Pointer to the error structure to examine.
/// @return Value indicating whether @p err indicates success.
[[gnu::nothrow, gnu::nonnull(1), gnu::access(read_only, 1)]]
static inline bool tek_kc_err_success(const tek_kc_err *_Nonnull err) {
  return err->primary == TEK_KC_ERRC_ok;
}

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

/// Get human-readable messages for specified error structure.
///
/// @param [in] err
///    Pointer to the error structure to get messages for.
/// @return A structure containing messages for the error structure fields. It
///    must be released with @ref tek_kc_err_release_msgs after use.
[[gnu::TEK_KC_API, gnu::nonnull(1), gnu::access(read_only, 1)]]
tek_kc_err_msgs tek_kc_err_get_msgs(const tek_kc_err *_Nonnull err);

/// Release error messages.
///
/// @param [in, out] err_msgs
///    Pointer to the error messages structure to release.
[[gnu::TEK_KC_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void tek_kc_err_release_msgs(tek_kc_err_msgs *_Nonnull err_msgs);

/// Free strings owned by an error structure and reset them to `nullptr`.
///
/// @param [in, out] err
///    Pointer to the error structure to release.
[[gnu::TEK_KC_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void tek_kc_err_release(tek_kc_err *_Nonnull err);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
