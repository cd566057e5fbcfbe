//===-- error.cpp - error message functions implementation ----------------===//
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
/// Implementation of @ref tek_kc_err_get_msgs, @ref tek_kc_err_release_msgs
///    and @ref tek_kc_err_release.
///
//===----------------------------------------------------------------------===//
#include "tek-koboclient/error.h"

#include "utils.h"

#include <cstdlib>
#include <cstring>
#include <curl/curl.h>
#include <sqlite3.h>
#include <string>
#include <string_view>

namespace tek::koboclient {

namespace {

//===-- Private functions -------------------------------------------------===//

/// Get message for a library error code.
///
/// @param errc
///    The error code to get message for.
/// @return Pointer to the statically allocated message string.
[[gnu::returns_nonnull]]
static const char *_Nonnull errc_msg(int errc) noexcept {
  switch (static_cast<tek_kc_errc>(errc)) {
  case TEK_KC_ERRC_ok:
    return "Operation completed successfully";
  case TEK_KC_ERRC_unsupported_token_type:
    return "Server returned an unsupported token type";
  case TEK_KC_ERRC_auth_settings_not_set:
    return "Authentication settings are not set after receiving new tokens";
  case TEK_KC_ERRC_auth_device:
    return "Device authentication failed";
  case TEK_KC_ERRC_auth_refresh:
    return "Authentication refresh failed";
  case TEK_KC_ERRC_creds_load:
    return "Failed to load credentials";
  case TEK_KC_ERRC_creds_open:
    return "Failed to open credential store";
  case TEK_KC_ERRC_creds_not_found:
    return "No credentials are stored for this email";
  case TEK_KC_ERRC_creds_remove:
    return "Failed to remove credentials";
  case TEK_KC_ERRC_creds_save:
    return "Failed to save credentials";
  case TEK_KC_ERRC_curle_init:
    return "curl_easy_init() failed";
  case TEK_KC_ERRC_curl_url:
    return "curl_url() failed";
  case TEK_KC_ERRC_directory_not_loaded:
    return "Endpoint directory has not been loaded";
  case TEK_KC_ERRC_directory_no_resource:
    return "Endpoint directory doesn't have the requested resource";
  case TEK_KC_ERRC_download:
    return "Failed to download the book";
  case TEK_KC_ERRC_download_url_list_empty:
    return "Download URL list is empty. If this is an archived book then it "
           "must be unarchived first on the Kobo website "
           "(https://www.kobo.com/help/en-US/article/1799/"
           "restoring-deleted-books-or-magazines)";
  case TEK_KC_ERRC_drm_remove:
    return "Failed to remove DRM from the downloaded file";
  case TEK_KC_ERRC_get_book_info:
    return "Failed to get book information";
  case TEK_KC_ERRC_get_content_access:
    return "Failed to get content access information";
  case TEK_KC_ERRC_get_directory:
    return "Failed to load the endpoint directory";
  case TEK_KC_ERRC_get_library:
    return "Failed to get the book list";
  case TEK_KC_ERRC_get_wishlist:
    return "Failed to get the wishlist";
  case TEK_KC_ERRC_invalid_data:
    return "Encountered invalid data";
  case TEK_KC_ERRC_invalid_url:
    return "Invalid URL";
  case TEK_KC_ERRC_json_parse:
    return "JSON parsing error";
  case TEK_KC_ERRC_login:
    return "Failed to sign in";
  case TEK_KC_ERRC_login_user_url:
    return "Authenticated user URL can't be found. The page format might have "
           "changed";
  case TEK_KC_ERRC_login_user_params:
    return "Authenticated user URL doesn't have user ID or user key";
  case TEK_KC_ERRC_login_verification_token:
    return "Can't find the request verification token in the login form. The "
           "page format might have changed";
  case TEK_KC_ERRC_login_workflow_id:
    return "Can't find the workflow ID in the login form. The page format "
           "might have changed";
  case TEK_KC_ERRC_mem_alloc:
    return "Memory allocation error";
  case TEK_KC_ERRC_no_download_url:
    return "Download URL can't be found";
  case TEK_KC_ERRC_no_drm_remover:
    return "The book is DRM-protected, but no DRM remover is available";
  case TEK_KC_ERRC_no_supported_format:
    return "Download URL for supported formats can't be found";
  case TEK_KC_ERRC_not_authenticated:
    return "User is not authenticated";
  case TEK_KC_ERRC_rand:
    return "Random number generation failed";
  default:
    return "Unknown error code";
  }
}

/// Get message for an I/O operation type.
[[gnu::returns_nonnull]]
static const char *_Nonnull io_type_msg(int io_type) noexcept {
  switch (static_cast<tek_kc_err_io_type>(io_type)) {
  case TEK_KC_ERR_IO_TYPE_none:
    return "Not an I/O operation";
  case TEK_KC_ERR_IO_TYPE_open:
    return "Opening/creating";
  case TEK_KC_ERR_IO_TYPE_write:
    return "Writing";
  case TEK_KC_ERR_IO_TYPE_close:
    return "Closing";
  case TEK_KC_ERR_IO_TYPE_move:
    return "Moving";
  case TEK_KC_ERR_IO_TYPE_delete:
    return "Deleting";
  default:
    return "Unknown I/O operation";
  }
}

/// Make a heap-allocated copy of a string for @ref tek_kc_err_msgs.
static char *_Nullable dup_msg(std::string_view msg) noexcept {
  return tkci_u_strdup(msg.data(), msg.length());
}

} // namespace

//===-- Public functions --------------------------------------------------===//

extern "C" {

tek_kc_err_msgs tek_kc_err_get_msgs(const tek_kc_err *err) {
  tek_kc_err_msgs msgs{.type = err->type,
                       .type_str = nullptr,
                       .primary = errc_msg(err->primary),
                       .auxiliary = nullptr,
                       .extra = nullptr,
                       .uri_type = nullptr};
  switch (err->type) {
  case TEK_KC_ERR_TYPE_basic:
    msgs.type_str = "Basic";
    switch (err->primary) {
    case TEK_KC_ERRC_creds_not_found:
      msgs.uri_type = "Email";
      break;
    case TEK_KC_ERRC_directory_no_resource:
      msgs.uri_type = "Resource";
      break;
    default:
      break;
    }
    break;
  case TEK_KC_ERR_TYPE_sub:
    msgs.type_str = "Compound";
    msgs.auxiliary = errc_msg(err->auxiliary);
    switch (err->auxiliary) {
    case TEK_KC_ERRC_no_download_url:
    case TEK_KC_ERRC_download_url_list_empty:
    case TEK_KC_ERRC_no_supported_format:
      msgs.uri_type = "Product ID";
      break;
    case TEK_KC_ERRC_creds_not_found:
    case TEK_KC_ERRC_not_authenticated:
      msgs.uri_type = "Email";
      break;
    case TEK_KC_ERRC_directory_no_resource:
      msgs.uri_type = "Resource";
      break;
    case TEK_KC_ERRC_invalid_url:
      msgs.uri_type = "URL";
      break;
    default:
      if (err->uri && (err->primary == TEK_KC_ERRC_download ||
                       err->primary == TEK_KC_ERRC_get_content_access)) {
        msgs.uri_type = "Product ID";
      }
      break;
    }
    break;
  case TEK_KC_ERR_TYPE_os:
    msgs.type_str = "OS";
    msgs.auxiliary = dup_msg(std::strerror(err->auxiliary));
    msgs.extra = io_type_msg(err->extra);
    msgs.uri_type = "Path";
    break;
  case TEK_KC_ERR_TYPE_curle:
    msgs.type_str = "libcurl";
    msgs.auxiliary = curl_easy_strerror(static_cast<CURLcode>(err->auxiliary));
    if (err->auxiliary == CURLE_HTTP_RETURNED_ERROR) {
      msgs.extra =
          dup_msg(std::string("HTTP status ").append(std::to_string(err->extra)));
    }
    msgs.uri_type = "URL";
    break;
  case TEK_KC_ERR_TYPE_sqlite:
    msgs.type_str = "SQLite";
    msgs.auxiliary = sqlite3_errstr(err->auxiliary);
    msgs.uri_type = "Path";
    break;
  default:
    msgs.type_str = "Unknown";
  }
  return msgs;
}

void tek_kc_err_release_msgs(tek_kc_err_msgs *err_msgs) {
  // Only OS error strings and HTTP status strings are heap-allocated
  if (err_msgs->type == TEK_KC_ERR_TYPE_os) {
    std::free(const_cast<char *>(err_msgs->auxiliary));
  } else if (err_msgs->type == TEK_KC_ERR_TYPE_curle) {
    std::free(const_cast<char *>(err_msgs->extra));
  }
  err_msgs->auxiliary = nullptr;
  err_msgs->extra = nullptr;
}

void tek_kc_err_release(tek_kc_err *err) {
  std::free(const_cast<char *>(err->uri));
  std::free(const_cast<char *>(err->detail));
  err->uri = nullptr;
  err->detail = nullptr;
}

} // extern "C"

} // namespace tek::koboclient
