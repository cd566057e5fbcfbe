//===-- content.h - catalog items and DRM removal interface ---------------===//
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
/// Declarations of catalog item types, the DRM remover callback interface,
///    and book filtering.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "base.h"
#include "creds.h"
#include "error.h"

//===-- Types -------------------------------------------------------------===//

/// Catalog item snapshot. Strings are null-terminated UTF-8.
typedef struct tek_kc_book tek_kc_book;
/// @copydoc tek_kc_book
struct tek_kc_book {
  /// Revision ID of the book, used as the product ID in store API requests.
  const char *_Nonnull revision_id;
  /// Title of the book, may be empty.
  const char *_Nonnull title;
  /// Authors joined with " & ", may be empty.
  const char *_Nonnull author;
  /// Value indicating whether the book has been removed from the library. Its
  ///    content can't be downloaded until it's restored.
  bool archived;
  /// Value indicating whether the book has been marked as finished.
  bool read;
  /// Value indicating whether the entitlement is a preview.
  bool preview;
  /// Value indicating whether the entitlement is locked (refunded).
  bool locked;
  /// Credentials that the book belongs to.
  const tek_kc_creds *_Nullable owner;
};

/// Criteria for @ref tek_kc_filter_books. A book is kept if every flag it has
///    is allowed.
typedef struct tek_kc_book_filter tek_kc_book_filter;
/// @copydoc tek_kc_book_filter
struct tek_kc_book_filter {
  bool include_archived;
  bool include_read;
  bool include_previews;
  bool include_locked;
};

/// Content key from a content access document.
typedef struct tek_kc_content_key tek_kc_content_key;
/// @copydoc tek_kc_content_key
struct tek_kc_content_key {
  const char *_Nonnull name;
  const char *_Nonnull value;
};

/// Prototype of the function removing hardware-bound DRM from downloaded
///    content.
///
/// @param [in] input_path
///    Path to the downloaded file, as a null-terminated UTF-8 string.
/// @param [in] output_path
///    Path to the file to write decrypted content to, as a null-terminated
///    UTF-8 string.
/// @param [in] device_id
///    Device ID of the credentials, as a null-terminated UTF-8 string.
/// @param [in] user_id
///    User ID of the credentials, as a null-terminated UTF-8 string.
/// @param [in] keys
///    Pointer to the array of content keys, sorted by name.
/// @param num_keys
///    Number of elements in @p keys.
/// @param user_data
///    User data pointer from the @ref tek_kc_drm_remover.
/// @return A @ref tek_kc_err indicating the result of operation.
typedef tek_kc_err tek_kc_drm_remove_func(
    const char *_Nonnull input_path, const char *_Nonnull output_path,
    const char *_Nonnull device_id, const char *_Nonnull user_id,
    const tek_kc_content_key *_Nullable keys, int num_keys,
    void *_Nullable user_data);

/// DRM remover interface.
typedef struct tek_kc_drm_remover tek_kc_drm_remover;
/// @copydoc tek_kc_drm_remover
struct tek_kc_drm_remover {
  /// Function removing DRM from a downloaded file.
  tek_kc_drm_remove_func *_Nonnull remove_drm;
  /// User data pointer passed to @ref remove_drm.
  void *_Nullable user_data;
};

//===-- Functions ---------------------------------------------------------===//

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

/// Select books matching a filter, preserving order. Matching books are moved
///    to the beginning of the array.
///
/// @param [in, out] books
///    Pointer to the array of books to filter.
/// @param num_books
///    Number of elements in @p books.
/// @param [in] filter
///    Pointer to the filter criteria.
/// @return Number of books that matched the filter.
[[gnu::TEK_KC_API, gnu::nonnull(3), gnu::access(read_write, 1, 2),
  gnu::access(read_only, 3)]]
int tek_kc_filter_books(tek_kc_book *_Nullable books, int num_books,
                        const tek_kc_book_filter *_Nonnull filter);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
