//===-- content.hpp - catalog items and content access --------------------===//
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
/// Declarations of catalog item types, the DRM remover interface, and
///    functions interpreting library, wishlist and content access documents.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "creds.hpp"
#include "tek-koboclient/base.h"
#include "tek-koboclient/content.h"
#include "tek-koboclient/creds.h"
#include "tek-koboclient/error.h"

#include <map>
#include <rapidjson/document.h>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tek::koboclient {

/// Catalog item snapshot.
struct book {
  /// Revision ID of the book, used as the product ID in store API requests.
  std::string revision_id;
  std::string title;
  /// Authors joined with " & ".
  std::string author;
  /// Value indicating whether the book has been removed from the library. Its
  ///    content can't be downloaded until it's restored.
  bool archived = false;
  /// Value indicating whether the book has been marked as finished.
  bool read = false;
  /// Value indicating whether the entitlement is a preview.
  bool preview = false;
  /// Value indicating whether the entitlement is locked (refunded).
  bool locked = false;
  /// Credentials that the book belongs to. Not owned.
  const creds *_Nullable owner = nullptr;
};

/// Content keys, mapping key names to their values.
using content_keys = std::map<std::string, std::string>;

/// Selected download URL of a book.
struct download_info {
  std::string url;
  /// DRM type of the selected URL.
  std::string drm_type;
  /// Format of the selected URL.
  std::string url_format;
  /// Value indicating whether the content has hardware-bound DRM that must be
  ///    removed after downloading.
  bool has_drm = false;
};

/// Interface of the routine that removes hardware-bound DRM from downloaded
///    content.
class drm_remover {
public:
  virtual ~drm_remover() = default;

  /// Remove DRM from a downloaded file.
  ///
  /// @param [in] input_path
  ///    Path to the downloaded file, as a null-terminated UTF-8 string.
  /// @param [in] output_path
  ///    Path to the file to write decrypted content to, as a null-terminated
  ///    UTF-8 string.
  /// @param device_id
  ///    Device ID of the credentials.
  /// @param user_id
  ///    User ID of the credentials.
  /// @param [in] keys
  ///    Content keys from the content access document.
  /// @return A @ref tek_kc_err indicating the result of operation.
  virtual tek_kc_err remove_drm(const char *_Nonnull input_path,
                                const char *_Nonnull output_path,
                                std::string_view device_id,
                                std::string_view user_id,
                                const content_keys &keys) = 0;
};

/// DRM remover forwarding to a @ref tek_kc_drm_remover callback.
class [[gnu::visibility("internal")]] c_drm_remover final : public drm_remover {
public:
  explicit c_drm_remover(const tek_kc_drm_remover &iface) noexcept
      : iface(iface) {}

  tek_kc_err remove_drm(const char *_Nonnull input_path,
                        const char *_Nonnull output_path,
                        std::string_view device_id, std::string_view user_id,
                        const content_keys &keys) override;

private:
  tek_kc_drm_remover iface;
};

/// Criteria for @ref filter_books. A book is kept if every flag it has is
///    allowed.
struct book_filter {
  bool include_archived = false;
  bool include_read = true;
  bool include_previews = false;
  bool include_locked = false;
};

/// Extract content keys from a content access document. Absent `ContentKeys`
///    member yields an empty map.
///
/// @param product_id
///    Product ID of the book, reported in errors.
/// @param [in] content_access
///    Parsed content access document.
/// @param [out] keys
///    Receives the keys on success.
/// @return A @ref tek_kc_err indicating the result of operation.
[[gnu::visibility("internal")]]
tek_kc_err get_content_keys(std::string_view product_id,
                            const rapidjson::Value &content_access,
                            content_keys &keys);

/// Select the download URL from a content access document. The first entry of
///    `ContentUrls`, in server order, whose DRM type is `KDRM` or
///    `SignedNoDrm` and whose format is `EPUB3`, `KEPUB` or `EPUB3FL` is
///    selected.
///
/// @param product_id
///    Product ID of the book, reported in errors.
/// @param [in] content_access
///    Parsed content access document.
/// @param [out] info
///    Receives the selected URL on success.
/// @return A @ref tek_kc_err indicating the result of operation. If no entry
///    matches, `detail` lists every DRM type and format pair.
[[gnu::visibility("internal")]]
tek_kc_err get_download_info(std::string_view product_id,
                             const rapidjson::Value &content_access,
                             download_info &info);

/// Convert library sync entries to books. Entries without a new or changed
///    entitlement with book metadata are skipped.
///
/// @param [in] entries
///    Array of library sync entries.
/// @param owner
///    Credentials to set as the owner of the books.
/// @return Converted books, in entry order.
[[gnu::visibility("internal")]]
std::vector<book> entries_to_books(const rapidjson::Value &entries,
                                   const creds *_Nullable owner);

/// Convert wishlist items to books. Items without product metadata are
///    skipped.
[[gnu::visibility("internal")]]
std::vector<book> wishlist_to_books(const rapidjson::Value &items,
                                    const creds *_Nullable owner);

/// Select books matching a filter, preserving order.
[[gnu::visibility("internal")]]
std::vector<book> filter_books(std::span<const book> books,
                               const book_filter &filter);

/// Copy books into a single heap buffer holding a @ref tek_kc_book array
///    followed by its strings.
///
/// @param [in] books
///    Books to copy.
/// @param owner
///    Credentials to set as the owner of every copied book.
/// @return Pointer to the buffer that must be freed with `free` after use, or
///    `nullptr` on allocation failure or if @p books is empty.
[[gnu::visibility("internal")]]
tek_kc_book *_Nullable books_to_c(std::span<const book> books,
                                  const tek_kc_creds *_Nullable owner);

} // namespace tek::koboclient
