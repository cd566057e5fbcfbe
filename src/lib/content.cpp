//===-- content.cpp - content document interpretation ---------------------===//
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
/// Implementation of functions interpreting library, wishlist and content
///    access documents, and of book filtering and conversion to C types.
///
//===----------------------------------------------------------------------===//
#include "content.hpp"

#include "api.hpp"
#include "common/error.h"
#include "tek-koboclient/content.h"
#include "tek-koboclient/creds.h"
#include "tek-koboclient/error.h"
#include "utils.h"

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <iterator>
#include <rapidjson/document.h>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tek::koboclient {

namespace {

//===-- Private functions -------------------------------------------------===//

/// Get a string member of an object.
///
/// @return View of the member's value, or an empty view if @p obj is not an
///    object or the member is missing or not a string.
static std::string_view get_str(const rapidjson::Value &obj,
                                std::string_view name) {
  if (!obj.IsObject()) {
    return {};
  }
  const auto it = obj.FindMember(
      rapidjson::Value(rapidjson::StringRef(name.data(), name.length())));
  if (it == obj.MemberEnd() || !it->value.IsString()) {
    return {};
  }
  return {it->value.GetString(), it->value.GetStringLength()};
}

/// Get a boolean member of an object, `false` if it's missing.
static bool get_bool(const rapidjson::Value &obj, const char *_Nonnull name) {
  if (!obj.IsObject()) {
    return false;
  }
  const auto it = obj.FindMember(name);
  return it != obj.MemberEnd() && it->value.IsBool() && it->value.GetBool();
}

/// Get an object member of an object.
///
/// @return Pointer to the member's value, or `nullptr` if it's missing or not
///    an object.
static const rapidjson::Value *_Nullable get_obj(const rapidjson::Value &obj,
                                                 const char *_Nonnull name) {
  if (!obj.IsObject()) {
    return nullptr;
  }
  const auto it = obj.FindMember(name);
  return it == obj.MemberEnd() || !it->value.IsObject() ? nullptr
                                                         : &it->value;
}

/// Join author names from a contributor role list. Contributors with role
///    "Author" are joined, if there are none, the first contributor is used.
static std::string get_author(const rapidjson::Value &metadata) {
  const auto roles = metadata.FindMember("ContributorRoles");
  if (roles == metadata.MemberEnd() || !roles->value.IsArray()) {
    return {};
  }
  std::string author;
  for (const auto &role : roles->value.GetArray()) {
    if (get_str(role, "Role") != "Author") {
      continue;
    }
    if (const auto name = get_str(role, "Name"); !name.empty()) {
      if (!author.empty()) {
        author.append(" & ");
      }
      author.append(name);
    }
  }
  if (author.empty() && !roles->value.Empty()) {
    author = get_str(*roles->value.Begin(), "Name");
  }
  return author;
}

/// Create a compound error for the download operation with product ID set as
///    `uri`.
static tek_kc_err product_err(tek_kc_errc aux, std::string_view product_id) {
  auto err = tkc_err_sub(TEK_KC_ERRC_download, aux);
  err.uri = tkci_u_strdup(product_id.data(), product_id.length());
  return err;
}

/// Check whether a book with specified flags passes a filter.
static bool passes(const book_filter &filter, bool archived, bool read,
                   bool preview, bool locked) noexcept {
  return (filter.include_archived || !archived) &&
         (filter.include_read || !read) &&
         (filter.include_previews || !preview) &&
         (filter.include_locked || !locked);
}

/// Copy a string including its terminating null character.
///
/// @return Pointer to the character after the copied null character.
static char *_Nonnull copy_str(std::string_view str, char *_Nonnull dest) {
  *std::ranges::copy(str, dest).out = '\0';
  return dest + str.length() + 1;
}

} // namespace

//===-- Public functions --------------------------------------------------===//

tek_kc_err get_content_keys(std::string_view product_id,
                            const rapidjson::Value &content_access,
                            content_keys &keys) {
  keys.clear();
  if (!content_access.IsObject()) {
    return product_err(TEK_KC_ERRC_invalid_data, product_id);
  }
  const auto json_keys = content_access.FindMember("ContentKeys");
  if (json_keys == content_access.MemberEnd() || json_keys->value.IsNull()) {
    return tkc_err_ok();
  }
  if (!json_keys->value.IsArray()) {
    return product_err(TEK_KC_ERRC_invalid_data, product_id);
  }
  for (const auto &key : json_keys->value.GetArray()) {
    if (!key.IsObject()) {
      return product_err(TEK_KC_ERRC_invalid_data, product_id);
    }
    const auto name = key.FindMember("Name");
    const auto value = key.FindMember("Value");
    if (name == key.MemberEnd() || !name->value.IsString() ||
        value == key.MemberEnd() || !value->value.IsString()) {
      return product_err(TEK_KC_ERRC_invalid_data, product_id);
    }
    keys.insert_or_assign(
        std::string{name->value.GetString(), name->value.GetStringLength()},
        std::string{value->value.GetString(), value->value.GetStringLength()});
  }
  return tkc_err_ok();
}

tek_kc_err get_download_info(std::string_view product_id,
                             const rapidjson::Value &content_access,
                             download_info &info) {
  if (!content_access.IsObject()) {
    return product_err(TEK_KC_ERRC_invalid_data, product_id);
  }
  const auto urls = content_access.FindMember("ContentUrls");
  if (urls == content_access.MemberEnd() || urls->value.IsNull()) {
    return product_err(TEK_KC_ERRC_no_download_url, product_id);
  }
  if (!urls->value.IsArray()) {
    return product_err(TEK_KC_ERRC_invalid_data, product_id);
  }
  if (urls->value.Empty()) {
    return product_err(TEK_KC_ERRC_download_url_list_empty, product_id);
  }
  for (const auto &url : urls->value.GetArray()) {
    const auto drm_type = get_str(url, "DRMType");
    const auto url_format = get_str(url, "UrlFormat");
    if ((drm_type != api::drm_kdrm && drm_type != api::drm_signed_no_drm) ||
        std::ranges::find(api::supported_formats, url_format) ==
            std::ranges::end(api::supported_formats)) {
      continue;
    }
    const auto download_url = get_str(url, "DownloadUrl");
    if (download_url.empty()) {
      return product_err(TEK_KC_ERRC_no_download_url, product_id);
    }
    info.url = download_url;
    info.drm_type = drm_type;
    info.url_format = url_format;
    info.has_drm = drm_type == api::drm_kdrm;
    return tkc_err_ok();
  }
  std::string formats;
  for (const auto &url : urls->value.GetArray()) {
    if (!formats.empty()) {
      formats.push_back('\n');
    }
    formats.append("DRMType: '")
        .append(get_str(url, "DRMType"))
        .append("', UrlFormat: '")
        .append(get_str(url, "UrlFormat"))
        .append(1, '\'');
  }
  auto err = product_err(TEK_KC_ERRC_no_supported_format, product_id);
  err.detail = tkci_u_strdup(formats.data(), formats.length());
  return err;
}

std::vector<book> entries_to_books(const rapidjson::Value &entries,
                                   const creds *owner) {
  std::vector<book> books;
  if (!entries.IsArray()) {
    return books;
  }
  books.reserve(entries.Size());
  for (const auto &entry : entries.GetArray()) {
    auto entitlement = get_obj(entry, "NewEntitlement");
    if (!entitlement) {
      entitlement = get_obj(entry, "ChangedEntitlement");
      if (!entitlement) {
        continue;
      }
    }
    const auto metadata = get_obj(*entitlement, "BookMetadata");
    if (!metadata) {
      continue;
    }
    const auto revision_id = get_str(*metadata, "RevisionId");
    if (revision_id.empty()) {
      continue;
    }
    auto &book = books.emplace_back();
    book.revision_id = revision_id;
    book.title = get_str(*metadata, "Title");
    book.author = get_author(*metadata);
    if (const auto book_ent = get_obj(*entitlement, "BookEntitlement");
        book_ent) {
      book.archived = get_bool(*book_ent, "IsRemoved");
      book.locked = get_bool(*book_ent, "IsLocked");
      book.preview = get_str(*book_ent, "Accessibility") == "Preview";
    }
    if (const auto reading_state = get_obj(*entitlement, "ReadingState");
        reading_state) {
      if (const auto status_info = get_obj(*reading_state, "StatusInfo");
          status_info) {
        book.read = get_str(*status_info, "Status") == "Finished";
      }
    }
    book.owner = owner;
  }
  return books;
}

std::vector<book> wishlist_to_books(const rapidjson::Value &items,
                                    const creds *owner) {
  std::vector<book> books;
  if (!items.IsArray()) {
    return books;
  }
  books.reserve(items.Size());
  for (const auto &item : items.GetArray()) {
    const auto product_metadata = get_obj(item, "ProductMetadata");
    if (!product_metadata) {
      continue;
    }
    const auto metadata = get_obj(*product_metadata, "Book");
    if (!metadata) {
      continue;
    }
    auto &book = books.emplace_back();
    book.revision_id = get_str(*metadata, "CrossRevisionId");
    book.title = get_str(*metadata, "Title");
    if (const auto contributors = metadata->FindMember("Contributors");
        contributors != metadata->MemberEnd() &&
        contributors->value.IsArray()) {
      for (const auto &contributor : contributors->value.GetArray()) {
        const auto name =
            contributor.IsString()
                ? std::string_view{contributor.GetString(),
                                   contributor.GetStringLength()}
                : get_str(contributor, "Name");
        if (name.empty()) {
          continue;
        }
        if (!book.author.empty()) {
          book.author.append(" & ");
        }
        book.author.append(name);
      }
    }
    book.owner = owner;
  }
  return books;
}

std::vector<book> filter_books(std::span<const book> books,
                               const book_filter &filter) {
  std::vector<book> res;
  std::ranges::copy_if(books, std::back_inserter(res),
                       [&filter](const auto &book) {
                         return passes(filter, book.archived, book.read,
                                       book.preview, book.locked);
                       });
  return res;
}

tek_kc_book *books_to_c(std::span<const book> books,
                        const tek_kc_creds *owner) {
  if (books.empty()) {
    return nullptr;
  }
  const auto buf{std::malloc(
      std::ranges::fold_left(books, 0zu, [](auto acc, const auto &book) {
        return acc + sizeof(tek_kc_book) + book.revision_id.length() +
               book.title.length() + book.author.length() + 3;
      }))};
  if (!buf) {
    return nullptr;
  }
  const auto c_books{static_cast<tek_kc_book *>(buf)};
  auto cur_book{c_books};
  for (auto cur_str{reinterpret_cast<char *>(&c_books[books.size()])};
       const auto &book : books) {
    const auto revision_id{cur_str};
    cur_str = copy_str(book.revision_id, cur_str);
    const auto title{cur_str};
    cur_str = copy_str(book.title, cur_str);
    const auto author{cur_str};
    cur_str = copy_str(book.author, cur_str);
    *cur_book++ = {.revision_id = revision_id,
                   .title = title,
                   .author = author,
                   .archived = book.archived,
                   .read = book.read,
                   .preview = book.preview,
                   .locked = book.locked,
                   .owner = owner};
  }
  return c_books;
}

tek_kc_err c_drm_remover::remove_drm(const char *input_path,
                                     const char *output_path,
                                     std::string_view device_id,
                                     std::string_view user_id,
                                     const content_keys &keys) {
  std::vector<tek_kc_content_key> c_keys;
  c_keys.reserve(keys.size());
  for (const auto &[name, value] : keys) {
    c_keys.push_back({.name = name.data(), .value = value.data()});
  }
  const std::string device_id_str{device_id};
  const std::string user_id_str{user_id};
  return iface.remove_drm(input_path, output_path, device_id_str.data(),
                          user_id_str.data(), c_keys.data(),
                          static_cast<int>(c_keys.size()), iface.user_data);
}

//===-- C API -------------------------------------------------------------===//

extern "C" int tek_kc_filter_books(tek_kc_book *books, int num_books,
                                   const tek_kc_book_filter *filter) {
  if (!books || num_books <= 0) {
    return 0;
  }
  const book_filter cpp_filter{
      .include_archived = filter->include_archived,
      .include_read = filter->include_read,
      .include_previews = filter->include_previews,
      .include_locked = filter->include_locked};
  const auto end = std::stable_partition(
      books, books + num_books, [&cpp_filter](const auto &book) {
        return passes(cpp_filter, book.archived, book.read, book.preview,
                      book.locked);
      });
  return static_cast<int>(end - books);
}

} // namespace tek::koboclient
