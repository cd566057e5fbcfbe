//===-- content_test.cpp - content access and book list tests -------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of tek-koboclient, under the GNU General Public License v3.0 or later
// See https://github.com/teknology-hub/tek-koboclient/blob/main/COPYING for
//    license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "content.hpp"

#include <cassert>
#include <iostream>
#include <rapidjson/document.h>
#include <string>
#include <vector>

#include "creds.hpp"
#include "fake_transport.hpp"
#include "tek-koboclient/error.h"

namespace {

using tek::koboclient::book;
using tek::koboclient::book_filter;
using tek::koboclient::content_keys;
using tek::koboclient::creds;
using tek::koboclient::download_info;
using tek::koboclient::entries_to_books;
using tek::koboclient::filter_books;
using tek::koboclient::get_content_keys;
using tek::koboclient::get_download_info;
using tek::koboclient::wishlist_to_books;
using tek::koboclient::test::make_creds;

rapidjson::Document Parse(const char* json) {
  rapidjson::Document doc;
  doc.Parse(json);
  assert(!doc.HasParseError());
  return doc;
}

book MakeBook(const char* id, bool archived, bool read, bool preview, bool locked) {
  book b;
  b.revision_id = id;
  b.archived = archived;
  b.read = read;
  b.preview = preview;
  b.locked = locked;
  return b;
}

void TestContentKeys() {
  content_keys keys{{"stale", "value"}};
  auto         doc = Parse(R"({"ContentKeys":[{"Name":"a.xhtml","Value":"k1"},{"Name":"b.xhtml","Value":"k2"}]})");
  auto         res = get_content_keys("pid", doc, keys);
  assert(tek_kc_err_success(&res));
  assert(keys.size() == 2);
  assert(keys.at("a.xhtml") == "k1");
  assert(keys.at("b.xhtml") == "k2");

  doc = Parse(R"({"ContentUrls":[]})");
  res = get_content_keys("pid", doc, keys);
  assert(tek_kc_err_success(&res));
  assert(keys.empty());

  doc = Parse(R"({"ContentKeys":null})");
  res = get_content_keys("pid", doc, keys);
  assert(tek_kc_err_success(&res));
  assert(keys.empty());

  doc = Parse(R"({"ContentKeys":[{"Name":"a.xhtml"}]})");
  res = get_content_keys("pid-k", doc, keys);
  assert(res.type == TEK_KC_ERR_TYPE_sub);
  assert(res.primary == TEK_KC_ERRC_download);
  assert(res.auxiliary == TEK_KC_ERRC_invalid_data);
  assert(std::string(res.uri) == "pid-k");
  tek_kc_err_release(&res);
}

void TestDownloadInfoFirstSupportedEntryWins() {
  auto doc = Parse(R"({"ContentUrls":[
      {"DRMType":"AdobeDrm","UrlFormat":"EPUB3","DownloadUrl":"https://cdn/adobe"},
      {"DRMType":"KDRM","UrlFormat":"PDF","DownloadUrl":"https://cdn/pdf"},
      {"DRMType":"SignedNoDrm","UrlFormat":"KEPUB","DownloadUrl":"https://cdn/kepub"},
      {"DRMType":"KDRM","UrlFormat":"EPUB3","DownloadUrl":"https://cdn/epub3"}]})");
  download_info info;
  auto          res = get_download_info("pid", doc, info);
  assert(tek_kc_err_success(&res));
  assert(info.url == "https://cdn/kepub");
  assert(info.drm_type == "SignedNoDrm");
  assert(info.url_format == "KEPUB");
  assert(!info.has_drm);

  doc = Parse(R"({"ContentUrls":[
      {"DRMType":"KDRM","UrlFormat":"EPUB3FL","DownloadUrl":"https://cdn/fl"},
      {"DRMType":"SignedNoDrm","UrlFormat":"EPUB3","DownloadUrl":"https://cdn/epub3"}]})");
  res = get_download_info("pid", doc, info);
  assert(tek_kc_err_success(&res));
  assert(info.url == "https://cdn/fl");
  assert(info.has_drm);
}

void TestDownloadInfoErrors() {
  download_info info;

  auto doc = Parse(R"({"ContentKeys":[]})");
  auto res = get_download_info("pid-1", doc, info);
  assert(res.type == TEK_KC_ERR_TYPE_sub);
  assert(res.primary == TEK_KC_ERRC_download);
  assert(res.auxiliary == TEK_KC_ERRC_no_download_url);
  assert(std::string(res.uri) == "pid-1");
  tek_kc_err_release(&res);

  doc = Parse(R"({"ContentUrls":null})");
  res = get_download_info("pid-1", doc, info);
  assert(res.auxiliary == TEK_KC_ERRC_no_download_url);
  tek_kc_err_release(&res);

  doc = Parse(R"({"ContentUrls":[]})");
  res = get_download_info("pid-2", doc, info);
  assert(res.auxiliary == TEK_KC_ERRC_download_url_list_empty);
  assert(std::string(res.uri) == "pid-2");
  tek_kc_err_release(&res);

  doc = Parse(R"({"ContentUrls":[
      {"DRMType":"AdobeDrm","UrlFormat":"EPUB3","DownloadUrl":"https://cdn/adobe"},
      {"DRMType":"KDRM","UrlFormat":"PDF","DownloadUrl":"https://cdn/pdf"}]})");
  res = get_download_info("pid-3", doc, info);
  assert(res.auxiliary == TEK_KC_ERRC_no_supported_format);
  assert(std::string(res.uri) == "pid-3");
  assert(std::string(res.detail) ==
         "DRMType: 'AdobeDrm', UrlFormat: 'EPUB3'\n"
         "DRMType: 'KDRM', UrlFormat: 'PDF'");
  tek_kc_err_release(&res);

  // Malformed documents still name the product
  doc = Parse(R"({"ContentUrls":{}})");
  res = get_download_info("pid-4", doc, info);
  assert(res.type == TEK_KC_ERR_TYPE_sub);
  assert(res.primary == TEK_KC_ERRC_download);
  assert(res.auxiliary == TEK_KC_ERRC_invalid_data);
  assert(std::string(res.uri) == "pid-4");
  tek_kc_err_release(&res);

  content_keys keys;
  doc = Parse(R"({"ContentKeys":[1]})");
  res = get_content_keys("pid-5", doc, keys);
  assert(res.auxiliary == TEK_KC_ERRC_invalid_data);
  assert(std::string(res.uri) == "pid-5");
  auto msgs = tek_kc_err_get_msgs(&res);
  assert(std::string(msgs.uri_type) == "Product ID");
  tek_kc_err_release_msgs(&msgs);
  tek_kc_err_release(&res);

  doc = Parse(R"([])");
  res = get_download_info("pid-6", doc, info);
  assert(res.auxiliary == TEK_KC_ERRC_invalid_data);
  assert(std::string(res.uri) == "pid-6");
  tek_kc_err_release(&res);
}

void TestEntriesToBooks() {
  const creds owner = make_creds();
  auto        doc = Parse(R"([
      {"NewEntitlement":{
        "BookEntitlement":{"IsRemoved":true,"IsLocked":false,"Accessibility":"Full"},
        "BookMetadata":{"RevisionId":"rev-1","Title":"First",
          "ContributorRoles":[{"Name":"Ann","Role":"Author"},{"Name":"Ian","Role":"Illustrator"},
                              {"Name":"Bob","Role":"Author"}]},
        "ReadingState":{"StatusInfo":{"Status":"Finished"}}}},
      {"ChangedReadingState":{"ReadingState":{}}},
      {"ChangedEntitlement":{
        "BookEntitlement":{"IsLocked":true,"Accessibility":"Preview"},
        "BookMetadata":{"RevisionId":"rev-2","Title":"Second",
          "ContributorRoles":[{"Name":"Editor Only","Role":"Editor"}]},
        "ReadingState":{"StatusInfo":{"Status":"Reading"}}}}])");

  const auto books = entries_to_books(doc, &owner);
  assert(books.size() == 2);

  assert(books[0].revision_id == "rev-1");
  assert(books[0].title == "First");
  assert(books[0].author == "Ann & Bob");
  assert(books[0].archived);
  assert(books[0].read);
  assert(!books[0].preview);
  assert(!books[0].locked);
  assert(books[0].owner == &owner);

  assert(books[1].revision_id == "rev-2");
  assert(books[1].author == "Editor Only");
  assert(!books[1].archived);
  assert(!books[1].read);
  assert(books[1].preview);
  assert(books[1].locked);
}

void TestWishlistToBooks() {
  auto doc = Parse(R"([
      {"ProductMetadata":{"Book":{"CrossRevisionId":"cr-1","Title":"Wanted",
        "Contributors":["Ann",{"Name":"Bob"},{"Role":"nameless"}]}}},
      {"ProductMetadata":{"Audiobook":{"CrossRevisionId":"cr-2"}}},
      {"ProductMetadata":{"Book":{"CrossRevisionId":"cr-3","Title":"Solo"}}}])");

  const auto books = wishlist_to_books(doc, nullptr);
  assert(books.size() == 2);
  assert(books[0].revision_id == "cr-1");
  assert(books[0].title == "Wanted");
  assert(books[0].author == "Ann & Bob");
  assert(books[0].owner == nullptr);
  assert(books[1].revision_id == "cr-3");
  assert(books[1].author.empty());
}

void TestFilterBooks() {
  const std::vector<book> books{MakeBook("plain", false, false, false, false),
                                MakeBook("archived", true, false, false, false),
                                MakeBook("read", false, true, false, false),
                                MakeBook("preview", false, false, true, false),
                                MakeBook("locked", false, false, false, true)};

  auto res = filter_books(books, book_filter{});
  assert(res.size() == 2);
  assert(res[0].revision_id == "plain");
  assert(res[1].revision_id == "read");

  res = filter_books(books, {.include_archived = true,
                             .include_read = false,
                             .include_previews = true,
                             .include_locked = true});
  assert(res.size() == 4);
  assert(res[0].revision_id == "plain");
  assert(res[1].revision_id == "archived");
  assert(res[2].revision_id == "preview");
  assert(res[3].revision_id == "locked");
}

} // namespace

int main() {
  TestContentKeys();
  TestDownloadInfoFirstSupportedEntryWins();
  TestDownloadInfoErrors();
  TestEntriesToBooks();
  TestWishlistToBooks();
  TestFilterBooks();

  std::cout << "content_test: pass\n";
  return 0;
}
