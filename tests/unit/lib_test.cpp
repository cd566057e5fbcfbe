//===-- lib_test.cpp - library context, error and utility tests -----------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of tek-koboclient, under the GNU General Public License v3.0 or later
// See https://github.com/teknology-hub/tek-koboclient/blob/main/COPYING for
//    license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "tek-koboclient/base.h"

#include <cassert>
#include <cerrno>
#include <cstring>
#include <curl/curl.h>
#include <iostream>
#include <set>
#include <string>
#include <string_view>

#include "common/error.h"
#include "os.h"
#include "tek-koboclient/error.h"
#include "utils.h"

namespace {

std::string Base64(std::string_view input) {
  char buf[64];
  const int len = tkci_u_base64_encode(reinterpret_cast<const unsigned char*>(input.data()),
                                       static_cast<int>(input.size()), buf);
  return {buf, static_cast<std::size_t>(len)};
}

void TestLibraryInit() {
  assert(tek_kc_lib_init());
  assert(std::string_view(tek_kc_version()) == "1.0.0");
  tek_kc_lib_cleanup();
}

void TestBase64() {
  assert(Base64("") == "");
  assert(Base64("f") == "Zg==");
  assert(Base64("fo") == "Zm8=");
  assert(Base64("foo") == "Zm9v");
  assert(Base64("00000000-0000-0000-0000-000000004000") ==
         "MDAwMDAwMDAtMDAwMC0wMDAwLTAwMDAtMDAwMDAwMDA0MDAw");
}

void TestUuid() {
  std::set<std::string> seen;
  for (int i = 0; i < 16; ++i) {
    char buf[36];
    assert(tkci_u_gen_uuid(buf));
    const std::string uuid(buf, sizeof buf);
    for (std::size_t pos = 0; pos < uuid.size(); ++pos) {
      if (pos == 8 || pos == 13 || pos == 18 || pos == 23) {
        assert(uuid[pos] == '-');
      } else {
        assert(std::strchr("0123456789abcdef", uuid[pos]));
      }
    }
    assert(uuid[14] == '4');
    assert(std::strchr("89ab", uuid[19]));
    seen.insert(uuid);
  }
  assert(seen.size() == 16);
}

void TestBasicMessages() {
  const auto err = tkc_err_basic(TEK_KC_ERRC_directory_no_resource);
  auto       msgs = tek_kc_err_get_msgs(&err);
  assert(msgs.type == TEK_KC_ERR_TYPE_basic);
  assert(std::string_view(msgs.type_str) == "Basic");
  assert(std::string_view(msgs.primary) == "Endpoint directory doesn't have the requested resource");
  assert(msgs.auxiliary == nullptr);
  assert(std::string_view(msgs.uri_type) == "Resource");
  tek_kc_err_release_msgs(&msgs);

  const auto ok = tkc_err_ok();
  assert(tek_kc_err_success(&ok));
  msgs = tek_kc_err_get_msgs(&ok);
  assert(std::string_view(msgs.primary) == "Operation completed successfully");
  assert(msgs.uri_type == nullptr);
  tek_kc_err_release_msgs(&msgs);
}

void TestCompoundMessages() {
  auto err = tkc_err_sub(TEK_KC_ERRC_download, TEK_KC_ERRC_no_supported_format);
  err.uri = tkci_u_strdup("pid", 3);
  err.detail = tkci_u_strdup("DRMType: 'AdobeDrm', UrlFormat: 'PDF'", 37);
  auto msgs = tek_kc_err_get_msgs(&err);
  assert(std::string_view(msgs.type_str) == "Compound");
  assert(std::string_view(msgs.primary) == "Failed to download the book");
  assert(std::string_view(msgs.auxiliary) == "Download URL for supported formats can't be found");
  assert(std::string_view(msgs.uri_type) == "Product ID");
  tek_kc_err_release_msgs(&msgs);

  tek_kc_err_release(&err);
  assert(err.uri == nullptr);
  assert(err.detail == nullptr);

  err = tkc_err_sub(TEK_KC_ERRC_get_library, TEK_KC_ERRC_not_authenticated);
  msgs = tek_kc_err_get_msgs(&err);
  assert(std::string_view(msgs.uri_type) == "Email");
  tek_kc_err_release_msgs(&msgs);

  err = tkc_err_sub(TEK_KC_ERRC_get_wishlist, TEK_KC_ERRC_mem_alloc);
  msgs = tek_kc_err_get_msgs(&err);
  assert(std::string_view(msgs.auxiliary) == "Memory allocation error");
  tek_kc_err_release_msgs(&msgs);
}

void TestCurlMessages() {
  const tek_kc_err err{.type = TEK_KC_ERR_TYPE_curle,
                       .primary = TEK_KC_ERRC_get_wishlist,
                       .auxiliary = CURLE_HTTP_RETURNED_ERROR,
                       .extra = 429,
                       .uri = nullptr,
                       .detail = nullptr};
  auto msgs = tek_kc_err_get_msgs(&err);
  assert(std::string_view(msgs.type_str) == "libcurl");
  assert(std::string_view(msgs.primary) == "Failed to get the wishlist");
  assert(std::string_view(msgs.auxiliary) == curl_easy_strerror(CURLE_HTTP_RETURNED_ERROR));
  assert(std::string_view(msgs.extra) == "HTTP status 429");
  assert(std::string_view(msgs.uri_type) == "URL");
  tek_kc_err_release_msgs(&msgs);
  assert(msgs.extra == nullptr);
}

void TestOsMessages() {
  errno = ENOENT;
  auto err = tkci_os_io_err(TEK_KC_ERRC_download, TEK_KC_ERR_IO_TYPE_delete, "/tmp/book.epub");
  assert(err.type == TEK_KC_ERR_TYPE_os);
  assert(err.auxiliary == ENOENT);
  assert(std::string_view(err.uri) == "/tmp/book.epub");

  auto msgs = tek_kc_err_get_msgs(&err);
  assert(std::string_view(msgs.type_str) == "OS");
  assert(std::string_view(msgs.auxiliary) == std::strerror(ENOENT));
  assert(std::string_view(msgs.extra) == "Deleting");
  assert(std::string_view(msgs.uri_type) == "Path");
  tek_kc_err_release_msgs(&msgs);
  tek_kc_err_release(&err);
}

} // namespace

int main() {
  TestLibraryInit();
  TestBase64();
  TestUuid();
  TestBasicMessages();
  TestCompoundMessages();
  TestCurlMessages();
  TestOsMessages();

  std::cout << "lib_test: pass\n";
  return 0;
}
