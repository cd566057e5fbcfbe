//===-- download.cpp - book content download pipeline ---------------------===//
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
/// Implementation of @ref tek::koboclient::client::download.
///
//===----------------------------------------------------------------------===//
#include "client.hpp"

#include "api.hpp"
#include "common/error.h"
#include "content.hpp"
#include "http.hpp"
#include "log.hpp"
#include "os.h"
#include "tek-koboclient/error.h"
#include "utils.h"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <memory>
#include <rapidjson/document.h>
#include <rapidjson/reader.h>
#include <string>
#include <string_view>

namespace tek::koboclient {

namespace {

/// Buffered writer of downloaded content into a file.
struct file_sink {
  /// Descriptor of the file being written.
  int fd;
  /// Path to the file being written.
  const std::string &path;
  /// Buffer accumulating content until it's full.
  std::unique_ptr<char[]> buf{
      std::make_unique_for_overwrite<char[]>(api::download_chunk_size)};
  /// Number of bytes currently in @ref buf.
  std::size_t buf_size = 0;
  /// Error that has occurred while writing, if any.
  tek_kc_err err = tkc_err_ok();

  /// Write buffered content to the file.
  ///
  /// @return Value indicating whether the write succeeded.
  bool flush() {
    if (!buf_size) {
      return true;
    }
    if (!tkci_os_file_write(fd, buf.get(), buf_size)) {
      err = tkci_os_io_err(TEK_KC_ERRC_download, TEK_KC_ERR_IO_TYPE_write,
                           path.data());
      return false;
    }
    buf_size = 0;
    return true;
  }

  /// Append received content to the buffer, flushing it whenever it fills up.
  bool append(const char *_Nonnull data, std::size_t size) {
    while (size) {
      const auto chunk = std::min(size, api::download_chunk_size - buf_size);
      std::memcpy(&buf[buf_size], data, chunk);
      buf_size += chunk;
      data += chunk;
      size -= chunk;
      if (buf_size == api::download_chunk_size && !flush()) {
        return false;
      }
    }
    return true;
  }
};

//===-- Private functions -------------------------------------------------===//

/// Delete a file left behind by a failed download, if it exists.
static void remove_leftover(const std::string &path) {
  if (!tkci_os_file_delete(path.data())) {
    auto err = tkci_os_io_err(TEK_KC_ERRC_download, TEK_KC_ERR_IO_TYPE_delete,
                              path.data());
    log::warn("Failed to delete file after a failed download",
              {log::str_field("path", path),
               log::int_field("errno", err.auxiliary)});
    tek_kc_err_release(&err);
  }
}

} // namespace

//===-- Public functions --------------------------------------------------===//

tek_kc_err client::download(std::string_view product_id,
                            std::string_view output_path,
                            std::string &result_path) {
  const std::string out_path{output_path};
  const auto tmp_path = std::string{output_path}.append(api::downloading_suffix);
  auto res = download_to(product_id, out_path, tmp_path);
  if (!tek_kc_err_success(&res)) {
    remove_leftover(tmp_path);
    remove_leftover(out_path);
    return res;
  }
  log::info("Book downloaded", {log::str_field("product_id", product_id),
                                log::str_field("path", out_path)});
  result_path = out_path;
  return res;
}

//===-- Private functions -------------------------------------------------===//

tek_kc_err client::download_to(std::string_view product_id,
                               const std::string &output_path,
                               const std::string &tmp_path) {
  // Get content access information
  http_request req;
  if (auto res = dir.expand(TEK_KC_ERRC_get_content_access,
                            api::res::content_access_book, product_id, req.url);
      !tek_kc_err_success(&res)) {
    return res;
  }
  req.query = {{"DisplayProfile", std::string{api::display_profile}}};
  http_response resp;
  if (auto res = authorized.perform(TEK_KC_ERRC_get_content_access, req, resp);
      !tek_kc_err_success(&res)) {
    return res;
  }
  rapidjson::Document doc;
  doc.Parse<rapidjson::kParseStopWhenDoneFlag>(resp.body.data(),
                                               resp.body.length());
  if (doc.HasParseError()) {
    auto err =
        tkc_err_sub(TEK_KC_ERRC_get_content_access, TEK_KC_ERRC_json_parse);
    err.uri = tkci_u_strdup(product_id.data(), product_id.length());
    return err;
  }
  content_keys keys;
  if (auto res = get_content_keys(product_id, doc, keys);
      !tek_kc_err_success(&res)) {
    return res;
  }
  download_info info;
  if (auto res = get_download_info(product_id, doc, info);
      !tek_kc_err_success(&res)) {
    return res;
  }
  log::info("Selected download URL",
            {log::str_field("product_id", product_id),
             log::str_field("drm_type", info.drm_type),
             log::str_field("format", info.url_format)});
  if (info.has_drm && !remover) {
    return tkc_err_sub(TEK_KC_ERRC_download, TEK_KC_ERRC_no_drm_remover);
  }
  // Download the content
  if (auto res = download_file(info.url, tmp_path); !tek_kc_err_success(&res)) {
    return res;
  }
  if (!info.has_drm) {
    if (!tkci_os_file_move(tmp_path.data(), output_path.data())) {
      return tkci_os_io_err(TEK_KC_ERRC_download, TEK_KC_ERR_IO_TYPE_move,
                            tmp_path.data());
    }
    return tkc_err_ok();
  }
  if (auto res = remover->remove_drm(tmp_path.data(), output_path.data(),
                                     state.device_id, state.user_id, keys);
      !tek_kc_err_success(&res)) {
    return res;
  }
  if (!tkci_os_file_delete(tmp_path.data())) {
    return tkci_os_io_err(TEK_KC_ERRC_download, TEK_KC_ERR_IO_TYPE_delete,
                          tmp_path.data());
  }
  return tkc_err_ok();
}

tek_kc_err client::download_file(const std::string &url,
                                 const std::string &path) {
  const int fd = tkci_os_file_create(path.data());
  if (fd == TKCI_OS_INVALID_HANDLE) {
    return tkci_os_io_err(TEK_KC_ERRC_download, TEK_KC_ERR_IO_TYPE_open,
                          path.data());
  }
  file_sink sink{.fd = fd, .path = path};
  http_request req;
  req.url = url;
  req.sink = [&sink](const char *data, std::size_t size) {
    return sink.append(data, size);
  };
  http_response resp;
  // Content URLs are fetched without authorization
  auto res = transport.perform(TEK_KC_ERRC_download, req, resp);
  if (tek_kc_err_success(&res)) {
    if (!resp.ok()) {
      res = http_status_err(TEK_KC_ERRC_download, req, resp);
    } else if (!sink.flush()) {
      res = sink.err;
    }
  } else if (!tek_kc_err_success(&sink.err)) {
    // The transfer has been aborted by a failed write, report that instead
    tek_kc_err_release(&res);
    res = sink.err;
  }
  if (!tkci_os_file_close(fd) && tek_kc_err_success(&res)) {
    res = tkci_os_io_err(TEK_KC_ERRC_download, TEK_KC_ERR_IO_TYPE_close,
                         path.data());
  }
  return res;
}

} // namespace tek::koboclient
