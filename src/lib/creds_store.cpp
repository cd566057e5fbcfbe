//===-- creds_store.cpp - SQLite credential store implementation ----------===//
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
/// Implementation of @ref tek::koboclient::sqlite_creds_store and the
///    `tek_kc_creds_db_*` functions.
///
//===----------------------------------------------------------------------===//
#include "creds.hpp"

#include "common/error.h"
#include "log.hpp"
#include "os.h"
#include "tek-koboclient/creds.h"
#include "tek-koboclient/error.h"
#include "utils.h"

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <memory>
#include <iterator>
#include <new>
#include <sqlite3.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/// SQLite credential database handle.
struct [[gnu::visibility("internal")]] tek_kc_creds_db {
  std::unique_ptr<tek::koboclient::sqlite_creds_store> store;
};

namespace tek::koboclient {

namespace {

/// Path of the database file relative to the user's configuration directory.
constexpr std::string_view db_rel_path{TKCI_OS_PATH_SEP_CHAR_STR
                                       "tek-koboclient" TKCI_OS_PATH_SEP_CHAR_STR
                                       "settings.sqlite3"};

using stmt_ptr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

//===-- Private functions -------------------------------------------------===//

/// Create a @ref TEK_KC_ERR_TYPE_sqlite error.
///
/// @param prim
///    Primary error code.
/// @param res
///    SQLite result code.
/// @param uri
///    Optional URI (email or path) to attach.
/// @return A @ref tek_kc_err for specified codes.
static tek_kc_err sqlite_err(tek_kc_errc prim, int res,
                             std::string_view uri = {}) {
  return {.type = TEK_KC_ERR_TYPE_sqlite,
          .primary = prim,
          .auxiliary = res,
          .extra = 0,
          .uri = uri.empty() ? nullptr : tkci_u_strdup(uri.data(), uri.length()),
          .detail = nullptr};
}

/// Prepare a statement.
///
/// @return SQLite result code.
static int prepare(sqlite3 *_Nonnull db, std::string_view query,
                   stmt_ptr &stmt) {
  sqlite3_stmt *ptr;
  const int res = sqlite3_prepare_v2(db, query.data(),
                                     static_cast<int>(query.length() + 1), &ptr,
                                     nullptr);
  if (res == SQLITE_OK) {
    stmt.reset(ptr);
  }
  return res;
}

/// Bind a text parameter without copying it; @p text must outlive the
///    statement execution.
static int bind_text(sqlite3_stmt *_Nonnull stmt, int index,
                     std::string_view text) {
  return sqlite3_bind_text(stmt, index, text.data(),
                           static_cast<int>(text.length()), SQLITE_STATIC);
}

/// Read a text column into a string.
static std::string column_text(sqlite3_stmt *_Nonnull stmt, int index) {
  const auto text = sqlite3_column_text(stmt, index);
  if (!text) {
    return {};
  }
  return {reinterpret_cast<const char *>(text),
          static_cast<std::size_t>(sqlite3_column_bytes(stmt, index))};
}

/// @ref tek_kc_creds_save_func saving to the @ref tek_kc_creds_db pointed to
///    by @p user_data.
static tek_kc_err db_save(const tek_kc_creds *creds, void *user_data) {
  return tek_kc_creds_db_save(static_cast<tek_kc_creds_db *>(user_data), creds);
}

/// Copy a string including its terminating null character.
///
/// @return Pointer to the character after the copied null character.
static char *_Nonnull copy_str(std::string_view str, char *_Nonnull dest) {
  *std::ranges::copy(str, dest).out = '\0';
  return dest + str.length() + 1;
}

} // namespace

void sqlite_creds_store::db_deleter::operator()(sqlite3 *db) const noexcept {
  sqlite3_close_v2(db);
}

//===-- Public functions --------------------------------------------------===//

tek_kc_err sqlite_creds_store::open(const char *path,
                                    std::unique_ptr<sqlite_creds_store> &store) {
  const std::string_view path_view{path};
  // Make sure the parent directory exists
  if (const auto sep = path_view.rfind(TKCI_OS_PATH_SEP_CHAR_STR[0]);
      sep != std::string_view::npos && sep != 0) {
    const std::string dir{path_view.substr(0, sep)};
    if (!tkci_os_dir_create_all(dir.data())) {
      return tkci_os_io_err(TEK_KC_ERRC_creds_open, TEK_KC_ERR_IO_TYPE_open,
                            dir.data());
    }
  }
  sqlite3 *db_ptr;
  int res = sqlite3_open_v2(path, &db_ptr,
                            SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                            nullptr);
  if (res != SQLITE_OK) {
    if (db_ptr) {
      sqlite3_close_v2(db_ptr);
    }
    return sqlite_err(TEK_KC_ERRC_creds_open, res, path_view);
  }
  std::unique_ptr<sqlite3, db_deleter> db{db_ptr};
  res = sqlite3_exec(db.get(),
                     "CREATE TABLE IF NOT EXISTS users (email TEXT PRIMARY "
                     "KEY, device_id TEXT NOT NULL, user_id TEXT NOT NULL, "
                     "user_key TEXT NOT NULL, access_token TEXT NOT NULL, "
                     "refresh_token TEXT NOT NULL)",
                     nullptr, nullptr, nullptr);
  if (res != SQLITE_OK) {
    return sqlite_err(TEK_KC_ERRC_creds_open, res, path_view);
  }
  store.reset(new sqlite_creds_store(db.release()));
  log::debug("Credential store opened", {log::str_field("path", path_view)});
  return tkc_err_ok();
}

std::string sqlite_creds_store::default_path() {
  const std::unique_ptr<char, decltype(&std::free)> config_dir{
      tkci_os_get_config_dir(), std::free};
  if (!config_dir) {
    return {};
  }
  return std::string{config_dir.get()}.append(db_rel_path);
}

tek_kc_err sqlite_creds_store::save(const creds &creds) {
  constexpr std::string_view query{
      "INSERT INTO users (email, device_id, user_id, user_key, access_token, "
      "refresh_token) VALUES (?, ?, ?, ?, ?, ?) ON CONFLICT (email) DO UPDATE "
      "SET device_id = excluded.device_id, user_id = excluded.user_id, "
      "user_key = excluded.user_key, access_token = excluded.access_token, "
      "refresh_token = excluded.refresh_token"};
  stmt_ptr stmt{nullptr, sqlite3_finalize};
  int res = prepare(db.get(), query, stmt);
  if (res != SQLITE_OK) {
    return sqlite_err(TEK_KC_ERRC_creds_save, res, creds.email);
  }
  const std::string_view values[]{creds.email,        creds.device_id,
                                   creds.user_id,      creds.user_key,
                                   creds.access_token, creds.refresh_token};
  for (int i = 0; const auto value : values) {
    res = bind_text(stmt.get(), ++i, value);
    if (res != SQLITE_OK) {
      return sqlite_err(TEK_KC_ERRC_creds_save, res, creds.email);
    }
  }
  res = sqlite3_step(stmt.get());
  if (res != SQLITE_DONE) {
    return sqlite_err(TEK_KC_ERRC_creds_save, res, creds.email);
  }
  return tkc_err_ok();
}

tek_kc_err sqlite_creds_store::load(std::string_view email, creds &creds) {
  constexpr std::string_view query{
      "SELECT device_id, user_id, user_key, access_token, refresh_token FROM "
      "users WHERE email = ?"};
  stmt_ptr stmt{nullptr, sqlite3_finalize};
  int res = prepare(db.get(), query, stmt);
  if (res != SQLITE_OK) {
    return sqlite_err(TEK_KC_ERRC_creds_load, res, email);
  }
  res = bind_text(stmt.get(), 1, email);
  if (res != SQLITE_OK) {
    return sqlite_err(TEK_KC_ERRC_creds_load, res, email);
  }
  res = sqlite3_step(stmt.get());
  switch (res) {
  case SQLITE_ROW:
    break;
  case SQLITE_DONE: {
    auto err = tkc_err_sub(TEK_KC_ERRC_creds_load, TEK_KC_ERRC_creds_not_found);
    err.uri = tkci_u_strdup(email.data(), email.length());
    return err;
  }
  default:
    return sqlite_err(TEK_KC_ERRC_creds_load, res, email);
  }
  creds.email = email;
  creds.device_id = column_text(stmt.get(), 0);
  creds.user_id = column_text(stmt.get(), 1);
  creds.user_key = column_text(stmt.get(), 2);
  creds.access_token = column_text(stmt.get(), 3);
  creds.refresh_token = column_text(stmt.get(), 4);
  return tkc_err_ok();
}

tek_kc_err sqlite_creds_store::remove(std::string_view email) {
  constexpr std::string_view query{"DELETE FROM users WHERE email = ?"};
  stmt_ptr stmt{nullptr, sqlite3_finalize};
  int res = prepare(db.get(), query, stmt);
  if (res != SQLITE_OK) {
    return sqlite_err(TEK_KC_ERRC_creds_remove, res, email);
  }
  res = bind_text(stmt.get(), 1, email);
  if (res == SQLITE_OK) {
    res = sqlite3_step(stmt.get());
  }
  if (res != SQLITE_DONE) {
    return sqlite_err(TEK_KC_ERRC_creds_remove, res, email);
  }
  return tkc_err_ok();
}

tek_kc_err sqlite_creds_store::list_emails(std::vector<std::string> &emails) {
  constexpr std::string_view query{"SELECT email FROM users ORDER BY rowid"};
  stmt_ptr stmt{nullptr, sqlite3_finalize};
  int res = prepare(db.get(), query, stmt);
  if (res != SQLITE_OK) {
    return sqlite_err(TEK_KC_ERRC_creds_load, res);
  }
  emails.clear();
  for (res = sqlite3_step(stmt.get()); res == SQLITE_ROW;
       res = sqlite3_step(stmt.get())) {
    emails.emplace_back(column_text(stmt.get(), 0));
  }
  if (res != SQLITE_DONE) {
    return sqlite_err(TEK_KC_ERRC_creds_load, res);
  }
  return tkc_err_ok();
}

//===-- C API -------------------------------------------------------------===//

extern "C" {

char *tek_kc_creds_db_default_path(void) {
  const auto path = sqlite_creds_store::default_path();
  return path.empty() ? nullptr : tkci_u_strdup(path.data(), path.length());
}

tek_kc_err tek_kc_creds_db_open(const char *path, tek_kc_creds_db **db) {
  std::unique_ptr<sqlite_creds_store> store;
  const auto res = sqlite_creds_store::open(path, store);
  if (!tek_kc_err_success(&res)) {
    return res;
  }
  const auto db_ptr = new (std::nothrow) tek_kc_creds_db{std::move(store)};
  if (!db_ptr) {
    return tkc_err_sub(TEK_KC_ERRC_creds_open, TEK_KC_ERRC_mem_alloc);
  }
  *db = db_ptr;
  return tkc_err_ok();
}

void tek_kc_creds_db_close(tek_kc_creds_db *db) { delete db; }

tek_kc_creds_store tek_kc_creds_db_get_store(tek_kc_creds_db *db) {
  return {.save = db_save, .user_data = db};
}

tek_kc_err tek_kc_creds_db_save(tek_kc_creds_db *db,
                                const tek_kc_creds *creds) {
  return db->store->save(creds_from_c(*creds));
}

tek_kc_err tek_kc_creds_db_load(tek_kc_creds_db *db, const char *email,
                                tek_kc_creds **c_creds_out) {
  creds loaded;
  const auto res = db->store->load(email, loaded);
  if (!tek_kc_err_success(&res)) {
    return res;
  }
  const std::string_view values[]{loaded.email,        loaded.device_id,
                                   loaded.user_id,      loaded.user_key,
                                   loaded.access_token, loaded.refresh_token};
  const auto buf{std::malloc(std::ranges::fold_left(
      values, sizeof(tek_kc_creds),
      [](auto acc, auto value) { return acc + value.length() + 1; }))};
  if (!buf) {
    auto err = tkc_err_sub(TEK_KC_ERRC_creds_load, TEK_KC_ERRC_mem_alloc);
    err.uri = tkci_u_strdup(email, std::char_traits<char>::length(email));
    return err;
  }
  const auto c_creds{static_cast<tek_kc_creds *>(buf)};
  const char *ptrs[std::size(values)];
  auto cur{reinterpret_cast<char *>(&c_creds[1])};
  for (std::size_t i = 0; i < std::size(values); ++i) {
    ptrs[i] = cur;
    cur = copy_str(values[i], cur);
  }
  *c_creds = {.email = ptrs[0],
              .device_id = ptrs[1],
              .user_id = ptrs[2],
              .user_key = ptrs[3],
              .access_token = ptrs[4],
              .refresh_token = ptrs[5]};
  *c_creds_out = c_creds;
  return tkc_err_ok();
}

tek_kc_err tek_kc_creds_db_remove(tek_kc_creds_db *db, const char *email) {
  return db->store->remove(email);
}

tek_kc_err tek_kc_creds_db_list_emails(tek_kc_creds_db *db,
                                       const char ***emails, int *num_emails) {
  std::vector<std::string> list;
  const auto res = db->store->list_emails(list);
  if (!tek_kc_err_success(&res)) {
    return res;
  }
  const auto buf{std::malloc(std::ranges::fold_left(
      list, 0zu, [](auto acc, const auto &email) {
        return acc + sizeof(const char *) + email.length() + 1;
      }))};
  if (!buf && !list.empty()) {
    return tkc_err_sub(TEK_KC_ERRC_creds_load, TEK_KC_ERRC_mem_alloc);
  }
  const auto array{static_cast<const char **>(buf)};
  if (array) {
    auto cur{reinterpret_cast<char *>(&array[list.size()])};
    for (std::size_t i = 0; i < list.size(); ++i) {
      array[i] = cur;
      cur = copy_str(list[i], cur);
    }
  }
  *emails = array;
  *num_emails = static_cast<int>(list.size());
  return tkc_err_ok();
}

} // extern "C"

} // namespace tek::koboclient
