//===-- creds.hpp - Kobo user credentials and their persistence -----------===//
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
/// Declarations of the credential state type, the persistence interface that
///    the client saves it through, and its SQLite-backed implementation.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "tek-koboclient/base.h"
#include "tek-koboclient/creds.h"
#include "tek-koboclient/error.h"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;

namespace tek::koboclient {

/// Credentials of a device/user pair.
/// A device ID is assigned on the first device registration and never changes
///    afterwards; tokens are replaced on every authentication and refresh.
struct creds {
  /// Email of the user, used as the key in credential stores.
  std::string email;
  /// Random device identifier (UUID).
  std::string device_id;
  /// Kobo user ID, obtained by interactive login.
  std::string user_id;
  /// Opaque user key, obtained by device registration with a user key.
  std::string user_key;
  /// Bearer access token.
  std::string access_token;
  /// Token used to obtain a new token pair.
  std::string refresh_token;

  /// Check whether the credentials are authenticated, that is both tokens are
  ///    set.
  bool auth_settings_set() const noexcept {
    return !access_token.empty() && !refresh_token.empty();
  }
};

/// Get a C view of credentials. Pointers stay valid while @p creds isn't
///    modified.
inline tek_kc_creds creds_view(const creds &creds) noexcept {
  return {.email = creds.email.data(),
          .device_id = creds.device_id.data(),
          .user_id = creds.user_id.data(),
          .user_key = creds.user_key.data(),
          .access_token = creds.access_token.data(),
          .refresh_token = creds.refresh_token.data()};
}

/// Copy C credentials into a @ref creds object. `nullptr` strings become
///    empty.
inline creds creds_from_c(const tek_kc_creds &c_creds) {
  const auto str = [](const char *_Nullable value) {
    return value ? std::string{value} : std::string{};
  };
  return {.email = str(c_creds.email),
          .device_id = str(c_creds.device_id),
          .user_id = str(c_creds.user_id),
          .user_key = str(c_creds.user_key),
          .access_token = str(c_creds.access_token),
          .refresh_token = str(c_creds.refresh_token)};
}

/// Interface for persisting credentials after every successful change.
class creds_store {
public:
  virtual ~creds_store() = default;

  /// Save credentials, replacing any record with the same email.
  ///
  /// @param [in] creds
  ///    Credentials to save.
  /// @return A @ref tek_kc_err indicating the result of operation.
  virtual tek_kc_err save(const creds &creds) = 0;
};

/// Credential store forwarding to a @ref tek_kc_creds_store callback.
class [[gnu::visibility("internal")]] c_creds_store final : public creds_store {
public:
  explicit c_creds_store(const tek_kc_creds_store &iface) noexcept
      : iface(iface) {}

  tek_kc_err save(const creds &creds) override {
    const auto view = creds_view(creds);
    return iface.save(&view, iface.user_data);
  }

private:
  tek_kc_creds_store iface;
};

/// Credential store keeping records in a SQLite database.
class [[gnu::visibility("internal")]] sqlite_creds_store final
    : public creds_store {
public:
  /// Open (creating if necessary) a credential store database.
  ///
  /// @param [in] path
  ///    Path to the database file, as a null-terminated UTF-8 string. Missing
  ///    parent directories are created.
  /// @param [out] store
  ///    Receives the opened store on success.
  /// @return A @ref tek_kc_err indicating the result of operation.
  static tek_kc_err open(const char *_Nonnull path,
                         std::unique_ptr<sqlite_creds_store> &store);

  /// Get the default database path,
  ///    `$XDG_CONFIG_HOME/tek-koboclient/settings.sqlite3`.
  ///
  /// @return The path, or an empty string if neither `XDG_CONFIG_HOME` nor
  ///    `HOME` is set.
  static std::string default_path();

  tek_kc_err save(const creds &creds) override;

  /// Load credentials stored for an email.
  ///
  /// @param email
  ///    Email to look up.
  /// @param [out] creds
  ///    Receives loaded credentials on success.
  /// @return A @ref tek_kc_err indicating the result of operation.
  ///    @ref TEK_KC_ERRC_creds_not_found is reported as the auxiliary code if
  ///    there is no record for @p email.
  tek_kc_err load(std::string_view email, creds &creds);

  /// Remove credentials stored for an email. Removing a missing record is not
  ///    an error.
  tek_kc_err remove(std::string_view email);

  /// List emails of all stored records, in insertion order.
  tek_kc_err list_emails(std::vector<std::string> &emails);

private:
  struct db_deleter {
    void operator()(sqlite3 *_Nonnull db) const noexcept;
  };

  explicit sqlite_creds_store(sqlite3 *_Nonnull db) noexcept : db(db) {}

  /// Database connection.
  std::unique_ptr<sqlite3, db_deleter> db;
};

} // namespace tek::koboclient
