//===-- creds.h - Kobo user credentials and credential store interface ----===//
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
/// Declarations of the credential state type, the callback interface that
///    clients save it through, and the SQLite credential database.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "base.h"
#include "error.h"

//===-- Types -------------------------------------------------------------===//

/// Credentials of a device/user pair. All strings are null-terminated UTF-8.
///    A `nullptr` or empty string means that the value is not set.
/// The credentials are authenticated when both tokens are set.
typedef struct tek_kc_creds tek_kc_creds;
/// @copydoc tek_kc_creds
struct tek_kc_creds {
  /// Email of the user, used as the key in credential stores.
  const char *_Nullable email;
  /// Random device identifier (UUID), assigned on the first device
  ///    registration.
  const char *_Nullable device_id;
  /// Kobo user ID, obtained by interactive login.
  const char *_Nullable user_id;
  /// Opaque user key, obtained by device registration with a user key.
  const char *_Nullable user_key;
  /// Bearer access token.
  const char *_Nullable access_token;
  /// Token used to obtain a new token pair.
  const char *_Nullable refresh_token;
};

/// Prototype of the function saving credentials after every successful
///    change.
///
/// @param [in] creds
///    Pointer to the credentials to save. Pointers stay valid during the call
///    and should not be freed.
/// @param user_data
///    User data pointer from the @ref tek_kc_creds_store.
/// @return A @ref tek_kc_err indicating the result of operation.
typedef tek_kc_err tek_kc_creds_save_func(const tek_kc_creds *_Nonnull creds,
                                          void *_Nullable user_data);

/// Credential store interface.
typedef struct tek_kc_creds_store tek_kc_creds_store;
/// @copydoc tek_kc_creds_store
struct tek_kc_creds_store {
  /// Function saving credentials, replacing any record with the same email.
  tek_kc_creds_save_func *_Nonnull save;
  /// User data pointer passed to @ref save.
  void *_Nullable user_data;
};

/// Opaque SQLite credential database type.
typedef struct tek_kc_creds_db tek_kc_creds_db;

//===-- Functions ---------------------------------------------------------===//

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

/// Get the default credential database path,
///    `$XDG_CONFIG_HOME/tek-koboclient/settings.sqlite3`.
///
/// @return Path to the database file, as a null-terminated UTF-8 string,
///    which must be freed with `free` after use. `nullptr` is returned if
///    neither `XDG_CONFIG_HOME` nor `HOME` is set.
[[gnu::TEK_KC_API]] char *_Nullable tek_kc_creds_db_default_path(void);

/// Open (creating if necessary) a credential database.
///
/// @param [in] path
///    Path to the database file, as a null-terminated UTF-8 string. Missing
///    parent directories are created.
/// @param [out] db
///    Address of variable that receives pointer to the opened database on
///    success. It must be closed with @ref tek_kc_creds_db_close after use.
/// @return A @ref tek_kc_err indicating the result of operation.
[[gnu::TEK_KC_API, gnu::nonnull(1, 2), gnu::access(read_only, 1),
  gnu::access(write_only, 2), gnu::null_terminated_string_arg(1)]]
tek_kc_err tek_kc_creds_db_open(const char *_Nonnull path,
                                tek_kc_creds_db *_Nullable *_Nonnull db);

/// Close a credential database.
///
/// @param [in, out] db
///    Pointer to the database to close.
[[gnu::TEK_KC_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void tek_kc_creds_db_close(tek_kc_creds_db *_Nonnull db);

/// Get the credential store interface saving into a database.
///
/// @param [in] db
///    Pointer to the database. It must stay open while the returned store is
///    in use.
/// @return Credential store interface for @p db.
[[gnu::TEK_KC_API, gnu::nonnull(1), gnu::access(none, 1)]]
tek_kc_creds_store tek_kc_creds_db_get_store(tek_kc_creds_db *_Nonnull db);

/// Save credentials to a database, replacing any record with the same email.
///
/// @param [in, out] db
///    Pointer to the database.
/// @param [in] creds
///    Pointer to the credentials to save.
/// @return A @ref tek_kc_err indicating the result of operation.
[[gnu::TEK_KC_API, gnu::nonnull(1, 2), gnu::access(read_write, 1),
  gnu::access(read_only, 2)]]
tek_kc_err tek_kc_creds_db_save(tek_kc_creds_db *_Nonnull db,
                                const tek_kc_creds *_Nonnull creds);

/// Load credentials stored for an email.
///
/// @param [in, out] db
///    Pointer to the database.
/// @param [in] email
///    Email to look up, as a null-terminated UTF-8 string.
/// @param [out] creds
///    Address of variable that receives pointer to the loaded credentials on
///    success. Strings are located in the same buffer as the structure, which
///    must be freed with `free` after use.
/// @return A @ref tek_kc_err indicating the result of operation.
///    @ref TEK_KC_ERRC_creds_not_found is reported as the auxiliary code if
///    there is no record for @p email.
[[gnu::TEK_KC_API, gnu::nonnull(1, 2, 3), gnu::access(read_write, 1),
  gnu::access(read_only, 2), gnu::access(write_only, 3),
  gnu::null_terminated_string_arg(2)]]
tek_kc_err tek_kc_creds_db_load(tek_kc_creds_db *_Nonnull db,
                                const char *_Nonnull email,
                                tek_kc_creds *_Nullable *_Nonnull creds);

/// Remove credentials stored for an email. Removing a missing record is not
///    an error.
///
/// @param [in, out] db
///    Pointer to the database.
/// @param [in] email
///    Email to remove the record for, as a null-terminated UTF-8 string.
/// @return A @ref tek_kc_err indicating the result of operation.
[[gnu::TEK_KC_API, gnu::nonnull(1, 2), gnu::access(read_write, 1),
  gnu::access(read_only, 2), gnu::null_terminated_string_arg(2)]]
tek_kc_err tek_kc_creds_db_remove(tek_kc_creds_db *_Nonnull db,
                                  const char *_Nonnull email);

/// List emails of all stored records, in insertion order.
///
/// @param [in, out] db
///    Pointer to the database.
/// @param [out] emails
///    Address of variable that receives pointer to the array of email
///    pointers on success. Strings are located in the same buffer as the
///    array, which must be freed with `free` after use.
/// @param [out] num_emails
///    Address of variable that receives the number of emails.
/// @return A @ref tek_kc_err indicating the result of operation.
[[gnu::TEK_KC_API, gnu::nonnull(1, 2, 3), gnu::access(read_write, 1),
  gnu::access(write_only, 2), gnu::access(write_only, 3)]]
tek_kc_err
tek_kc_creds_db_list_emails(tek_kc_creds_db *_Nonnull db,
                            const char *_Nonnull *_Nullable *_Nonnull emails,
                            int *_Nonnull num_emails);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
