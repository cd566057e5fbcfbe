//===-- os.h - OS-specific code -------------------------------------------===//
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
/// Declarations of file system functions used by the download pipeline and
///    the credential store. Implementation is provided by os_linux.cpp.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "tek-koboclient/base.h" // IWYU pragma: keep
#include "tek-koboclient/error.h"

#include <stddef.h>

#ifndef __linux__
#error Unsupported target OS. Only Linux (__linux__) is supported.
#endif // ndef __linux__

/// @def TKCI_OS_PATH_SEP_CHAR_STR
/// Path separator character for current operating system as a string literal.
#define TKCI_OS_PATH_SEP_CHAR_STR "/"
/// @def TKCI_OS_INVALID_HANDLE
/// Invalid file descriptor value.
#define TKCI_OS_INVALID_HANDLE -1

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

/// Create a file for writing, truncating it if it already exists.
///
/// @param [in] path
///    Path to the file to create, as a null-terminated UTF-8 string.
/// @return File descriptor of the created file, or
///    @ref TKCI_OS_INVALID_HANDLE on failure, in which case `errno` is set.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1),
  gnu::null_terminated_string_arg(1)]]
int tkci_os_file_create(const char *_Nonnull path);

/// Write the whole buffer to a file.
///
/// @param fd
///    Descriptor of the file to write to.
/// @param [in] buf
///    Pointer to the buffer containing data to write.
/// @param size
///    Number of bytes to write.
/// @return Value indicating whether all data has been written. On failure,
///    `errno` is set.
[[gnu::visibility("internal"), gnu::nonnull(2), gnu::access(read_only, 2, 3)]]
bool tkci_os_file_write(int fd, const void *_Nonnull buf, size_t size);

/// Close a file descriptor.
///
/// @param fd
///    Descriptor of the file to close.
/// @return Value indicating whether the descriptor has been closed without
///    errors. On failure, `errno` is set.
[[gnu::visibility("internal")]]
bool tkci_os_file_close(int fd);

/// Atomically move a file, replacing the target if it exists.
///
/// @param [in] src
///    Path to the file to move, as a null-terminated UTF-8 string.
/// @param [in] tgt
///    Path to move the file to, as a null-terminated UTF-8 string.
/// @return Value indicating whether the file has been moved. On failure,
///    `errno` is set.
[[gnu::visibility("internal"), gnu::nonnull(1, 2), gnu::access(read_only, 1),
  gnu::access(read_only, 2), gnu::null_terminated_string_arg(1),
  gnu::null_terminated_string_arg(2)]]
bool tkci_os_file_move(const char *_Nonnull src, const char *_Nonnull tgt);

/// Delete a file if it exists.
///
/// @param [in] path
///    Path to the file to delete, as a null-terminated UTF-8 string.
/// @return Value indicating whether the file doesn't exist anymore. On
///    failure, `errno` is set.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1),
  gnu::null_terminated_string_arg(1)]]
bool tkci_os_file_delete(const char *_Nonnull path);

/// Create a directory and all its missing parents.
///
/// @param [in] path
///    Path to the directory to create, as a null-terminated UTF-8 string.
/// @return Value indicating whether the directory exists now. On failure,
///    `errno` is set.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1),
  gnu::null_terminated_string_arg(1)]]
bool tkci_os_dir_create_all(const char *_Nonnull path);

/// Get the path to user's configuration directory.
///
/// @return Path to `$XDG_CONFIG_HOME` or `$HOME/.config`, as a heap-allocated
///    null-terminated UTF-8 string that must be freed with `free` after use,
///    or `nullptr` if neither variable is set.
[[gnu::visibility("internal")]]
char *_Nullable tkci_os_get_config_dir(void);

/// Create a @ref TEK_KC_ERR_TYPE_os error for current `errno` value.
///
/// @param prim
///    Primary error code.
/// @param io_type
///    Type of the I/O operation that has failed.
/// @param [in] path
///    Path to the affected file, as a null-terminated UTF-8 string.
/// @return A @ref tek_kc_err with `uri` set to a heap-allocated copy of
///    @p path.
[[gnu::visibility("internal"), gnu::nonnull(3), gnu::access(read_only, 3),
  gnu::null_terminated_string_arg(3)]]
tek_kc_err tkci_os_io_err(tek_kc_errc prim, tek_kc_err_io_type io_type,
                          const char *_Nonnull path);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
