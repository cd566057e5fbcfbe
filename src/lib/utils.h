//===-- utils.h - utility function declarations ---------------------------===//
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
/// Declarations of small utility functions that may be used anywhere in the
///    project.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "tek-koboclient/base.h" // IWYU pragma: keep

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

/// Encode data into a Base64 string.
///
/// @param [in] input
///    Pointer to the data to encode.
/// @param input_size
///    Number of bytes to read from @p input.
/// @param [out] output
///    Pointer to the buffer that receives the encoded string. Caller must
///    ensure that it is large enough, that is its size is at least (4/3 of
///    @p input_size) rounded to the next multiple of 4, plus 1 for the
///    terminating null character.
/// @return The number of characters written to @p output, not including the
///    terminating null character.
[[gnu::visibility("internal"), gnu::nonnull(1, 3), gnu::access(read_only, 1, 2),
  gnu::access(write_only, 3)]]
int tkci_u_base64_encode(const unsigned char *_Nonnull input, int input_size,
                         char *_Nonnull output);

/// Generate a random (version 4) UUID string in canonical 8-4-4-4-12 form.
///
/// @param [out] str
///    Pointer to the buffer that receives the resulting string (without
///    terminating null character).
/// @return Value indicating whether the random number generator succeeded.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(write_only, 1)]]
bool tkci_u_gen_uuid(char str[_Nonnull 36]);

/// Copy a string into a heap-allocated null-terminated buffer, suitable for
///    @ref tek_kc_err::uri and @ref tek_kc_err::detail.
///
/// @param [in] str
///    Pointer to the string to copy.
/// @param len
///    Length of @p str, in bytes.
/// @return Pointer to the copy that must be freed with `free` after use, or
///    `nullptr` on allocation failure.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1, 2)]]
char *_Nullable tkci_u_strdup(const char *_Nonnull str, size_t len);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
