//===-- base.h - basic TEK Kobo Client declarations -----------------------===//
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
/// Declarations of TEK Kobo Client's basic macros and library-wide functions.
///
//===----------------------------------------------------------------------===//
#pragma once

#include <stdint.h>

//===-- Compiler macros ---------------------------------------------------===//

#ifndef __clang__
// Clang nullability attributes are replaced with mock macros for other
//    compilers.

#ifndef _Nullable
#define _Nullable
#endif // ndef _Nullable
#ifndef _Nonnull
#define _Nonnull
#endif // ndef _Nonnull
#ifndef _Null_unspecified
#define _Null_unspecified
#endif // ndef _Null_unspecified

#endif // ndef __clang__

// Public API attribute.
#if defined(_WIN32) && !defined(TEK_KC_STATIC)

// Use DLL exports/imports.
#ifdef TEK_KC_EXPORT
#define TEK_KC_API dllexport
#else // def TEK_KC_EXPORT
#define TEK_KC_API dllimport
#endif // def TEK_KC_EXPORT else

#else // defined(_WIN32) && !defined(TEK_KC_STATIC)
#define TEK_KC_API visibility("default")
#endif // defined(_WIN32) && !defined(TEK_KC_STATIC) else

//===-- Library context ---------------------------------------------------===//

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

/// Initialize TEK Kobo Client library.
///
/// @remark
/// This function initializes libcurl global state and creates the
///    `tek-koboclient` spdlog logger, so it must be called once before any
///    other library function, and is not thread-safe.
///
/// @return Value indicating whether initialization succeeded. `false` may be
///    returned if libcurl fails to initialize.
[[gnu::TEK_KC_API]] bool tek_kc_lib_init(void);

/// Cleanup TEK Kobo Client library global state.
[[gnu::TEK_KC_API]] void tek_kc_lib_cleanup(void);

/// Get the version of TEK Kobo Client library.
///
/// @return Pointer to the statically allocated null-terminated version string.
[[gnu::TEK_KC_API,
  gnu::returns_nonnull]] const char *_Nonnull tek_kc_version(void);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
