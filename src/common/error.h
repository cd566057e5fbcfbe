//===-- error.h - error creation helpers ----------------------------------===//
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
/// Helper functions for creating @ref tek_kc_err objects.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "tek-koboclient/error.h"

/// Create a basic @ref tek_kc_err for specified error code.
///
/// @param errc
///    Error code to create error object for.
/// @return A @ref tek_kc_err for specified error code.
[[gnu::nothrow, gnu::const]]
static inline tek_kc_err tkc_err_basic(tek_kc_errc errc) {
  return
#ifdef __cplusplus
      {.type = TEK_KC_ERR_TYPE_basic,
       .primary = errc,
       .auxiliary = 0,
       .extra = 0,
       .uri = nullptr,
       .detail = nullptr};
#else  // def __cplusplus
      (tek_kc_err){.type = TEK_KC_ERR_TYPE_basic, .primary = errc};
#endif // def __cplusplus else
}

/// Create a @ref tek_kc_err object indicating success.
/// @return A @ref tek_kc_err indicating success.
[[gnu::nothrow, gnu::const]]
static inline tek_kc_err tkc_err_ok(void) {
  return tkc_err_basic(TEK_KC_ERRC_ok);
}

/// Create a compound @ref tek_kc_err.
///
/// @param prim
///    Primary error code.
/// @param aux
///    Auxiliary error code.
/// @return A @ref tek_kc_err for specified error codes.
[[gnu::nothrow, gnu::const]]
static inline tek_kc_err tkc_err_sub(tek_kc_errc prim, tek_kc_errc aux) {
  return
#ifdef __cplusplus
      {.type = TEK_KC_ERR_TYPE_sub,
       .primary = prim,
       .auxiliary = aux,
       .extra = 0,
       .uri = nullptr,
       .detail = nullptr};
#else  // def __cplusplus
      (tek_kc_err){
          .type = TEK_KC_ERR_TYPE_sub, .primary = prim, .auxiliary = aux};
#endif // def __cplusplus else
}
