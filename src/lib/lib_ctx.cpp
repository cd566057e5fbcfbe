//===-- lib_ctx.cpp - library global state implementation -----------------===//
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
/// Implementation of library initialization and cleanup functions.
///
//===----------------------------------------------------------------------===//
#include "tek-koboclient/base.h"

#include "config.h"
#include "log.hpp"

#include <curl/curl.h>

//===-- Public functions --------------------------------------------------===//

extern "C" {

bool tek_kc_lib_init(void) {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    return false;
  }
  tek::koboclient::log::init();
  tek::koboclient::log::debug("Library initialized",
                              {tek::koboclient::log::str_field(
                                   "version", TEK_KC_VERSION),
                               tek::koboclient::log::str_field(
                                   "curl", curl_version())});
  return true;
}

void tek_kc_lib_cleanup(void) {
  tek::koboclient::log::shutdown();
  curl_global_cleanup();
}

const char *tek_kc_version(void) { return TEK_KC_VERSION; }

} // extern "C"
