//===-- scrape.hpp - sign-in page scraping --------------------------------===//
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
/// Declarations of functions extracting values from the HTML pages of the
///    interactive sign-in flow.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "tek-koboclient/error.h"

#include <string>
#include <string_view>

namespace tek::koboclient::scrape {

/// Values of the sign-in form required to submit it.
struct sign_in_form {
  /// 36-character workflow ID.
  std::string workflow_id;
  /// Value of the hidden `__RequestVerificationToken` input.
  std::string verification_token;
};

/// User identity found in the page returned after submitting the sign-in
///    form.
struct user_identity {
  std::string user_id;
  std::string user_key;
};

/// Decode HTML character references the way HTML5 parsers do in attribute
///    values. Numeric references for NUL, surrogates and values above
///    U+10FFFF decode to U+FFFD, and legacy named references such as `&amp`
///    are recognized without the semicolon. Named references are limited to
///    Latin-1 and common punctuation.
std::string html_unescape(std::string_view str);

/// Extract the sign-in form values from the sign-in page.
///
/// @param html
///    Body of the sign-in page.
/// @param [out] form
///    Receives the HTML-unescaped form values on success.
/// @return A @ref tek_kc_err indicating the result of operation, with
///    @ref TEK_KC_ERRC_login primary code.
tek_kc_err parse_sign_in_page(std::string_view html, sign_in_form &form);

/// Extract the `kobo://UserAuthenticated?...` redirect URL from the page
///    returned after submitting the sign-in form.
///
/// @param html
///    Body of the page.
/// @param [out] url
///    Receives the URL on success.
/// @return A @ref tek_kc_err indicating the result of operation, with
///    @ref TEK_KC_ERRC_login primary code.
tek_kc_err find_user_url(std::string_view html, std::string &url);

/// Parse user ID and user key from the query of the redirect URL.
///
/// @param url
///    The redirect URL.
/// @param [out] identity
///    Receives the values on success.
/// @return A @ref tek_kc_err indicating the result of operation, with
///    @ref TEK_KC_ERRC_login primary code.
tek_kc_err parse_user_url(std::string_view url, user_identity &identity);

} // namespace tek::koboclient::scrape
