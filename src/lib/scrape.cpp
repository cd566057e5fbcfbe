//===-- scrape.cpp - sign-in page scraping implementation -----------------===//
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
/// Implementation of sign-in page scraping functions.
///
//===----------------------------------------------------------------------===//
#include "scrape.hpp"

#include "common/error.h"
#include "tek-koboclient/error.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <curl/curl.h>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace tek::koboclient::scrape {

namespace {

using sv_match = std::match_results<std::string_view::const_iterator>;

/// Names of Latin-1 character references, indexed by code point minus 0xA0.
constexpr std::string_view latin1_refs[]{
    "nbsp",   "iexcl",  "cent",   "pound",  "curren", "yen",    "brvbar",
    "sect",   "uml",    "copy",   "ordf",   "laquo",  "not",    "shy",
    "reg",    "macr",   "deg",    "plusmn", "sup2",   "sup3",   "acute",
    "micro",  "para",   "middot", "cedil",  "sup1",   "ordm",   "raquo",
    "frac14", "frac12", "frac34", "iquest", "Agrave", "Aacute", "Acirc",
    "Atilde", "Auml",   "Aring",  "AElig",  "Ccedil", "Egrave", "Eacute",
    "Ecirc",  "Euml",   "Igrave", "Iacute", "Icirc",  "Iuml",   "ETH",
    "Ntilde", "Ograve", "Oacute", "Ocirc",  "Otilde", "Ouml",   "times",
    "Oslash", "Ugrave", "Uacute", "Ucirc",  "Uuml",   "Yacute", "THORN",
    "szlig",  "agrave", "aacute", "acirc",  "atilde", "auml",   "aring",
    "aelig",  "ccedil", "egrave", "eacute", "ecirc",  "euml",   "igrave",
    "iacute", "icirc",  "iuml",   "eth",    "ntilde", "ograve", "oacute",
    "ocirc",  "otilde", "ouml",   "divide", "oslash", "ugrave", "uacute",
    "ucirc",  "uuml",   "yacute", "thorn",  "yuml"};

/// Named character reference outside of the Latin-1 block.
struct named_ref {
  std::string_view name;
  std::uint32_t cp;
  /// Value indicating whether the reference is recognized without the
  ///    terminating semicolon.
  bool legacy;
};

constexpr named_ref other_refs[]{
    {"amp", '&', true},        {"AMP", '&', true},
    {"lt", '<', true},         {"LT", '<', true},
    {"gt", '>', true},         {"GT", '>', true},
    {"quot", '"', true},       {"QUOT", '"', true},
    {"COPY", 0xA9, true},      {"REG", 0xAE, true},
    {"apos", '\'', false},     {"OElig", 0x152, false},
    {"oelig", 0x153, false},   {"Scaron", 0x160, false},
    {"scaron", 0x161, false},  {"Yuml", 0x178, false},
    {"fnof", 0x192, false},    {"circ", 0x2C6, false},
    {"tilde", 0x2DC, false},   {"ensp", 0x2002, false},
    {"emsp", 0x2003, false},   {"thinsp", 0x2009, false},
    {"ndash", 0x2013, false},  {"mdash", 0x2014, false},
    {"lsquo", 0x2018, false},  {"rsquo", 0x2019, false},
    {"sbquo", 0x201A, false},  {"ldquo", 0x201C, false},
    {"rdquo", 0x201D, false},  {"bdquo", 0x201E, false},
    {"dagger", 0x2020, false}, {"Dagger", 0x2021, false},
    {"bull", 0x2022, false},   {"hellip", 0x2026, false},
    {"permil", 0x2030, false}, {"lsaquo", 0x2039, false},
    {"rsaquo", 0x203A, false}, {"euro", 0x20AC, false},
    {"trade", 0x2122, false},  {"notin", 0x2209, false}};

/// Windows-1252 interpretation of numeric references to C1 control codes,
///    indexed by code point minus 0x80. Zero means the code point is kept.
constexpr std::uint16_t c1_refs[]{
    0x20AC, 0,      0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0,      0x017D, 0,
    0,      0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0,      0x017E, 0x0178};

/// U+FFFD REPLACEMENT CHARACTER.
constexpr std::uint32_t replacement_char = 0xFFFD;

//===-- Private functions -------------------------------------------------===//

/// Append UTF-8 encoding of a code point to a string.
static void append_utf8(std::string &str, std::uint32_t cp) {
  if (cp < 0x80) {
    str.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    str.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    str.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    str.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    str.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    str.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    str.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    str.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    str.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    str.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

/// Append the character that a numeric character reference resolves to.
///    Code points that can't be represented resolve to U+FFFD. C1 control
///    codes are read as Windows-1252.
static void append_char_ref(std::string &str, std::uint32_t cp) {
  if (cp == 0 || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
    append_utf8(str, replacement_char);
    return;
  }
  if (cp >= 0x80 && cp <= 0x9F) {
    append_utf8(str, c1_refs[cp - 0x80] ? c1_refs[cp - 0x80] : cp);
    return;
  }
  if ((cp >= 0x1 && cp <= 0x8) || cp == 0xB || (cp >= 0xE && cp <= 0x1F) ||
      cp == 0x7F || (cp >= 0xFDD0 && cp <= 0xFDEF) ||
      (cp & 0xFFFE) == 0xFFFE) {
    return;
  }
  append_utf8(str, cp);
}

/// Find the code point of a named character reference.
///
/// @param name
///    Name of the reference, without '&' and ';'.
/// @param semicolon
///    Value indicating whether the reference is terminated by a semicolon.
///    Without it, only legacy references are recognized.
/// @return The code point, or 0 if there is no such reference.
static std::uint32_t find_named_ref(std::string_view name, bool semicolon) {
  if (const auto it = std::ranges::find(latin1_refs, name);
      it != std::ranges::end(latin1_refs)) {
    return 0xA0 + static_cast<std::uint32_t>(it - std::ranges::begin(latin1_refs));
  }
  const auto it = std::ranges::find(other_refs, name, &named_ref::name);
  return it != std::ranges::end(other_refs) && (semicolon || it->legacy)
             ? it->cp
             : 0;
}

/// Decode a form-urlencoded query component.
static std::string unquote_plus(std::string_view str) {
  std::string buf{str};
  std::ranges::replace(buf, '+', ' ');
  int len;
  const std::unique_ptr<char, decltype(&curl_free)> decoded{
      curl_easy_unescape(nullptr, buf.data(), static_cast<int>(buf.length()),
                         &len),
      curl_free};
  if (!decoded) {
    return buf;
  }
  return {decoded.get(), static_cast<std::size_t>(len)};
}

static tek_kc_err login_err(tek_kc_errc aux) {
  return tkc_err_sub(TEK_KC_ERRC_login, aux);
}

} // namespace

//===-- Internal functions ------------------------------------------------===//

std::string html_unescape(std::string_view str) {
  std::string res;
  res.reserve(str.length());
  while (!str.empty()) {
    const auto amp = str.find('&');
    res.append(str.substr(0, amp));
    if (amp == std::string_view::npos) {
      break;
    }
    str.remove_prefix(amp);
    // Number of characters consumed by the reference, including '&'
    std::size_t len = 0;
    if (str.length() > 1 && str[1] == '#') {
      const bool hex = str.length() > 2 && (str[2] == 'x' || str[2] == 'X');
      const std::size_t start = hex ? 3 : 2;
      const auto tail = str.substr(start);
      const auto digits_end = std::ranges::find_if_not(tail, [hex](char c) {
        return hex ? std::isxdigit(static_cast<unsigned char>(c))
                   : std::isdigit(static_cast<unsigned char>(c));
      });
      const auto digits = tail.substr(
          0, static_cast<std::size_t>(digits_end - tail.begin()));
      if (!digits.empty()) {
        std::uint32_t cp;
        if (const auto [ptr, ec] =
                std::from_chars(digits.data(), digits.data() + digits.length(),
                                cp, hex ? 16 : 10);
            ec != std::errc{}) {
          cp = replacement_char;
        }
        append_char_ref(res, cp);
        len = start + digits.length();
        if (len < str.length() && str[len] == ';') {
          ++len;
        }
      }
    } else {
      auto name = str.substr(1, 32);
      name = name.substr(0, name.find_first_of("\t\n\f <&#;"));
      const bool semicolon =
          name.length() + 1 < str.length() && str[name.length() + 1] == ';';
      if (const auto cp = find_named_ref(name, semicolon); cp) {
        append_utf8(res, cp);
        len = name.length() + (semicolon ? 2 : 1);
      } else {
        // Longest legacy reference that the name starts with
        for (auto prefix_len = semicolon ? name.length() : name.length() - 1;
             !name.empty() && prefix_len >= 2; --prefix_len) {
          if (const auto cp = find_named_ref(name.substr(0, prefix_len), false);
              cp) {
            append_utf8(res, cp);
            len = prefix_len + 1;
            break;
          }
        }
      }
    }
    if (len) {
      str.remove_prefix(len);
    } else {
      res.push_back('&');
      str.remove_prefix(1);
    }
  }
  return res;
}

tek_kc_err parse_sign_in_page(std::string_view html, sign_in_form &form) {
  static const std::regex workflow_id_re{R"(\?workflowId=([^"]{36}))"};
  static const std::regex token_re{
      R"re(<input name="__RequestVerificationToken" type="hidden" value="([^"]+)" />)re"};
  sv_match match;
  if (!std::regex_search(html.begin(), html.end(), match, workflow_id_re)) {
    return login_err(TEK_KC_ERRC_login_workflow_id);
  }
  form.workflow_id = html_unescape({match[1].first, match[1].second});
  if (!std::regex_search(html.begin(), html.end(), match, token_re)) {
    return login_err(TEK_KC_ERRC_login_verification_token);
  }
  form.verification_token = html_unescape({match[1].first, match[1].second});
  return tkc_err_ok();
}

tek_kc_err find_user_url(std::string_view html, std::string &url) {
  static const std::regex user_url_re{
      R"('(kobo://UserAuthenticated\?[^']+)';)"};
  sv_match match;
  if (!std::regex_search(html.begin(), html.end(), match, user_url_re)) {
    return login_err(TEK_KC_ERRC_login_user_url);
  }
  url = match[1].str();
  return tkc_err_ok();
}

tek_kc_err parse_user_url(std::string_view url, user_identity &identity) {
  const auto query_pos = url.find('?');
  if (query_pos == std::string_view::npos) {
    return login_err(TEK_KC_ERRC_login_user_params);
  }
  auto query = url.substr(query_pos + 1);
  if (const auto fragment = query.find('#');
      fragment != std::string_view::npos) {
    query = query.substr(0, fragment);
  }
  std::string user_id;
  std::string user_key;
  bool has_id = false;
  bool has_key = false;
  while (!query.empty()) {
    const auto amp = query.find('&');
    const auto param = query.substr(0, amp);
    query = amp == std::string_view::npos ? std::string_view{}
                                          : query.substr(amp + 1);
    const auto eq = param.find('=');
    if (eq == std::string_view::npos) {
      continue;
    }
    const auto name = unquote_plus(param.substr(0, eq));
    const auto value = param.substr(eq + 1);
    if (value.empty()) {
      continue;
    }
    // The first occurrence of each parameter wins
    if (name == "userId" && !has_id) {
      user_id = unquote_plus(value);
      has_id = true;
    } else if (name == "userKey" && !has_key) {
      user_key = unquote_plus(value);
      has_key = true;
    }
  }
  if (!has_id || !has_key) {
    return login_err(TEK_KC_ERRC_login_user_params);
  }
  identity.user_id = std::move(user_id);
  identity.user_key = std::move(user_key);
  return tkc_err_ok();
}

} // namespace tek::koboclient::scrape
