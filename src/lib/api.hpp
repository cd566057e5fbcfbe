//===-- api.hpp - Kobo store API constants --------------------------------===//
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
/// Identifiers and fixed endpoints that the client presents to the Kobo store
///    API.
///
//===----------------------------------------------------------------------===//
#pragma once

#include <cstddef>
#include <string_view>

namespace tek::koboclient::api {

/// Affiliate name sent with authentication and sign-in requests.
constexpr std::string_view affiliate{"Kobo"};
/// Version of the Kobo application that the client identifies as.
constexpr std::string_view app_version{"8.11.24971"};
/// Platform ID of the Kobo application that the client identifies as.
constexpr std::string_view platform_id{"00000000-0000-0000-0000-000000004000"};
/// Display profile requested for content access.
constexpr std::string_view display_profile{"Android"};

/// Device authentication endpoint.
constexpr std::string_view url_auth_device{
    "https://storeapi.kobo.com/v1/auth/device"};
/// Token refresh endpoint.
constexpr std::string_view url_auth_refresh{
    "https://storeapi.kobo.com/v1/auth/refresh"};
/// Endpoint directory (initialization) endpoint.
constexpr std::string_view url_initialization{
    "https://storeapi.kobo.com/v1/initialization"};

/// Path of the sign-in form submission URL, on the host of the sign-in page.
constexpr std::string_view sign_in_submit_path{"/ww/en/signin/signin/kobo"};

/// Endpoint directory resource names.
namespace res {

constexpr std::string_view sign_in_page{"sign_in_page"};
constexpr std::string_view library_sync{"library_sync"};
constexpr std::string_view user_wishlist{"user_wishlist"};
constexpr std::string_view book{"book"};
constexpr std::string_view content_access_book{"content_access_book"};

} // namespace res

/// Placeholder for product ID in endpoint directory URL templates.
constexpr std::string_view product_id_placeholder{"{ProductId}"};

/// Request header carrying the library sync token.
constexpr std::string_view hdr_sync_token{"x-kobo-synctoken"};
/// Response header indicating whether more library sync pages follow.
constexpr std::string_view hdr_sync{"x-kobo-sync"};

/// Number of wishlist items requested per page.
constexpr int wishlist_page_size = 100;

/// DRM type of hardware-bound (device/user-keyed) encrypted content.
constexpr std::string_view drm_kdrm{"KDRM"};
/// DRM type of signed but unencrypted content.
constexpr std::string_view drm_signed_no_drm{"SignedNoDrm"};
/// Supported download URL formats.
constexpr std::string_view supported_formats[]{"EPUB3", "KEPUB", "EPUB3FL"};

/// Suffix appended to the output path for the file being downloaded.
constexpr std::string_view downloading_suffix{".downloading"};
/// Size of the buffer that downloaded content is written from, in bytes.
constexpr std::size_t download_chunk_size = 1024 * 256;

} // namespace tek::koboclient::api
