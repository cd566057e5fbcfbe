//===-- utils.cpp - utility function implementations ----------------------===//
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
/// Implementation of small utility functions declared in utils.h.
///
//===----------------------------------------------------------------------===//
#include "utils.h"

#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <openssl/evp.h>
#include <openssl/rand.h>

extern "C" {

int tkci_u_base64_encode(const unsigned char *input, int input_size,
                         char *output) {
  return EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output), input,
                         input_size);
}

bool tkci_u_gen_uuid(char str[36]) {
  unsigned char bytes[16];
  if (RAND_bytes(bytes, sizeof bytes) != 1) {
    return false;
  }
  // Version 4, RFC 4122 variant
  bytes[6] = (bytes[6] & 0x0F) | 0x40;
  bytes[8] = (bytes[8] & 0x3F) | 0x80;
  static constexpr char digits[]{"0123456789abcdef"};
  int pos = 0;
  for (int i = 0; i < 16; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      str[pos++] = '-';
    }
    str[pos++] = digits[bytes[i] >> 4];
    str[pos++] = digits[bytes[i] & 0x0F];
  }
  return true;
}

char *tkci_u_strdup(const char *str, std::size_t len) {
  const auto buf = reinterpret_cast<char *>(std::malloc(len + 1));
  if (buf) {
    std::memcpy(buf, str, len);
    buf[len] = '\0';
  }
  return buf;
}

} // extern "C"
