//===-- os_linux.cpp - GNU/Linux implementation of OS functions -----------===//
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
/// GNU/Linux implementation of functions declared in os.h.
///
//===----------------------------------------------------------------------===//
#include "os.h"

#include "tek-koboclient/error.h"
#include "utils.h"

#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <string_view>
#include <sys/stat.h>
#include <unistd.h>

extern "C" {

int tkci_os_file_create(const char *path) {
  int fd;
  do {
    fd = open(path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  } while (fd < 0 && errno == EINTR);
  return fd;
}

bool tkci_os_file_write(int fd, const void *buf, std::size_t size) {
  auto cur = reinterpret_cast<const char *>(buf);
  while (size) {
    const auto res = write(fd, cur, size);
    if (res < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    cur += res;
    size -= static_cast<std::size_t>(res);
  }
  return true;
}

bool tkci_os_file_close(int fd) { return !close(fd); }

bool tkci_os_file_move(const char *src, const char *tgt) {
  return !std::rename(src, tgt);
}

bool tkci_os_file_delete(const char *path) {
  return !unlink(path) || errno == ENOENT;
}

bool tkci_os_dir_create_all(const char *path) {
  std::string buf(path);
  for (std::size_t pos = buf.find('/', 1); pos != std::string::npos;
       pos = buf.find('/', pos + 1)) {
    buf[pos] = '\0';
    if (mkdir(buf.data(), 0755) && errno != EEXIST) {
      return false;
    }
    buf[pos] = '/';
  }
  return !mkdir(buf.data(), 0755) || errno == EEXIST;
}

char *tkci_os_get_config_dir(void) {
  if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return tkci_u_strdup(xdg, std::strlen(xdg));
  }
  const char *home = std::getenv("HOME");
  if (!home || !*home) {
    return nullptr;
  }
  const auto path = std::string(home).append("/.config");
  return tkci_u_strdup(path.data(), path.length());
}

tek_kc_err tkci_os_io_err(tek_kc_errc prim, tek_kc_err_io_type io_type,
                          const char *path) {
  const int errc = errno;
  return {.type = TEK_KC_ERR_TYPE_os,
          .primary = prim,
          .auxiliary = errc,
          .extra = io_type,
          .uri = tkci_u_strdup(path, std::strlen(path)),
          .detail = nullptr};
}

} // extern "C"
