/*
 * SPDX-FileCopyrightText: 2026 The gpxstat authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

/**
 * @brief owner of a file descriptor
 *
 * The descriptor is closed when the guard goes out of scope.
 */
struct fdguard {
  explicit fdguard(int f) : fd(f) {}
  /**
   * @brief open a file
   * @param pathname the path to open
   * @param flags additional flags to pass to open.
   *
   * O_CLOEXEC will always be added to flags.
   */
  explicit fdguard(const char *pathname, int flags);
  inline fdguard(fdguard &&other) noexcept
    : fd(other.fd)
  {
    const_cast<int &>(other.fd) = -1;
  }
  fdguard(const fdguard &other) = delete;
  fdguard &operator=(const fdguard &other) = delete;
  ~fdguard();

  const int fd;
  inline operator int() const noexcept { return fd; }
  inline operator bool() const noexcept { return valid(); }
  inline bool valid() const noexcept { return fd >= 0; }
  void swap(fdguard &other) noexcept;
};
