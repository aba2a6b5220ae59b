/*
 * SPDX-FileCopyrightText: 2026 The gpxstat authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

namespace gpxstat_platform {
  /**
   * @brief strictly converts a character string to a double in local-unaware fashion
   * @param str the string to parse
   * @param value where the result is stored on success
   * @returns if the whole string is a finite number
   *
   * Leading and trailing whitespace is accepted, anything else behind the
   * number is not. Only decimal notation is accepted, hexadecimal numbers
   * like 0x10 are rejected.
   */
  bool string_to_double(const char *str, double &value) __attribute__((nonnull(1)));
};
