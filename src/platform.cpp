/*
 * SPDX-FileCopyrightText: 2026 The gpxstat authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "gpxstat_platform.h"

#include <cerrno>
#include <cmath>
#include <glib.h>

#include "gpxstat_annotations.h"

bool gpxstat_platform::string_to_double(const char *str, double &value)
{
  // g_ascii_strtod() also parses hexadecimal numbers, which are no valid decimals
  const char *digits = str;
  while(g_ascii_isspace(*digits))
    digits++;
  if(*digits == '+' || *digits == '-')
    digits++;
  if(unlikely(digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')))
    return false;

  char *end;
  errno = 0;
  const double v = g_ascii_strtod(str, &end);

  // nothing consumed at all
  if(unlikely(end == str))
    return false;

  while(g_ascii_isspace(*end))
    end++;

  if(unlikely(*end != '\0' || errno == ERANGE || !std::isfinite(v)))
    return false;

  value = v;
  return true;
}
