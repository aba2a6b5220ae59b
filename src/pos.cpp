/*
 * SPDX-FileCopyrightText: 2026 The gpxstat authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "pos.h"

#include <cmath>

bool pos_t::valid() const noexcept
{
  return pos_lat_valid(lat) && pos_lon_valid(lon);
}

bool pos_lat_valid(pos_float_t lat) noexcept
{
  return(!std::isnan(lat) && (lat >= -90.0) && (lat <= 90.0));
}

bool pos_lon_valid(pos_float_t lon) noexcept
{
  return(!std::isnan(lon) && (lon >= -180.0) && (lon <= 180.0));
}

pos_float_t pos_t::distance(const pos_t &other) const noexcept
{
  const pos_float_t dlat = DEG2RAD(other.lat - lat);
  const pos_float_t dlon = DEG2RAD(other.lon - lon);
  const pos_float_t lat1 = DEG2RAD(lat);
  const pos_float_t lat2 = DEG2RAD(other.lat);

  const pos_float_t slat = sin(dlat / 2);
  const pos_float_t slon = sin(dlon / 2);
  const pos_float_t h = slat * slat + cos(lat1) * cos(lat2) * slon * slon;

  return POS_MEAN_RADIUS * 2 * atan2(sqrt(h), sqrt(1 - h));
}
