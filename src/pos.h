/*
 * SPDX-FileCopyrightText: 2026 The gpxstat authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cmath>

typedef double pos_float_t;

/* mean earth radius in meters */
#define POS_MEAN_RADIUS   (6371000.0)

#define DEG2RAD(a)  ((a) * M_PI / 180.0)
#define RAD2DEG(a)  ((a) * 180.0 / M_PI)

/* global position */
struct pos_t {
  pos_float_t lat, lon;
  inline pos_t() noexcept : lat(NAN), lon(NAN) {}
  inline pos_t(pos_float_t a, pos_float_t o) noexcept : lat(a), lon(o) {}
  bool operator==(const pos_t &other) const noexcept
  { return lat == other.lat && lon == other.lon; }
  inline bool operator!=(const pos_t &other) const noexcept
  { return !operator==(other); }
  bool valid() const noexcept;

  /**
   * @brief great circle distance to another position
   * @returns the distance in meters
   *
   * This uses the haversine formula on a sphere of POS_MEAN_RADIUS. Altitude
   * is not taken into account.
   */
  pos_float_t distance(const pos_t &other) const noexcept;
};

bool pos_lat_valid(pos_float_t lat) noexcept;
bool pos_lon_valid(pos_float_t lon) noexcept;
