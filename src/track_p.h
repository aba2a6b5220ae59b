/*
 * SPDX-FileCopyrightText: 2026 The gpxstat authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include "track.h"

#include <optional>
#include <string>

class gpx_error;

/**
 * @brief a track point while its element is still open
 */
struct track_point_builder {
  explicit track_point_builder(const pos_t &p) : pos(p) {}

  pos_t pos;
  std::optional<double> elevation;
  std::optional<std::string> time;

  track_point_t finish();
};

/**
 * @brief assign the text content of a child element to the point
 * @returns false if the text is not valid for this field, err is set then
 */
typedef bool (*track_field_apply)(track_point_builder &point, const char *text, gpx_error &err);

struct track_field_handler {
  const char *name;
  track_field_apply apply;
};

/**
 * @brief look up the handler for a child element of <trkpt>
 * @returns the handler or nullptr if the element is not evaluated
 */
track_field_apply track_field_find(const char *name);
