/*
 * SPDX-FileCopyrightText: 2026 The gpxstat authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "track_p.h"

#include "gpx_error.h"

#include <algorithm>
#include <array>
#include <cstring>
#include <utility>

#include "gpxstat_annotations.h"
#include <gpxstat_platform.h>

namespace {

bool apply_time(track_point_builder &point, const char *text, gpx_error &)
{
  point.time = text;
  return true;
}

bool apply_ele(track_point_builder &point, const char *text, gpx_error &err)
{
  double ele;
  if(unlikely(!gpxstat_platform::string_to_double(text, ele))) {
    err.set(gpx_error::TrackPoint, "ele is not a number");
    return false;
  }

  point.elevation = ele;
  return true;
}

const std::array<track_field_handler, 2> field_handlers = { {
  { "time", apply_time },
  { "ele",  apply_ele  }
} };

// custom find to avoid memory allocations for std::string
struct field_find {
  const char * const name;
  explicit field_find(const char *n) : name(n) {}
  bool operator()(const track_field_handler &h) const {
    return strcmp(h.name, name) == 0;
  }
};

} // namespace

track_field_apply track_field_find(const char *name)
{
  const std::array<track_field_handler, 2>::const_iterator it =
      std::find_if(field_handlers.begin(), field_handlers.end(), field_find(name));

  if(it == field_handlers.end())
    return nullptr;

  return it->apply;
}

track_point_t track_point_builder::finish()
{
  return track_point_t(pos, elevation, std::move(time));
}
