/*
 * SPDX-FileCopyrightText: 2026 The gpxstat authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "track.h"

#include <cstdio>
#include <utility>

elevation_change elevation_delta(const std::optional<double> &from, const std::optional<double> &to) noexcept
{
  // a gap in the elevation data is skipped, not bridged
  if(!from || !to)
    return elevation_change();

  const double delta = *to - *from;
  if(delta > 0)
    return elevation_change(delta, 0);
  else if(delta < 0)
    return elevation_change(0, -delta);
  else
    return elevation_change();
}

track_point_t::track_point_t(const pos_t &p, std::optional<double> ele, std::optional<std::string> t)
  : m_pos(p)
  , m_elevation(ele)
  , m_time(std::move(t))
{
}

bool track_point_t::operator==(const track_point_t &other) const
{
  return m_pos == other.m_pos &&
         m_elevation == other.m_elevation &&
         m_time == other.m_time;
}

track_seg_t::track_seg_t(std::vector<track_point_t> &&points)
  : track_points(std::move(points))
{
}

double track_seg_t::distance() const
{
  double ret = 0;

  for(size_t i = 1; i < track_points.size(); i++)
    ret += track_points[i - 1].distance(track_points[i]);

  return ret;
}

elevation_change track_seg_t::ascentDescent() const
{
  elevation_change ret;

  for(size_t i = 1; i < track_points.size(); i++)
    ret += elevation_delta(track_points[i - 1].elevation(), track_points[i].elevation());

  return ret;
}

track_t::track_t(std::vector<track_seg_t> &&segs)
  : m_segments(std::move(segs))
{
}

size_t track_t::pointCount() const
{
  size_t ret = 0;
  for(std::vector<track_seg_t>::const_iterator it = m_segments.begin(); it != m_segments.end(); it++)
    ret += it->points().size();
  return ret;
}

double track_t::distance() const
{
  double ret = 0;
  for(std::vector<track_seg_t>::const_iterator it = m_segments.begin(); it != m_segments.end(); it++)
    ret += it->distance();
  return ret;
}

elevation_change track_t::ascentDescent() const
{
  elevation_change ret;
  for(std::vector<track_seg_t>::const_iterator it = m_segments.begin(); it != m_segments.end(); it++)
    ret += it->ascentDescent();
  return ret;
}

track_stats::track_stats(const track_t &track)
  : segments(track.segmentCount())
  , points(track.pointCount())
  , distance(track.distance())
  , elevation(track.ascentDescent())
{
}

std::string track_stats::report(const char *filename) const
{
  std::string ret = "File: ";
  ret += filename;
  ret += '\n';

  char buf[128];
  snprintf(buf, sizeof(buf), "Segments: %zu\nPoints: %zu\n", segments, points);
  ret += buf;

  snprintf(buf, sizeof(buf), "Distance: %.2f km\nAscent: %.1f m\nDescent: %.1f m\n",
           distance / 1000, elevation.ascent, elevation.descent);
  ret += buf;

  return ret;
}
