/*
 * SPDX-FileCopyrightText: 2026 The gpxstat authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include "pos.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class gpx_error;
class gpx_event_source;

/**
 * @brief cumulative elevation changes in meters
 *
 * Both values are positive magnitudes.
 */
struct elevation_change {
  elevation_change() noexcept : ascent(0), descent(0) {}
  elevation_change(double a, double d) noexcept : ascent(a), descent(d) {}
  double ascent;
  double descent;

  elevation_change &operator+=(const elevation_change &other) noexcept
  {
    ascent += other.ascent;
    descent += other.descent;
    return *this;
  }
};

/**
 * @brief classify the elevation difference between two consecutive fixes
 *
 * If either elevation is unknown the pair contributes nothing.
 */
elevation_change elevation_delta(const std::optional<double> &from, const std::optional<double> &to) noexcept;

class track_point_t {
public:
  explicit track_point_t(const pos_t &p, std::optional<double> ele = std::nullopt,
                         std::optional<std::string> t = std::nullopt);

  inline const pos_t &pos() const noexcept
  { return m_pos; }
  /* meters */
  inline const std::optional<double> &elevation() const noexcept
  { return m_elevation; }
  /* unparsed content of the <time> element */
  inline const std::optional<std::string> &time() const noexcept
  { return m_time; }

  /**
   * @brief great circle distance to another point in meters
   */
  inline double distance(const track_point_t &other) const noexcept
  { return m_pos.distance(other.m_pos); }

  bool operator==(const track_point_t &other) const;
  inline bool operator!=(const track_point_t &other) const
  { return !operator==(other); }

private:
  pos_t m_pos;
  std::optional<double> m_elevation;
  std::optional<std::string> m_time;
};

class track_seg_t {
public:
  explicit track_seg_t(std::vector<track_point_t> &&points);

  inline const std::vector<track_point_t> &points() const noexcept
  { return track_points; }

  /**
   * @brief the length of the segment in meters
   */
  double distance() const;
  elevation_change ascentDescent() const;

  inline bool operator==(const track_seg_t &other) const
  { return track_points == other.track_points; }
  inline bool operator!=(const track_seg_t &other) const
  { return !operator==(other); }

private:
  std::vector<track_point_t> track_points;
};

class track_t {
public:
  explicit track_t(std::vector<track_seg_t> &&segs);

  inline const std::vector<track_seg_t> &segments() const noexcept
  { return m_segments; }
  inline size_t segmentCount() const noexcept
  { return m_segments.size(); }
  size_t pointCount() const;

  /**
   * @brief the summed length of all segments in meters
   *
   * The gaps between segments are not included.
   */
  double distance() const;
  elevation_change ascentDescent() const;

  inline bool operator==(const track_t &other) const
  { return m_segments == other.m_segments; }
  inline bool operator!=(const track_t &other) const
  { return !operator==(other); }

private:
  std::vector<track_seg_t> m_segments;
};

/**
 * @brief summary of a track as presented to the user
 */
struct track_stats {
  explicit track_stats(const track_t &track);

  size_t segments;
  size_t points;
  double distance;    ///< meters
  elevation_change elevation;

  /**
   * @brief the human readable report
   * @param filename the name of the file the track was read from
   */
  std::string report(const char *filename) const;
};

/**
 * @brief read a track from the given event source
 * @param source the tokenized document
 * @param err filled with the reason on failure
 * @returns the track or nullptr on error
 *
 * Points are grouped by their segments. A segment start discards the points
 * collected since the previous segment start or end, so points outside of any
 * segment are dropped. Segments without points are dropped as well.
 */
std::unique_ptr<track_t> track_parse(gpx_event_source &source, gpx_error &err);

/**
 * @brief read all points from the given event source
 * @param source the tokenized document
 * @param points the points are appended here in document order
 * @param err filled with the reason on failure
 * @returns if the document was read successfully
 *
 * Segment boundaries are ignored. On error points is left untouched.
 */
bool track_parse_points(gpx_event_source &source, std::vector<track_point_t> &points, gpx_error &err);

/**
 * @brief read the track from a GPX file
 * @param filename the file to open
 * @param err filled with the reason on failure
 * @returns the track or nullptr on error
 */
std::unique_ptr<track_t> track_import(const char *filename, gpx_error &err);
