/*
 * SPDX-FileCopyrightText: 2026 The gpxstat authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "track.h"
#include "track_p.h"

#include "fdguard.h"
#include "gpx_error.h"
#include "gpx_event_source.h"
#include "gpx_xml_reader.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "gpxstat_annotations.h"
#include <gpxstat_platform.h>

namespace {

/**
 * @brief read a mandatory coordinate attribute of <trkpt>
 */
bool point_coordinate(const gpx_event_source &source, const char *attr, pos_float_t &value, gpx_error &err)
{
  std::string str;
  if(unlikely(!source.attribute(attr, str))) {
    err.set(gpx_error::TrackPoint, std::string(attr) + " is missing");
    return false;
  }

  if(unlikely(!gpxstat_platform::string_to_double(str.c_str(), value))) {
    err.set(gpx_error::TrackPoint, std::string(attr) + " is not a number");
    return false;
  }

  return true;
}

/**
 * @brief the state machine shared by both ways of reading a track
 *
 * Only the point currently being read and the points of the current segment
 * are held, everything else is handed out as soon as its closing element is
 * seen.
 */
class TrackStream {
public:
  enum Mode {
    Segments,   ///< keep the points grouped by <trkseg>
    Flat        ///< collect all points in document order
  };

  explicit TrackStream(Mode m)
    : dropped(0)
    , mode(m)
    , curField(nullptr)
  {
  }

  bool parse(gpx_event_source &source, gpx_error &err);

  std::vector<track_seg_t> segments;
  std::vector<track_point_t> points;
  size_t dropped;   ///< points not followed by a segment end

private:
  bool startElement(const gpx_event_source &source, gpx_error &err);
  void endElement(const char *name);
  bool characters(const char *text, gpx_error &err);

  const Mode mode;
  std::optional<track_point_builder> curPoint;
  track_field_apply curField;
  /* points since the last <trkseg> start or end */
  std::vector<track_point_t> segmentPoints;
};

bool TrackStream::parse(gpx_event_source &source, gpx_error &err)
{
  gpx_event_source::Event event;

  for(;;) {
    if(unlikely(!source.next(event, err)))
      return false;

    switch(event) {
    case gpx_event_source::ElementStart:
      if(unlikely(!startElement(source, err)))
        return false;
      break;
    case gpx_event_source::ElementEnd:
      endElement(source.name());
      break;
    case gpx_event_source::Text:
      if(unlikely(!characters(source.text(), err)))
        return false;
      break;
    case gpx_event_source::EndOfStream:
      dropped += segmentPoints.size();
      segmentPoints.clear();
      return true;
    }
  }
}

bool TrackStream::startElement(const gpx_event_source &source, gpx_error &err)
{
  const char *name = source.name();

  if(strcmp(name, "trkpt") == 0) {
    pos_t pos;
    if(unlikely(!point_coordinate(source, "lat", pos.lat, err) ||
                !point_coordinate(source, "lon", pos.lon, err)))
      return false;

    if(unlikely(!pos.valid()))
      fprintf(stderr, "track point with position %f/%f outside of the valid range\n",
              pos.lat, pos.lon);

    curPoint.emplace(pos);
    curField = nullptr;
  } else if(mode == Segments && strcmp(name, "trkseg") == 0) {
    dropped += segmentPoints.size();
    segmentPoints.clear();
  } else if(curPoint) {
    curField = track_field_find(name);
  }

  return true;
}

void TrackStream::endElement(const char *name)
{
  curField = nullptr;

  if(strcmp(name, "trkpt") == 0) {
    if(unlikely(!curPoint))
      return;

    if(mode == Flat)
      points.push_back(curPoint->finish());
    else
      segmentPoints.push_back(curPoint->finish());

    curPoint.reset();
  } else if(mode == Segments && strcmp(name, "trkseg") == 0) {
    // drop empty segments
    if(likely(!segmentPoints.empty())) {
      // this vector will never be appended to again, so shrink it to the size
      // that is actually needed
      segmentPoints.shrink_to_fit();
      segments.push_back(track_seg_t(std::move(segmentPoints)));
      segmentPoints.clear();
    }
  }
}

bool TrackStream::characters(const char *text, gpx_error &err)
{
  if(curField == nullptr || !curPoint)
    return true;

  return curField(*curPoint, text, err);
}

} // namespace

std::unique_ptr<track_t> track_parse(gpx_event_source &source, gpx_error &err)
{
  TrackStream ts(TrackStream::Segments);

  if(unlikely(!ts.parse(source, err)))
    return nullptr;

  if(unlikely(ts.dropped != 0))
    fprintf(stderr, "ignored %zu track points not terminated by a segment end\n", ts.dropped);

  return std::make_unique<track_t>(std::move(ts.segments));
}

bool track_parse_points(gpx_event_source &source, std::vector<track_point_t> &points, gpx_error &err)
{
  TrackStream ts(TrackStream::Flat);

  if(unlikely(!ts.parse(source, err)))
    return false;

  points.insert(points.end(), std::make_move_iterator(ts.points.begin()),
                std::make_move_iterator(ts.points.end()));

  return true;
}

std::unique_ptr<track_t> track_import(const char *filename, gpx_error &err)
{
  fprintf(stderr, "loading track %s\n", filename);

  fdguard fd(filename, O_RDONLY);
  if(unlikely(!fd.valid())) {
    err.setIo(errno, filename);
    fprintf(stderr, "Unable to open %s\n", filename);
    return nullptr;
  }

  gpx_xml_reader reader(fd);
  std::unique_ptr<track_t> track = track_parse(reader, err);
  if(unlikely(!track)) {
    fprintf(stderr, "track %s could not be read: %s\n", filename, err.toString().c_str());
    return nullptr;
  }

  fprintf(stderr, "%zu points in %zu segments\n", track->pointCount(), track->segmentCount());

  return track;
}
