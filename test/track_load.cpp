#include <fdguard.h>
#include <gpx_error.h>
#include <gpx_xml_reader.h>
#include <track.h>

#include <gpxstat_annotations.h>

#include <cassert>
#include <cerrno>
#include <fcntl.h>
#include <libxml/parser.h>
#include <memory>
#include <string>
#include <vector>

namespace {

std::unique_ptr<track_t> load(const std::string &fname)
{
  gpx_error err;
  std::unique_ptr<track_t> track = track_import(fname.c_str(), err);
  assert(track);
  assert(!err.failed());
  return track;
}

void check_two_segments(const std::string &datadir)
{
  std::unique_ptr<track_t> track = load(datadir + "two_segments.gpx");

  assert_cmpnum(track->segmentCount(), 2);
  assert_cmpnum(track->pointCount(), 4);

  const elevation_change ele = track->ascentDescent();
  assert_cmpnum(ele.ascent, 10.0);
  assert_cmpnum(ele.descent, 5.0);

  // 2 steps of 0.001 degrees along the equator
  assert_cmpnum_op(track->distance(), >, 222.0);
  assert_cmpnum_op(track->distance(), <, 223.0);

  const track_stats stats(*track);
  assert_cmpstr(stats.report("two_segments.gpx"),
                "File: two_segments.gpx\n"
                "Segments: 2\n"
                "Points: 4\n"
                "Distance: 0.22 km\n"
                "Ascent: 10.0 m\n"
                "Descent: 5.0 m\n");
}

void check_single_point(const std::string &datadir)
{
  fdguard fd((datadir + "single_point.gpx").c_str(), O_RDONLY);
  assert(fd.valid());

  gpx_xml_reader reader(fd);
  gpx_error err;
  std::vector<track_point_t> points;
  assert(track_parse_points(reader, points, err));

  assert_cmpnum(points.size(), 1);
  const track_point_t &pt = points.front();
  assert_cmpnum(pt.pos().lat, 1.0);
  assert_cmpnum(pt.pos().lon, 2.0);
  assert(pt.elevation());
  assert_cmpnum(*pt.elevation(), 123.45);
  assert(pt.time());
  assert_cmpstr(*pt.time(), "2024-01-01T00:00:00Z");

  // a single point has no length and no elevation changes
  std::unique_ptr<track_t> track = load(datadir + "single_point.gpx");
  assert_cmpnum(track->segmentCount(), 1);
  assert_cmpnum(track->distance(), 0.0);
  assert_cmpnum(track->ascentDescent().ascent, 0.0);
  assert_cmpnum(track->ascentDescent().descent, 0.0);
}

void check_mixed(const std::string &datadir)
{
  const std::string fname = datadir + "mixed.gpx";
  std::unique_ptr<track_t> track = load(fname);

  // the empty segments and the point outside of any segment are gone
  assert_cmpnum(track->segmentCount(), 2);
  assert_cmpnum(track->pointCount(), 6);

  const std::vector<track_point_t> &first = track->segments().front().points();
  assert_cmpnum(first.size(), 4);
  assert_cmpnum(first[0].pos().lat, 47.0);
  assert_cmpnum(*first[0].elevation(), 1000.5);
  assert_cmpstr(*first[0].time(), "2024-05-01T06:00:00Z");
  assert_cmpnum(*first[1].elevation(), 1010.5);
  assert(!first[1].time());
  assert(!first[2].elevation());
  assert_cmpnum(*first[3].elevation(), 1005.5);

  const elevation_change ele = track->ascentDescent();
  assert_cmpnum(ele.ascent, 10.0);
  assert_cmpnum(ele.descent, 5.0);

  // reading the same file again gives the same result
  std::unique_ptr<track_t> again = load(fname);
  assert(*track == *again);

  // the flat view keeps every point, in document order
  fdguard fd(fname.c_str(), O_RDONLY);
  assert(fd.valid());
  gpx_xml_reader reader(fd);
  gpx_error err;
  std::vector<track_point_t> points;
  assert(track_parse_points(reader, points, err));

  assert_cmpnum(points.size(), 7);
  assert_cmpnum(points.front().pos().lat, 46.0);
  assert_cmpnum(*points.front().elevation(), 1.0);
  assert_cmpnum(points.back().pos().lat, 47.004);
}

void check_failure(const std::string &fname, gpx_error::Kind kind, gpx_error::Cause cause)
{
  gpx_error err;
  std::unique_ptr<track_t> track = track_import(fname.c_str(), err);
  assert(!track);
  assert(err.failed());
  assert_cmpnum(err.kind(), kind);
  assert_cmpnum(err.cause(), cause);
}

void check_failures(const std::string &datadir)
{
  check_failure(datadir + "missing_lon.gpx", gpx_error::InvalidData, gpx_error::TrackPoint);
  check_failure(datadir + "bad_ele.gpx", gpx_error::InvalidData, gpx_error::TrackPoint);
  check_failure(datadir + "malformed.gpx", gpx_error::InvalidFormat, gpx_error::Xml);
  check_failure(datadir + "empty.gpx", gpx_error::InvalidFormat, gpx_error::Xml);
  check_failure(datadir + "does_not_exist.gpx", gpx_error::Input, gpx_error::Io);

  gpx_error err;
  std::unique_ptr<track_t> track = track_import((datadir + "missing_lon.gpx").c_str(), err);
  assert_null(track.get());
  assert_cmpstr(err.toString(), "invalid GPX data: lon is missing");

  err.clear();
  track = track_import((datadir + "bad_ele.gpx").c_str(), err);
  assert_null(track.get());
  assert_cmpstr(err.toString(), "invalid GPX data: ele is not a number");

  // the points read before the error are not handed out
  fdguard fd((datadir + "missing_lon.gpx").c_str(), O_RDONLY);
  assert(fd.valid());
  gpx_xml_reader reader(fd);
  std::vector<track_point_t> points;
  err.clear();
  assert(!track_parse_points(reader, points, err));
  assert(points.empty());
}

} // namespace

int main(int argc, char **argv)
{
  if(argc != 2)
    return EINVAL;

  xmlInitParser();

  const std::string datadir = argv[1];

  check_two_segments(datadir);
  check_single_point(datadir);
  check_mixed(datadir);
  check_failures(datadir);

  xmlCleanupParser();

  return 0;
}
