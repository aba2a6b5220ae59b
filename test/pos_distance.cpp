#include <pos.h>

#include <gpxstat_annotations.h>

#include <cassert>
#include <cmath>

namespace {

void check_identical()
{
  const pos_t a(47.26543, 11.39246);
  assert_cmpnum(a.distance(a), 0.0);

  const pos_t b(-33.8688, 151.2093);
  assert_cmpnum(b.distance(pos_t(b.lat, b.lon)), 0.0);

  const pos_t origin(0, 0);
  assert_cmpnum(origin.distance(origin), 0.0);
}

void check_symmetric()
{
  const pos_t a(52.5200, 13.4050);
  const pos_t b(52.5205, 13.4062);
  assert_cmpnum(a.distance(b), b.distance(a));

  const pos_t c(-0.0001, -179.9999);
  const pos_t d(0.0001, 179.9999);
  assert_cmpnum(c.distance(d), d.distance(c));
}

void check_equator_step()
{
  const pos_t a(0, 0);
  const pos_t b(0, 0.001);
  const double dist = a.distance(b);

  assert_cmpnum_op(dist, >, 100.0);
  assert_cmpnum_op(dist, <, 120.0);
  // R * pi / 180000
  assert_cmpnum_op(std::fabs(dist - 111.19492664), <, 0.0001);
}

void check_known_distances()
{
  // one degree along a meridian
  const double meridian = pos_t(10, 5).distance(pos_t(11, 5));
  assert_cmpnum_op(std::fabs(meridian - 111194.9266), <, 0.001);

  // the antipode is half way around the earth
  const double half = pos_t(0, 0).distance(pos_t(0, 180));
  assert_cmpnum_op(std::fabs(half - M_PI * POS_MEAN_RADIUS), <, 0.001);

  // crossing the date line takes the short way
  const double dateline = pos_t(0, 179.9995).distance(pos_t(0, -179.9995));
  assert_cmpnum_op(dateline, <, 120.0);

  // longitude degrees shrink towards the poles
  const double north = pos_t(60, 0).distance(pos_t(60, 1));
  assert_cmpnum_op(std::fabs(north - 55596.0), <, 10.0);
}

void check_valid()
{
  assert(pos_t(0, 0).valid());
  assert(pos_t(90, 180).valid());
  assert(pos_t(-90, -180).valid());
  assert(!pos_t(90.5, 0).valid());
  assert(!pos_t(0, -180.5).valid());
  assert(!pos_t().valid());
  assert(!pos_t(NAN, 0).valid());

  assert(pos_t(1, 2) == pos_t(1, 2));
  assert(pos_t(1, 2) != pos_t(2, 1));
}

} // namespace

int main()
{
  check_identical();
  check_symmetric();
  check_equator_step();
  check_known_distances();
  check_valid();

  return 0;
}
