/*
 * SPDX-FileCopyrightText: 2026 The gpxstat authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "gpx_error.h"

#include <cstring>

#include "gpxstat_annotations.h"

gpx_error::Kind gpx_error::kind() const noexcept
{
  switch(m_cause) {
  case Io:
    return Input;
  case Xml:
    return InvalidFormat;
  case TrackPoint:
    return InvalidData;
  default:
    assert_unreachable();
  }
}

const char *gpx_error::message() const
{
  switch(kind()) {
  case Input:
    return "invalid input";
  case InvalidFormat:
    return "invalid GPX format";
  case InvalidData:
    return "invalid GPX data";
  }

  assert_unreachable();
}

std::string gpx_error::toString() const
{
  std::string ret = message();
  if(!m_detail.empty()) {
    ret += ": ";
    ret += m_detail;
  }
  return ret;
}

void gpx_error::set(Cause c, const std::string &d)
{
  assert(c != None);
  m_cause = c;
  m_detail = d;
}

void gpx_error::setIo(int err, const char *what)
{
  m_cause = Io;
  m_detail = what;
  m_detail += ": ";
  m_detail += strerror(err);
}

void gpx_error::clear()
{
  m_cause = None;
  m_detail.clear();
}
