/*
 * SPDX-FileCopyrightText: 2026 The gpxstat authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include "gpx_event_source.h"
#include "xml_helpers.h"

#include <cstddef>
#include <string>

/**
 * @brief event source on top of the libxml2 stream reader
 *
 * Empty elements are reported as a start event immediately followed by an
 * end event. Text is trimmed, text consisting only of whitespace is not
 * reported at all.
 */
class gpx_xml_reader : public gpx_event_source {
public:
  /**
   * @brief read from the given file descriptor
   *
   * The descriptor is not closed, it must stay open as long as this object
   * is used.
   */
  explicit gpx_xml_reader(int fd);
  /**
   * @brief read from a memory buffer
   *
   * The buffer is not copied, it must stay valid as long as this object
   * is used. Buffers larger than INT_MAX bytes are refused, the first call
   * to next() fails then.
   */
  gpx_xml_reader(const char *buffer, size_t len);

  gpx_xml_reader(const gpx_xml_reader &) = delete;
  gpx_xml_reader &operator=(const gpx_xml_reader &) = delete;

  bool next(Event &event, gpx_error &err) override;
  const char *name() const override;
  const char *text() const override;
  bool attribute(const char *attr, std::string &value) const override;

private:
  void setup();
  void fail(gpx_error &err) const;

  static int cb_read(void *ctx, char *buffer, int len);
  static void cb_error(void *arg, xmlErrorPtr error);

  const int fd;
  int readErrno;            ///< errno of a failed read, 0 if none happened
  std::string xmlMessage;   ///< first error reported by libxml2
  bool pendingEnd;          ///< the current element was empty, report its end next
  const char *m_name;
  std::string m_text;
  xmlTextReaderGuard reader;
};
