/*
 * SPDX-FileCopyrightText: 2026 The gpxstat authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <string>

class gpx_error;

/**
 * @brief pull interface to a tokenized markup document
 *
 * Every call to next() advances by exactly one structural event. The
 * accessors refer to the current event and are only valid until the next
 * call to next().
 */
class gpx_event_source {
public:
  enum Event {
    ElementStart,
    ElementEnd,
    Text,
    EndOfStream
  };

  virtual ~gpx_event_source() {}

  /**
   * @brief advance to the next event
   * @param event the type of the new current event
   * @param err filled with the reason if reading failed
   * @returns if an event was read
   *
   * Once EndOfStream was returned no further calls are permitted.
   */
  virtual bool next(Event &event, gpx_error &err) = 0;

  /**
   * @brief the element name of an ElementStart or ElementEnd event
   */
  virtual const char *name() const = 0;

  /**
   * @brief the decoded content of a Text event
   */
  virtual const char *text() const = 0;

  /**
   * @brief look up an attribute of the current ElementStart event
   * @param attr the attribute name
   * @param value the decoded attribute value if present
   * @returns if the attribute is present
   */
  virtual bool attribute(const char *attr, std::string &value) const = 0;
};
