/*
 * SPDX-FileCopyrightText: 2026 The gpxstat authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <string>

/**
 * @brief the reason a GPX parse was aborted
 *
 * The cause records what actually went wrong, the kind is what callers are
 * expected to act upon.
 */
class gpx_error {
public:
  enum Kind {
    Input,          ///< the source could not be read
    InvalidFormat,  ///< the markup is malformed
    InvalidData     ///< well-formed markup with unusable track content
  };

  enum Cause {
    None,
    Io,             ///< read failure of the underlying byte source
    Xml,            ///< structural parse error from the tokenizer
    TrackPoint      ///< a point or one of its fields failed validation
  };

  gpx_error() : m_cause(None) {}

  inline Cause cause() const noexcept
  { return m_cause; }
  inline bool failed() const noexcept
  { return m_cause != None; }

  Kind kind() const noexcept;

  /**
   * @brief the outward facing description of kind()
   */
  const char *message() const;

  /**
   * @brief the details of the failure, e.g. the offending field
   */
  inline const std::string &detail() const noexcept
  { return m_detail; }

  /**
   * @brief message() and detail() combined for display
   */
  std::string toString() const;

  void set(Cause c, const std::string &d);
  void setIo(int err, const char *what);

  void clear();

private:
  Cause m_cause;
  std::string m_detail;
};
