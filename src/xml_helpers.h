/*
 * SPDX-FileCopyrightText: 2026 The gpxstat authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <libxml/tree.h>
#include <libxml/xmlreader.h>
#include <memory>

struct xmlDelete {
  inline void operator()(xmlChar *s) {
    xmlFree(s);
  }
};

class xmlString : public std::unique_ptr<xmlChar, xmlDelete> {
public:
  xmlString(xmlChar *txt = nullptr)
    : std::unique_ptr<xmlChar, xmlDelete>(txt) {}

  operator const char *() const
  { return reinterpret_cast<const char *>(get()); }

  inline bool empty() const
  { return !operator bool() || *get() == '\0'; }
};

struct xmlTextReaderDelete {
  inline void operator()(xmlTextReaderPtr reader) {
    xmlFreeTextReader(reader);
  }
};

typedef std::unique_ptr<xmlTextReader, xmlTextReaderDelete> xmlTextReaderGuard;
