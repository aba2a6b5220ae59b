/*
 * SPDX-FileCopyrightText: 2026 The gpxstat authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "gpx_xml_reader.h"

#include "gpx_error.h"

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstring>
#include <libxml/parser.h>
#include <libxml/xmlreader.h>
#include <unistd.h>

#include "gpxstat_annotations.h"

namespace {

inline bool is_space(char c)
{
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

} // namespace

gpx_xml_reader::gpx_xml_reader(int f)
  : fd(f)
  , readErrno(0)
  , pendingEnd(false)
  , m_name(nullptr)
  , reader(xmlReaderForIO(cb_read, nullptr, this, nullptr, nullptr, XML_PARSE_NONET))
{
  setup();
}

gpx_xml_reader::gpx_xml_reader(const char *buffer, size_t len)
  : fd(-1)
  , readErrno(0)
  , pendingEnd(false)
  , m_name(nullptr)
  , reader(likely(len <= INT_MAX) ?
           xmlReaderForMemory(buffer, static_cast<int>(len), nullptr, nullptr, XML_PARSE_NONET) :
           nullptr)
{
  if(unlikely(len > INT_MAX))
    readErrno = EFBIG;
  else
    setup();
}

void gpx_xml_reader::setup()
{
  if(likely(reader))
    xmlTextReaderSetStructuredErrorHandler(reader.get(), cb_error, this);
}

int gpx_xml_reader::cb_read(void *ctx, char *buffer, int len)
{
  gpx_xml_reader * const r = static_cast<gpx_xml_reader *>(ctx);

  ssize_t n;
  do {
    n = read(r->fd, buffer, len);
  } while(unlikely(n < 0 && errno == EINTR));

  if(unlikely(n < 0)) {
    r->readErrno = errno;
    return -1;
  }

  return n;
}

void gpx_xml_reader::cb_error(void *arg, xmlErrorPtr error)
{
  if(unlikely(error == nullptr))
    return;

  gpx_xml_reader * const r = static_cast<gpx_xml_reader *>(arg);

  std::string m = error->message != nullptr ? error->message : "";
  while(!m.empty() && is_space(m[m.size() - 1]))
    m.erase(m.size() - 1);

  if(error->level == XML_ERR_WARNING) {
    fprintf(stderr, "XML warning in line %i: %s\n", error->line, m.c_str());
    return;
  }

  // later errors are usually just fallout of the first one
  if(r->xmlMessage.empty())
    r->xmlMessage = "line " + std::to_string(error->line) + ": " + m;
}

void gpx_xml_reader::fail(gpx_error &err) const
{
  if(readErrno != 0)
    err.setIo(readErrno, "reading input failed");
  else if(!xmlMessage.empty())
    err.set(gpx_error::Xml, xmlMessage);
  else
    err.set(gpx_error::Xml, "malformed document");
}

bool gpx_xml_reader::next(Event &event, gpx_error &err)
{
  if(unlikely(!reader)) {
    fail(err);
    return false;
  }

  if(pendingEnd) {
    pendingEnd = false;
    event = ElementEnd;
    return true;
  }

  for(;;) {
    int ret = xmlTextReaderRead(reader.get());
    if(ret == 0) {
      event = EndOfStream;
      return true;
    } else if(unlikely(ret < 0 || readErrno != 0)) {
      fail(err);
      return false;
    }

    switch(xmlTextReaderNodeType(reader.get())) {
    case XML_READER_TYPE_ELEMENT:
      m_name = reinterpret_cast<const char *>(xmlTextReaderConstLocalName(reader.get()));
      pendingEnd = xmlTextReaderIsEmptyElement(reader.get()) == 1;
      event = ElementStart;
      return true;
    case XML_READER_TYPE_END_ELEMENT:
      m_name = reinterpret_cast<const char *>(xmlTextReaderConstLocalName(reader.get()));
      event = ElementEnd;
      return true;
    case XML_READER_TYPE_TEXT:
    case XML_READER_TYPE_CDATA: {
      const char *value = reinterpret_cast<const char *>(xmlTextReaderConstValue(reader.get()));
      if(unlikely(value == nullptr))
        break;

      const char *end = value + strlen(value);
      while(value != end && is_space(*value))
        value++;
      while(end != value && is_space(*(end - 1)))
        end--;

      if(value == end)
        break;

      m_text.assign(value, end);
      event = Text;
      return true;
    }
    default:
      // whitespace, comments, processing instructions, doctype
      break;
    }
  }
}

const char *gpx_xml_reader::name() const
{
  return m_name;
}

const char *gpx_xml_reader::text() const
{
  return m_text.c_str();
}

bool gpx_xml_reader::attribute(const char *attr, std::string &value) const
{
  xmlString prop(xmlTextReaderGetAttribute(reader.get(), BAD_CAST attr));
  if(!prop)
    return false;

  value = static_cast<const char *>(prop);
  return true;
}
