/*
 * SPDX-FileCopyrightText: 2026 The gpxstat authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "gpx_error.h"
#include "track.h"

#include <cstdio>
#include <cstdlib>
#include <libxml/parser.h>
#include <memory>

int main(int argc, char **argv)
{
  if(argc != 2) {
    fprintf(stderr, "Usage: %s <file.gpx>\n", PACKAGE);
    return EXIT_FAILURE;
  }

  LIBXML_TEST_VERSION
  xmlInitParser();

  gpx_error err;
  std::unique_ptr<track_t> track = track_import(argv[1], err);

  int ret = EXIT_SUCCESS;
  if(track) {
    const track_stats stats(*track);
    fputs(stats.report(argv[1]).c_str(), stdout);
  } else {
    fprintf(stderr, "Error: %s\n", err.toString().c_str());
    ret = EXIT_FAILURE;
  }

  track.reset();
  xmlCleanupParser();

  return ret;
}
