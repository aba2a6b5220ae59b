/*
 * SPDX-FileCopyrightText: 2026 The gpxstat authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "fdguard.h"

#include "gpxstat_annotations.h"

#include <fcntl.h>
#include <unistd.h>

#ifndef O_CLOEXEC
#define O_CLOEXEC 0
#endif

fdguard::fdguard(const char *pathname, int flags)
  : fd(open(pathname, flags | O_CLOEXEC))
{
}

fdguard::~fdguard() {
  if(likely(valid()))
    close(fd);
}

void fdguard::swap(fdguard &other) noexcept
{
  int f = fd;
  const_cast<int &>(fd) = other.fd;
  const_cast<int &>(other.fd) = f;
}
