/* Copyright © 2007-2022 Jakub Wilk <jwilk@jwilk.net>
 * Copyright © 2026 pdftocio contributors
 *
 * This file is part of pdftocio.
 *
 * pdftocio is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 *
 * pdftocio is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * General Public License for more details.
 */

#include "debug.hh"

#include <iostream>

#include "i18n.hh"
#include "string-printf.hh"

namespace
{
  /* Without a stream buffer, every write fails silently. */
  class NullStream : public std::ostream
  {
  public:
    NullStream()
    : std::ostream(nullptr)
    { }
  };

  NullStream null_stream;
  DebugStream discarding_log(null_stream);
  DebugStream diagnostic_log(std::clog);
}

DebugStream error_log(std::cerr);

DebugStream &debug(int n, int threshold)
{
  return n <= threshold ? diagnostic_log : discarding_log;
}

void DebugStream::begin_line()
{
  if (this->started)
    return;
  this->started = true;
  if (this->level == 0)
    return;
  this->ostream << std::string(2 * (this->level - 1), ' ') << "- ";
}

void DebugStream::warning(const std::string &message)
{
  *this << string_printf(_("Warning: %s"), message.c_str()) << std::endl;
}

DebugStream &operator<<(DebugStream &stream, std::ostream& (*pf)(std::ostream&))
{
  if (pf == static_cast<std::ostream& (*)(std::ostream&)>(std::endl))
    stream.started = false;
  stream.ostream << pf;
  return stream;
}

// vim:ts=2 sts=2 sw=2 et
