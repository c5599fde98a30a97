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

#ifndef PDFTOCIO_DEBUG_HH
#define PDFTOCIO_DEBUG_HH

#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "system.hh"

class DebugStream;

template <typename tp>
static inline DebugStream &operator<<(DebugStream &, const tp &);

/* Line-oriented diagnostics. Lines written while the stream is nested
 * are prefixed with “- ”, indented by two spaces per extra level. */
class DebugStream
{
protected:
  unsigned int level;
  bool started;
  std::ostream &ostream;
  void begin_line();
public:
  explicit DebugStream(std::ostream &ostream)
  : level(0), started(false), ostream(ostream)
  { }
  void operator ++(int) { this->level++; }
  void operator --(int) { this->level--; }
  /* One line: “Warning: <message>” */
  void warning(const std::string &message);
  template <typename tp>
    friend DebugStream &operator<<(DebugStream &, const tp &);
  friend DebugStream &operator<<(DebugStream &stream, std::ostream& (*)(std::ostream&));

  /* Nests the stream for the lifetime of the object. */
  class Nested
  {
  protected:
    DebugStream &stream;
  public:
    explicit Nested(DebugStream &stream)
    : stream(stream)
    {
      this->stream++;
    }
    ~Nested()
    {
      this->stream--;
    }
  };
};

/* Message level n is shown if it does not exceed the verbosity threshold
 * (0 with --quiet, 1 by default, 2 with --verbose). */
DebugStream &debug(int n, int threshold);
extern DebugStream error_log;

static inline std::ostream &operator<<(std::ostream &stream, const std::runtime_error &error)
{
  stream << error.what();
  return stream;
}

template <typename tp>
static inline DebugStream &operator<<(DebugStream &stream, const tp &object)
{
  stream.begin_line();
  std::ostringstream buffer;
  buffer.copyfmt(stream.ostream);
  buffer << object;
  stream.ostream << encoding::proxy<encoding::native, encoding::terminal>(buffer.str());
  return stream;
}

#endif

// vim:ts=2 sts=2 sw=2 et
