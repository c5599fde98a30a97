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

#ifndef PDFTOCIO_SYSTEM_HH
#define PDFTOCIO_SYSTEM_HH

#include <iostream>
#include <stdexcept>
#include <string>

/* An error reported by the C library through errno. */
class POSIXError : public std::runtime_error
{
public:
  /* "<context>: <strerror(errno)>" */
  static std::string error_message(const std::string &context);
  explicit POSIXError(const std::string &context)
  : std::runtime_error(error_message(context))
  { }
};

[[noreturn]]
void throw_posix_error(const std::string &context);

namespace encoding
{

  class Error : public POSIXError
  {
  public:
    Error()
    : POSIXError("iconv()")
    { }
  };

  enum encoding
  {
    native,
    terminal,
    utf8,
  };

  template <enum encoding from, enum encoding to>
  class proxy;

  template <enum encoding from, enum encoding to>
  std::ostream &operator << (std::ostream &, const proxy<from, to> &);

  template <enum encoding from, enum encoding to>
  class proxy
  {
  protected:
    const std::string &string;
  public:
    explicit proxy(const std::string &string)
    : string(string)
    { }
    friend std::ostream &operator << <>(std::ostream &, const proxy<from, to> &);
  };

}

bool isatty(const std::ostream &ostream);
bool isatty(const std::istream &istream);

/* "dir/name.ext" → "dir/name", ".ext". Leading dots of the file name do
 * not start an extension. */
void split_extension(const std::string &path, std::string &stem, std::string &extension);

bool is_same_file(const std::string &path1, const std::string &path2);

#endif

// vim:ts=2 sts=2 sw=2 et
