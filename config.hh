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

#ifndef PDFTOCIO_CONFIG_HH
#define PDFTOCIO_CONFIG_HH

#include <stdexcept>
#include <string>

#include "i18n.hh"
#include "toc-bridge.hh"

class Config
{
public:
  std::string input;
  std::string output;
  std::string toc_path;
  bool human_readable;
  bool debug_mode;
  int verbose;
  toc::WriteOptions write_options;

  Config();

  /* Output path: the --output argument, or the input path with “_out”
   * inserted before the extension. */
  std::string get_output() const;

  /* No --toc given: standard input is used unless it is a terminal. */
  bool toc_from_stdin() const
  {
    return this->toc_path.empty() || this->toc_path == "-";
  }

  class NeedVersion
  { };

  class Error : public std::runtime_error
  {
  public:
    explicit Error(const std::string &message)
    : std::runtime_error(message)
    { }
    virtual bool is_quiet() const
    {
      return false;
    }
    virtual bool is_already_printed() const
    {
      return false;
    }
  };

  class NeedHelp : public Error
  {
  public:
    NeedHelp()
    : Error("")
    { }
    virtual bool is_quiet() const
    {
      return true;
    }
  };

  class InvalidOption : public Error
  {
  public:
    InvalidOption()
    : Error("")
    { }
    virtual bool is_quiet() const
    {
      return true;
    }
    virtual bool is_already_printed() const
    {
      return true;
    }
  };

  void read_config(int argc, char * const argv[]);
  void usage(const Error &error) const;
  void usage() const;
};

#endif

// vim:ts=2 sts=2 sw=2 et
