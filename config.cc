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

#include "config.hh"

#include <climits>
#include <iostream>
#include <stdexcept>

#include <getopt.h>

#include "debug.hh"
#include "i18n.hh"
#include "string-printf.hh"
#include "system.hh"

Config::Config()
{
  this->human_readable = false;
  this->debug_mode = false;
  this->verbose = 1;
}

std::string Config::get_output() const
{
  if (!this->output.empty())
    return this->output;
  std::string stem, extension;
  split_extension(this->input, stem, extension);
  return stem + "_out" + extension;
}

static toc::WriteOptions::encoding_t parse_encoding(const std::string &s)
{
  if (s == "auto")
    return toc::WriteOptions::ENCODING_AUTO;
  else if (s == "pdfdoc")
    return toc::WriteOptions::ENCODING_PDF_DOC;
  else if (s == "utf16")
    return toc::WriteOptions::ENCODING_UTF16;
  throw Config::Error(string_printf(
    _("Unknown title encoding: %s"),
    s.c_str()
  ));
}

void Config::read_config(int argc, char * const argv[])
{
  enum
  {
    OPT_ENCODING = 'e',
    OPT_DEBUG = 'g',
    OPT_HELP = 'h',
    OPT_HUMAN_READABLE = 'H',
    OPT_OUTPUT = 'o',
    OPT_QUIET = 'q',
    OPT_TOC = 't',
    OPT_VERBOSE = 'v',
    OPT_DUMMY = CHAR_MAX,
    OPT_REPLACE_UNSUPPORTED,
    OPT_VERSION,
  };
  static struct option options [] =
  {
    { "debug", 0, nullptr, OPT_DEBUG },
    { "encoding", 1, nullptr, OPT_ENCODING },
    { "help", 0, nullptr, OPT_HELP },
    { "human-readable", 0, nullptr, OPT_HUMAN_READABLE },
    { "output", 1, nullptr, OPT_OUTPUT },
    { "quiet", 0, nullptr, OPT_QUIET },
    { "replace-unsupported", 0, nullptr, OPT_REPLACE_UNSUPPORTED },
    { "toc", 1, nullptr, OPT_TOC },
    { "verbose", 0, nullptr, OPT_VERBOSE },
    { "version", 0, nullptr, OPT_VERSION },
    { nullptr, 0, nullptr, '\0' }
  };
  /* Zero requests a full reset of the getopt_long() state. */
  optind = 0;
  while (true)
  {
    int c = getopt_long(argc, argv, "e:ghHo:qt:v", options, nullptr);
    if (c < 0)
      break;
    if (c == 0)
      throw Config::Error(_("Unable to parse command-line options"));
    switch (c)
    {
    case OPT_ENCODING:
      this->write_options.encoding = parse_encoding(optarg);
      break;
    case OPT_DEBUG:
      this->debug_mode = true;
      break;
    case OPT_HUMAN_READABLE:
      this->human_readable = true;
      break;
    case OPT_OUTPUT:
      this->output = optarg;
      if (this->output.empty())
        throw Config::Error(_("Invalid output file name"));
      break;
    case OPT_QUIET:
      this->verbose = 0;
      break;
    case OPT_REPLACE_UNSUPPORTED:
      this->write_options.replace_unsupported = true;
      break;
    case OPT_TOC:
      this->toc_path = optarg;
      if (this->toc_path.empty())
        throw Config::Error(_("Invalid table of contents file name"));
      break;
    case OPT_VERBOSE:
      this->verbose = 2;
      break;
    case OPT_HELP:
      throw NeedHelp();
    case OPT_VERSION:
      throw NeedVersion();
    case '?':
    case ':':
      throw InvalidOption();
    default:
      throw std::logic_error(_("Unknown option"));
    }
  }
  if (optind > argc - 1)
    throw Config::Error(_("No input file name was specified"));
  if (optind < argc - 1)
    throw Config::Error(_("Too many input file names were specified"));
  this->input = argv[optind];
  std::string output = this->get_output();
  if (output == this->input || is_same_file(output, this->input))
    throw Config::Error(string_printf(
      _("Input file is the same as output file: %s"),
      output.c_str()
    ));
}

template <typename streamtp>
static void print_usage(streamtp &stream)
{
  stream
    << _("Usage: ") << std::endl
    << _("   pdftocio [options] <pdf-file>                      (print the table of contents)") << std::endl
    << _("   pdftocio [options] <pdf-file> < <toc-file>         (replace the table of contents)") << std::endl
    << _("   pdftocio [options] -t <toc-file> <pdf-file>        (replace the table of contents)") << std::endl
    << std::endl << _("Options: ")
    << std::endl << _(" -o, --output=FILE")
    << std::endl << _(" -t, --toc=FILE")
    << std::endl <<   " -H, --human-readable"
    << std::endl <<   " -e, --encoding=auto"
    << std::endl <<   " -e, --encoding=pdfdoc"
    << std::endl <<   " -e, --encoding=utf16"
    << std::endl <<   "     --replace-unsupported"
    << std::endl <<   " -g, --debug"
    << std::endl <<   " -v, --verbose"
    << std::endl <<   " -q, --quiet"
    << std::endl <<   " -h, --help"
    << std::endl <<   "     --version"
    << std::endl;
}

void Config::usage(const Config::Error &error) const
{
  DebugStream &log = debug(0, this->verbose);
  if (error.is_already_printed())
    log << std::endl;
  if (!error.is_quiet())
    log << error << std::endl << std::endl;
  print_usage(log);
}

void Config::usage() const
{
  print_usage(std::cout);
}

// vim:ts=2 sts=2 sw=2 et
