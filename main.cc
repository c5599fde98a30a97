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

#include <csignal>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

#include "autoconf.hh"
#include "config.hh"
#include "debug.hh"
#include "i18n.hh"
#include "pdf-backend.hh"
#include "pdf-outline.hh"
#include "string-printf.hh"
#include "system.hh"
#include "toc-bridge.hh"
#include "toc-error.hh"
#include "toc-parser.hh"
#include "toc-serializer.hh"

static Config config;

static void print_version()
{
  std::cout
    << PACKAGE_STRING << std::endl
    << "+ Poppler " POPPLER_VERSION_STRING << std::endl;
}

static inline DebugStream &debug(int n)
{
  return debug(n, config.verbose);
}

/* signal handling
 * ===============
 */

static std::string interrupted_message;

extern "C" void handle_sigint(int)
{
  /* Only async-signal-safe functions from here on. */
  const char *message = interrupted_message.c_str();
  ssize_t rc = write(STDERR_FILENO, message, strlen(message));
  (void) rc;
  _exit(1);
}

static void setup_signals()
{
  interrupted_message = std::string(_("Interrupted")) + "\n";
  struct sigaction action;
  memset(&action, 0, sizeof action);
  action.sa_handler = handle_sigint;
  sigemptyset(&action.sa_mask);
  if (sigaction(SIGINT, &action, nullptr) < 0)
    throw_posix_error("sigaction()");
}


/* error reporting
 * ===============
 */

static void report_encoding_error(const toc::EncodingError &error)
{
  error_log << error << std::endl;
  {
    DebugStream::Nested nested(error_log);
    for (const toc::EncodingError::Problem &problem : error.get_problems())
    {
      std::string positions;
      for (size_t position : problem.positions)
      {
        if (!positions.empty())
          positions += ", ";
        positions += string_printf("%zu", position + 1);
      }
      error_log << string_printf(
        P_(
          "entry %zu, \"%s\": character %s",
          "entry %zu, \"%s\": characters %s",
          problem.positions.size()
        ),
        problem.index + 1, problem.title.c_str(), positions.c_str()
      ) << std::endl;
    }
  }
  error_log << _("Use --replace-unsupported to substitute these characters.") << std::endl;
}

static void report_error(const toc::Error &error)
{
  switch (error.kind())
  {
  case toc::Error::FORMAT:
    error_log << string_printf(_("Unable to parse the table of contents: %s"), error.what()) << std::endl;
    break;
  case toc::Error::RANGE:
    error_log << error << std::endl;
    break;
  case toc::Error::ENCODING:
    report_encoding_error(dynamic_cast<const toc::EncodingError &>(error));
    break;
  case toc::Error::EMPTY_OUTLINE:
    error_log << error << std::endl;
    break;
  case toc::Error::IO:
    error_log << string_printf(_("Input/output error (%s)"), error.what()) << std::endl;
    break;
  }
}


/* read path
 * =========
 */

static void print_toc(toc::OutlineStore &store)
{
  debug(2) << _("extracting document outline") << std::endl;
  toc::Entries entries = toc::read_toc(store);
  {
    DebugStream::Nested nested(debug(0));
    debug(2) << string_printf(_("%zu entries"), entries.size()) << std::endl;
  }
  std::cout.exceptions(std::ios::badbit);
  if (config.human_readable && isatty(std::cout))
    std::cout << encoding::proxy<encoding::utf8, encoding::native>(toc::render_human_readable(entries));
  else if (config.human_readable)
    std::cout << toc::render_human_readable(entries);
  else
    toc::serialize(std::cout, entries);
  std::cout.flush();
}


/* write path
 * ==========
 */

static toc::Entries read_toc_text()
{
  if (config.toc_from_stdin())
  {
    debug(2) << _("reading table of contents from standard input") << std::endl;
    return toc::parse(std::cin);
  }
  debug(2) << string_printf(_("reading table of contents from %s"), config.toc_path.c_str()) << std::endl;
  std::ifstream stream(config.toc_path.c_str(), std::ios::in | std::ios::binary);
  if (!stream.is_open())
    throw toc::IOError(POSIXError::error_message(config.toc_path));
  return toc::parse(stream);
}

static void replace_toc(pdf::Document &document, toc::OutlineStore &store)
{
  toc::Entries entries = read_toc_text();
  {
    DebugStream::Nested nested(debug(0));
    debug(2) << string_printf(_("%zu entries"), entries.size()) << std::endl;
  }
  std::vector<toc::EncodingError::Problem> problems =
    toc::write_toc(store, entries, config.write_options);
  for (const toc::EncodingError::Problem &problem : problems)
  {
    debug(1).warning(string_printf(_("unsupported characters replaced in \"%s\""), problem.title.c_str()));
  }
  std::string output = config.get_output();
  debug(2) << string_printf(_("saving %s"), output.c_str()) << std::endl;
  document.save(output);
  debug(1) << string_printf(_("Table of contents written to %s"), output.c_str()) << std::endl;
}


static int xmain(int argc, char * const argv[])
{
  std::ios_base::sync_with_stdio(false);

  try
  {
    config.read_config(argc, argv);
  }
  catch (const Config::NeedVersion &)
  {
    print_version();
    exit(0);
  }
  catch (const Config::NeedHelp &)
  {
    config.usage();
    exit(0);
  }
  catch (const Config::Error &ex)
  {
    config.usage(ex);
    exit(1);
  }

  setup_signals();

  try
  {
    pdf::Environment environment(config.verbose);
    debug(2) << string_printf(_("opening %s"), config.input.c_str()) << std::endl;
    pdf::Document document(config.input);
    pdf::OutlineStore store(document, debug(1));
    if (config.toc_path.empty() && isatty(std::cin))
      print_toc(store);
    else
      replace_toc(document, store);
  }
  catch (const toc::Error &ex)
  {
    if (config.debug_mode)
    {
      ex.describe(std::cerr);
      throw;
    }
    report_error(ex);
    exit(1);
  }
  return 0;
}

int main(int argc, char * const argv[])
try
{
  i18n::setup();
  return xmain(argc, argv);
}
catch (const std::ios_base::failure &ex)
{
  if (config.debug_mode)
    throw;
  error_log << string_printf(_("Input/output error (%s)"), ex.what()) << std::endl;
  exit(2);
}
catch (const std::runtime_error &ex)
{
  if (config.debug_mode)
    throw;
  error_log << ex << std::endl;
  exit(1);
}

// vim:ts=2 sts=2 sw=2 et
