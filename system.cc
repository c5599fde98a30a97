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

#include "system.hh"

#include <cerrno>
#include <cstring>

#include <sys/stat.h>
#include <unistd.h>

static const char path_separator = '/';


/* class POSIXError
 * ================
 */

std::string POSIXError::error_message(const std::string &context)
{
  /* POSIX says that ``strerror()`` returns a locale-dependent error message.
   * No need to translate. */
  std::string message = strerror(errno);
  if (context.length())
    message = context + ": " + message;
  return message;
}

void throw_posix_error(const std::string &context)
{
  throw POSIXError(context);
}


/* terminal detection
 * ==================
 */

bool isatty(const std::ostream &ostream)
{
  if (&ostream == &std::cout)
    return isatty(STDOUT_FILENO);
  else if (&ostream == &std::cerr || &ostream == &std::clog)
    return isatty(STDERR_FILENO);
  else
  {
    /* Not implemented for streams other that the standard ones.
     * See https://www.ginac.de/~kreckel/fileno/ for a more general
     * (although unportable, GCC-specific) solution.
     */
    throw std::invalid_argument("isatty(const std::ostream &)");
  }
}

bool isatty(const std::istream &istream)
{
  if (&istream == &std::cin)
    return isatty(STDIN_FILENO);
  else
    throw std::invalid_argument("isatty(const std::istream &)");
}


/* path manipulation
 * =================
 */

void split_extension(const std::string &path, std::string &stem, std::string &extension)
{
  size_t name_pos = path.rfind(path_separator);
  name_pos = (name_pos == std::string::npos) ? 0 : name_pos + 1;
  size_t dot_pos = path.rfind('.');
  if (dot_pos == std::string::npos || dot_pos < name_pos)
  {
    stem = path;
    extension.clear();
    return;
  }
  size_t first_non_dot = path.find_first_not_of('.', name_pos);
  if (first_non_dot == std::string::npos || dot_pos < first_non_dot)
  {
    /* ".hidden" and ".." have no extension */
    stem = path;
    extension.clear();
    return;
  }
  stem = path.substr(0, dot_pos);
  extension = path.substr(dot_pos);
}

bool is_same_file(const std::string &path1, const std::string &path2)
{
  struct stat st1, st2;
  int rc;
  rc = stat(path1.c_str(), &st1);
  if (rc)
    return false;
  rc = stat(path2.c_str(), &st2);
  if (rc)
    return false;
  return
    (st1.st_dev == st2.st_dev) &&
    (st1.st_ino == st2.st_ino);
}

// vim:ts=2 sts=2 sw=2 et
