/* Copyright © 2026 pdftocio contributors
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

#include "toc-error.hh"

#include "i18n.hh"
#include "string-printf.hh"

const char *toc::Error::kind_name() const
{
  switch (this->kind_)
  {
  case FORMAT:
    return "FormatError";
  case RANGE:
    return "RangeError";
  case ENCODING:
    return "EncodingError";
  case EMPTY_OUTLINE:
    return "EmptyOutline";
  case IO:
    return "IOError";
  }
  return "Error";
}

void toc::Error::describe(std::ostream &stream) const
{
  stream << this->kind_name() << ": " << this->what() << std::endl;
}

static std::string format_error_message(const std::string &reason, size_t line)
{
  /* L10N: "line <number>: <reason>" */
  return string_printf(_("line %zu: %s"), line, _(reason.c_str()));
}

static std::string format_error_message(const std::string &reason, const std::string &title)
{
  /* L10N: "entry "<title>": <reason>" */
  return string_printf(_("entry \"%s\": %s"), title.c_str(), _(reason.c_str()));
}

toc::FormatError::FormatError(const std::string &reason, size_t line)
: Error(FORMAT, format_error_message(reason, line)),
  reason(reason),
  line(line)
{ }

toc::FormatError::FormatError(const std::string &reason, const std::string &title)
: Error(FORMAT, format_error_message(reason, title)),
  reason(reason),
  line(0),
  title(title)
{ }

void toc::FormatError::describe(std::ostream &stream) const
{
  stream << this->kind_name() << ": reason=\"" << this->reason << "\"";
  if (this->line > 0)
    stream << " line=" << this->line;
  else
    stream << " title=\"" << this->title << "\"";
  stream << std::endl;
}

toc::RangeError::RangeError(const std::string &title, int page, int page_count)
: Error(RANGE, string_printf(
    _("Page number %d for \"%s\" is outside the allowed range: %d .. %d"),
    page, title.c_str(), 1, page_count
  )),
  title(title),
  page(page),
  page_count(page_count)
{ }

void toc::RangeError::describe(std::ostream &stream) const
{
  stream << this->kind_name()
    << ": title=\"" << this->title << "\""
    << " page=" << this->page
    << " page_count=" << this->page_count
    << std::endl;
}

static std::string encoding_error_message(size_t n)
{
  return string_printf(
    P_(
      "%zu title contains characters that cannot be encoded",
      "%zu titles contain characters that cannot be encoded",
      n
    ),
    n
  );
}

toc::EncodingError::EncodingError(const std::vector<Problem> &problems)
: Error(ENCODING, encoding_error_message(problems.size())),
  problems(problems)
{ }

void toc::EncodingError::describe(std::ostream &stream) const
{
  stream << this->kind_name() << ":" << std::endl;
  for (const Problem &problem : this->problems)
  {
    stream << "  entry=" << problem.index << " title=\"" << problem.title << "\" positions=";
    const char *sep = "";
    for (size_t position : problem.positions)
    {
      stream << sep << position;
      sep = ",";
    }
    stream << std::endl;
  }
}

toc::EmptyOutline::EmptyOutline()
: Error(EMPTY_OUTLINE, _("No table of contents found"))
{ }

// vim:ts=2 sts=2 sw=2 et
