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

#include "toc-charset.hh"

#include <CharTypes.h>

#include "pdf-unicode.hh"
#include "toc-error.hh"

static bool is_supported(Unicode code, toc::charset::encoding target)
{
  if (code == pdf::bad_unicode || code == 0)
    return false;
  switch (target)
  {
  case toc::charset::PDF_DOC:
    {
      char byte;
      return pdf::unicode_as_pdfdoc(code, byte);
    }
  case toc::charset::UTF16:
    return true;
  }
  return false;
}

/* A PDFDocEncoding string starting with "þÿ" (bytes FE FF) or "ï»¿"
 * (bytes EF BB BF) would be read back as UTF-16BE or UTF-8. The last
 * character of such a prefix is reported as unsupported.
 */
static bool is_misread_prefix(const std::vector<Unicode> &unistr, size_t i, toc::charset::encoding target)
{
  if (target != toc::charset::PDF_DOC)
    return false;
  if (i == 1)
    return unistr[0] == 0xFE && unistr[1] == 0xFF;
  if (i == 2)
    return unistr[0] == 0xEF && unistr[1] == 0xBB && unistr[2] == 0xBF;
  return false;
}

std::vector<size_t> toc::charset::check(const std::string &title, toc::charset::encoding target)
{
  std::vector<size_t> positions;
  std::vector<Unicode> unistr = pdf::utf8_as_unicode(title);
  for (size_t i = 0; i < unistr.size(); i++)
    if (!is_supported(unistr[i], target) || is_misread_prefix(unistr, i, target))
      positions.push_back(i);
  return positions;
}

toc::charset::encoding toc::charset::choose(const std::string &title)
{
  if (toc::charset::check(title, PDF_DOC).empty())
    return PDF_DOC;
  return UTF16;
}

std::string toc::charset::replace_unsupported(const std::string &title, toc::charset::encoding target,
  const std::string &replacement)
{
  std::vector<Unicode> unistr = pdf::utf8_as_unicode(title);
  std::string result;
  size_t chunk_start = 0;
  for (size_t i = 0; i < unistr.size(); i++)
  {
    if (is_supported(unistr[i], target) && !is_misread_prefix(unistr, i, target))
      continue;
    std::vector<Unicode> chunk(unistr.begin() + chunk_start, unistr.begin() + i);
    result += pdf::unicode_as_utf8(chunk);
    result += replacement;
    chunk_start = i + 1;
  }
  std::vector<Unicode> chunk(unistr.begin() + chunk_start, unistr.end());
  result += pdf::unicode_as_utf8(chunk);
  return result;
}

std::string toc::charset::encode(const std::string &title, toc::charset::encoding target)
{
  std::vector<size_t> positions = toc::charset::check(title, target);
  if (!positions.empty())
  {
    std::vector<toc::EncodingError::Problem> problems;
    problems.push_back(toc::EncodingError::Problem(0, title, positions));
    throw toc::EncodingError(problems);
  }
  std::vector<Unicode> unistr = pdf::utf8_as_unicode(title);
  switch (target)
  {
  case PDF_DOC:
    {
      std::string result;
      for (Unicode code : unistr)
      {
        char byte;
        pdf::unicode_as_pdfdoc(code, byte);
        result += byte;
      }
      return result;
    }
  case UTF16:
    return pdf::unicode_as_utf16be(unistr);
  }
  return std::string();
}

// vim:ts=2 sts=2 sw=2 et
