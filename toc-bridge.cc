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

#include "toc-bridge.hh"

#include "toc-tree.hh"

toc::charset::encoding toc::WriteOptions::target(const std::string &title) const
{
  switch (this->encoding)
  {
  case ENCODING_AUTO:
    return toc::charset::choose(title);
  case ENCODING_PDF_DOC:
    return toc::charset::PDF_DOC;
  case ENCODING_UTF16:
    return toc::charset::UTF16;
  }
  return toc::charset::UTF16;
}

toc::Entries toc::read_toc(toc::OutlineStore &store)
{
  toc::Outline outline = store.get_outline();
  if (!outline)
    throw toc::EmptyOutline();
  return toc::flatten(outline);
}

std::vector<toc::EncodingError::Problem> toc::check_titles(const toc::Entries &entries,
  const toc::WriteOptions &options)
{
  std::vector<toc::EncodingError::Problem> problems;
  for (size_t i = 0; i < entries.size(); i++)
  {
    const std::string &title = entries[i].title;
    std::vector<size_t> positions = toc::charset::check(title, options.target(title));
    if (!positions.empty())
      problems.push_back(toc::EncodingError::Problem(i, title, positions));
  }
  return problems;
}

std::vector<toc::EncodingError::Problem> toc::write_toc(toc::OutlineStore &store,
  const toc::Entries &entries, const toc::WriteOptions &options)
{
  std::vector<toc::EncodingError::Problem> problems = toc::check_titles(entries, options);
  if (problems.empty())
  {
    toc::Outline outline = toc::build(entries, store.page_count());
    store.set_outline(outline, options);
    return problems;
  }
  if (!options.replace_unsupported)
    throw toc::EncodingError(problems);
  toc::Entries fixed_entries(entries);
  for (const toc::EncodingError::Problem &problem : problems)
  {
    toc::Entry &entry = fixed_entries[problem.index];
    entry.title = toc::charset::replace_unsupported(entry.title, options.target(entry.title));
  }
  toc::Outline outline = toc::build(fixed_entries, store.page_count());
  store.set_outline(outline, options);
  return problems;
}

// vim:ts=2 sts=2 sw=2 et
