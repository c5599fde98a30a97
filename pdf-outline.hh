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

#ifndef PDFTOCIO_PDF_OUTLINE_HH
#define PDFTOCIO_PDF_OUTLINE_HH

#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "debug.hh"
#include "pdf-backend.hh"
#include "toc-bridge.hh"
#include "toc-outline.hh"

namespace pdf
{

/* class pdf::OutlineStore : toc::OutlineStore
 * ===========================================
 */

  class OutlineStore : public toc::OutlineStore
  {
  protected:
    pdf::Document &document;
    DebugStream &warning_log;
    void read_items(pdf::Object *node, toc::OutlineBase &outline, int depth, std::set<std::pair<int, int>> &seen);
    void set_destinations(pdf::Object *node, const std::vector<toc::OutlineNode> &nodes);
  public:
    /* Items that cannot be read are skipped, with a warning
     * written to warning_log. */
    OutlineStore(pdf::Document &document, DebugStream &warning_log)
    : document(document), warning_log(warning_log)
    { }
    int page_count();
    toc::Outline get_outline();
    void set_outline(const toc::Outline &outline, const toc::WriteOptions &options);
  };

  class BookmarkError : public std::runtime_error
  {
  public:
    explicit BookmarkError(const std::string &message)
    : std::runtime_error(message)
    { }
  };

  class NoPageForBookmark : public BookmarkError
  {
  public:
    NoPageForBookmark()
    : BookmarkError(_("No page for a bookmark"))
    { }
  };

  class NoTitleForBookmark : public BookmarkError
  {
  public:
    NoTitleForBookmark()
    : BookmarkError(_("No title for a bookmark"))
    { }
  };

}

#endif

// vim:ts=2 sts=2 sw=2 et
