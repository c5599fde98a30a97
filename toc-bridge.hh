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

#ifndef PDFTOCIO_TOC_BRIDGE_HH
#define PDFTOCIO_TOC_BRIDGE_HH

#include <string>
#include <vector>

#include "toc-charset.hh"
#include "toc-entry.hh"
#include "toc-error.hh"
#include "toc-outline.hh"

namespace toc
{

  class WriteOptions
  {
  public:
    enum encoding_t
    {
      ENCODING_AUTO,
      ENCODING_PDF_DOC,
      ENCODING_UTF16,
    };
    encoding_t encoding;
    bool replace_unsupported;
    WriteOptions()
    : encoding(ENCODING_AUTO), replace_unsupported(false)
    { }
    /* The encoding a title will be written in. */
    charset::encoding target(const std::string &title) const;
  };

  /* Where an outline is read from and written to. */
  class OutlineStore
  {
  public:
    virtual int page_count() = 0;
    virtual Outline get_outline() = 0;
    /* Replace the whole outline. */
    virtual void set_outline(const Outline &outline, const WriteOptions &options) = 0;
    virtual ~OutlineStore()
    { }
  };

  /* Read the outline and flatten it.
   * Throws toc::EmptyOutline if the store has no outline.
   */
  Entries read_toc(OutlineStore &store);

  /* Report every title that cannot be written as requested. */
  std::vector<EncodingError::Problem> check_titles(const Entries &entries, const WriteOptions &options);

  /* Check titles, build the tree and install it, replacing the outline.
   *
   * Unsupported characters fail the whole write with toc::EncodingError,
   * listing all offending titles, unless options.replace_unsupported is set;
   * then they are replaced and the problems are returned. Format and range
   * errors abort at the first offending entry. The store is left untouched
   * on failure.
   */
  std::vector<EncodingError::Problem> write_toc(OutlineStore &store, const Entries &entries,
    const WriteOptions &options);

}

#endif

// vim:ts=2 sts=2 sw=2 et
