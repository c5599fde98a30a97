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

#ifndef PDFTOCIO_TOC_CHARSET_HH
#define PDFTOCIO_TOC_CHARSET_HH

#include <cstddef>
#include <string>
#include <vector>

namespace toc
{
  namespace charset
  {

    /* Encodings of a PDF text string (PDF 32000-1:2008, 7.9.2.2). */
    enum encoding
    {
      PDF_DOC,
      UTF16,
    };

    /* Return positions (counted in characters, not bytes) of characters in
     * the UTF-8 title that cannot be represented in the target encoding.
     * Malformed UTF-8 sequences count as one character each and are always
     * reported.
     *
     * Nothing is repaired here; what to do about the positions is up to
     * the caller.
     */
    std::vector<size_t> check(const std::string &title, encoding target);

    /* PDF_DOC if the title is fully representable in it, UTF16 otherwise. */
    encoding choose(const std::string &title);

    /* Substitute the replacement for every character check() would report. */
    std::string replace_unsupported(const std::string &title, encoding target,
      const std::string &replacement = "?");

    /* Encode the UTF-8 title as a PDF text string.
     * Throws toc::EncodingError if check() would report anything.
     */
    std::string encode(const std::string &title, encoding target);

  }
}

#endif

// vim:ts=2 sts=2 sw=2 et
