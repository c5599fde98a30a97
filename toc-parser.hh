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

#ifndef PDFTOCIO_TOC_PARSER_HH
#define PDFTOCIO_TOC_PARSER_HH

#include <istream>
#include <string>
#include <vector>

#include "toc-entry.hh"

namespace toc
{

    /* Parse ToC text, one entry per non-blank line:
     *
     *   <indent><title>|<page>[|<top-offset>]
     *
     * where <indent> is (level - 1) tab characters. See toc-format.hh for
     * the escape sequences allowed in <title>.
     *
     * Throws toc::FormatError on the first malformed line.
     */
    Entries parse(const std::vector<std::string> &lines);
    Entries parse(std::istream &stream);

    /* Undo the escaping done by toc::escape_title(). */
    std::string unescape_title(const std::string &s, size_t line);

}

#endif

// vim:ts=4 sts=4 sw=4 et
