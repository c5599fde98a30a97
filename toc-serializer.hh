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

#ifndef PDFTOCIO_TOC_SERIALIZER_HH
#define PDFTOCIO_TOC_SERIALIZER_HH

#include <ostream>
#include <string>

#include "toc-entry.hh"

namespace toc
{

    /* Render entries in the format read by toc::parse(). */
    void serialize(std::ostream &stream, const Entries &entries);
    std::string serialize(const Entries &entries);

    std::string escape_title(const std::string &title);

    /* Shortest C-locale form that reads back as the same number. */
    std::string format_top_offset(double offset);

    /* Indented, bulleted tree for display on a terminal:
     *
     *   - Chapter 1 (1)
     *     - Section 1.1 (2)
     *
     * The output is not meant to be parsed back.
     */
    std::string render_human_readable(const Entries &entries);

}

#endif

// vim:ts=4 sts=4 sw=4 et
