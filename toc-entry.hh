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

#ifndef PDFTOCIO_TOC_ENTRY_HH
#define PDFTOCIO_TOC_ENTRY_HH

#include <ostream>
#include <string>
#include <vector>

namespace toc
{

    class Entry
    {
    public:
        std::string title;
        int level;
        int page;
        bool has_top_offset;
        double top_offset; // points below the top edge of the page
        Entry(const std::string &title, int level, int page)
        : title(title),
          level(level),
          page(page),
          has_top_offset(false),
          top_offset(0.0)
        { }
        Entry(const std::string &title, int level, int page, double top_offset)
        : title(title),
          level(level),
          page(page),
          has_top_offset(true),
          top_offset(top_offset)
        { }
    };

    typedef std::vector<Entry> Entries;

    /* ASCII whitespace, as recognized in ToC text. */
    bool is_space(char c);

    /* True if the title would be empty after trimming whitespace. */
    bool is_blank(const std::string &s);

    bool operator==(const Entry &, const Entry &);
    bool operator!=(const Entry &, const Entry &);
    std::ostream &operator<<(std::ostream &, const Entry &);

}

#endif

// vim:ts=4 sts=4 sw=4 et
