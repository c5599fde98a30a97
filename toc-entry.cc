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

#include "toc-entry.hh"

bool toc::is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

bool toc::is_blank(const std::string &s)
{
    for (char c : s)
        if (!toc::is_space(c))
            return false;
    return true;
}

bool toc::operator==(const toc::Entry &e1, const toc::Entry &e2)
{
    if (e1.title != e2.title || e1.level != e2.level || e1.page != e2.page)
        return false;
    if (e1.has_top_offset != e2.has_top_offset)
        return false;
    return !e1.has_top_offset || e1.top_offset == e2.top_offset;
}

bool toc::operator!=(const toc::Entry &e1, const toc::Entry &e2)
{
    return !(e1 == e2);
}

std::ostream &toc::operator<<(std::ostream &stream, const toc::Entry &entry)
{
    stream << "(\"" << entry.title << "\", level=" << entry.level << ", page=" << entry.page;
    if (entry.has_top_offset)
        stream << ", top=" << entry.top_offset;
    return stream << ")";
}

// vim:ts=4 sts=4 sw=4 et
