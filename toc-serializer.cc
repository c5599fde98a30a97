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

#include "toc-serializer.hh"

#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

#include "toc-format.hh"

static void check_level(const toc::Entry &entry)
{
    if (entry.level < 1)
        throw std::invalid_argument("toc::serialize(): level < 1");
}

std::string toc::escape_title(const std::string &title)
{
    std::string result;
    result.reserve(title.length());
    for (size_t i = 0; i < title.length(); i++) {
        char c = title[i];
        switch (c) {
        case toc::format::escape:
        case toc::format::separator:
            result += toc::format::escape;
            result += c;
            break;
        case '\t':
            result += toc::format::escape;
            result += 't';
            break;
        case '\n':
            result += toc::format::escape;
            result += 'n';
            break;
        case '\r':
            result += toc::format::escape;
            result += 'r';
            break;
        case '\v':
            result += toc::format::escape;
            result += 'v';
            break;
        case '\f':
            result += toc::format::escape;
            result += 'f';
            break;
        case ' ':
            /* A leading space would read back as bad indentation. */
            if (i == 0)
                result += toc::format::escape;
            result += c;
            break;
        default:
            result += c;
        }
    }
    return result;
}

static double read_double(const std::string &s)
{
    double value = 0;
    std::istringstream stream(s);
    stream.imbue(std::locale::classic());
    stream >> value;
    return value;
}

std::string toc::format_top_offset(double offset)
{
    std::ostringstream stream;
    stream.imbue(std::locale::classic());
    stream << std::setprecision(15) << offset;
    if (read_double(stream.str()) == offset)
        return stream.str();
    stream.str("");
    stream << std::setprecision(17) << offset;
    return stream.str();
}

void toc::serialize(std::ostream &stream, const toc::Entries &entries)
{
    for (const toc::Entry &entry : entries) {
        check_level(entry);
        stream
            << std::string(entry.level - 1, toc::format::indent)
            << toc::escape_title(entry.title)
            << toc::format::separator
            << entry.page;
        if (entry.has_top_offset)
            stream << toc::format::separator << toc::format_top_offset(entry.top_offset);
        stream << '\n';
    }
}

std::string toc::serialize(const toc::Entries &entries)
{
    std::ostringstream stream;
    stream.imbue(std::locale::classic());
    toc::serialize(stream, entries);
    return stream.str();
}

static std::string display_title(const std::string &title)
{
    std::string result(title);
    for (char &c : result)
        if ((c >= 0 && c < 0x20) || c == 0x7F)
            c = ' ';
    return result;
}

std::string toc::render_human_readable(const toc::Entries &entries)
{
    std::ostringstream stream;
    stream.imbue(std::locale::classic());
    for (const toc::Entry &entry : entries) {
        check_level(entry);
        stream
            << std::string(2 * (entry.level - 1), ' ')
            << "- "
            << display_title(entry.title)
            << " (" << entry.page << ")"
            << '\n';
    }
    return stream.str();
}

// vim:ts=4 sts=4 sw=4 et
