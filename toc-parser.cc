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

#include "toc-parser.hh"

#include <climits>
#include <cmath>
#include <cstddef>
#include <locale>
#include <sstream>

#include "i18n.hh"
#include "toc-error.hh"
#include "toc-format.hh"

static std::string strip(const std::string &s)
{
    size_t l = 0;
    size_t r = s.length();
    while (l < r && toc::is_space(s[l]))
        l++;
    while (r > l && toc::is_space(s[r - 1]))
        r--;
    return s.substr(l, r - l);
}

std::string toc::unescape_title(const std::string &s, size_t line)
{
    std::string result;
    result.reserve(s.length());
    for (size_t i = 0; i < s.length(); i++) {
        char c = s[i];
        if (c != toc::format::escape) {
            result += c;
            continue;
        }
        if (++i == s.length())
            throw toc::FormatError("bad escape sequence", line);
        switch (s[i]) {
        case toc::format::escape:
        case toc::format::separator:
        case ' ':
            result += s[i];
            break;
        case 't':
            result += '\t';
            break;
        case 'n':
            result += '\n';
            break;
        case 'r':
            result += '\r';
            break;
        case 'v':
            result += '\v';
            break;
        case 'f':
            result += '\f';
            break;
        default:
            throw toc::FormatError("bad escape sequence", line);
        }
    }
    return result;
}

/* Split the line at unescaped separators. Escape sequences are kept
 * verbatim; only the title field may contain them.
 */
static std::vector<std::string> split_fields(const std::string &s, size_t line)
{
    std::vector<std::string> fields;
    size_t lpos = 0;
    for (size_t i = 0; i < s.length(); i++) {
        if (s[i] == toc::format::escape) {
            i++;
            continue;
        }
        if (s[i] == toc::format::separator) {
            fields.push_back(s.substr(lpos, i - lpos));
            lpos = i + 1;
        }
    }
    fields.push_back(s.substr(lpos));
    if (fields.size() < 2)
        throw toc::FormatError("missing page number", line);
    if (fields.size() > 3)
        throw toc::FormatError("too many fields", line);
    return fields;
}

static int parse_page(const std::string &field, size_t line)
{
    std::string s = strip(field);
    if (s.empty())
        throw toc::FormatError("bad page number", line);
    long value = 0;
    for (char c : s) {
        if (c < '0' || c > '9')
            throw toc::FormatError("bad page number", line);
        value = value * 10 + (c - '0');
        if (value > INT_MAX)
            throw toc::FormatError("bad page number", line);
    }
    if (value < 1)
        throw toc::FormatError("bad page number", line);
    return static_cast<int>(value);
}

static double parse_top_offset(const std::string &field, size_t line)
{
    std::string s = strip(field);
    double value;
    std::istringstream stream(s);
    stream.imbue(std::locale::classic());
    stream >> value;
    if (s.empty() || stream.fail() || !stream.eof())
        throw toc::FormatError("bad top offset", line);
    if (!std::isfinite(value) || value < 0)
        throw toc::FormatError("bad top offset", line);
    if (value == 0)
        /* no negative zero */
        value = 0.0;
    return value;
}

toc::Entries toc::parse(const std::vector<std::string> &lines)
{
    toc::Entries entries;
    int prev_level = 0;
    for (size_t i = 0; i < lines.size(); i++) {
        size_t lineno = i + 1;
        std::string line = lines[i];
        if (i == 0 && line.compare(0, sizeof toc::format::utf8_bom - 1, toc::format::utf8_bom) == 0)
            line.erase(0, sizeof toc::format::utf8_bom - 1);
        if (!line.empty() && line[line.length() - 1] == '\r')
            line.erase(line.length() - 1);
        if (toc::is_blank(line))
            continue;
        size_t indent = line.find_first_not_of(toc::format::indent);
        if (toc::is_space(line[indent]))
            throw toc::FormatError("bad indentation", lineno);
        int level = static_cast<int>(indent) + 1;
        if (prev_level == 0 && level != 1)
            throw toc::FormatError("first entry must be top-level", lineno);
        if (prev_level > 0 && level > prev_level + 1)
            throw toc::FormatError("skipped indentation level", lineno);
        std::vector<std::string> fields = split_fields(line.substr(indent), lineno);
        std::string title = toc::unescape_title(fields[0], lineno);
        if (toc::is_blank(title))
            throw toc::FormatError("empty title", lineno);
        int page = parse_page(fields[1], lineno);
        if (fields.size() == 3)
            entries.push_back(toc::Entry(title, level, page, parse_top_offset(fields[2], lineno)));
        else
            entries.push_back(toc::Entry(title, level, page));
        prev_level = level;
    }
    return entries;
}

toc::Entries toc::parse(std::istream &stream)
{
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(stream, line))
        lines.push_back(line);
    if (stream.bad())
        throw toc::IOError(_("Unable to read the table of contents"));
    return toc::parse(lines);
}

// vim:ts=4 sts=4 sw=4 et
