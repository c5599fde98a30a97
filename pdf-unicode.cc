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

#include "pdf-unicode.hh"

#include <cstddef>
#include <cstdint>
#include <map>
#include <sstream>

#include "autoconf.hh"

#include <CharTypes.h>
#include <PDFDocEncoding.h>
#include <UnicodeMapFuncs.h>

/* Unicode → UTF-8 conversion
 * ==========================
 */

void pdf::write_as_utf8(std::ostream &stream, Unicode unicode_char)
{
    char buffer[8];
    int seqlen = mapUTF8(unicode_char, buffer, sizeof buffer);
    stream.write(buffer, seqlen);
}

std::string pdf::unicode_as_utf8(const std::vector<Unicode> &unistr)
{
    std::ostringstream stream;
    for (Unicode unicode_char : unistr)
        write_as_utf8(stream, unicode_char);
    return stream.str();
}

std::string pdf::string_as_utf8(const pdf::String *string)
{
    /* See
     * https://unicode.org/faq/utf_bom.html
     * for description of both UTF-16 and UTF-8.
     */
    const static uint32_t replacement_character = 0xFFFD;
    const char *cstring = pdf::get_c_string(string);
    size_t clength = string->getLength();
    std::ostringstream stream;
    if (clength >= 2 && (cstring[0] & 0xFF) == 0xFE && (cstring[1] & 0xFF) == 0xFF) {
        /* UTF-16-BE Byte Order Mark */
        uint32_t code, code_shift = 0;
        for (size_t i = 2; i < clength; i += 2) {
            if (i + 1 < clength)
                code = ((cstring[i] & 0xFF) << 8) + (cstring[i + 1] & 0xFF);
            else {
                /* lone byte */
                code = replacement_character;
            }
            if (code_shift) {
                if (code >= 0xDC00 && code < 0xE000) {
                    /* trailing surrogate */
                    code = code_shift + (code & 0x3FF);
                    if (code >= 0x110000)
                        code = replacement_character;
                } else {
                    /* unpaired surrogate */
                    code = replacement_character;
                }
                code_shift = 0;
            } else if (code >= 0xD800 && code < 0xDC00) {
                /* leading surrogate */
                code_shift = 0x10000 + ((code & 0x3FF) << 10);
                continue;
            } else if (code >= 0xDC00 && code < 0xE000) {
                /* unpaired trailing surrogate */
                code = replacement_character;
            }
            write_as_utf8(stream, code);
        }
    } else {
        /* PDFDoc encoding */
        for (size_t i = 0; i < clength; i++) {
            Unicode code = pdfDocEncoding[cstring[i] & 0xFF];
            if (code == 0 && (cstring[i] & 0xFF) != 0)
                code = replacement_character;
            write_as_utf8(stream, code);
        }
    }
    return stream.str();
}

std::string pdf::string_as_utf8(pdf::Object &object)
{
    return pdf::string_as_utf8(object.getString());
}

/* UTF-8 → Unicode conversion
 * ==========================
 */

std::vector<Unicode> pdf::utf8_as_unicode(const std::string &string)
{
    std::vector<Unicode> result;
    size_t length = string.length();
    size_t i = 0;
    while (i < length) {
        uint32_t code = string[i] & 0xFF;
        uint32_t min_code;
        size_t nbytes;
        if (code < 0x80) {
            result.push_back(code);
            i++;
            continue;
        } else if ((code & 0xE0) == 0xC0) {
            nbytes = 2;
            min_code = 0x80;
            code &= 0x1F;
        } else if ((code & 0xF0) == 0xE0) {
            nbytes = 3;
            min_code = 0x800;
            code &= 0x0F;
        } else if ((code & 0xF8) == 0xF0) {
            nbytes = 4;
            min_code = 0x10000;
            code &= 0x07;
        } else {
            /* stray continuation byte, or invalid lead byte */
            result.push_back(bad_unicode);
            i++;
            continue;
        }
        size_t j;
        for (j = 1; j < nbytes && i + j < length; j++) {
            uint32_t byte = string[i + j] & 0xFF;
            if ((byte & 0xC0) != 0x80)
                break;
            code = (code << 6) | (byte & 0x3F);
        }
        if (j < nbytes)
            /* truncated sequence */
            result.push_back(bad_unicode);
        else if (code < min_code || code >= 0x110000 || (code >= 0xD800 && code < 0xE000))
            /* overlong form, out of range, or surrogate */
            result.push_back(bad_unicode);
        else
            result.push_back(code);
        i += j;
    }
    return result;
}

/* Unicode → PDF text string conversion
 * ====================================
 */

typedef std::map<Unicode, char> PDFDocMap;

static PDFDocMap make_pdfdoc_map()
{
    PDFDocMap map;
    /* Code 0 is left out: a NUL byte is not a usable title character. */
    for (int byte = 1; byte < 0x100; byte++) {
        Unicode code = pdfDocEncoding[byte];
        if (code == 0)
            /* undefined in PDFDocEncoding */
            continue;
        map.insert(PDFDocMap::value_type(code, static_cast<char>(byte)));
    }
    return map;
}

bool pdf::unicode_as_pdfdoc(Unicode unicode_char, char &byte)
{
    static const PDFDocMap map = make_pdfdoc_map();
    PDFDocMap::const_iterator it = map.find(unicode_char);
    if (it == map.end())
        return false;
    byte = it->second;
    return true;
}

std::string pdf::unicode_as_utf16be(const std::vector<Unicode> &unistr)
{
    std::string result("\xFE\xFF", 2);
    for (Unicode code : unistr) {
        if (code >= 0x10000) {
            code -= 0x10000;
            uint32_t lead = 0xD800 + (code >> 10);
            uint32_t trail = 0xDC00 + (code & 0x3FF);
            result += static_cast<char>(lead >> 8);
            result += static_cast<char>(lead & 0xFF);
            result += static_cast<char>(trail >> 8);
            result += static_cast<char>(trail & 0xFF);
        } else {
            result += static_cast<char>(code >> 8);
            result += static_cast<char>(code & 0xFF);
        }
    }
    return result;
}

// vim:ts=4 sts=4 sw=4 et
