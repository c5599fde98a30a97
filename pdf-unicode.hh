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

#ifndef PDFTOCIO_PDF_UNICODE_HH
#define PDFTOCIO_PDF_UNICODE_HH

#include <ostream>
#include <string>
#include <vector>

#include <CharTypes.h>

#include "pdf-backend.hh"

namespace pdf
{

/* Unicode → UTF-8 conversion
 * ==========================
 */

    void write_as_utf8(std::ostream &stream, Unicode unicode_char);
    std::string unicode_as_utf8(const std::vector<Unicode> &);

    /* Decode a PDF text string (PDFDocEncoding or UTF-16BE with BOM). */
    std::string string_as_utf8(const pdf::String *);
    std::string string_as_utf8(pdf::Object &);

/* UTF-8 → Unicode conversion
 * ==========================
 */

    /* Stands for a malformed UTF-8 sequence. Never a valid code point. */
    const Unicode bad_unicode = 0xFFFFFFFFU;

    std::vector<Unicode> utf8_as_unicode(const std::string &);

/* Unicode → PDF text string conversion
 * ====================================
 */

    /* Return false if the character has no PDFDocEncoding representation. */
    bool unicode_as_pdfdoc(Unicode unicode_char, char &byte);

    /* UTF-16BE with a byte order mark. */
    std::string unicode_as_utf16be(const std::vector<Unicode> &);

}

#endif

// vim:ts=4 sts=4 sw=4 et
