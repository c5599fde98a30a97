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

#ifndef PDFTOCIO_TOC_FORMAT_HH
#define PDFTOCIO_TOC_FORMAT_HH

namespace toc
{
  namespace format
  {
    /* One indentation unit per nesting level below the top one. */
    static const char indent = '\t';

    /* Separates the title, the page number and the optional top offset. */
    static const char separator = '|';

    /* Recognized escape sequences:
     *   \|  separator
     *   \\  backslash
     *   \t  tab
     *   \n  line feed
     *   \r  carriage return
     *   \v  vertical tab
     *   \f  form feed
     *   \   (backslash, space) space; only needed for a leading space
     */
    static const char escape = '\\';

    static const char utf8_bom[] = "\xEF\xBB\xBF";
  }
}

#endif

// vim:ts=2 sts=2 sw=2 et
