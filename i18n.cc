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

#include "i18n.hh"

#include <clocale>

#include "paths.hh"

void i18n::setup()
{
#ifdef ENABLE_NLS
  std::setlocale(LC_ALL, "");
  /* Numbers in PDF files and in the table of contents are never localized. */
  std::setlocale(LC_NUMERIC, "C");
  bindtextdomain(PACKAGE_NAME, paths::localedir);
  textdomain(PACKAGE_NAME);
#else
  std::setlocale(LC_CTYPE, "");
#endif
  /* Failures leave the "C" locale in place; nothing else to do. */
}

// vim:ts=2 sts=2 sw=2 et
