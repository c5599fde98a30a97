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

#ifndef PDFTOCIO_I18N_HH
#define PDFTOCIO_I18N_HH

#include "autoconf.hh"

#ifdef ENABLE_NLS
#include <libintl.h>
#endif

namespace i18n
{
  /* Take the character type (and, with NLS, the message language) from the
   * environment. Numbers in the table of contents never depend on it. */
  void setup();
}

static inline const char * _(const char *message_id)
{
#ifdef ENABLE_NLS
  return gettext(message_id);
#else
  return message_id;
#endif
}

/* Plural-aware variant of _(). */
static inline const char * P_(const char *message_id, const char *message_id_plural, unsigned long int n)
{
#ifdef ENABLE_NLS
  return ngettext(message_id, message_id_plural, n);
#else
  return n == 1 ? message_id : message_id_plural;
#endif
}

#endif

// vim:ts=2 sts=2 sw=2 et
