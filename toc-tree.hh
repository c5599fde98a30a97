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

#ifndef PDFTOCIO_TOC_TREE_HH
#define PDFTOCIO_TOC_TREE_HH

#include "toc-entry.hh"
#include "toc-outline.hh"

namespace toc
{

    /* Pre-order walk; a node at depth d becomes an entry of level d + 1. */
    Entries flatten(const Outline &outline);

    /* Build a fresh outline tree from leveled entries.
     *
     * Throws toc::RangeError if a page lies outside [1, page_count], and
     * toc::FormatError if a level is less than 1 or more than one deeper
     * than the preceding entry. Nothing is returned on failure.
     */
    Outline build(const Entries &entries, int page_count);

}

#endif

// vim:ts=4 sts=4 sw=4 et
