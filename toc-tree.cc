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

#include "toc-tree.hh"

#include <utility>
#include <vector>

#include "toc-error.hh"

static void flatten(const std::vector<toc::OutlineNode> &nodes, int level, toc::Entries &entries)
{
    for (const toc::OutlineNode &node : nodes) {
        if (node.has_top_offset)
            entries.push_back(toc::Entry(node.title, level, node.page, node.top_offset));
        else
            entries.push_back(toc::Entry(node.title, level, node.page));
        flatten(node.get_children(), level + 1, entries);
    }
}

toc::Entries toc::flatten(const toc::Outline &outline)
{
    toc::Entries entries;
    ::flatten(outline.get_children(), 1, entries);
    return entries;
}

toc::Outline toc::build(const toc::Entries &entries, int page_count)
{
    toc::Outline outline;
    /* Currently open ancestors, innermost last. The root sits at level 0
     * and is never popped.
     *
     * The pointers stay valid: a node's sibling vector only grows after the
     * node itself has been popped.
     */
    std::vector<std::pair<int, toc::OutlineBase*>> stack;
    stack.push_back(std::make_pair(0, &outline));
    for (const toc::Entry &entry : entries) {
        if (entry.page < 1 || entry.page > page_count)
            throw toc::RangeError(entry.title, entry.page, page_count);
        if (entry.level < 1)
            throw toc::FormatError("skipped indentation level", entry.title);
        while (stack.back().first >= entry.level)
            stack.pop_back();
        if (stack.back().first != entry.level - 1)
            throw toc::FormatError("skipped indentation level", entry.title);
        toc::OutlineNode &node = stack.back().second->add(entry.title, entry.page);
        if (entry.has_top_offset)
            node.set_top_offset(entry.top_offset);
        stack.push_back(std::make_pair(entry.level, &node));
    }
    return outline;
}

// vim:ts=4 sts=4 sw=4 et
