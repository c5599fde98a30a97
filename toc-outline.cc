/* Copyright © 2015-2022 Jakub Wilk <jwilk@jwilk.net>
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

#include "toc-outline.hh"

toc::OutlineNode& toc::OutlineNode::add(const std::string &title, int page)
{
    this->children.push_back(toc::OutlineNode(title, page));
    return this->children.back();
}

toc::OutlineNode& toc::Outline::add(const std::string &title, int page)
{
    this->items.push_back(toc::OutlineNode(title, page));
    return this->items.back();
}

size_t toc::OutlineNode::size() const
{
    size_t size = 1;
    for (const toc::OutlineNode &child : this->children)
        size += child.size();
    return size;
}

size_t toc::Outline::size() const
{
    size_t size = 0;
    for (const toc::OutlineNode &item : this->items)
        size += item.size();
    return size;
}

toc::Outline::operator bool() const
{
    return this->items.size() > 0;
}

bool toc::operator==(const toc::OutlineNode &node1, const toc::OutlineNode &node2)
{
    if (node1.title != node2.title || node1.page != node2.page)
        return false;
    if (node1.has_top_offset != node2.has_top_offset)
        return false;
    if (node1.has_top_offset && node1.top_offset != node2.top_offset)
        return false;
    return node1.get_children() == node2.get_children();
}

bool toc::operator!=(const toc::OutlineNode &node1, const toc::OutlineNode &node2)
{
    return !(node1 == node2);
}

bool toc::operator==(const toc::Outline &outline1, const toc::Outline &outline2)
{
    return outline1.get_children() == outline2.get_children();
}

bool toc::operator!=(const toc::Outline &outline1, const toc::Outline &outline2)
{
    return !(outline1 == outline2);
}

std::ostream& toc::operator<<(std::ostream &stream, const toc::OutlineNode &node)
{
    stream << "(\"" << node.title << "\" " << node.page;
    if (node.has_top_offset)
        stream << " @" << node.top_offset;
    for (const toc::OutlineNode &child : node.get_children())
        stream << " " << child;
    return stream << ")";
}

std::ostream& toc::operator<<(std::ostream &stream, const toc::Outline &outline)
{
    stream << "(outline";
    for (const toc::OutlineNode &item : outline.get_children())
        stream << " " << item;
    return stream << ")";
}

// vim:ts=4 sts=4 sw=4 et
