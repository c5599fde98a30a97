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

#ifndef PDFTOCIO_TOC_OUTLINE_HH
#define PDFTOCIO_TOC_OUTLINE_HH

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace toc
{

    class OutlineNode;

    class OutlineBase
    {
    public:
        virtual OutlineNode& add(const std::string &title, int page) = 0;
        virtual const std::vector<OutlineNode>& get_children() const = 0;
        OutlineBase() = default;
        OutlineBase(const OutlineBase &) = default;
        OutlineBase& operator=(const OutlineBase &) = default;
        virtual ~OutlineBase()
        { }
    };

    /* A node of the document outline. The node owns its children; the tree
     * is only ever grown by add(), so it cannot contain cycles.
     */
    class OutlineNode
    : public OutlineBase
    {
    public:
        OutlineNode(const std::string &title, int page)
        : title(title),
          page(page),
          has_top_offset(false),
          top_offset(0.0)
        { }
        std::string title;
        int page;
        bool has_top_offset;
        double top_offset;
        void set_top_offset(double value)
        {
            this->has_top_offset = true;
            this->top_offset = value;
        }
        OutlineNode& add(const std::string &title, int page);
        const std::vector<OutlineNode>& get_children() const
        {
            return this->children;
        }
        size_t size() const;
    private:
        std::vector<OutlineNode> children;
    };

    /* The implicit root: the sequence of top-level nodes. */
    class Outline
    : public OutlineBase
    {
    private:
        std::vector<OutlineNode> items;
    public:
        OutlineNode& add(const std::string &title, int page);
        const std::vector<OutlineNode>& get_children() const
        {
            return this->items;
        }
        size_t size() const;
        operator bool() const;
    };

    bool operator==(const OutlineNode &, const OutlineNode &);
    bool operator!=(const OutlineNode &, const OutlineNode &);
    bool operator==(const Outline &, const Outline &);
    bool operator!=(const Outline &, const Outline &);

    std::ostream &operator<<(std::ostream &, const OutlineNode &);
    std::ostream &operator<<(std::ostream &, const Outline &);

}

#endif

// vim:ts=4 sts=4 sw=4 et
