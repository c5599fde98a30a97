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

#include "pdf-outline.hh"

#include <memory>
#include <utility>

#include "i18n.hh"
#include "pdf-unicode.hh"
#include "toc-charset.hh"
#include "toc-entry.hh"

class NoLinkDestination : public std::runtime_error
{
public:
  NoLinkDestination()
  : std::runtime_error(_("Cannot find link destination"))
  { }
};

static std::unique_ptr<pdf::link::Destination> get_destination(const pdf::link::GoTo *goto_link, pdf::Catalog *catalog)
{
  std::unique_ptr<pdf::link::Destination> dest;
  const pdf::link::Destination *orig_dest = goto_link->getDest();
  if (orig_dest == nullptr)
    dest = catalog->findDest(goto_link->getNamedDest());
  else
    dest.reset(new pdf::link::Destination(*orig_dest));
  if (dest.get() == nullptr)
    throw NoLinkDestination();
  return dest;
}

static int get_page(const pdf::link::Destination &dest, pdf::Catalog *catalog)
{
  if (dest.isPageRef())
  {
    pdf::Ref pageref = dest.getPageRef();
    return pdf::find_page(catalog, pageref);
  }
  else
    return dest.getPageNum();
}

static const int pdf_outline_max_depth = 0x100;

void pdf::OutlineStore::read_items(pdf::Object *node, toc::OutlineBase &outline, int depth,
  std::set<std::pair<int, int>> &seen)
{
  if (depth > pdf_outline_max_depth)
  {
    /* Very deep outlines are almost certainly broken,
     * and would exhaust the stack. */
    this->warning_log.warning(_("Document outline too deep; skipping nested items"));
    return;
  }
  pdf::Catalog *catalog = this->document.getCatalog();
  pdf::Object current_ref, current, next_ref, next;
  pdf::dict_lookup_nf(*node, "First", &current_ref);
  pdf::dict_lookup(node, "First", &current);
  while (current.isDict())
  {
    if (current_ref.isRef())
    {
      pdf::Ref ref = current_ref.getRef();
      if (!seen.insert(std::make_pair(ref.num, ref.gen)).second)
      {
        this->warning_log.warning(_("Loop in document outline"));
        break;
      }
    }
    try
    {
      std::string title_str;
      {
        pdf::Object title;
        if (!pdf::dict_lookup(current, "Title", &title)->isString())
          throw NoTitleForBookmark();
        title_str = pdf::string_as_utf8(title);
        if (toc::is_blank(title_str))
          throw NoTitleForBookmark();
      }

      int page;
      std::unique_ptr<pdf::link::Destination> dest;
      {
        pdf::Object destination;
        std::unique_ptr<pdf::link::Action> link_action;
        if (!pdf::dict_lookup(current, "Dest", &destination)->isNull())
          link_action = pdf::link::Action::parseDest(&destination);
        else if (!pdf::dict_lookup(current, "A", &destination)->isNull())
          link_action = pdf::link::Action::parseAction(&destination);
        else
          throw NoPageForBookmark();
        if (link_action.get() == nullptr || link_action->getKind() != actionGoTo)
          throw NoPageForBookmark();
        try
        {
          dest = get_destination(
            dynamic_cast<pdf::link::GoTo*>(link_action.get()),
            catalog
          );
        }
        catch (const NoLinkDestination &)
        {
          throw NoPageForBookmark();
        }
        page = get_page(*dest, catalog);
        if (page < 1 || page > this->document.get_page_count())
          throw NoPageForBookmark();
      }
      {
        toc::OutlineNode &item = outline.add(title_str, page);
        switch (dest->getKind())
        {
        case destXYZ:
        case destFitH:
        case destFitBH:
          if (dest->getChangeTop())
          {
            double offset = this->document.get_page_top(page) - dest->getTop();
            item.set_top_offset(offset > 0 ? offset : 0.0);
          }
          break;
        default:
          break;
        }
        this->read_items(&current, item, depth + 1, seen);
      }
    }
    catch (const BookmarkError &ex)
    {
      this->warning_log.warning(ex.what());
    }

    pdf::dict_lookup_nf(current, "Next", &next_ref);
    pdf::dict_lookup(current, "Next", &next);
    current_ref = std::move(next_ref);
    current = std::move(next);
  }
}

int pdf::OutlineStore::page_count()
{
  return this->document.get_page_count();
}

toc::Outline pdf::OutlineStore::get_outline()
{
  toc::Outline outline;
  pdf::Object *pdf_outline = this->document.getCatalog()->getOutline();
  if (!pdf_outline->isDict())
    return outline;
  std::set<std::pair<int, int>> seen;
  this->read_items(pdf_outline, outline, 0, seen);
  return outline;
}

static void make_tree_nodes(const std::vector<toc::OutlineNode> &nodes, const toc::WriteOptions &options,
  std::vector<pdf::outline::TreeNode> &result)
{
  for (const toc::OutlineNode &node : nodes)
  {
    pdf::outline::TreeNode tree_node;
    tree_node.title = toc::charset::encode(node.title, options.target(node.title));
    tree_node.destPageNum = node.page;
    make_tree_nodes(node.get_children(), options, tree_node.children);
    result.push_back(std::move(tree_node));
  }
}

/* Outline::setOutline() makes every item point to its page with /Fit.
 * Items with a top offset get [page /XYZ null top null] instead.
 */
void pdf::OutlineStore::set_destinations(pdf::Object *node, const std::vector<toc::OutlineNode> &nodes)
{
  pdf::Catalog *catalog = this->document.getCatalog();
  pdf::XRef *xref = this->document.getXRef();
  pdf::Object current_ref, next_ref;
  pdf::dict_lookup_nf(*node, "First", &current_ref);
  for (const toc::OutlineNode &toc_node : nodes)
  {
    if (!current_ref.isRef())
      throw toc::IOError(_("Unable to update the document outline"));
    pdf::Ref ref = current_ref.getRef();
    pdf::Object current = xref->fetch(ref);
    if (!current.isDict())
      throw toc::IOError(_("Unable to update the document outline"));
    if (toc_node.has_top_offset)
    {
      pdf::Array *dest = new pdf::Array(xref);
      pdf::Ref *page_ref = catalog->getPageRef(toc_node.page);
      if (page_ref != nullptr)
        dest->add(pdf::Object(*page_ref));
      else
        dest->add(pdf::Object(toc_node.page - 1));
      dest->add(pdf::Object(objName, "XYZ"));
      dest->add(pdf::Object(objNull));
      dest->add(pdf::Object(this->document.get_page_top(toc_node.page) - toc_node.top_offset));
      dest->add(pdf::Object(objNull));
      current.dictSet("Dest", pdf::Object(dest));
      xref->setModifiedObject(&current, ref);
    }
    if (!toc_node.get_children().empty())
      this->set_destinations(&current, toc_node.get_children());
    pdf::dict_lookup_nf(current, "Next", &next_ref);
    current_ref = std::move(next_ref);
  }
}

void pdf::OutlineStore::set_outline(const toc::Outline &outline, const toc::WriteOptions &options)
{
  std::vector<pdf::outline::TreeNode> tree;
  /* Encode everything first, so that the document is not touched if a
   * title cannot be encoded. */
  make_tree_nodes(outline.get_children(), options, tree);
  pdf::outline::Outline *pdf_outline = this->document.getOutline();
  pdf_outline->setOutline(tree);
  pdf::Object *outlines = this->document.getCatalog()->getOutline();
  if (outlines->isDict())
    this->set_destinations(outlines, outline.get_children());
}

// vim:ts=2 sts=2 sw=2 et
