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

#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "toc-error.hh"
#include "toc-parser.hh"
#include "toc-tree.hh"

using toc::Entry;
using toc::Entries;

static Entries parse(const std::string &text)
{
  std::istringstream stream(text);
  return toc::parse(stream);
}

static std::string show(const toc::Outline &outline)
{
  std::ostringstream stream;
  stream << outline;
  return stream.str();
}

TEST(Build, NestedEntries)
{
  toc::Outline outline = toc::build(parse("Chapter 1|1\n\tSection 1.1|2\nChapter 2|5\n"), 10);
  ASSERT_EQ(2U, outline.get_children().size());
  const toc::OutlineNode &chapter1 = outline.get_children()[0];
  EXPECT_EQ("Chapter 1", chapter1.title);
  EXPECT_EQ(1, chapter1.page);
  ASSERT_EQ(1U, chapter1.get_children().size());
  EXPECT_EQ("Section 1.1", chapter1.get_children()[0].title);
  EXPECT_EQ(2, chapter1.get_children()[0].page);
  EXPECT_TRUE(outline.get_children()[1].get_children().empty());
  EXPECT_EQ(3U, outline.size());
}

TEST(Build, Shape)
{
  toc::Outline outline = toc::build(parse("A|1\n\tB|2\n\t\tC|3\n\tD|4|20\nE|5\n"), 5);
  EXPECT_EQ("(outline (\"A\" 1 (\"B\" 2 (\"C\" 3)) (\"D\" 4 @20)) (\"E\" 5))", show(outline));
}

TEST(Build, Empty)
{
  toc::Outline outline = toc::build(Entries(), 0);
  EXPECT_FALSE(outline);
  EXPECT_EQ(0U, outline.size());
}

TEST(Build, ManySiblings)
{
  /* Sibling vectors reallocate while growing. */
  Entries entries;
  entries.push_back(Entry("root", 1, 1));
  for (int i = 0; i < 100; i++)
  {
    entries.push_back(Entry("child", 2, 1));
    entries.push_back(Entry("grandchild", 3, 1));
  }
  toc::Outline outline = toc::build(entries, 1);
  ASSERT_EQ(1U, outline.get_children().size());
  EXPECT_EQ(100U, outline.get_children()[0].get_children().size());
  EXPECT_EQ(201U, outline.size());
}

TEST(Build, PageOutOfRange)
{
  Entries entries;
  entries.push_back(Entry("A", 1, 1));
  entries.push_back(Entry("B", 1, 11));
  try
  {
    toc::build(entries, 10);
    FAIL() << "no exception";
  }
  catch (const toc::RangeError &ex)
  {
    EXPECT_EQ(toc::Error::RANGE, ex.kind());
    EXPECT_EQ("B", ex.get_title());
    EXPECT_EQ(11, ex.get_page());
    EXPECT_EQ(10, ex.get_page_count());
  }
}

TEST(Build, PageZeroOrNegative)
{
  Entries entries;
  entries.push_back(Entry("A", 1, 0));
  EXPECT_THROW(toc::build(entries, 10), toc::RangeError);
  entries[0].page = -3;
  EXPECT_THROW(toc::build(entries, 10), toc::RangeError);
  entries[0].page = 10;
  EXPECT_NO_THROW(toc::build(entries, 10));
}

TEST(Build, EmptyDocument)
{
  Entries entries;
  entries.push_back(Entry("A", 1, 1));
  EXPECT_THROW(toc::build(entries, 0), toc::RangeError);
}

TEST(Build, SkippedLevel)
{
  Entries entries;
  entries.push_back(Entry("A", 1, 1));
  entries.push_back(Entry("B", 3, 2));
  try
  {
    toc::build(entries, 10);
    FAIL() << "no exception";
  }
  catch (const toc::FormatError &ex)
  {
    EXPECT_EQ("skipped indentation level", ex.get_reason());
    EXPECT_EQ("B", ex.get_title());
    EXPECT_EQ(0U, ex.get_line());
  }
}

TEST(Build, FirstEntryNotTopLevel)
{
  Entries entries;
  entries.push_back(Entry("A", 2, 1));
  EXPECT_THROW(toc::build(entries, 10), toc::FormatError);
}

TEST(Build, LevelBelowOne)
{
  Entries entries;
  entries.push_back(Entry("A", 1, 1));
  entries.push_back(Entry("B", 0, 1));
  EXPECT_THROW(toc::build(entries, 10), toc::FormatError);
}

TEST(Flatten, PreOrder)
{
  toc::Outline outline;
  toc::OutlineNode &a = outline.add("A", 1);
  toc::OutlineNode &b = a.add("B", 2);
  b.add("C", 3);
  a.add("D", 4).set_top_offset(20.0);
  outline.add("E", 5);
  Entries expected;
  expected.push_back(Entry("A", 1, 1));
  expected.push_back(Entry("B", 2, 2));
  expected.push_back(Entry("C", 3, 3));
  expected.push_back(Entry("D", 2, 4, 20.0));
  expected.push_back(Entry("E", 1, 5));
  EXPECT_EQ(expected, toc::flatten(outline));
}

TEST(Flatten, Empty)
{
  EXPECT_TRUE(toc::flatten(toc::Outline()).empty());
}

TEST(Flatten, RoundTrip)
{
  Entries entries = parse("A|1\n\tB|2\n\t\tC|3|7.5\n\t\t\tD|4\n\tE|5\nF|6\n\tG|7\n");
  toc::Outline outline = toc::build(entries, 7);
  EXPECT_EQ(entries, toc::flatten(outline));
  EXPECT_EQ(outline, toc::build(toc::flatten(outline), 7));
}

TEST(Outline, Equality)
{
  toc::Outline outline1;
  outline1.add("A", 1).add("B", 2);
  toc::Outline outline2;
  outline2.add("A", 1).add("B", 2);
  EXPECT_EQ(outline1, outline2);
  outline2.add("C", 3);
  EXPECT_NE(outline1, outline2);
}

// vim:ts=2 sts=2 sw=2 et
