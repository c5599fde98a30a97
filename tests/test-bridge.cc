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

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "toc-bridge.hh"
#include "toc-charset.hh"
#include "toc-error.hh"
#include "toc-serializer.hh"
#include "toc-tree.hh"

using toc::Entry;
using toc::Entries;

namespace
{

  /* An outline store kept in memory. Titles are checked the way a real
   * document would encode them. */
  class MemoryStore : public toc::OutlineStore
  {
  public:
    int n_pages;
    toc::Outline outline;
    int n_writes;
    explicit MemoryStore(int n_pages)
    : n_pages(n_pages), n_writes(0)
    { }
    int page_count()
    {
      return this->n_pages;
    }
    toc::Outline get_outline()
    {
      return this->outline;
    }
    void set_outline(const toc::Outline &outline, const toc::WriteOptions &options)
    {
      for (const Entry &entry : toc::flatten(outline))
        toc::charset::encode(entry.title, options.target(entry.title));
      this->outline = outline;
      this->n_writes++;
    }
  };

  Entries sample_entries()
  {
    Entries entries;
    entries.push_back(Entry("Chapter 1", 1, 1));
    entries.push_back(Entry("Section 1.1", 2, 2));
    entries.push_back(Entry("Chapter 2", 1, 5));
    return entries;
  }

}

TEST(Bridge, ReadEmptyOutline)
{
  MemoryStore store(3);
  EXPECT_THROW(toc::read_toc(store), toc::EmptyOutline);
}

TEST(Bridge, ReadOutline)
{
  MemoryStore store(10);
  toc::OutlineNode &chapter = store.outline.add("Chapter 1", 1);
  chapter.add("Section 1.1", 2).set_top_offset(144.0);
  store.outline.add("Chapter 2", 5);
  Entries entries = toc::read_toc(store);
  ASSERT_EQ(3U, entries.size());
  EXPECT_EQ(Entry("Section 1.1", 2, 2, 144.0), entries[1]);
  EXPECT_EQ("Chapter 1|1\n\tSection 1.1|2|144\nChapter 2|5\n", toc::serialize(entries));
}

TEST(Bridge, WriteThenRead)
{
  MemoryStore store(10);
  std::vector<toc::EncodingError::Problem> problems =
    toc::write_toc(store, sample_entries(), toc::WriteOptions());
  EXPECT_TRUE(problems.empty());
  EXPECT_EQ(1, store.n_writes);
  EXPECT_EQ(sample_entries(), toc::read_toc(store));
}

TEST(Bridge, WriteReplacesOutline)
{
  MemoryStore store(10);
  store.outline.add("Old", 1).add("Older", 2);
  Entries entries;
  entries.push_back(Entry("New", 1, 3));
  toc::write_toc(store, entries, toc::WriteOptions());
  EXPECT_EQ(entries, toc::read_toc(store));
}

TEST(Bridge, WriteOutOfRangeLeavesStoreUntouched)
{
  MemoryStore store(4);
  store.outline.add("Old", 1);
  toc::Outline before = store.outline;
  EXPECT_THROW(toc::write_toc(store, sample_entries(), toc::WriteOptions()), toc::RangeError);
  EXPECT_EQ(0, store.n_writes);
  EXPECT_EQ(before, store.outline);
}

TEST(Bridge, WriteSkippedLevelLeavesStoreUntouched)
{
  MemoryStore store(10);
  Entries entries;
  entries.push_back(Entry("A", 1, 1));
  entries.push_back(Entry("B", 3, 1));
  EXPECT_THROW(toc::write_toc(store, entries, toc::WriteOptions()), toc::FormatError);
  EXPECT_EQ(0, store.n_writes);
}

TEST(Bridge, EncodingProblemsAreCollected)
{
  MemoryStore store(10);
  Entries entries;
  entries.push_back(Entry("ok", 1, 1));
  entries.push_back(Entry("bad \xFF", 1, 2));
  entries.push_back(Entry("fine", 2, 2));
  entries.push_back(Entry(std::string("nul\0", 4), 1, 3));
  try
  {
    toc::write_toc(store, entries, toc::WriteOptions());
    FAIL() << "no exception";
  }
  catch (const toc::EncodingError &ex)
  {
    const std::vector<toc::EncodingError::Problem> &problems = ex.get_problems();
    ASSERT_EQ(2U, problems.size());
    EXPECT_EQ(1U, problems[0].index);
    EXPECT_EQ(std::vector<size_t>(1, 4), problems[0].positions);
    EXPECT_EQ(3U, problems[1].index);
    EXPECT_EQ(std::vector<size_t>(1, 3), problems[1].positions);
  }
  EXPECT_EQ(0, store.n_writes);
}

TEST(Bridge, ForcedPdfDocEncoding)
{
  MemoryStore store(10);
  Entries entries;
  entries.push_back(Entry("\xE7\xAB\xA0", 1, 1));
  toc::WriteOptions options;
  EXPECT_NO_THROW(toc::write_toc(store, entries, options));
  options.encoding = toc::WriteOptions::ENCODING_PDF_DOC;
  EXPECT_THROW(toc::write_toc(store, entries, options), toc::EncodingError);
  options.encoding = toc::WriteOptions::ENCODING_UTF16;
  EXPECT_NO_THROW(toc::write_toc(store, entries, options));
}

TEST(Bridge, ReplaceUnsupported)
{
  MemoryStore store(10);
  Entries entries;
  entries.push_back(Entry("Chapter \xE7\xAB\xA0", 1, 1));
  entries.push_back(Entry("Plain", 2, 2));
  toc::WriteOptions options;
  options.encoding = toc::WriteOptions::ENCODING_PDF_DOC;
  options.replace_unsupported = true;
  std::vector<toc::EncodingError::Problem> problems = toc::write_toc(store, entries, options);
  ASSERT_EQ(1U, problems.size());
  EXPECT_EQ(0U, problems[0].index);
  Entries written = toc::read_toc(store);
  ASSERT_EQ(2U, written.size());
  EXPECT_EQ("Chapter ?", written[0].title);
  EXPECT_EQ(entries[1], written[1]);
}

TEST(Bridge, CheckTitles)
{
  toc::WriteOptions options;
  EXPECT_TRUE(toc::check_titles(sample_entries(), options).empty());
  Entries entries;
  entries.push_back(Entry("\xE7\xAB\xA0", 1, 1));
  EXPECT_TRUE(toc::check_titles(entries, options).empty());
  options.encoding = toc::WriteOptions::ENCODING_PDF_DOC;
  EXPECT_EQ(1U, toc::check_titles(entries, options).size());
}

TEST(WriteOptions, Target)
{
  toc::WriteOptions options;
  EXPECT_EQ(toc::charset::PDF_DOC, options.target("Chapter"));
  EXPECT_EQ(toc::charset::UTF16, options.target("\xE7\xAB\xA0"));
  options.encoding = toc::WriteOptions::ENCODING_UTF16;
  EXPECT_EQ(toc::charset::UTF16, options.target("Chapter"));
  options.encoding = toc::WriteOptions::ENCODING_PDF_DOC;
  EXPECT_EQ(toc::charset::PDF_DOC, options.target("\xE7\xAB\xA0"));
}

// vim:ts=2 sts=2 sw=2 et
