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

#include "pdf-backend.hh"
#include "pdf-unicode.hh"
#include "toc-charset.hh"
#include "toc-error.hh"

namespace charset = toc::charset;

static std::vector<size_t> positions(size_t p)
{
  return std::vector<size_t>(1, p);
}

TEST(Charset, AsciiIsSupportedEverywhere)
{
  EXPECT_TRUE(charset::check("Chapter 1: Introduction", charset::PDF_DOC).empty());
  EXPECT_TRUE(charset::check("Chapter 1: Introduction", charset::UTF16).empty());
  EXPECT_TRUE(charset::check("", charset::PDF_DOC).empty());
}

TEST(Charset, Latin1InPdfDoc)
{
  EXPECT_TRUE(charset::check("R\xC3\xA9sum\xC3\xA9", charset::PDF_DOC).empty());
  /* euro sign */
  EXPECT_TRUE(charset::check("\xE2\x82\xAC" "5", charset::PDF_DOC).empty());
}

TEST(Charset, PositionsCountCharacters)
{
  /* "aé章b": the CJK character is the third character, not the fourth byte */
  std::string title = "a\xC3\xA9\xE7\xAB\xA0" "b";
  EXPECT_EQ(positions(2), charset::check(title, charset::PDF_DOC));
  EXPECT_TRUE(charset::check(title, charset::UTF16).empty());
}

TEST(Charset, SeveralPositions)
{
  std::string title = "\xE7\xAB\xA0 1 \xF0\x9F\x98\x80";
  std::vector<size_t> expected;
  expected.push_back(0);
  expected.push_back(4);
  EXPECT_EQ(expected, charset::check(title, charset::PDF_DOC));
  EXPECT_TRUE(charset::check(title, charset::UTF16).empty());
}

TEST(Charset, MalformedUtf8IsAlwaysReported)
{
  EXPECT_EQ(positions(1), charset::check("a\xFF" "b", charset::UTF16));
  EXPECT_EQ(positions(1), charset::check("a\xFF" "b", charset::PDF_DOC));
  /* truncated sequence counts as one character */
  EXPECT_EQ(positions(1), charset::check("a\xE7\xAB" "b", charset::UTF16));
  /* overlong form */
  EXPECT_EQ(positions(0), charset::check("\xC0\xAF", charset::UTF16));
  /* encoded surrogate */
  EXPECT_EQ(positions(0), charset::check("\xED\xA0\x80", charset::UTF16));
}

TEST(Charset, NulIsAlwaysReported)
{
  std::string title("a\0b", 3);
  EXPECT_EQ(positions(1), charset::check(title, charset::UTF16));
  EXPECT_EQ(positions(1), charset::check(title, charset::PDF_DOC));
}

TEST(Charset, ByteOrderMarkLookalikes)
{
  /* "þÿ" would be read back as a UTF-16BE byte order mark */
  std::string thorn_y = "\xC3\xBE\xC3\xBFx";
  EXPECT_EQ(positions(1), charset::check(thorn_y, charset::PDF_DOC));
  EXPECT_TRUE(charset::check(thorn_y, charset::UTF16).empty());
  EXPECT_EQ(charset::UTF16, charset::choose(thorn_y));
  /* "ï»¿" would be read back as a UTF-8 byte order mark */
  std::string utf8_bom = "\xC3\xAF\xC2\xBB\xC2\xBFx";
  EXPECT_EQ(positions(2), charset::check(utf8_bom, charset::PDF_DOC));
  /* only at the very beginning */
  EXPECT_TRUE(charset::check("x\xC3\xBE\xC3\xBF", charset::PDF_DOC).empty());
}

TEST(Charset, Choose)
{
  EXPECT_EQ(charset::PDF_DOC, charset::choose("Chapter 1"));
  EXPECT_EQ(charset::PDF_DOC, charset::choose("Zur\xC3\xBC" "ck"));
  EXPECT_EQ(charset::UTF16, charset::choose("\xE7\xAB\xA0"));
}

TEST(Charset, ReplaceUnsupported)
{
  EXPECT_EQ("a?b", charset::replace_unsupported("a\xE7\xAB\xA0" "b", charset::PDF_DOC));
  EXPECT_EQ("a\xE7\xAB\xA0" "b", charset::replace_unsupported("a\xE7\xAB\xA0" "b", charset::UTF16));
  EXPECT_EQ("a?b", charset::replace_unsupported("a\xFF" "b", charset::UTF16));
  EXPECT_EQ("a?b", charset::replace_unsupported(std::string("a\0b", 3), charset::UTF16));
  EXPECT_EQ("??", charset::replace_unsupported("\xE7\xAB\xA0\xE8\x8A\x82", charset::PDF_DOC));
  EXPECT_EQ("x_y", charset::replace_unsupported("x\xE7\xAB\xA0y", charset::PDF_DOC, "_"));
}

TEST(Charset, ReplacedTitlesPassCheck)
{
  std::string title = "\xC3\xBE\xC3\xBF \xE7\xAB\xA0 \xFF";
  std::string replaced = charset::replace_unsupported(title, charset::PDF_DOC);
  EXPECT_TRUE(charset::check(replaced, charset::PDF_DOC).empty());
}

TEST(Charset, EncodePdfDoc)
{
  EXPECT_EQ("Chapter", charset::encode("Chapter", charset::PDF_DOC));
  EXPECT_EQ("R\xE9sum\xE9", charset::encode("R\xC3\xA9sum\xC3\xA9", charset::PDF_DOC));
}

TEST(Charset, EncodeUtf16)
{
  EXPECT_EQ(std::string("\xFE\xFF\x00\x41", 4), charset::encode("A", charset::UTF16));
  EXPECT_EQ(std::string("\xFE\xFF\x7A\xE0", 4), charset::encode("\xE7\xAB\xA0", charset::UTF16));
  /* surrogate pair */
  EXPECT_EQ(std::string("\xFE\xFF\xD8\x3D\xDE\x00", 6), charset::encode("\xF0\x9F\x98\x80", charset::UTF16));
}

TEST(Charset, EncodeRejectsUnsupported)
{
  try
  {
    charset::encode("a\xE7\xAB\xA0", charset::PDF_DOC);
    FAIL() << "no exception";
  }
  catch (const toc::EncodingError &ex)
  {
    EXPECT_EQ(toc::Error::ENCODING, ex.kind());
    ASSERT_EQ(1U, ex.get_problems().size());
    EXPECT_EQ(positions(1), ex.get_problems()[0].positions);
  }
}

TEST(PdfText, DecodePdfDoc)
{
  pdf::String string("R\xE9sum\xE9", 6);
  EXPECT_EQ("R\xC3\xA9sum\xC3\xA9", pdf::string_as_utf8(&string));
}

TEST(PdfText, DecodeUtf16)
{
  pdf::String string("\xFE\xFF\x7A\xE0\xD8\x3D\xDE\x00", 8);
  EXPECT_EQ("\xE7\xAB\xA0\xF0\x9F\x98\x80", pdf::string_as_utf8(&string));
}

TEST(PdfText, DecodeBrokenUtf16)
{
  /* unpaired trailing surrogate, then a lone byte */
  pdf::String string("\xFE\xFF\xDC\x00\x00", 5);
  EXPECT_EQ("\xEF\xBF\xBD\xEF\xBF\xBD", pdf::string_as_utf8(&string));
}

TEST(PdfText, EncodeDecode)
{
  std::string title = "Zur\xC3\xBC" "ck \xE2\x82\xAC";
  std::string bytes = charset::encode(title, charset::PDF_DOC);
  pdf::String string(bytes.c_str(), bytes.length());
  EXPECT_EQ(title, pdf::string_as_utf8(&string));
}

// vim:ts=2 sts=2 sw=2 et
