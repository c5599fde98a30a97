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

#ifndef PDFTOCIO_TOC_ERROR_HH
#define PDFTOCIO_TOC_ERROR_HH

#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace toc
{

  /* Base of all errors reported by the ToC conversion.
   *
   * The set of kinds is closed. Callers dispatch on kind() with a switch
   * that lists every enumerator, so that adding a kind is a compile-time
   * warning rather than a silent fall-through.
   */
  class Error : public std::runtime_error
  {
  public:
    enum kind_t
    {
      FORMAT,
      RANGE,
      ENCODING,
      EMPTY_OUTLINE,
      IO,
    };
    Error(kind_t kind, const std::string &message)
    : std::runtime_error(message), kind_(kind)
    { }
    kind_t kind() const
    {
      return this->kind_;
    }
    const char *kind_name() const;
    /* Print structured details (used in debug mode). */
    virtual void describe(std::ostream &stream) const;
  private:
    kind_t kind_;
  };

  /* Malformed ToC text, or a level sequence that skips a level. */
  class FormatError : public Error
  {
  protected:
    std::string reason;
    size_t line;
    std::string title;
  public:
    FormatError(const std::string &reason, size_t line);
    FormatError(const std::string &reason, const std::string &title);
    const std::string &get_reason() const
    {
      return this->reason;
    }
    /* 1-based; 0 if the error is not tied to a line of text. */
    size_t get_line() const
    {
      return this->line;
    }
    const std::string &get_title() const
    {
      return this->title;
    }
    virtual void describe(std::ostream &stream) const;
  };

  class RangeError : public Error
  {
  protected:
    std::string title;
    int page;
    int page_count;
  public:
    RangeError(const std::string &title, int page, int page_count);
    const std::string &get_title() const
    {
      return this->title;
    }
    int get_page() const
    {
      return this->page;
    }
    int get_page_count() const
    {
      return this->page_count;
    }
    virtual void describe(std::ostream &stream) const;
  };

  class EncodingError : public Error
  {
  public:
    class Problem
    {
    public:
      size_t index; // position of the entry in its sequence
      std::string title;
      std::vector<size_t> positions; // character positions within the title
      Problem(size_t index, const std::string &title, const std::vector<size_t> &positions)
      : index(index), title(title), positions(positions)
      { }
    };
    explicit EncodingError(const std::vector<Problem> &problems);
    const std::vector<Problem> &get_problems() const
    {
      return this->problems;
    }
    virtual void describe(std::ostream &stream) const;
  protected:
    std::vector<Problem> problems;
  };

  /* The document has no outline to read. Recoverable. */
  class EmptyOutline : public Error
  {
  public:
    EmptyOutline();
  };

  class IOError : public Error
  {
  public:
    explicit IOError(const std::string &message)
    : Error(IO, message)
    { }
  };

}

#endif

// vim:ts=2 sts=2 sw=2 et
