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

#ifndef PDFTOCIO_PDF_BACKEND_HH
#define PDFTOCIO_PDF_BACKEND_HH

#include <memory>
#include <stdexcept>
#include <string>

#include "autoconf.hh"

// Poppler:
#include <PDFDoc.h>
#include <Array.h>
#include <Catalog.h>
#include <Dict.h>
#include <Link.h>
#include <Object.h>
#include <Outline.h>
#include <Page.h>
#include <XRef.h>
#include <goo/GooString.h>

#include "i18n.hh"
#include "toc-error.hh"

namespace pdf
{

/* miscellaneous type definitions
 * ==============================
 */

  typedef ::Object Object;
  typedef ::Array Array;
  typedef ::Catalog Catalog;
  typedef ::GooString String;
  typedef ::Goffset Offset;
  typedef ::Ref Ref;
  typedef ::XRef XRef;

/* type definitions: link destinations
 * ===================================
 */

  namespace link
  {
    typedef ::LinkAction Action;
    typedef ::LinkDest Destination;
    typedef ::LinkGoTo GoTo;
  }

/* type definitions: outline
 * ==========================
 */

  namespace outline
  {
    typedef ::Outline Outline;
    typedef ::OutlineTreeNode TreeNode;
  }

/* class pdf::Environment
 * ======================
 */

  /* Poppler's global state. Messages from Poppler go to the diagnostic
   * log, filtered by the verbosity. */
  class Environment
  {
  public:
    explicit Environment(int verbosity);
  };


/* class pdf::Document
 * ===================
 */

  class Document : public ::PDFDoc
  {
  public:
    explicit Document(const std::string &file_name);
    int get_page_count()
    {
      return this->getNumPages();
    }
    /* Upper edge of the crop box of page n (1-based), in default user
     * space units. */
    double get_page_top(int n);
    void save(const std::string &file_name);
    class LoadError : public toc::IOError
    {
    public:
      LoadError(const std::string &file_name, int error_code);
    };
    class SaveError : public toc::IOError
    {
    public:
      SaveError(const std::string &file_name, int error_code);
    };
  };


/* dictionary lookup
 * =================
 */

  pdf::Object *dict_lookup(pdf::Object &dict, const char *key, pdf::Object *object);
  pdf::Object *dict_lookup(pdf::Object *dict, const char *key, pdf::Object *object);

  /* Same as dict_lookup(), but indirect references are not resolved. */
  pdf::Object *dict_lookup_nf(pdf::Object &dict, const char *key, pdf::Object *object);

  const char * get_c_string(const pdf::String *str);

  int find_page(pdf::Catalog *catalog, pdf::Ref pgref);

}

#endif

// vim:ts=2 sts=2 sw=2 et
