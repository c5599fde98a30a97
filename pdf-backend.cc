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

#include "pdf-backend.hh"

#include <cstdint>
#include <memory>
#include <string>

#include <Error.h>
#include <ErrorCodes.h>
#include <GlobalParams.h>
#include <PDFDoc.h>
#include <goo/GooString.h>

#include "debug.hh"
#include "i18n.hh"
#include "string-printf.hh"


/* class pdf::Environment
 * ======================
 */

/* Poppler's callback takes no user data. */
static int poppler_verbosity = 1;

static void poppler_error_handler(ErrorCategory category, pdf::Offset pos, const char *message)
{
  /* Syntax warnings are shown only with --verbose. */
  DebugStream &log = debug(category == errSyntaxWarning ? 2 : 1, poppler_verbosity);
  const char *category_name = _("PDF error");
  switch (category)
  {
    case errSyntaxWarning:
      category_name = _("PDF syntax warning");
      break;
    case errSyntaxError:
      category_name = _("PDF syntax error");
      break;
    case errConfig:
      category_name = _("Poppler configuration error");
      break;
    case errCommandLine:
      break; /* should not happen */
    case errIO:
      category_name = _("Input/output error");
      break;
    case errNotAllowed:
      category_name = _("Permission denied");
      break;
    case errUnimplemented:
      category_name = _("PDF feature not implemented");
      break;
    case errInternal:
      category_name = _("Internal Poppler error");
      break;
  }

  if (pos >= 0)
  {
    log <<
      /* L10N: "<error-category> (<position>): <error-message>" */
      string_printf(_("%s (%jd): %s"), category_name, static_cast<intmax_t>(pos), message);
  }
  else
  {
    log <<
      /* L10N: "<error-category>: <error-message>" */
      string_printf(_("%s: %s"), category_name, message);
  }
  log << std::endl;
}

pdf::Environment::Environment(int verbosity)
{
  poppler_verbosity = verbosity;
  globalParams = std::unique_ptr<GlobalParams>(new GlobalParams);
  setErrorCallback(poppler_error_handler);
}


/* class pdf::Document
 * ===================
 */

static const char *error_code_message(int error_code)
{
  switch (error_code)
  {
  case errOpenFile:
    return _("Unable to open file");
  case errBadCatalog:
  case errDamaged:
    return _("File is damaged");
  case errEncrypted:
    return _("File is encrypted");
  case errPermission:
    return _("Permission denied");
  case errFileIO:
    return _("Input/output error");
  default:
    return _("Unable to load document");
  }
}

pdf::Document::LoadError::LoadError(const std::string &file_name, int error_code)
: toc::IOError(string_printf(_("%s: %s"), file_name.c_str(), error_code_message(error_code)))
{ }

pdf::Document::SaveError::SaveError(const std::string &file_name, int error_code)
: toc::IOError(string_printf(_("Unable to save %s: %s"), file_name.c_str(), error_code_message(error_code)))
{ }

pdf::Document::Document(const std::string &file_name)
: ::PDFDoc(std::make_unique<pdf::String>(file_name.c_str()))
{
  if (!this->isOk())
    throw LoadError(file_name, this->getErrorCode());
}

double pdf::Document::get_page_top(int n)
{
  ::Page *page = this->getCatalog()->getPage(n);
  if (page == nullptr)
    return this->getPageCropHeight(n);
  return page->getCropBox()->y2;
}

void pdf::Document::save(const std::string &file_name)
{
  pdf::String gfile_name(file_name.c_str());
  int rc = this->saveAs(gfile_name, writeForceRewrite);
  if (rc != errNone)
    throw SaveError(file_name, rc);
}


/* dictionary lookup
 * =================
 */

pdf::Object *pdf::dict_lookup(pdf::Object &dict, const char *key, pdf::Object *object)
{
  *object = dict.dictLookup(key);
  return object;
}

pdf::Object *pdf::dict_lookup(pdf::Object *dict, const char *key, pdf::Object *object)
{
  return pdf::dict_lookup(*dict, key, object);
}

pdf::Object *pdf::dict_lookup_nf(pdf::Object &dict, const char *key, pdf::Object *object)
{
  *object = dict.dictLookupNF(key).copy();
  return object;
}

const char * pdf::get_c_string(const pdf::String *str)
{
  return str->c_str();
}

int pdf::find_page(pdf::Catalog *catalog, pdf::Ref pgref)
{
  return catalog->findPage(pgref);
}

// vim:ts=2 sts=2 sw=2 et
