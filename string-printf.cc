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

#include "string-printf.hh"

#include <cstdarg>
#include <cstdio>
#include <string>
#include <vector>

#include "system.hh"

/* Most messages are short; longer ones (titles can be long) take a second
 * pass with an exactly sized buffer. */
std::string string_vprintf(const char *message, va_list args)
{
    char small_buffer[256];
    va_list first_args;
    va_copy(first_args, args);
    int length = vsnprintf(small_buffer, sizeof small_buffer, message, first_args);
    va_end(first_args);
    if (length < 0)
        throw_posix_error("vsnprintf()");
    size_t size = static_cast<size_t>(length);
    if (size < sizeof small_buffer)
        return std::string(small_buffer, size);
    std::vector<char> large_buffer(size + 1);
    if (vsnprintf(large_buffer.data(), large_buffer.size(), message, args) < 0)
        throw_posix_error("vsnprintf()");
    return std::string(large_buffer.data(), size);
}

std::string string_printf(const char *message, ...)
{
    va_list args;
    va_start(args, message);
    std::string result;
    try {
        result = string_vprintf(message, args);
    }
    catch (...) {
        va_end(args);
        throw;
    }
    va_end(args);
    return result;
}

// vim:ts=4 sts=4 sw=4 et
