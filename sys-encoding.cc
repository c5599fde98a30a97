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

#include "system.hh"

#include <cstddef>
#include <cstdio>
#include <ostream>
#include <string>

#include <errno.h>
#include <iconv.h>

namespace encoding {

// POSIX requires that “inbuf” type must be “char **”.
// But on MacOS X, it is “const char **”.
// This adapter converts “const char **” to whichever type is needed.
template <typename ConstT, typename T>
class const_adapter
{
protected:
    ConstT x;
public:
    explicit const_adapter(ConstT x)
    : x(x)
    { }
    operator T () const
    {
        return const_cast<T>(x);
    }
    operator ConstT () const
    {
        return x;
    }
};

/* Streaming conversion from UTF-8 to another character set.
 * Characters that have no representation in the target character set are
 * written as the substitute. Malformed input throws encoding::Error.
 */
class UTF8Converter
{
protected:
    iconv_t cd;
    char buffer[BUFSIZ];
    char *buffer_ptr;
    size_t buffer_left;
    std::ostream &stream;
    void flush()
    {
        this->stream.write(this->buffer, this->buffer_ptr - this->buffer);
        this->buffer_ptr = this->buffer;
        this->buffer_left = sizeof this->buffer;
    }
    size_t step(const char **inbuf, size_t *inbytesleft)
    {
        typedef const_adapter<const char **, char **> const_adapter;
        return ::iconv(this->cd, const_adapter(inbuf), inbytesleft, &this->buffer_ptr, &this->buffer_left);
    }
    static size_t sequence_length(const char *s, size_t left)
    {
        size_t n = 1;
        while (n < left && (static_cast<unsigned char>(s[n]) & 0xC0) == 0x80)
            n++;
        return n;
    }
public:
    UTF8Converter(const char *tocode, std::ostream &stream)
    : buffer_ptr(buffer), buffer_left(sizeof buffer), stream(stream)
    {
        this->cd = iconv_open(tocode, "UTF-8");
        if (this->cd == reinterpret_cast<iconv_t>(-1))
            throw_posix_error("iconv_open()");
    }
    ~UTF8Converter()
    {
        iconv_close(this->cd);
    }
    void convert(const std::string &string, char substitute)
    {
        const char *inbuf = string.c_str();
        size_t inbuf_left = string.length();
        while (inbuf_left > 0) {
            size_t n = this->step(&inbuf, &inbuf_left);
            if (n != static_cast<size_t>(-1))
                continue;
            switch (errno) {
            case E2BIG:
                this->flush();
                break;
            case EILSEQ:
                if ((static_cast<unsigned char>(*inbuf) & 0xC0) != 0xC0)
                    throw Error();
                /* valid UTF-8, but not representable */
                if (this->buffer_left == 0)
                    this->flush();
                *this->buffer_ptr++ = substitute;
                this->buffer_left--;
                {
                    size_t skip = sequence_length(inbuf, inbuf_left);
                    inbuf += skip;
                    inbuf_left -= skip;
                }
                break;
            default:
                /* EINVAL: truncated sequence at the end */
                throw Error();
            }
        }
        this->flush();
    }
};

template <>
std::ostream &operator <<(std::ostream &stream, const proxy<native, terminal> &converter)
{
    stream << converter.string;
    return stream;
}

template <>
std::ostream &operator <<(std::ostream &stream, const proxy<utf8, native> &converter)
{
    /* An empty name selects the locale's character set. */
    UTF8Converter converter_to_native("", stream);
    converter_to_native.convert(converter.string, '?');
    return stream;
}

}

// vim:ts=4 sts=4 sw=4 et
