/*

codec.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <string>
#include <stdexcept>
#include <triagexx/export.hpp>


namespace triagexx
{


/**
Base of the transfer and header decoders.

Decoders are lenient by default: malformed input is repaired where a reader would still recognize the text. In strict
mode the same input raises `codec_error`.
**/
class TRIAGEXX_EXPORT codec
{
public:

    /**
    Value of a hex digit of either case, -1 when the character is not one.
    **/
    static constexpr int hex_digit_to_int(char digit)
    {
        if (digit >= '0' && digit <= '9')
            return digit - '0';
        if (digit >= 'A' && digit <= 'F')
            return digit - 'A' + 10;
        if (digit >= 'a' && digit <= 'f')
            return digit - 'a' + 10;
        return -1;
    }

    static constexpr char CR_CHAR = '\r';
    static constexpr char LF_CHAR = '\n';
    static constexpr char PLUS_CHAR = '+';
    static constexpr char MINUS_CHAR = '-';
    static constexpr char SLASH_CHAR = '/';
    static constexpr char EQUAL_CHAR = '=';
    static constexpr char SPACE_CHAR = ' ';
    static constexpr char TAB_CHAR = '\t';
    static constexpr char QUESTION_MARK_CHAR = '?';
    static constexpr char UNDERSCORE_CHAR = '_';

    /**
    Encoding of an RFC 2047 encoded word.
    **/
    enum class codec_t {BASE64, QUOTED_PRINTABLE};

    explicit codec(bool strict = false) : strict_mode_(strict)
    {
    }

    codec(const codec&) = delete;

    codec(codec&&) = delete;

    virtual ~codec() = default;

    void operator=(const codec&) = delete;

    void operator=(codec&&) = delete;

protected:

    bool strict_mode_;
};


/**
Malformed input met by a decoder in strict mode.
**/
class codec_error : public std::runtime_error
{
public:

    explicit codec_error(const std::string& msg) : std::runtime_error(msg)
    {
    }
};


} // namespace triagexx


#ifdef _MSC_VER
#pragma warning(pop)
#endif
