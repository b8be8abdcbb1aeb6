/*

utf8.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace triagexx
{
namespace detail
{

inline constexpr std::uint32_t REPLACEMENT_CHAR = 0xFFFD;

/// Decode one code point at `index`. On success `index` moves past it; on
/// failure it is left untouched and false is returned.
inline bool decode_utf8(std::string_view text, std::size_t& index, std::uint32_t& cp) noexcept
{
    if (index >= text.size())
        return false;

    auto cont = [&](std::size_t k) noexcept
    {
        return (static_cast<unsigned char>(text[index + k]) & 0xC0) == 0x80;
    };
    auto bits = [&](std::size_t k) noexcept
    {
        return static_cast<std::uint32_t>(static_cast<unsigned char>(text[index + k]) & 0x3F);
    };

    unsigned char b0 = static_cast<unsigned char>(text[index]);
    if (b0 < 0x80)
    {
        cp = b0;
        index += 1;
        return true;
    }

    if ((b0 >> 5) == 0x6)
    {
        if (index + 1 >= text.size() || !cont(1))
            return false;
        std::uint32_t v = ((b0 & 0x1F) << 6) | bits(1);
        if (v < 0x80)
            return false;
        cp = v;
        index += 2;
        return true;
    }

    if ((b0 >> 4) == 0xE)
    {
        if (index + 2 >= text.size() || !cont(1) || !cont(2))
            return false;
        std::uint32_t v = ((b0 & 0x0F) << 12) | (bits(1) << 6) | bits(2);
        if (v < 0x800 || (v >= 0xD800 && v <= 0xDFFF))
            return false;
        cp = v;
        index += 3;
        return true;
    }

    if ((b0 >> 3) == 0x1E)
    {
        if (index + 3 >= text.size() || !cont(1) || !cont(2) || !cont(3))
            return false;
        std::uint32_t v = ((b0 & 0x07) << 18) | (bits(1) << 12) | (bits(2) << 6) | bits(3);
        if (v < 0x10000 || v > 0x10FFFF)
            return false;
        cp = v;
        index += 4;
        return true;
    }

    return false;
}

inline void append_utf8(std::uint32_t codepoint, std::string& out)
{
    if (codepoint > 0x10FFFF || (codepoint >= 0xD800 && codepoint <= 0xDFFF))
        codepoint = REPLACEMENT_CHAR;

    if (codepoint <= 0x7F)
    {
        out.push_back(static_cast<char>(codepoint));
    }
    else if (codepoint <= 0x7FF)
    {
        out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
    else if (codepoint <= 0xFFFF)
    {
        out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
}

[[nodiscard]] inline bool is_valid_utf8(std::string_view text) noexcept
{
    std::size_t index = 0;
    std::uint32_t cp = 0;
    while (index < text.size())
    {
        if (!decode_utf8(text, index, cp))
            return false;
    }
    return true;
}

/// Every invalid byte becomes U+FFFD, valid sequences are copied.
[[nodiscard]] inline std::string sanitize_utf8(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    std::size_t index = 0;
    while (index < text.size())
    {
        const std::size_t start = index;
        std::uint32_t cp = 0;
        if (decode_utf8(text, index, cp))
            out.append(text.data() + start, index - start);
        else
        {
            append_utf8(REPLACEMENT_CHAR, out);
            ++index;
        }
    }
    return out;
}

/// Number of code points; expects valid UTF-8, stray bytes count one each.
[[nodiscard]] inline std::size_t utf8_length(std::string_view text) noexcept
{
    std::size_t count = 0;
    for (char ch : text)
    {
        if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80)
            ++count;
    }
    return count;
}

/// Byte offset just past the first `max_chars` code points.
[[nodiscard]] inline std::size_t utf8_prefix_bytes(std::string_view text, std::size_t max_chars) noexcept
{
    std::size_t count = 0;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80)
        {
            if (count == max_chars)
                return i;
            ++count;
        }
    }
    return text.size();
}

/// Cut to at most `max_chars` code points, never inside a sequence.
[[nodiscard]] inline std::string utf8_truncate(std::string_view text, std::size_t max_chars)
{
    return std::string(text.substr(0, utf8_prefix_bytes(text, max_chars)));
}

} // namespace detail
} // namespace triagexx
