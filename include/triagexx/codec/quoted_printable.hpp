/*

quoted_printable.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <triagexx/codec/codec.hpp>
#include <triagexx/export.hpp>


namespace triagexx
{


/**
Quoted Printable decoder.

The Q codec mode covers the RFC 2047 variant used inside encoded words, where the underscore stands for a space and
there are no soft line breaks. In the lenient mode an equal sign that does not start a valid escape is kept as it is.
**/
class TRIAGEXX_EXPORT quoted_printable : public codec
{
public:

    /**
    Setting the strictness.

    @param strict Strict mode flag.
    **/
    explicit quoted_printable(bool strict = false)
        : codec(strict), q_codec_mode_(false)
    {
    }

    quoted_printable(const quoted_printable&) = delete;

    quoted_printable(quoted_printable&&) = delete;

    /**
    Default destructor.
    **/
    ~quoted_printable() = default;

    void operator=(const quoted_printable&) = delete;

    void operator=(quoted_printable&&) = delete;

    /**
    Decoding a quoted printable text.

    @param text        Encoded text, possibly spanning several lines.
    @return            Decoded bytes, line breaks are kept as they come.
    @throw codec_error Bad hexadecimal digit, in the strict mode only.
    **/
    std::string decode(std::string_view text) const
    {
        std::string dec_text;
        dec_text.reserve(text.size());
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            const char ch = text[i];
            if (ch == EQUAL_CHAR)
            {
                // Soft line break, either `=CRLF` or `=LF`.
                if (!q_codec_mode_)
                {
                    std::size_t j = i + 1;
                    while (j < text.size() && (text[j] == SPACE_CHAR || text[j] == TAB_CHAR))
                        ++j;
                    if (j < text.size() && text[j] == CR_CHAR && j + 1 < text.size() && text[j + 1] == LF_CHAR)
                    {
                        i = j + 1;
                        continue;
                    }
                    if (j < text.size() && text[j] == LF_CHAR)
                    {
                        i = j;
                        continue;
                    }
                    if (j == text.size())
                        break;
                }

                const int high = i + 1 < text.size() ? hex_digit_to_int(text[i + 1]) : -1;
                const int low = i + 2 < text.size() ? hex_digit_to_int(text[i + 2]) : -1;
                if (high < 0 || low < 0)
                {
                    if (strict_mode_)
                        throw codec_error("Bad hexadecimal digit.");
                    dec_text += ch;
                    continue;
                }
                dec_text += static_cast<char>((high << 4) + low);
                i += 2;
            }
            else if (q_codec_mode_ && ch == UNDERSCORE_CHAR)
                dec_text += SPACE_CHAR;
            else
                dec_text += ch;
        }

        return dec_text;
    }

    /**
    Setting Q codec mode.

    @param mode True to set, false to unset.
    **/
    void q_codec_mode(bool mode)
    {
        q_codec_mode_ = mode;
    }

private:

    /**
    Flag for the Q codec mode.
    **/
    bool q_codec_mode_;
};


} // namespace triagexx
