/*

base64.hpp
----------

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
#include <string_view>
#include <triagexx/codec/codec.hpp>
#include <triagexx/export.hpp>


namespace triagexx
{


/**
Base64 codec, for both the standard (RFC 4648 section 4) and the URL safe (section 5) alphabets.

Mail providers transport body data as URL safe Base64 and frequently omit the padding. In the lenient mode the
missing padding is tolerated, line breaks are skipped and both alphabets are accepted. The strict mode requires
the configured alphabet and complete padding.
**/
class TRIAGEXX_EXPORT base64 : public codec
{
public:

    /**
    Alphabet variants.
    **/
    enum class alphabet_t {STANDARD, URL_SAFE};

    /**
    Standard Base64 character set.
    **/
    inline static const std::string CHARSET{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

    /**
    URL safe Base64 character set.
    **/
    inline static const std::string URL_CHARSET{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_"};

    /**
    Setting the alphabet and the strictness.

    @param alphabet Alphabet to encode with, and to require in the strict mode.
    @param strict   Strict mode flag.
    **/
    explicit base64(alphabet_t alphabet = alphabet_t::STANDARD, bool strict = false)
        : codec(strict), alphabet_(alphabet)
    {
    }

    base64(const base64&) = delete;

    base64(base64&&) = delete;

    /**
    Default destructor.
    **/
    ~base64() = default;

    void operator=(const base64&) = delete;

    void operator=(base64&&) = delete;

    /**
    Encoding a string into a single line of Base64.

    @param text    String to encode.
    @param padding Whether to append the `=` padding.
    @return        Encoded string.
    **/
    std::string encode(std::string_view text, bool padding = true) const
    {
        const std::string& charset = alphabet_ == alphabet_t::URL_SAFE ? URL_CHARSET : CHARSET;
        std::string enc_text;
        enc_text.reserve((text.size() + 2) / 3 * 4);
        unsigned char octets[OCTETS_NO];
        int octets_counter = 0;

        auto flush = [&](int count)
        {
            for (int i = count; i < OCTETS_NO; i++)
                octets[i] = '\0';
            unsigned char sextets[SEXTETS_NO];
            sextets[0] = (octets[0] & 0xfc) >> 2;
            sextets[1] = ((octets[0] & 0x03) << 4) + ((octets[1] & 0xf0) >> 4);
            sextets[2] = ((octets[1] & 0x0f) << 2) + ((octets[2] & 0xc0) >> 6);
            sextets[3] = octets[2] & 0x3f;
            for (int i = 0; i < count + 1; i++)
                enc_text += charset[sextets[i]];
            if (padding)
                for (int i = count; i < OCTETS_NO; i++)
                    enc_text += EQUAL_CHAR;
        };

        for (char ch : text)
        {
            octets[octets_counter++] = static_cast<unsigned char>(ch);
            if (octets_counter == OCTETS_NO)
            {
                flush(OCTETS_NO);
                octets_counter = 0;
            }
        }
        // encode remaining characters if any
        if (octets_counter > 0)
            flush(octets_counter);

        return enc_text;
    }

    /**
    Decoding a Base64 string.

    @param text        Base64 encoded string.
    @return            Decoded bytes.
    @throw codec_error Bad character.
    @throw codec_error Bad padding.
    @throw codec_error Truncated input.
    **/
    std::string decode(std::string_view text) const
    {
        std::string dec_text;
        dec_text.reserve(text.size() / 4 * 3 + 3);
        unsigned char sextets[SEXTETS_NO];
        int count_4_chars = 0;
        std::size_t data_chars = 0;
        std::size_t padding_chars = 0;

        for (char ch : text)
        {
            if (ch == CR_CHAR || ch == LF_CHAR || ch == SPACE_CHAR || ch == TAB_CHAR)
            {
                if (strict_mode_)
                    throw codec_error("Bad character `" + std::string(1, ch) + "`.");
                continue;
            }

            if (ch == EQUAL_CHAR)
            {
                ++padding_chars;
                continue;
            }

            // Data after padding.
            if (padding_chars > 0)
                throw codec_error("Bad padding.");

            int value = sextet_value(ch);
            if (value < 0)
                throw codec_error("Bad character `" + std::string(1, ch) + "`.");

            ++data_chars;
            sextets[count_4_chars++] = static_cast<unsigned char>(value);
            if (count_4_chars == SEXTETS_NO)
            {
                dec_text += static_cast<char>((sextets[0] << 2) + ((sextets[1] & 0x30) >> 4));
                dec_text += static_cast<char>(((sextets[1] & 0xf) << 4) + ((sextets[2] & 0x3c) >> 2));
                dec_text += static_cast<char>(((sextets[2] & 0x3) << 6) + sextets[3]);
                count_4_chars = 0;
            }
        }

        // A single leftover sextet carries less than one octet.
        if (count_4_chars == 1)
            throw codec_error("Truncated input.");

        if (padding_chars > 0)
        {
            if (count_4_chars == 0 || padding_chars > 2 || (data_chars + padding_chars) % SEXTETS_NO != 0)
                throw codec_error("Bad padding.");
        }
        else if (strict_mode_ && count_4_chars > 0)
            throw codec_error("Missing padding.");

        // decode remaining characters if any
        if (count_4_chars > 0)
        {
            for (int i = count_4_chars; i < SEXTETS_NO; i++)
                sextets[i] = 0;
            dec_text += static_cast<char>((sextets[0] << 2) + ((sextets[1] & 0x30) >> 4));
            if (count_4_chars == 3)
                dec_text += static_cast<char>(((sextets[1] & 0xf) << 4) + ((sextets[2] & 0x3c) >> 2));
        }

        return dec_text;
    }

private:

    /**
    Mapping a character to its six bit value.

    @param ch Character to map.
    @return   Value, or -1 if the character is not allowed.
    **/
    int sextet_value(char ch) const
    {
        if (ch >= 'A' && ch <= 'Z')
            return ch - 'A';
        if (ch >= 'a' && ch <= 'z')
            return ch - 'a' + 26;
        if (ch >= '0' && ch <= '9')
            return ch - '0' + 52;

        const bool url_safe = alphabet_ == alphabet_t::URL_SAFE;
        if (ch == PLUS_CHAR && (!url_safe || !strict_mode_))
            return 62;
        if (ch == SLASH_CHAR && (url_safe ? !strict_mode_ : true))
            return 63;
        if (ch == MINUS_CHAR && (url_safe || !strict_mode_))
            return 62;
        if (ch == UNDERSCORE_CHAR && (url_safe || !strict_mode_))
            return 63;
        return -1;
    }

    /**
    Alphabet in use.
    **/
    alphabet_t alphabet_;

    /**
    Number of six bit chunks.
    **/
    static constexpr unsigned short SEXTETS_NO = 4;

    /**
    Number of eight bit characters.
    **/
    static constexpr unsigned short OCTETS_NO = SEXTETS_NO - 1;
};


} // namespace triagexx


#ifdef _MSC_VER
#pragma warning(pop)
#endif
