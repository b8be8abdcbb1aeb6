/*

q_codec.hpp
-----------

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
#include <tuple>
#include <boost/algorithm/string.hpp>
#include <triagexx/codec/codec.hpp>
#include <triagexx/codec/base64.hpp>
#include <triagexx/codec/charset.hpp>
#include <triagexx/codec/quoted_printable.hpp>
#include <triagexx/export.hpp>


namespace triagexx
{


/**
Decoder of RFC 2047 encoded words, as found in the subject and the address display names.

Any charset Boost.Locale knows is converted to UTF-8. A malformed encoded word is kept verbatim.
**/
class TRIAGEXX_EXPORT q_codec : public codec
{
public:

    q_codec() = default;

    q_codec(const q_codec&) = delete;

    q_codec(q_codec&&) = delete;

    /**
    Default destructor.
    **/
    ~q_codec() = default;

    void operator=(const q_codec&) = delete;

    void operator=(q_codec&&) = delete;

    /**
    Decoding the inside of a single encoded word, ie. `charset?method?text` without the `=?` and `?=` delimiters.

    @param text        String to decode.
    @return            Decoded bytes, their charset and the codec method.
    @throw codec_error Missing Q codec separator for charset.
    @throw codec_error Missing Q codec separator for codec type.
    @throw codec_error Missing Q codec charset.
    @throw codec_error Bad encoding method.
    @throw *           `base64::decode(std::string_view)`.
    **/
    std::tuple<std::string, std::string, codec_t> decode(std::string_view text) const
    {
        std::string::size_type method_pos = text.find(QUESTION_MARK_CHAR);
        if (method_pos == std::string::npos)
            throw codec_error("Missing Q codec separator for charset.");
        std::string::size_type content_pos = text.find(QUESTION_MARK_CHAR, method_pos + 1);
        if (content_pos == std::string::npos)
            throw codec_error("Missing Q codec separator for codec type.");

        std::string charset = boost::to_upper_copy(std::string(text.substr(0, method_pos)));
        // RFC 2231 language suffix, `UTF-8*en`.
        const auto star = charset.find('*');
        if (star != std::string::npos)
            charset.erase(star);
        if (charset.empty())
            throw codec_error("Missing Q codec charset.");

        std::string_view method = text.substr(method_pos + 1, content_pos - method_pos - 1);
        std::string_view text_c = text.substr(content_pos + 1);

        std::string dec_text;
        codec_t method_type;
        if (boost::iequals(method, BASE64_CODEC_STR))
        {
            base64 b64;
            dec_text = b64.decode(text_c);
            method_type = codec_t::BASE64;
        }
        else if (boost::iequals(method, QP_CODEC_STR))
        {
            quoted_printable qp;
            qp.q_codec_mode(true);
            dec_text = qp.decode(text_c);
            method_type = codec_t::QUOTED_PRINTABLE;
        }
        else
            throw codec_error("Bad encoding method.");

        return std::make_tuple(dec_text, charset, method_type);
    }

    /**
    Decoding every encoded word of a header value into UTF-8.

    Linear whitespace between two adjacent encoded words is dropped. Text outside encoded words is kept, with invalid
    UTF-8 repaired.

    @param text Header value.
    @return     UTF-8 text.
    **/
    std::string check_decode(std::string_view text) const
    {
        std::string dec_text;
        bool last_was_word = false;
        std::size_t pos = 0;

        auto flush_plain = [&](std::string_view plain)
        {
            if (plain.empty())
                return;
            dec_text += detail::sanitize_utf8(plain);
            last_was_word = false;
        };

        while (pos < text.size())
        {
            const std::size_t begin = text.find("=?", pos);
            if (begin == std::string_view::npos)
            {
                flush_plain(text.substr(pos));
                break;
            }

            // Encoded word is `=?charset?method?payload?=`, the payload holds no `?`.
            const std::size_t q1 = text.find(QUESTION_MARK_CHAR, begin + 2);
            const std::size_t q2 = q1 == std::string_view::npos ? q1 : text.find(QUESTION_MARK_CHAR, q1 + 1);
            const std::size_t end = q2 == std::string_view::npos ? q2 : text.find("?=", q2 + 1);
            if (end == std::string_view::npos)
            {
                flush_plain(text.substr(pos));
                break;
            }

            std::string_view between = text.substr(pos, begin - pos);
            const bool only_ws = between.find_first_not_of(" \t\r\n") == std::string_view::npos;

            std::string word;
            try
            {
                auto [bytes, charset, method] = decode(text.substr(begin + 2, end - begin - 2));
                word = to_utf8(bytes, charset);
            }
            catch (const codec_error&)
            {
                flush_plain(text.substr(pos, end + 2 - pos));
                pos = end + 2;
                continue;
            }

            if (!(last_was_word && only_ws))
                flush_plain(between);
            dec_text += word;
            last_was_word = true;
            pos = end + 2;
        }

        return dec_text;
    }

private:

    /**
    String representation of Base64 method.
    **/
    inline static const std::string BASE64_CODEC_STR{"B"};

    /**
    String representation of Quoted Printable method.
    **/
    inline static const std::string QP_CODEC_STR{"Q"};
};


} // namespace triagexx


#ifdef _MSC_VER
#pragma warning(pop)
#endif
