/*

charset.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <boost/locale/encoding.hpp>
#include <triagexx/detail/ascii.hpp>
#include <triagexx/detail/utf8.hpp>
#include <triagexx/detail/log.hpp>


namespace triagexx
{


/**
Converting decoded bytes to UTF-8 text.

The declared charset is used when Boost.Locale can convert it; otherwise the bytes are read as UTF-8 where every
invalid sequence maps to U+FFFD. The conversion never throws.

@param bytes   Decoded bytes.
@param charset Declared charset label, possibly empty.
@return        Valid UTF-8 text.
**/
inline std::string to_utf8(std::string_view bytes, std::string_view charset)
{
    const std::string label = detail::to_lower_ascii(detail::trim_view(charset));
    if (label.empty() || label == "utf-8" || label == "utf8" || label == "us-ascii" || label == "ascii")
        return detail::sanitize_utf8(bytes);

    try
    {
        std::string converted = boost::locale::conv::to_utf<char>(bytes.data(), bytes.data() + bytes.size(), label,
            boost::locale::conv::stop);
        return detail::sanitize_utf8(converted);
    }
    catch (const boost::locale::conv::invalid_charset_error&)
    {
        TRIAGEXX_DEBUG("charset", "unsupported charset `" + label + "`, reading as UTF-8");
    }
    catch (const boost::locale::conv::conversion_error&)
    {
        TRIAGEXX_DEBUG("charset", "invalid `" + label + "` sequence, reading as UTF-8");
    }
    return detail::sanitize_utf8(bytes);
}


/**
Extracting a parameter of a structured header value, like the `charset` of `Content-Type`.

@param header_value Full header value, e.g. `text/plain; charset="ISO-8859-1"`.
@param name         Parameter name, matched case insensitively.
@return             Unquoted parameter value, empty if absent.
**/
inline std::string header_parameter(std::string_view header_value, std::string_view name)
{
    std::size_t pos = header_value.find(';');
    while (pos != std::string_view::npos)
    {
        std::string_view rest = header_value.substr(pos + 1);
        std::size_t next = std::string_view::npos;
        bool in_quotes = false;
        for (std::size_t i = 0; i < rest.size(); ++i)
        {
            if (rest[i] == '"')
                in_quotes = !in_quotes;
            else if (rest[i] == ';' && !in_quotes)
            {
                next = i;
                break;
            }
        }
        std::string_view param = detail::trim_view(rest.substr(0, next));
        const std::size_t eq = param.find('=');
        if (eq != std::string_view::npos && detail::iequals_ascii(detail::trim_view(param.substr(0, eq)), name))
        {
            std::string_view value = detail::trim_view(param.substr(eq + 1));
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
                value = value.substr(1, value.size() - 2);
            return std::string(value);
        }
        pos = next == std::string_view::npos ? next : pos + 1 + next;
    }
    return {};
}


} // namespace triagexx
