/*

raw_message.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include <triagexx/detail/ascii.hpp>


namespace triagexx
{


/**
Ordered header list with case insensitive lookup. Repeated headers are kept, lookup returns the first one.
**/
class header_list
{
public:

    using value_type = std::pair<std::string, std::string>;

    header_list() = default;

    header_list(std::initializer_list<value_type> headers) : headers_(headers)
    {
    }

    void add(std::string name, std::string value)
    {
        headers_.emplace_back(std::move(name), std::move(value));
    }

    /**
    Finding the first header of the given name.

    @param name Header name, any case.
    @return     Its value or nothing.
    **/
    [[nodiscard]] std::optional<std::string_view> find(std::string_view name) const
    {
        for (const auto& h : headers_)
            if (detail::iequals_ascii(h.first, name))
                return std::string_view(h.second);
        return std::nullopt;
    }

    [[nodiscard]] std::string get(std::string_view name) const
    {
        auto value = find(name);
        return value ? std::string(*value) : std::string();
    }

    [[nodiscard]] bool contains(std::string_view name) const
    {
        return find(name).has_value();
    }

    [[nodiscard]] const std::vector<value_type>& entries() const noexcept { return headers_; }
    [[nodiscard]] bool empty() const noexcept { return headers_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return headers_.size(); }

private:
    std::vector<value_type> headers_;
};


/**
Transfer encoding of a leaf body.
**/
enum class body_encoding_t
{
    BASE64URL,
    BASE64,
    BIT7,
    BIT8,
    BINARY,
    QUOTED_PRINTABLE,
    UNKNOWN,
    NONE
};


/**
Parsing the transfer encoding label used by the provider or a `Content-Transfer-Encoding` header.

@param label Encoding label, any case.
@return      Encoding, `UNKNOWN` for a label nothing recognizes, `NONE` for an empty one.
**/
inline body_encoding_t parse_body_encoding(std::string_view label)
{
    label = detail::trim_view(label);
    if (label.empty())
        return body_encoding_t::NONE;
    if (detail::iequals_ascii(label, "base64url"))
        return body_encoding_t::BASE64URL;
    if (detail::iequals_ascii(label, "base64"))
        return body_encoding_t::BASE64;
    if (detail::iequals_ascii(label, "7bit"))
        return body_encoding_t::BIT7;
    if (detail::iequals_ascii(label, "8bit"))
        return body_encoding_t::BIT8;
    if (detail::iequals_ascii(label, "binary"))
        return body_encoding_t::BINARY;
    if (detail::iequals_ascii(label, "quoted-printable"))
        return body_encoding_t::QUOTED_PRINTABLE;
    return body_encoding_t::UNKNOWN;
}


struct part;


/**
Body of a leaf part. The data is still transfer encoded.
**/
struct leaf_body
{
    body_encoding_t encoding = body_encoding_t::BASE64URL;
    std::optional<std::string> data;
    std::string attachment_id;
    std::uint64_t size = 0;
};


/**
Children of a `multipart/*` part.
**/
struct container_body
{
    std::string subtype;
    std::vector<part> children;
};


/**
MIME tree node, either a leaf carrying at most one body or a container carrying ordered children.
**/
struct part
{
    std::string part_id;
    std::string mime_type;
    std::string filename;
    header_list headers;
    std::variant<leaf_body, container_body> body;

    [[nodiscard]] bool is_container() const noexcept
    {
        return std::holds_alternative<container_body>(body);
    }
};


/**
Message as delivered by the mail provider: identifiers, labels and the MIME tree whose root carries the top level headers.
**/
struct raw_message
{
    std::string id;
    std::string thread_id;
    std::vector<std::string> labels;
    std::string snippet;
    std::string history_id;
    std::optional<std::int64_t> internal_date_ms;
    std::optional<std::int64_t> size_estimate;
    part payload;
};


} // namespace triagexx
