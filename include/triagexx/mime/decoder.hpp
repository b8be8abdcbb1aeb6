/*

decoder.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Walking the provider MIME tree into a normalized message.

*/


#pragma once

#include <array>
#include <chrono>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <triagexx/codec/base64.hpp>
#include <triagexx/codec/charset.hpp>
#include <triagexx/codec/q_codec.hpp>
#include <triagexx/codec/quoted_printable.hpp>
#include <triagexx/detail/ascii.hpp>
#include <triagexx/detail/log.hpp>
#include <triagexx/detail/utf8.hpp>
#include <triagexx/mime/html_to_text.hpp>
#include <triagexx/mime/mailboxes.hpp>
#include <triagexx/mime/normalized_message.hpp>
#include <triagexx/mime/raw_message.hpp>
#include <triagexx/timestamp.hpp>
#include <triagexx/triage_config.hpp>


namespace triagexx
{


/**
Headers carried through to the normalized message, in this order.
**/
inline constexpr std::array<std::string_view, 6> HEADERS_OF_INTEREST = {{
    "Message-ID", "In-Reply-To", "References", "Reply-To", "List-Unsubscribe", "Date"
}};


/**
Decoder of the provider MIME tree.

It never fails: a leaf whose body cannot be decoded contributes an empty text, a container nested too deep is skipped.
**/
class mime_decoder
{
public:

    explicit mime_decoder(triage_config config) : config_(std::move(config))
    {
    }

    /**
    Decoding a message.

    @param msg Raw message.
    @return    Normalized message whose body text respects the configured cap.
    **/
    normalized_message decode(const raw_message& msg) const;

    /**
    Decoding the body of a leaf to UTF-8 text, without any further normalization.

    @param p    Leaf part, for its headers.
    @param body Its body.
    @return     Decoded text, empty if the transfer encoding is malformed.
    **/
    std::string decode_leaf(const part& p, const leaf_body& body) const;

    /**
    Decoding a header value holding encoded words, unfolded and trimmed.
    **/
    static std::string decode_header(std::string_view value);

private:

    enum class text_kind {NONE, PLAIN, HTML};

    /**
    Text a subtree offers to its parent.
    **/
    struct contribution
    {
        std::string text;
        text_kind kind = text_kind::NONE;
    };

    contribution walk(const part& p, std::size_t depth, normalized_message& out) const;

    contribution walk_leaf(const part& p, const leaf_body& body, normalized_message& out) const;

    contribution walk_container(const part& p, const container_body& body, std::size_t depth, normalized_message& out) const;

    static bool is_attachment(const part& p);

    static std::string normalize_line_endings(std::string_view text);

    triage_config config_;
};


inline std::string mime_decoder::decode_header(std::string_view value)
{
    q_codec qc;
    return detail::collapse_whitespace(qc.check_decode(value));
}


inline std::string mime_decoder::normalize_line_endings(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '\r')
        {
            out += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
        }
        else
            out += text[i];
    }
    return out;
}


inline bool mime_decoder::is_attachment(const part& p)
{
    const std::string disposition = detail::to_lower_ascii(detail::trim_view(p.headers.get("Content-Disposition")));
    if (disposition.rfind("attachment", 0) == 0)
        return true;
    if (!detail::trim_view(p.filename).empty())
        return true;
    if (!header_parameter(p.headers.get("Content-Disposition"), "filename").empty())
        return true;

    const std::string mime_type = detail::to_lower_ascii(detail::trim_view(p.mime_type));
    return !mime_type.empty() && mime_type != "text/plain" && mime_type != "text/html";
}


inline std::string mime_decoder::decode_leaf(const part& p, const leaf_body& body) const
{
    if (!body.data || body.data->empty())
        return {};

    body_encoding_t encoding = body.encoding;
    if (encoding == body_encoding_t::NONE)
        encoding = parse_body_encoding(p.headers.get("Content-Transfer-Encoding"));

    std::string bytes;
    try
    {
        switch (encoding)
        {
            case body_encoding_t::BASE64URL:
            {
                base64 b64(base64::alphabet_t::URL_SAFE);
                bytes = b64.decode(*body.data);
                break;
            }
            case body_encoding_t::BASE64:
            {
                base64 b64(base64::alphabet_t::STANDARD);
                bytes = b64.decode(*body.data);
                break;
            }
            case body_encoding_t::QUOTED_PRINTABLE:
            {
                quoted_printable qp;
                bytes = qp.decode(*body.data);
                break;
            }
            case body_encoding_t::UNKNOWN:
                TRIAGEXX_DEBUG("decoder", "part " + p.part_id + ": unknown transfer encoding, kept as raw bytes");
                bytes = *body.data;
                break;
            case body_encoding_t::BIT7:
            case body_encoding_t::BIT8:
            case body_encoding_t::BINARY:
            case body_encoding_t::NONE:
                bytes = *body.data;
                break;
        }
    }
    catch (const codec_error& exc)
    {
        TRIAGEXX_WARN("decoder", "part " + p.part_id + ": body dropped, " + exc.what());
        return {};
    }

    return to_utf8(bytes, header_parameter(p.headers.get("Content-Type"), "charset"));
}


inline mime_decoder::contribution mime_decoder::walk_leaf(const part& p, const leaf_body& body, normalized_message& out) const
{
    if (is_attachment(p))
    {
        attachment_info info;
        info.part_id = p.part_id;
        info.filename = p.filename.empty() ? header_parameter(p.headers.get("Content-Disposition"), "filename") : p.filename;
        info.filename = decode_header(info.filename);
        info.mime_type = detail::to_lower_ascii(detail::trim_view(p.mime_type));
        info.size = body.size;
        info.attachment_id = body.attachment_id;
        info.is_inline = detail::istarts_with_ascii(detail::trim_view(p.headers.get("Content-Disposition")), "inline");
        out.attachments.push_back(std::move(info));
        return {};
    }

    const std::string mime_type = detail::to_lower_ascii(detail::trim_view(p.mime_type));
    std::string text = decode_leaf(p, body);
    if (mime_type == "text/html")
    {
        if (!detail::trim_view(text).empty())
            out.body_html_present = true;
        return contribution{html_to_text(text), text_kind::HTML};
    }
    return contribution{detail::trim_copy(normalize_line_endings(text)), text_kind::PLAIN};
}


inline mime_decoder::contribution mime_decoder::walk_container(const part& p, const container_body& body, std::size_t depth,
    normalized_message& out) const
{
    if (depth > config_.max_part_depth)
    {
        TRIAGEXX_WARN("decoder", "part " + p.part_id + ": nested deeper than " + std::to_string(config_.max_part_depth) + ", skipped");
        return {};
    }

    std::vector<contribution> children;
    children.reserve(body.children.size());
    for (const auto& child : body.children)
        children.push_back(walk(child, depth + 1, out));

    if (body.subtype == "alternative")
    {
        // Later alternatives are the richer renderings: take the last plain one, else the last HTML one.
        for (auto kind : {text_kind::PLAIN, text_kind::HTML})
        {
            for (auto it = children.rbegin(); it != children.rend(); ++it)
                if (it->kind == kind && !it->text.empty())
                    return std::move(*it);
        }
        return {};
    }

    // mixed, related and every other multipart: all texts in order.
    contribution merged;
    for (auto& c : children)
    {
        if (c.text.empty())
            continue;
        if (!merged.text.empty())
            merged.text += "\n\n";
        merged.text += c.text;
        if (merged.kind != text_kind::PLAIN)
            merged.kind = c.kind;
    }
    return merged;
}


inline mime_decoder::contribution mime_decoder::walk(const part& p, std::size_t depth, normalized_message& out) const
{
    return std::visit([&](const auto& body) -> contribution
    {
        using body_t = std::decay_t<decltype(body)>;
        if constexpr (std::is_same_v<body_t, container_body>)
            return walk_container(p, body, depth, out);
        else
            return walk_leaf(p, body, out);
    }, p.body);
}


inline normalized_message mime_decoder::decode(const raw_message& msg) const
{
    normalized_message out;
    out.message_id = msg.id;
    out.thread_id = msg.thread_id;
    out.labels = msg.labels;
    out.snippet = detail::trim_copy(detail::sanitize_utf8(msg.snippet));
    out.history_id = msg.history_id;

    const header_list& headers = msg.payload.headers;
    out.subject = decode_header(headers.get("Subject"));
    out.sender = parse_mailbox(headers.get("From"));
    for (const auto& addr : parse_address_list(headers.get("To")))
        if (!addr.address.empty())
            out.to.push_back(addr.address);
    for (const auto& addr : parse_address_list(headers.get("Cc")))
        if (!addr.address.empty())
            out.cc.push_back(addr.address);

    if (auto date = headers.find("Date"))
        out.sent_at = parse_rfc5322_date(*date);
    if (msg.internal_date_ms)
        out.internal_date = std::chrono::floor<std::chrono::seconds>(
            sys_seconds{} + std::chrono::milliseconds{*msg.internal_date_ms});

    for (auto name : HEADERS_OF_INTEREST)
        if (auto value = headers.find(name))
            out.headers_of_interest.emplace_back(std::string(name), detail::trim_copy(*value));

    contribution body = walk(msg.payload, 0, out);
    std::string text = detail::trim_copy(body.text);
    if (detail::utf8_length(text) > config_.max_body_chars)
    {
        text = detail::utf8_truncate(text, config_.max_body_chars);
        out.body_truncated = true;
    }
    out.body_text = std::move(text);
    return out;
}


} // namespace triagexx
