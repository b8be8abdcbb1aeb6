/*

raw_message_json.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Loading the provider message resource (JSON) into a raw_message.

*/


#pragma once

#include <charconv>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <json/json.h>
#include <triagexx/detail/result.hpp>
#include <triagexx/mime/raw_message.hpp>


namespace triagexx
{

namespace detail
{

inline std::string json_string(const Json::Value& obj, const char* key)
{
    if (!obj.isObject())
        return {};
    const Json::Value& v = obj[key];
    if (v.isString())
        return v.asString();
    if (v.isNumeric() || v.isBool())
        return v.asString();
    return {};
}

// Provider integers arrive either as JSON numbers or as decimal strings.
inline std::optional<std::int64_t> json_int64(const Json::Value& obj, const char* key)
{
    if (!obj.isObject())
        return std::nullopt;
    const Json::Value& v = obj[key];
    if (v.isIntegral())
        return v.asInt64();
    if (v.isDouble())
        return static_cast<std::int64_t>(v.asDouble());
    if (v.isString())
    {
        const std::string s = v.asString();
        std::int64_t out = 0;
        auto res = std::from_chars(s.data(), s.data() + s.size(), out);
        if (res.ec == std::errc{} && res.ptr == s.data() + s.size())
            return out;
    }
    return std::nullopt;
}

inline part parse_part(const Json::Value& node)
{
    part p;
    p.part_id = json_string(node, "partId");
    p.mime_type = json_string(node, "mimeType");
    p.filename = json_string(node, "filename");

    const Json::Value& headers = node["headers"];
    if (headers.isArray())
    {
        for (const auto& h : headers)
        {
            if (!h.isObject())
                continue;
            std::string name = json_string(h, "name");
            if (name.empty())
                continue;
            p.headers.add(std::move(name), json_string(h, "value"));
        }
    }

    const Json::Value& parts = node["parts"];
    if (parts.isArray() && !parts.empty())
    {
        container_body cb;
        const auto slash = p.mime_type.find('/');
        cb.subtype = to_lower_ascii(slash == std::string::npos ? std::string_view() : std::string_view(p.mime_type).substr(slash + 1));
        cb.children.reserve(parts.size());
        for (const auto& child : parts)
        {
            if (child.isObject())
                cb.children.push_back(parse_part(child));
        }
        p.body = std::move(cb);
        return p;
    }

    leaf_body lb;
    const Json::Value& body = node["body"];
    if (body.isObject())
    {
        if (body["data"].isString())
            lb.data = body["data"].asString();
        lb.attachment_id = json_string(body, "attachmentId");
        const std::int64_t size = json_int64(body, "size").value_or(0);
        lb.size = size > 0 ? static_cast<std::uint64_t>(size) : 0;
        const std::string enc = json_string(body, "encoding");
        if (!enc.empty())
            lb.encoding = parse_body_encoding(enc);
    }
    p.body = std::move(lb);
    return p;
}

} // namespace detail


/**
Converting the provider message resource into a raw message.

Only a non-object root or a missing `payload` object fail; every other irregularity is tolerated and left to the decoder.

@param root Parsed JSON document.
@return     Raw message or `invalid_message`.
**/
inline result<raw_message> parse_raw_message(const Json::Value& root)
{
    if (!root.isObject())
        return fail<raw_message>(error_code::invalid_message, "Message is not a JSON object.");
    const Json::Value& payload = root["payload"];
    if (!payload.isObject())
        return fail<raw_message>(error_code::invalid_message, "Message has no payload object.");

    raw_message msg;
    msg.id = detail::json_string(root, "id");
    msg.thread_id = detail::json_string(root, "threadId");
    msg.snippet = detail::json_string(root, "snippet");
    msg.history_id = detail::json_string(root, "historyId");
    msg.internal_date_ms = detail::json_int64(root, "internalDate");
    msg.size_estimate = detail::json_int64(root, "sizeEstimate");
    const Json::Value& labels = root["labelIds"];
    if (labels.isArray())
    {
        for (const auto& l : labels)
            if (l.isString())
                msg.labels.push_back(l.asString());
    }
    msg.payload = detail::parse_part(payload);
    return msg;
}


/**
Parsing a JSON text, shared by the message loader and the example program.

@param text JSON text.
@return     Document or `invalid_json` with the reader diagnostics as detail.
**/
inline result<Json::Value> parse_json(std::string_view text)
{
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors))
        return fail<Json::Value>(error_code::invalid_json, "Malformed JSON.", errors);
    return root;
}


/**
Parsing the provider message resource from its JSON text.

@param text JSON text.
@return     Raw message, `invalid_json` or `invalid_message`.
**/
inline result<raw_message> parse_raw_message_json(std::string_view text)
{
    auto root = parse_json(text);
    if (!root)
        return fail<raw_message>(root.error());
    return parse_raw_message(*root);
}


} // namespace triagexx
