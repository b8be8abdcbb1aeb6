/*

coerce.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Reading values out of an untrusted JSON document, each with a deterministic default.

*/


#pragma once

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>
#include <triagexx/detail/ascii.hpp>
#include <triagexx/detail/utf8.hpp>


namespace triagexx::coerce
{


/**
Member of an object, or `null` when the value is not an object or has no such member.
**/
inline const Json::Value& member(const Json::Value& obj, const char* key)
{
    if (!obj.isObject())
        return Json::Value::nullSingleton();
    const Json::Value* found = obj.find(key, key + std::char_traits<char>::length(key));
    return found != nullptr ? *found : Json::Value::nullSingleton();
}


/**
Text of a scalar: strings as they are, numbers and booleans in their JSON spelling. Invalid UTF-8 is repaired.
**/
inline std::optional<std::string> as_string(const Json::Value& v)
{
    if (v.isString())
        return detail::sanitize_utf8(v.asString());
    if (v.isBool())
        return std::string(v.asBool() ? "true" : "false");
    if (v.isIntegral())
        return v.isUInt64() ? std::to_string(v.asUInt64()) : std::to_string(v.asInt64());
    if (v.isDouble())
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%g", v.asDouble());
        return std::string(buf);
    }
    return std::nullopt;
}


/**
Trimmed text of a scalar, empty for anything else.
**/
inline std::string trimmed(const Json::Value& v)
{
    auto s = as_string(v);
    return s ? detail::trim_copy(*s) : std::string();
}


/**
Trimmed text of a scalar, nothing when it is absent or blank.
**/
inline std::optional<std::string> optional_trimmed(const Json::Value& v)
{
    std::string s = trimmed(v);
    if (s.empty())
        return std::nullopt;
    return s;
}


/**
Number of a numeric value or numeric string; nothing for anything else, including non-finite values.
**/
inline std::optional<double> as_double(const Json::Value& v)
{
    double value = 0.0;
    if (v.isNumeric() && !v.isBool())
        value = v.asDouble();
    else if (v.isString())
    {
        const std::string s = detail::trim_copy(v.asString());
        if (s.empty())
            return std::nullopt;
        char* end = nullptr;
        value = std::strtod(s.c_str(), &end);
        if (end != s.c_str() + s.size())
            return std::nullopt;
    }
    else
        return std::nullopt;
    if (!std::isfinite(value))
        return std::nullopt;
    return value;
}


/**
Integer of a numeric value or numeric string, fractions truncated.
**/
inline std::optional<std::int64_t> as_int(const Json::Value& v)
{
    if (v.isIntegral() && !v.isBool())
        return v.isUInt64() && !v.isInt64() ? INT64_MAX : v.asInt64();
    auto d = as_double(v);
    if (!d || *d > 9.0e18 || *d < -9.0e18)
        return std::nullopt;
    return static_cast<std::int64_t>(*d);
}


/**
Boolean of `true/false`, `yes/no`, `1/0` (as strings or numbers); the default otherwise.
**/
inline bool as_bool(const Json::Value& v, bool fallback = false)
{
    if (v.isBool())
        return v.asBool();
    if (v.isNumeric())
        return v.asDouble() != 0.0;
    if (v.isString())
    {
        const std::string s = detail::to_lower_ascii(detail::trim_view(v.asString()));
        if (s == "true" || s == "yes" || s == "y" || s == "1")
            return true;
        if (s == "false" || s == "no" || s == "n" || s == "0")
            return false;
    }
    return fallback;
}


/**
Elements of a list: the items of an array, a lone non-null value wrapped, nothing for `null`.
**/
inline std::vector<Json::Value> as_list(const Json::Value& v)
{
    std::vector<Json::Value> items;
    if (v.isArray())
    {
        items.reserve(v.size());
        for (const auto& item : v)
            items.push_back(item);
    }
    else if (!v.isNull())
        items.push_back(v);
    return items;
}


/**
Trimmed non-empty strings of a list.
**/
inline std::vector<std::string> string_list(const Json::Value& v)
{
    std::vector<std::string> out;
    for (const auto& item : as_list(v))
    {
        std::string s = trimmed(item);
        if (!s.empty())
            out.push_back(std::move(s));
    }
    return out;
}


} // namespace triagexx::coerce
