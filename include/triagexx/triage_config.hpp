/*

triage_config.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <charconv>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <triagexx/detail/ascii.hpp>
#include <triagexx/detail/result.hpp>
#include <triagexx/timestamp.hpp>

namespace triagexx
{

/**
 * Immutable settings shared read-only by every request.
 */
struct triage_config
{
    /// Body text cap, in code points
    std::size_t max_body_chars = 12000;

    /// Containers nested deeper than this are skipped
    std::size_t max_part_depth = 64;

    /// Confidence used when the classification omits it or it is not a number
    double missing_confidence = 0.5;

    /// Confidence of the substitute output when classification failed
    double fallback_confidence = 0.0;

    /// Offset given to deadlines without an explicit zone
    std::chrono::minutes default_utc_offset{0};

    /// Upper bound on the classification call
    std::chrono::milliseconds gateway_timeout{30000};

    /// Sampling temperature hint passed to the classification service
    double temperature = 0.2;

    std::string model_version = "classifier-v1";
    std::string prompt_version = "triage-v3-2026-02";

    /// Reported as model_version on the fallback path
    std::string fallback_model_marker = "fallback";

    /// Signals per kind carried in the classification request
    std::size_t max_signals_per_kind = 10;

    // ==================== Output bounds ====================

    std::size_t max_suggested_replies = 3;
    std::size_t max_recommended_actions = 4;
    std::size_t min_evidence = 1;
    std::size_t max_evidence = 3;
    std::size_t max_evidence_chars = 240;
    std::size_t max_missing_info = 3;
};


/// Key lookup used to build a configuration, the process environment by default.
using config_lookup_t = std::function<std::optional<std::string>(std::string_view)>;


/// Environment variable lookup
inline std::optional<std::string> environment_lookup(std::string_view key)
{
    const char* value = std::getenv(std::string(key).c_str());
    if (value == nullptr)
        return std::nullopt;
    return std::string(value);
}


namespace config_detail
{

inline error bad_value(std::string_view key, std::string_view value, std::string_view expected)
{
    return error(error_code::invalid_config, "Invalid value for " + std::string(key) + ".",
        "value `" + std::string(value) + "`, expected " + std::string(expected));
}

inline result<std::size_t> parse_size(std::string_view key, std::string_view text, std::size_t min_value)
{
    const std::string_view trimmed = detail::trim_view(text);
    std::size_t value = 0;
    auto res = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
    if (res.ec != std::errc{} || res.ptr != trimmed.data() + trimmed.size() || value < min_value)
        return fail<std::size_t>(bad_value(key, text, "an integer >= " + std::to_string(min_value)));
    return value;
}

inline result<double> parse_double(std::string_view key, std::string_view text, double min_value, double max_value)
{
    const std::string trimmed = detail::trim_copy(text);
    char* end = nullptr;
    const double value = std::strtod(trimmed.c_str(), &end);
    if (trimmed.empty() || end != trimmed.c_str() + trimmed.size() || !std::isfinite(value) ||
        value < min_value || value > max_value)
        return fail<double>(bad_value(key, text, "a number in [" + std::to_string(min_value) + ", " +
            std::to_string(max_value) + "]"));
    return value;
}

} // namespace config_detail


/**
 * Building a configuration from keyed values, defaults kept for absent keys.
 *
 * Keys: TRIAGEXX_MAX_BODY_CHARS, TRIAGEXX_MAX_PART_DEPTH, TRIAGEXX_MISSING_CONFIDENCE,
 * TRIAGEXX_FALLBACK_CONFIDENCE, TRIAGEXX_DEFAULT_TZ, TRIAGEXX_GATEWAY_TIMEOUT_MS,
 * TRIAGEXX_TEMPERATURE, TRIAGEXX_MODEL_VERSION, TRIAGEXX_PROMPT_VERSION, TRIAGEXX_FALLBACK_MARKER.
 *
 * @param lookup Key lookup.
 * @return       Configuration, or `invalid_config` naming the first malformed key.
 */
inline result<triage_config> load_config(const config_lookup_t& lookup = environment_lookup)
{
    using namespace config_detail;
    triage_config cfg;

    if (auto v = lookup("TRIAGEXX_MAX_BODY_CHARS"))
    {
        auto n = parse_size("TRIAGEXX_MAX_BODY_CHARS", *v, 1);
        if (!n)
            return fail<triage_config>(n.error());
        cfg.max_body_chars = *n;
    }
    if (auto v = lookup("TRIAGEXX_MAX_PART_DEPTH"))
    {
        auto n = parse_size("TRIAGEXX_MAX_PART_DEPTH", *v, 1);
        if (!n)
            return fail<triage_config>(n.error());
        cfg.max_part_depth = *n;
    }
    if (auto v = lookup("TRIAGEXX_MISSING_CONFIDENCE"))
    {
        auto d = parse_double("TRIAGEXX_MISSING_CONFIDENCE", *v, 0.0, 1.0);
        if (!d)
            return fail<triage_config>(d.error());
        cfg.missing_confidence = *d;
    }
    if (auto v = lookup("TRIAGEXX_FALLBACK_CONFIDENCE"))
    {
        auto d = parse_double("TRIAGEXX_FALLBACK_CONFIDENCE", *v, 0.0, 1.0);
        if (!d)
            return fail<triage_config>(d.error());
        cfg.fallback_confidence = *d;
    }
    if (auto v = lookup("TRIAGEXX_TEMPERATURE"))
    {
        auto d = parse_double("TRIAGEXX_TEMPERATURE", *v, 0.0, 2.0);
        if (!d)
            return fail<triage_config>(d.error());
        cfg.temperature = *d;
    }
    if (auto v = lookup("TRIAGEXX_DEFAULT_TZ"))
    {
        auto offset = parse_offset(*v);
        if (!offset)
            return fail<triage_config>(bad_value("TRIAGEXX_DEFAULT_TZ", *v, "an offset such as UTC-8 or +05:30"));
        cfg.default_utc_offset = *offset;
    }
    if (auto v = lookup("TRIAGEXX_GATEWAY_TIMEOUT_MS"))
    {
        auto n = parse_size("TRIAGEXX_GATEWAY_TIMEOUT_MS", *v, 1);
        if (!n)
            return fail<triage_config>(n.error());
        cfg.gateway_timeout = std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(*n)};
    }
    if (auto v = lookup("TRIAGEXX_MODEL_VERSION"); v && !detail::trim_view(*v).empty())
        cfg.model_version = detail::trim_copy(*v);
    if (auto v = lookup("TRIAGEXX_PROMPT_VERSION"); v && !detail::trim_view(*v).empty())
        cfg.prompt_version = detail::trim_copy(*v);
    if (auto v = lookup("TRIAGEXX_FALLBACK_MARKER"); v && !detail::trim_view(*v).empty())
        cfg.fallback_model_marker = detail::trim_copy(*v);

    return cfg;
}

} // namespace triagexx
