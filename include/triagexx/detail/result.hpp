/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
Input and gateway failures are returned via result<T>; codecs throw codec_error
which the decoder recovers from locally.

*/

#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <cstdint>
#include <utility>

namespace triagexx
{

/// Error categories for triagexx operations
enum class error_code : std::uint16_t
{
    success = 0,

    // Decoding errors (100-199)
    decode_failed = 100,
    charset_unsupported = 101,

    // Input errors (200-299)
    invalid_json = 200,
    invalid_message = 201,

    // Classification gateway errors (300-399)
    gateway_timeout = 300,
    gateway_error = 301,
    gateway_cancelled = 302,
    gateway_invalid_response = 303,

    // Configuration errors (400-499)
    invalid_config = 400,

    // Internal errors (900-999)
    internal_error = 900,
};

/// Convert error code to string
[[nodiscard]] constexpr std::string_view error_code_to_string(error_code ec) noexcept
{
    switch (ec)
    {
        case error_code::success: return "Success";
        case error_code::decode_failed: return "Decode failed";
        case error_code::charset_unsupported: return "Charset unsupported";
        case error_code::invalid_json: return "Invalid JSON";
        case error_code::invalid_message: return "Invalid message";
        case error_code::gateway_timeout: return "Gateway timeout";
        case error_code::gateway_error: return "Gateway error";
        case error_code::gateway_cancelled: return "Gateway cancelled";
        case error_code::gateway_invalid_response: return "Gateway invalid response";
        case error_code::invalid_config: return "Invalid configuration";
        case error_code::internal_error: return "Internal error";
    }
    return "Unknown error";
}

/// Short machine-friendly token, used in debug notes
[[nodiscard]] constexpr std::string_view error_code_token(error_code ec) noexcept
{
    switch (ec)
    {
        case error_code::success: return "success";
        case error_code::decode_failed: return "decode_failed";
        case error_code::charset_unsupported: return "charset_unsupported";
        case error_code::invalid_json: return "invalid_json";
        case error_code::invalid_message: return "invalid_message";
        case error_code::gateway_timeout: return "gateway_timeout";
        case error_code::gateway_error: return "gateway_error";
        case error_code::gateway_cancelled: return "gateway_cancelled";
        case error_code::gateway_invalid_response: return "gateway_invalid_response";
        case error_code::invalid_config: return "invalid_config";
        case error_code::internal_error: return "internal_error";
    }
    return "unknown";
}

/// Rich error type with code, message, and optional detail
class error
{
public:
    error() noexcept : code_(error_code::success) {}

    explicit error(error_code code)
        : code_(code), message_(error_code_to_string(code)) {}

    error(error_code code, std::string message) noexcept
        : code_(code), message_(std::move(message)) {}

    error(error_code code, std::string message, std::string detail) noexcept
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

    [[nodiscard]] bool is_success() const noexcept { return code_ == error_code::success; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_success(); }

    /// Format error for display
    [[nodiscard]] std::string to_string() const
    {
        std::string out = "[" + std::to_string(static_cast<int>(code_)) + "] " + message_;
        if (!detail_.empty())
            out += ": " + detail_;
        return out;
    }

    /// Check if this is a specific error
    [[nodiscard]] bool is(error_code ec) const noexcept { return code_ == ec; }

private:
    error_code code_;
    std::string message_;
    std::string detail_;
};

/// Result type alias using std::expected
template<typename T>
using result = std::expected<T, error>;

/// Void result for operations that don't return a value
using result_void = std::expected<void, error>;

/// Helper to create successful result
template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

/// Helper to create void success
[[nodiscard]] inline constexpr result_void ok()
{
    return result_void{};
}

/// Helper to create error result
template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error_code code)
{
    return std::unexpected(error(code));
}

template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error_code code, std::string message)
{
    return std::unexpected(error(code, std::move(message)));
}

template<typename T = void>
[[nodiscard]] constexpr std::expected<T, error> fail(error_code code, std::string message, std::string detail)
{
    return std::unexpected(error(code, std::move(message), std::move(detail)));
}

} // namespace triagexx
