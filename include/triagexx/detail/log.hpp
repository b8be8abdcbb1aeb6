/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Lightweight, header-only logging infrastructure for triagexx.
Supports multiple log levels, optional callbacks and per-component tagging.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>

namespace triagexx::log
{

/// Log severity levels
enum class level : std::uint8_t
{
    trace = 0,   ///< Stage-level tracing (very verbose)
    debug = 1,   ///< Debug information
    info = 2,    ///< Informational messages
    warn = 3,    ///< Warnings (recovered failures)
    error = 4,   ///< Errors (operation failures)
    fatal = 5,   ///< Fatal errors (unrecoverable)
    off = 6      ///< Logging disabled
};

/// Log entry structure passed to callbacks
struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string component;  // "decoder", "gateway", "pipeline", ...
    std::string message;
    std::source_location location;
};

/// Log callback signature
using callback_t = std::function<void(const entry&)>;

/// Convert level to string
[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info:  return "INFO";
        case level::warn:  return "WARN";
        case level::error: return "ERROR";
        case level::fatal: return "FATAL";
        case level::off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as used in configuration ("debug", "WARN", ...)
[[nodiscard]] inline bool level_from_string(std::string_view name, level& out) noexcept
{
    constexpr level all[] = {level::trace, level::debug, level::info, level::warn, level::error, level::fatal, level::off};
    for (level lvl : all)
    {
        std::string_view ref = level_to_string(lvl);
        if (ref.size() != name.size())
            continue;
        bool same = true;
        for (std::size_t i = 0; i < ref.size() && same; ++i)
        {
            char c = name[i];
            if (c >= 'a' && c <= 'z')
                c = static_cast<char>(c - 'a' + 'A');
            same = c == ref[i];
        }
        if (same)
        {
            out = lvl;
            return true;
        }
    }
    return false;
}

/// Global logger configuration (thread-safe singleton)
class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    /// Set minimum log level
    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    /// Get current minimum log level
    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    /// Check if level is enabled
    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    /// Set custom log callback (replaces default stderr output)
    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        callback_ = std::move(cb);
    }

    /// Clear custom callback (restore default stderr output)
    void clear_callback()
    {
        std::lock_guard lock(mutex_);
        callback_ = nullptr;
    }

    /// Log a message
    void log(level lvl, std::string_view component, std::string_view message,
             std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;

        entry e{
            .lvl = lvl,
            .timestamp = std::chrono::system_clock::now(),
            .component = std::string(component),
            .message = std::string(message),
            .location = loc
        };

        dispatch(e);
    }

private:
    logger() = default;

    void dispatch(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (callback_)
        {
            callback_(e);
        }
        else
        {
            default_output(e);
        }
    }

    void default_output(const entry& e)
    {
        auto time = std::chrono::system_clock::to_time_t(e.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            e.timestamp.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif

        std::ostringstream line;
        line << '[' << std::setfill('0')
             << std::setw(2) << tm_buf.tm_hour << ':'
             << std::setw(2) << tm_buf.tm_min << ':'
             << std::setw(2) << tm_buf.tm_sec << '.'
             << std::setw(3) << ms.count() << "] ["
             << level_to_string(e.lvl) << "] ";
        if (!e.component.empty())
            line << e.component << ": ";
        line << sanitize(e.message) << '\n';
        std::cerr << line.str();
    }

    /// Replace control characters and truncate very long messages
    [[nodiscard]] static std::string sanitize(std::string_view data)
    {
        std::string result(data);

        constexpr std::size_t max_len = 500;
        if (result.size() > max_len)
        {
            result.resize(max_len);
            result += "... [truncated]";
        }

        for (char& c : result)
        {
            if (static_cast<unsigned char>(c) < 32)
                c = ' ';
        }
        return result;
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::info)};
    std::mutex mutex_;
    callback_t callback_;
};

// Convenience macros for logging with source location
#define TRIAGEXX_LOG(lvl, component, msg) \
    ::triagexx::log::logger::instance().log(lvl, component, msg, std::source_location::current())

#define TRIAGEXX_TRACE(component, msg)  TRIAGEXX_LOG(::triagexx::log::level::trace, component, msg)
#define TRIAGEXX_DEBUG(component, msg)  TRIAGEXX_LOG(::triagexx::log::level::debug, component, msg)
#define TRIAGEXX_INFO(component, msg)   TRIAGEXX_LOG(::triagexx::log::level::info, component, msg)
#define TRIAGEXX_WARN(component, msg)   TRIAGEXX_LOG(::triagexx::log::level::warn, component, msg)
#define TRIAGEXX_ERROR(component, msg)  TRIAGEXX_LOG(::triagexx::log::level::error, component, msg)
#define TRIAGEXX_FATAL(component, msg)  TRIAGEXX_LOG(::triagexx::log::level::fatal, component, msg)

} // namespace triagexx::log
