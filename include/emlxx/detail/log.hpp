/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Lightweight, header-only logging infrastructure for emlxx.
Supports multiple log levels and an optional callback so that a front end can
render the extraction log itself.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iostream>
#include <mutex>
#include <source_location>
#include <string>
#include <string_view>

namespace emlxx::log
{

/// Log severity levels
enum class level : std::uint8_t
{
    trace = 0,   ///< Part-by-part parser tracing (very verbose)
    debug = 1,   ///< Debug information
    info = 2,    ///< Informational messages
    warn = 3,    ///< Warnings (non-fatal issues)
    error = 4,   ///< Errors (per-file failures)
    fatal = 5,   ///< Fatal errors (unrecoverable)
    off = 6      ///< Logging disabled
};

/// Log entry structure passed to callbacks
struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
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
    void log(level lvl, std::string_view message,
             std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;

        entry e{
            .lvl = lvl,
            .timestamp = std::chrono::system_clock::now(),
            .message = std::string(message),
            .location = loc
        };

        dispatch(e);
    }

    /// Format the `[HH:MM:SS.mmm] [LEVEL] message` line used by the default sink
    [[nodiscard]] static std::string format_line(const entry& e)
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

        char stamp[32]{};
        std::snprintf(stamp, sizeof(stamp), "[%02d:%02d:%02d.%03d] ",
            tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms.count()));

        std::string line(stamp);
        line += '[';
        line += level_to_string(e.lvl);
        line += "] ";
        line += e.message;
        return line;
    }

private:
    logger() = default;

    void dispatch(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (callback_)
            callback_(e);
        else
            std::cerr << format_line(e) << '\n';
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::info)};
    std::mutex mutex_;
    callback_t callback_;
};

// Convenience macros for logging with source location
#define EMLXX_LOG(lvl, msg) \
    ::emlxx::log::logger::instance().log(lvl, msg, std::source_location::current())

#define EMLXX_TRACE(msg)  EMLXX_LOG(::emlxx::log::level::trace, msg)
#define EMLXX_DEBUG(msg)  EMLXX_LOG(::emlxx::log::level::debug, msg)
#define EMLXX_INFO(msg)   EMLXX_LOG(::emlxx::log::level::info, msg)
#define EMLXX_WARN(msg)   EMLXX_LOG(::emlxx::log::level::warn, msg)
#define EMLXX_ERROR(msg)  EMLXX_LOG(::emlxx::log::level::error, msg)
#define EMLXX_FATAL(msg)  EMLXX_LOG(::emlxx::log::level::fatal, msg)

} // namespace emlxx::log
