/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
The public emlxx operations return result<T>; exceptions raised by codecs and
by the MIME parser are converted at the library boundary.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace emlxx
{

/// Error categories for emlxx operations
enum class error_code : std::uint16_t
{
    success = 0,

    // MIME/Message errors (600-699)
    malformed_message = 600,
    mime_encoding_error = 601,
    mime_invalid_header = 602,
    mime_missing_boundary = 603,
    mime_nesting_too_deep = 604,

    // Input validation (700-799)
    invalid_argument = 700,

    // File system errors (800-899)
    file_system_error = 800,
    file_not_found = 801,
    file_exists = 802,

    // Internal errors (900-999)
    internal_error = 900,
    cancelled = 902,
};

/// Convert error code to string
[[nodiscard]] constexpr std::string_view error_code_to_string(error_code ec) noexcept
{
    switch (ec)
    {
        case error_code::success: return "Success";
        case error_code::malformed_message: return "Malformed message";
        case error_code::mime_encoding_error: return "MIME encoding error";
        case error_code::mime_invalid_header: return "MIME invalid header";
        case error_code::mime_missing_boundary: return "MIME missing boundary";
        case error_code::mime_nesting_too_deep: return "MIME nesting too deep";
        case error_code::invalid_argument: return "Invalid argument";
        case error_code::file_system_error: return "File system error";
        case error_code::file_not_found: return "File not found";
        case error_code::file_exists: return "File exists";
        case error_code::internal_error: return "Internal error";
        case error_code::cancelled: return "Operation cancelled";
    }
    return "Unknown error";
}

/// Rich error type with code, message and optional structured detail
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

    /// `key=value` lines, see detail::error_detail
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

    [[nodiscard]] bool is_success() const noexcept { return code_ == error_code::success; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_success(); }

    /// Format error for display
    [[nodiscard]] std::string to_string() const
    {
        return "[" + std::to_string(static_cast<int>(code_)) + "] " + message_;
    }

    /// Check if this is a specific error
    [[nodiscard]] bool is(error_code ec) const noexcept { return code_ == ec; }

    /// Check if the message itself could not be understood
    [[nodiscard]] bool is_message_error() const noexcept
    {
        auto c = static_cast<std::uint16_t>(code_);
        return c >= 600 && c < 700;
    }

    /// Check if the failure comes from the file system
    [[nodiscard]] bool is_file_system_error() const noexcept
    {
        auto c = static_cast<std::uint16_t>(code_);
        return c >= 800 && c < 900;
    }

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

} // namespace emlxx
