/*

sanitize.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <emlxx/codec/charset.hpp>
#include <emlxx/detail/ascii.hpp>

namespace emlxx
{
namespace detail
{

inline constexpr std::size_t MAX_NAME_LENGTH = 200;
inline constexpr std::string_view PLACEHOLDER_NAME = "unnamed";
inline constexpr std::string_view NO_EXTENSION_LABEL = "other";

inline bool is_reserved_name_char(char ch) noexcept
{
    switch (ch)
    {
        case '<': case '>': case ':': case '"': case '/': case '\\': case '|': case '?': case '*':
            return true;
        default:
            return false;
    }
}

/**
Making a subject or a filename usable as a single path component.

Reserved characters and control characters become `_`, surrounding whitespace and dots are stripped, the result is cut to `max_length`
code points and an empty result is replaced by the placeholder.
**/
inline std::string sanitize_file_name(std::string_view name, std::size_t max_length = MAX_NAME_LENGTH,
    std::string_view placeholder = PLACEHOLDER_NAME)
{
    std::string out = charset::utf8_replace_invalid(name);
    for (auto& ch : out)
    {
        if (is_reserved_name_char(ch) || (static_cast<unsigned char>(ch) < 0x20 && ch != '\t') || ch == '\x7F')
            ch = '_';
    }

    auto strip = [](char ch) { return is_wsp(ch) || ch == '.'; };
    std::string::size_type begin = 0;
    std::string::size_type end = out.size();
    while (begin < end && strip(out[begin]))
        ++begin;
    while (end > begin && strip(out[end - 1]))
        --end;
    out = out.substr(begin, end - begin);

    if (charset::code_points(out) > max_length)
    {
        out = charset::truncate_code_points(out, max_length);
        // cutting may expose trailing whitespace or dots again
        while (!out.empty() && strip(out.back()))
            out.pop_back();
    }

    if (out.empty())
        return std::string(placeholder);
    return out;
}

/**
Lower casing of UTF-8 text for ASCII and the Latin-1, Greek and Cyrillic capitals; other code points are kept as they are.
**/
inline std::string to_lower_utf8(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        const auto lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80 || i + 1 == text.size())
        {
            out += ascii_tolower(text[i]);
            continue;
        }
        const auto next = static_cast<unsigned char>(text[i + 1]);
        unsigned char lower_lead = lead;
        unsigned char lower_next = next;
        // U+00C0..U+00DE without the multiplication sign
        if (lead == 0xC3 && next >= 0x80 && next <= 0x9E && next != 0x97)
            lower_next = next + 0x20;
        // U+0391..U+03A9 without the unassigned U+03A2
        else if (lead == 0xCE && next >= 0x91 && next <= 0x9F)
            lower_next = next + 0x20;
        else if (lead == 0xCE && next >= 0xA0 && next <= 0xA9 && next != 0xA2)
        {
            lower_lead = 0xCF;
            lower_next = next - 0x20;
        }
        // U+0400..U+042F
        else if (lead == 0xD0 && next >= 0x80 && next <= 0x8F)
        {
            lower_lead = 0xD1;
            lower_next = next + 0x10;
        }
        else if (lead == 0xD0 && next >= 0x90 && next <= 0x9F)
            lower_next = next + 0x20;
        else if (lead == 0xD0 && next >= 0xA0 && next <= 0xAF)
        {
            lower_lead = 0xD1;
            lower_next = next - 0x20;
        }
        else
        {
            out += text[i];
            continue;
        }
        out += static_cast<char>(lower_lead);
        out += static_cast<char>(lower_next);
        ++i;
    }
    return out;
}

/**
Lower cased extension of a sanitized filename without the dot, or the fallback label when there is none.
**/
inline std::string extension_label(std::string_view file_name, std::string_view fallback = NO_EXTENSION_LABEL)
{
    auto dot = file_name.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == file_name.size())
        return std::string(fallback);
    std::string ext = to_lower_utf8(file_name.substr(dot + 1));
    for (char ch : ext)
    {
        if (is_wsp(ch))
            return std::string(fallback);
    }
    return ext;
}

/**
Path from UTF-8 text, independent of the narrow encoding of the platform.
**/
inline std::filesystem::path utf8_path(std::string_view text)
{
    std::u8string u8(text.size(), u8'\0');
    for (std::size_t i = 0; i < text.size(); ++i)
        u8[i] = static_cast<char8_t>(text[i]);
    return std::filesystem::path(u8);
}

/**
UTF-8 text of a path.
**/
inline std::string path_utf8(const std::filesystem::path& p)
{
    auto u8 = p.u8string();
    return std::string(u8.begin(), u8.end());
}

} // namespace detail
} // namespace emlxx
