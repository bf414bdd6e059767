/*

header.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Header field values: decoding of the encoded words of unstructured text and
parsing of the parameterized values of Content-Type and Content-Disposition,
including the RFC 2231 extended and continued parameters.

*/


#pragma once

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <emlxx/codec/charset.hpp>
#include <emlxx/codec/q_codec.hpp>
#include <emlxx/detail/ascii.hpp>
#include <emlxx/export.hpp>


namespace emlxx
{


/**
Decoding header text to UTF-8.

Each encoded word is converted from its declared charset; an unknown charset or octets invalid for it fall back to UTF-8 with the invalid
sequences replaced. Plain text is taken as UTF-8 the same way. The chunks are concatenated without any separator. It never throws.

@param value Raw header value, absent if the header is missing.
@return      Decoded text, empty for an absent header.
**/
[[nodiscard]] inline std::string decode_header_text(std::optional<std::string_view> value)
{
    if (!value)
        return {};

    q_codec qc;
    std::string decoded;
    for (const auto& w : qc.split(detail::trim_view(*value)))
        decoded += charset::to_utf8_or_replace(w.text, w.charset);
    return decoded;
}


/**
Header value of the form `token; name=value; ...` as used by Content-Type and Content-Disposition.
**/
class EMLXX_EXPORT parameterized_value
{
public:

    parameterized_value() = default;

    /**
    Parsing a header value.

    Parameter names are case insensitive and kept lower cased. Quoted values are unquoted. RFC 2231 continuations are joined and extended
    values are percent decoded and converted to UTF-8; an extended value takes precedence over a plain one of the same name.

    @param header_value Unfolded header value.
    **/
    explicit parameterized_value(std::string_view header_value)
    {
        auto segments = split_segments(header_value);
        if (segments.empty())
            return;
        value_ = detail::to_lower_ascii(detail::trim_view(segments.front()));

        std::map<std::string, std::string> plain;
        std::map<std::string, std::vector<continuation>> extended;
        for (std::size_t i = 1; i < segments.size(); ++i)
        {
            std::string_view segment = segments[i];
            auto eq = segment.find('=');
            if (eq == std::string_view::npos)
                continue;
            std::string name = detail::to_lower_ascii(detail::trim_view(segment.substr(0, eq)));
            std::string val = unquote(detail::trim_view(segment.substr(eq + 1)));
            if (name.empty())
                continue;

            auto star = name.find('*');
            if (star == std::string::npos)
            {
                plain.emplace(std::move(name), std::move(val));
                continue;
            }

            // name*, name*N or name*N*
            continuation cont;
            cont.encoded = name.back() == '*';
            std::string index = name.substr(star + 1);
            if (cont.encoded && !index.empty())
                index.pop_back();
            if (!index.empty() && !std::all_of(index.begin(), index.end(), detail::is_ascii_digit))
                continue;
            cont.index = index.empty() ? 0 : std::stoul(index.substr(0, 9));
            cont.text = std::move(val);
            extended[name.substr(0, star)].push_back(std::move(cont));
        }

        for (auto& [name, val] : plain)
            params_[name] = std::move(val);
        for (auto& [name, conts] : extended)
            params_[name] = join_continuations(conts);
    }

    /**
    Lower cased main value, such as `multipart/mixed` or `attachment`.
    **/
    const std::string& value() const
    {
        return value_;
    }

    /**
    Returning a parameter by its case insensitive name.

    @param name Parameter name.
    @return     Parameter value if present.
    **/
    std::optional<std::string> param(std::string_view name) const
    {
        auto it = params_.find(detail::to_lower_ascii(name));
        if (it == params_.end())
            return std::nullopt;
        return it->second;
    }

    const std::map<std::string, std::string>& params() const
    {
        return params_;
    }

private:

    struct continuation
    {
        unsigned long index = 0;
        bool encoded = false;
        std::string text;
    };

    /**
    Splitting on semicolons outside of quoted strings.
    **/
    static std::vector<std::string_view> split_segments(std::string_view text)
    {
        std::vector<std::string_view> segments;
        bool quoted = false;
        std::string_view::size_type start = 0;
        for (std::string_view::size_type i = 0; i < text.size(); ++i)
        {
            const char ch = text[i];
            if (quoted && ch == '\\')
                ++i;
            else if (ch == '"')
                quoted = !quoted;
            else if (ch == ';' && !quoted)
            {
                segments.push_back(text.substr(start, i - start));
                start = i + 1;
            }
        }
        segments.push_back(text.substr(start));
        return segments;
    }

    /**
    Removing the quotes and the backslash escapes of a quoted string; a missing closing quote is tolerated.
    **/
    static std::string unquote(std::string_view text)
    {
        if (text.empty() || text.front() != '"')
            return std::string(text);

        std::string out;
        for (std::string_view::size_type i = 1; i < text.size(); ++i)
        {
            const char ch = text[i];
            if (ch == '\\' && i + 1 < text.size())
                out += text[++i];
            else if (ch == '"')
                break;
            else
                out += ch;
        }
        return out;
    }

    static std::string percent_decode(std::string_view text)
    {
        std::string out;
        out.reserve(text.size());
        for (std::string_view::size_type i = 0; i < text.size(); ++i)
        {
            if (text[i] == '%' && i + 2 < text.size() && detail::is_hex_digit(text[i + 1]) && detail::is_hex_digit(text[i + 2]))
            {
                out += static_cast<char>((detail::hex_value(text[i + 1]) << 4) + detail::hex_value(text[i + 2]));
                i += 2;
            }
            else
                out += text[i];
        }
        return out;
    }

    /**
    Joining RFC 2231 continuations in index order; the charset comes from the first one (`charset'language'text`).
    **/
    static std::string join_continuations(std::vector<continuation>& conts)
    {
        std::stable_sort(conts.begin(), conts.end(), [](const continuation& a, const continuation& b) { return a.index < b.index; });

        std::string label;
        std::string octets;
        for (std::size_t i = 0; i < conts.size(); ++i)
        {
            std::string_view text = conts[i].text;
            if (i == 0 && conts[i].encoded)
            {
                auto first = text.find('\'');
                auto second = first == std::string_view::npos ? std::string_view::npos : text.find('\'', first + 1);
                if (second != std::string_view::npos)
                {
                    label = std::string(text.substr(0, first));
                    text = text.substr(second + 1);
                }
            }
            octets += conts[i].encoded ? percent_decode(text) : std::string(text);
        }
        return charset::to_utf8_or_replace(octets, label);
    }

    std::string value_;
    std::map<std::string, std::string> params_;
};


} // namespace emlxx
