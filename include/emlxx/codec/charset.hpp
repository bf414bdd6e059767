/*

charset.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Conversion of header and parameter octets in a declared charset to UTF-8,
built on the iconv(3) interface of the C library.

*/


#pragma once

#include <cerrno>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <iconv.h>
#include <emlxx/detail/ascii.hpp>
#include <emlxx/export.hpp>


namespace emlxx
{


/**
Charset conversions to UTF-8.

Every text handed out by emlxx is UTF-8. Conversions that cannot be done exactly fall back to UTF-8 decoding where each invalid sequence
becomes the replacement character U+FFFD, so no text is ever dropped.
**/
class EMLXX_EXPORT charset
{
public:

    /**
    UTF-8 encoding of the replacement character U+FFFD.
    **/
    inline static const std::string REPLACEMENT_CHAR{"\xEF\xBF\xBD"};

    charset() = delete;

    /**
    Normalizing a charset label as found in headers.

    Surrounding whitespace and quotes are removed, and so is the RFC 2231 language suffix (`utf-8*en`).

    @param label Charset label.
    @return      Upper cased bare charset name.
    **/
    static std::string normalize(std::string_view label)
    {
        label = detail::trim_view(label);
        if (label.size() >= 2 && label.front() == '"' && label.back() == '"')
            label = detail::trim_view(label.substr(1, label.size() - 2));
        auto star = label.find('*');
        if (star != std::string_view::npos)
            label = label.substr(0, star);

        std::string name(label);
        for (auto& ch : name)
            if (ch >= 'a' && ch <= 'z')
                ch = static_cast<char>(ch - ('a' - 'A'));
        return name;
    }

    /**
    Converting octets in the given charset to UTF-8.

    @param text  Octets to convert.
    @param label Declared charset.
    @return      UTF-8 text, or nothing if the charset is unknown or the octets are invalid for it.
    **/
    static std::optional<std::string> to_utf8(std::string_view text, std::string_view label)
    {
        const std::string name = normalize(label);
        if (name.empty())
            return std::nullopt;

        if (name == "UTF-8" || name == "UTF8")
        {
            if (!is_valid_utf8(text))
                return std::nullopt;
            return std::string(text);
        }
        if (name == "US-ASCII" || name == "ASCII")
        {
            for (char ch : text)
                if (static_cast<unsigned char>(ch) > 127)
                    return std::nullopt;
            return std::string(text);
        }

        converter conv(name);
        if (!conv.valid())
            return std::nullopt;
        return conv.convert(text);
    }

    /**
    Converting octets to UTF-8, falling back to a lossy UTF-8 decoding.

    @param text  Octets to convert.
    @param label Declared charset, empty if none.
    @return      UTF-8 text.
    **/
    static std::string to_utf8_or_replace(std::string_view text, std::string_view label)
    {
        if (!label.empty())
        {
            auto converted = to_utf8(text, label);
            if (converted)
                return std::move(*converted);
        }
        return utf8_replace_invalid(text);
    }

    /**
    Checking whether octets form well formed UTF-8.

    @param text Octets to check.
    @return     True if valid, false if not.
    **/
    static bool is_valid_utf8(std::string_view text)
    {
        std::size_t pos = 0;
        while (pos < text.size())
        {
            std::size_t len = valid_sequence_length(text, pos);
            if (len == 0)
                return false;
            pos += len;
        }
        return true;
    }

    /**
    Decoding octets as UTF-8, replacing each maximal invalid subsequence by U+FFFD.

    @param text Octets to decode.
    @return     Well formed UTF-8 text.
    **/
    static std::string utf8_replace_invalid(std::string_view text)
    {
        std::string out;
        out.reserve(text.size());
        std::size_t pos = 0;
        while (pos < text.size())
        {
            std::size_t len = valid_sequence_length(text, pos);
            if (len > 0)
            {
                out.append(text.substr(pos, len));
                pos += len;
            }
            else
            {
                out += REPLACEMENT_CHAR;
                pos += invalid_prefix_length(text, pos);
            }
        }
        return out;
    }

    /**
    Counting code points of a well formed UTF-8 text.

    @param text UTF-8 text.
    @return     Number of code points.
    **/
    static std::size_t code_points(std::string_view text)
    {
        std::size_t count = 0;
        for (char ch : text)
            if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80)
                ++count;
        return count;
    }

    /**
    Truncating a well formed UTF-8 text to a number of code points without splitting a sequence.

    @param text  UTF-8 text.
    @param limit Maximum number of code points.
    @return      The truncated text.
    **/
    static std::string truncate_code_points(std::string_view text, std::size_t limit)
    {
        std::size_t count = 0;
        for (std::size_t pos = 0; pos < text.size(); ++pos)
        {
            if ((static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80)
                continue;
            if (count == limit)
                return std::string(text.substr(0, pos));
            ++count;
        }
        return std::string(text);
    }

private:

    /**
    RAII holder of an iconv descriptor converting to UTF-8.
    **/
    class converter
    {
    public:
        explicit converter(const std::string& from) : cd_(iconv_open("UTF-8", from.c_str()))
        {
        }

        converter(const converter&) = delete;

        converter& operator=(const converter&) = delete;

        ~converter()
        {
            if (valid())
                iconv_close(cd_);
        }

        bool valid() const
        {
            return cd_ != reinterpret_cast<iconv_t>(-1);
        }

        std::optional<std::string> convert(std::string_view text)
        {
            std::string out;
            out.resize(text.size() * 2 + 16);
            char* in_ptr = const_cast<char*>(text.data());
            std::size_t in_left = text.size();
            std::size_t written = 0;

            while (true)
            {
                char* out_ptr = out.data() + written;
                std::size_t out_left = out.size() - written;
                // A null input flushes the shift state of stateful charsets like ISO-2022-JP.
                std::size_t rc = in_left > 0 ? iconv(cd_, &in_ptr, &in_left, &out_ptr, &out_left)
                    : iconv(cd_, nullptr, nullptr, &out_ptr, &out_left);
                written = out.size() - out_left;
                if (rc != static_cast<std::size_t>(-1))
                {
                    if (in_left == 0 && in_ptr != nullptr)
                    {
                        in_ptr = nullptr;
                        continue;
                    }
                    break;
                }
                if (errno == E2BIG)
                {
                    out.resize(out.size() * 2);
                    continue;
                }
                return std::nullopt;
            }

            out.resize(written);
            return out;
        }

    private:
        iconv_t cd_;
    };

    /**
    Length of the well formed UTF-8 sequence starting at the given position.

    @return Sequence length, zero if the sequence is not well formed.
    **/
    static std::size_t valid_sequence_length(std::string_view text, std::size_t pos)
    {
        const auto lead = static_cast<unsigned char>(text[pos]);
        if (lead < 0x80)
            return 1;

        std::size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF)
            len = 2;
        else if (lead == 0xE0)
        {
            len = 3;
            lo = 0xA0;
        }
        else if (lead == 0xED)
        {
            len = 3;
            hi = 0x9F;
        }
        else if (lead >= 0xE1 && lead <= 0xEF)
            len = 3;
        else if (lead == 0xF0)
        {
            len = 4;
            lo = 0x90;
        }
        else if (lead == 0xF4)
        {
            len = 4;
            hi = 0x8F;
        }
        else if (lead >= 0xF1 && lead <= 0xF3)
            len = 4;
        else
            return 0;

        if (pos + len > text.size())
            return 0;
        for (std::size_t i = 1; i < len; ++i)
        {
            const auto ch = static_cast<unsigned char>(text[pos + i]);
            const unsigned char min = i == 1 ? lo : 0x80;
            const unsigned char max = i == 1 ? hi : 0xBF;
            if (ch < min || ch > max)
                return 0;
        }
        return len;
    }

    /**
    Length of the maximal prefix of an ill formed sequence, at least one octet.
    **/
    static std::size_t invalid_prefix_length(std::string_view text, std::size_t pos)
    {
        const auto lead = static_cast<unsigned char>(text[pos]);
        std::size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF)
            len = 2;
        else if (lead >= 0xE0 && lead <= 0xEF)
        {
            len = 3;
            if (lead == 0xE0)
                lo = 0xA0;
            else if (lead == 0xED)
                hi = 0x9F;
        }
        else if (lead >= 0xF0 && lead <= 0xF4)
        {
            len = 4;
            if (lead == 0xF0)
                lo = 0x90;
            else if (lead == 0xF4)
                hi = 0x8F;
        }
        else
            return 1;

        std::size_t consumed = 1;
        while (consumed < len && pos + consumed < text.size())
        {
            const auto ch = static_cast<unsigned char>(text[pos + consumed]);
            const unsigned char min = consumed == 1 ? lo : 0x80;
            const unsigned char max = consumed == 1 ? hi : 0xBF;
            if (ch < min || ch > max)
                break;
            ++consumed;
        }
        return consumed;
    }
};


} // namespace emlxx
