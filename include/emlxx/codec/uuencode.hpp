/*

uuencode.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <string>
#include <string_view>
#include <emlxx/codec/codec.hpp>
#include <emlxx/detail/ascii.hpp>
#include <emlxx/export.hpp>


namespace emlxx
{


/**
Decoder of the `x-uuencode` transfer encoding.

The body holds a `begin <mode> <name>` line, the encoded lines each led by a length character, and an `end` line.
**/
class EMLXX_EXPORT uuencode : public codec
{
public:

    /**
    Names under which the encoding shows up in the `Content-Transfer-Encoding` header, lower case.
    **/
    static bool is_encoding_name(std::string_view name)
    {
        return name == "x-uuencode" || name == "uuencode" || name == "x-uue" || name == "uue";
    }

    uuencode() = default;

    uuencode(const uuencode&) = delete;

    uuencode(uuencode&&) = delete;

    /**
    Default destructor.
    **/
    ~uuencode() = default;

    void operator=(const uuencode&) = delete;

    void operator=(uuencode&&) = delete;

    /**
    Decoding uuencoded text.

    Lines before the `begin` line are ignored, decoding stops at the `end` line. A line longer than its length character announces is cut to the
    announced length, missing characters count as zero. When the `begin` line is absent or an empty line shows up before `end`, the text is
    returned as it is.

    @param text        Uuencoded text.
    @return            Decoded octets.
    @throw codec_error Missing `begin` line, truncated input or bad character, in strict mode only.
    **/
    std::string decode(std::string_view text) const
    {
        std::string_view::size_type pos = 0;
        bool begun = false;
        while (pos < text.size() && !begun)
        {
            auto line = next_line(text, pos);
            begun = is_begin_line(line);
        }
        if (!begun)
        {
            if (strict_mode_)
                throw codec_error("Missing begin line.");
            return std::string(text);
        }

        std::string dec_text;
        dec_text.reserve(text.size() - pos);
        bool ended = false;
        while (pos < text.size())
        {
            auto line = next_line(text, pos);
            if (line.empty())
                break;
            if (detail::trim_view(line) == "end")
            {
                ended = true;
                break;
            }
            decode_line(line, dec_text);
        }

        if (!ended)
        {
            if (strict_mode_)
                throw codec_error("Truncated uuencoded text.");
            return std::string(text);
        }
        return dec_text;
    }

private:

    /**
    Number of octets carried by a full group.
    **/
    static constexpr int OCTETS_NO = 3;

    /**
    Number of characters in a full group.
    **/
    static constexpr int SEXTETS_NO = 4;

    /**
    Longest line payload that the length character can announce.
    **/
    static constexpr int MAX_LINE_OCTETS = 63;

    /**
    Returning the line starting at `pos` without its end of line, and moving `pos` past it.
    **/
    static std::string_view next_line(std::string_view text, std::string_view::size_type& pos)
    {
        auto eol = text.find(LF_CHAR, pos);
        auto end = eol == std::string_view::npos ? text.size() : eol;
        std::string_view line = text.substr(pos, end - pos);
        pos = eol == std::string_view::npos ? text.size() : eol + 1;
        if (!line.empty() && line.back() == CR_CHAR)
            line.remove_suffix(1);
        return line;
    }

    /**
    Checking for `begin` followed by an octal file mode.
    **/
    static bool is_begin_line(std::string_view line)
    {
        constexpr std::string_view prefix = "begin ";
        if (!line.starts_with(prefix))
            return false;
        line.remove_prefix(prefix.size());
        auto mode = line.substr(0, line.find(SPACE_CHAR));
        if (mode.empty())
            return false;
        for (char ch : mode)
            if (ch < '0' || ch > '7')
                return false;
        return true;
    }

    /**
    Value of an encoded character; both the space and the backtick stand for zero.
    **/
    int sextet(char ch) const
    {
        const auto uch = static_cast<unsigned char>(ch);
        if (uch < 0x20 || uch > 0x60)
        {
            if (strict_mode_)
                throw codec_error("Bad character `" + std::string(1, ch) + "`.");
        }
        return (uch - 0x20) & 0x3F;
    }

    void decode_line(std::string_view line, std::string& dec_text) const
    {
        const int length = sextet(line[0]);
        line.remove_prefix(1);

        int written = 0;
        std::string_view::size_type i = 0;
        while (written < length && written < MAX_LINE_OCTETS)
        {
            int group[SEXTETS_NO];
            for (int j = 0; j < SEXTETS_NO; j++, i++)
                group[j] = i < line.size() ? sextet(line[i]) : 0;

            const unsigned char octets[OCTETS_NO] = {
                static_cast<unsigned char>((group[0] << 2) | (group[1] >> 4)),
                static_cast<unsigned char>(((group[1] & 0x0F) << 4) | (group[2] >> 2)),
                static_cast<unsigned char>(((group[2] & 0x03) << 6) | group[3])};
            for (int j = 0; j < OCTETS_NO && written < length; j++, written++)
                dec_text += static_cast<char>(octets[j]);
        }
    }
};


} // namespace emlxx


#ifdef _MSC_VER
#pragma warning(pop)
#endif
