/*

base64.hpp
----------

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
Base64 decoder for transfer encoded bodies and for the `B` encoded words.
**/
class EMLXX_EXPORT base64 : public codec
{
public:

    /**
    Base64 character set.
    **/
    inline static const std::string CHARSET{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

    base64() = default;

    base64(const base64&) = delete;

    base64(base64&&) = delete;

    /**
    Default destructor.
    **/
    ~base64() = default;

    void operator=(const base64&) = delete;

    void operator=(base64&&) = delete;

    /**
    Decoding Base64 text to the original octets.

    Line breaks and other whitespace are ignored, decoding stops at the first padding character. A trailing group of a single sextet carries no
    complete octet and is dropped.

    @param text        Base64 encoded text, possibly spanning many lines.
    @return            Decoded octets.
    @throw codec_error Bad character, in strict mode only.
    **/
    std::string decode(std::string_view text) const
    {
        std::string dec_text;
        dec_text.reserve(text.size() / SEXTETS_NO * OCTETS_NO + OCTETS_NO);
        unsigned char sextets[SEXTETS_NO];
        int count_4_chars = 0;

        for (char ch : text)
        {
            if (ch == EQUAL_CHAR)
                break;
            if (detail::is_wsp(ch))
                continue;

            if (!is_allowed(ch))
            {
                if (strict_mode_)
                    throw codec_error("Bad character `" + std::string(1, ch) + "`.");
                continue;
            }

            sextets[count_4_chars++] = static_cast<unsigned char>(CHARSET.find(ch));
            if (count_4_chars == SEXTETS_NO)
            {
                append_octets(dec_text, sextets, OCTETS_NO);
                count_4_chars = 0;
            }
        }

        // decode remaining characters if any

        if (count_4_chars > 1)
        {
            for (int i = count_4_chars; i < SEXTETS_NO; i++)
                sextets[i] = 0;
            append_octets(dec_text, sextets, count_4_chars - 1);
        }
        else if (count_4_chars == 1 && strict_mode_)
            throw codec_error("Truncated Base64 group.");

        return dec_text;
    }

private:

    /**
    Checking if the given character is in the base64 character set.

    @param ch Character to check.
    @return   True if it is, false if not.
    **/
    static bool is_allowed(char ch)
    {
        return detail::is_ascii_alnum(ch) || ch == PLUS_CHAR || ch == SLASH_CHAR;
    }

    /**
    Converting four sextets into up to three octets.

    @param out     String to append the octets to.
    @param sextets Four sextet values.
    @param count   Number of octets to append.
    **/
    static void append_octets(std::string& out, const unsigned char* sextets, int count)
    {
        unsigned char octets[OCTETS_NO];
        octets[0] = static_cast<unsigned char>((sextets[0] << 2) + ((sextets[1] & 0x30) >> 4));
        octets[1] = static_cast<unsigned char>(((sextets[1] & 0xf) << 4) + ((sextets[2] & 0x3c) >> 2));
        octets[2] = static_cast<unsigned char>(((sextets[2] & 0x3) << 6) + sextets[3]);
        for (int i = 0; i < count; i++)
            out += static_cast<char>(octets[i]);
    }

	/**
	Number of six bit chunks.
	**/
	static constexpr unsigned short SEXTETS_NO = 4;

	/**
	Number of eight bit characters.
	**/
	static constexpr unsigned short OCTETS_NO = SEXTETS_NO - 1;
};


} // namespace emlxx


#ifdef _MSC_VER
#pragma warning(pop)
#endif
