/*

quoted_printable.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <emlxx/codec/codec.hpp>
#include <emlxx/detail/ascii.hpp>
#include <emlxx/export.hpp>


namespace emlxx
{


/**
Quoted Printable decoder.

The Q codec mode turns it into the variant used by the encoded words, where the underscore stands for the space and there are no soft line
breaks.
**/
class EMLXX_EXPORT quoted_printable : public codec
{
public:

    quoted_printable() : q_codec_mode_(false)
    {
    }

    quoted_printable(const quoted_printable&) = delete;

    quoted_printable(quoted_printable&&) = delete;

    /**
    Default destructor.
    **/
    ~quoted_printable() = default;

    void operator=(const quoted_printable&) = delete;

    void operator=(quoted_printable&&) = delete;

    /**
    Decoding quoted printable text.

    Line endings are kept as found in the input, soft line breaks (`=` before the end of line) are removed. An equal sign not followed by two
    hexadecimal digits is kept literally unless the strict mode is on.

    @param text        Quoted printable text.
    @return            Decoded octets.
    @throw codec_error Bad hexadecimal digit, in strict mode only.
    **/
    std::string decode(std::string_view text) const
    {
        std::string dec_text;
        dec_text.reserve(text.size());

        for (std::string_view::size_type i = 0; i < text.size(); i++)
        {
            const char ch = text[i];
            if (ch == EQUAL_CHAR)
            {
                if (!q_codec_mode_)
                {
                    // Soft break, tolerating transport padding before the line end.
                    std::string_view::size_type eol = i + 1;
                    while (eol < text.size() && (text[eol] == SPACE_CHAR || text[eol] == '\t'))
                        eol++;
                    if (eol == text.size())
                        break;
                    if (text[eol] == CR_CHAR && eol + 1 < text.size() && text[eol + 1] == LF_CHAR)
                    {
                        i = eol + 1;
                        continue;
                    }
                    if (text[eol] == LF_CHAR)
                    {
                        i = eol;
                        continue;
                    }
                }

                if (i + 2 < text.size() && detail::is_hex_digit(text[i + 1]) && detail::is_hex_digit(text[i + 2]))
                {
                    dec_text += static_cast<char>((detail::hex_value(text[i + 1]) << 4) + detail::hex_value(text[i + 2]));
                    i += 2;
                    continue;
                }

                if (strict_mode_)
                    throw codec_error("Bad hexadecimal digit.");
                dec_text += ch;
            }
            else if (q_codec_mode_ && ch == UNDERSCORE_CHAR)
                dec_text += SPACE_CHAR;
            else
                dec_text += ch;
        }

        return dec_text;
    }

    /**
    Setting Q codec mode.

    @param mode True to set, false to unset.
    **/
    void q_codec_mode(bool mode)
    {
        q_codec_mode_ = mode;
    }

private:

    /**
    Flag for the Q codec mode.
    **/
    bool q_codec_mode_;
};


} // namespace emlxx
