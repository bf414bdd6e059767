/*

q_codec.hpp
-----------

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
#include <vector>
#include <optional>
#include <emlxx/codec/codec.hpp>
#include <emlxx/codec/base64.hpp>
#include <emlxx/codec/charset.hpp>
#include <emlxx/codec/quoted_printable.hpp>
#include <emlxx/detail/ascii.hpp>
#include <emlxx/export.hpp>


namespace emlxx
{


/**
Q codec, decoder of the RFC 2047 encoded words found in the unstructured headers and in the parameter values.
**/
class EMLXX_EXPORT q_codec : public codec
{
public:

    /**
    Chunk of a header value, either plain text or the octets carried by one or more adjacent encoded words.
    **/
    struct word
    {
        /**
        Octets of the chunk, not yet converted to UTF-8.
        **/
        std::string text;

        /**
        Declared charset, empty for plain text.
        **/
        std::string charset;

        /**
        Method the chunk was encoded with, ASCII for plain text.
        **/
        codec_t method = codec_t::ASCII;
    };

    q_codec() = default;

    q_codec(const q_codec&) = delete;

    q_codec(q_codec&&) = delete;

    /**
    Default destructor.
    **/
    ~q_codec() = default;

    void operator=(const q_codec&) = delete;

    void operator=(q_codec&&) = delete;

    /**
    Decoding the body of a single encoded word, that is the part between `=?` and `?=`.

    @param text        Encoded word body as `charset?method?text`.
    @return            Decoded word.
    @throw codec_error Missing Q codec separator for charset.
    @throw codec_error Missing Q codec separator for codec type.
    @throw codec_error Bad encoding method.
    **/
    word decode(std::string_view text) const
    {
        std::string_view::size_type method_pos = text.find(QUESTION_MARK_CHAR);
        if (method_pos == std::string_view::npos)
            throw codec_error("Missing Q codec separator for charset.");
        std::string_view::size_type content_pos = text.find(QUESTION_MARK_CHAR, method_pos + 1);
        if (content_pos == std::string_view::npos)
            throw codec_error("Missing Q codec separator for codec type.");

        word w;
        w.charset = charset::normalize(text.substr(0, method_pos));
        if (w.charset.empty())
            throw codec_error("Missing Q codec charset.");
        std::string_view method = text.substr(method_pos + 1, content_pos - method_pos - 1);
        std::string_view text_c = text.substr(content_pos + 1);

        if (detail::iequals_ascii(method, BASE64_CODEC_STR))
        {
            base64 b64;
            b64.strict_mode(strict_mode_);
            w.text = b64.decode(text_c);
            w.method = codec_t::BASE64;
        }
        else if (detail::iequals_ascii(method, QP_CODEC_STR))
        {
            quoted_printable qp;
            qp.q_codec_mode(true);
            qp.strict_mode(strict_mode_);
            w.text = qp.decode(text_c);
            w.method = codec_t::QUOTED_PRINTABLE;
        }
        else
            throw codec_error("Bad encoding method.");

        return w;
    }

    /**
    Splitting a header value into plain and encoded chunks.

    Whitespace between two encoded words is dropped, and adjacent encoded words of the same charset are merged so that a multibyte character
    split over two words is decoded as a whole. Text that looks like an encoded word but is not well formed is kept as plain text.

    @param text Header value.
    @return     Chunks in the order of appearance.
    **/
    std::vector<word> split(std::string_view text) const
    {
        std::vector<word> words;
        // Plain text seen since the last encoded word; dropped if it is only whitespace and another encoded word follows.
        std::string pending;
        bool after_encoded = false;

        auto flush_plain = [&words, &pending]()
        {
            if (pending.empty())
                return;
            if (!words.empty() && words.back().method == codec_t::ASCII)
                words.back().text += pending;
            else
                words.push_back(word{pending, std::string(), codec_t::ASCII});
            pending.clear();
        };

        std::string_view::size_type pos = 0;
        while (pos < text.size())
        {
            std::string_view::size_type begin = text.find(ENCODED_WORD_BEGIN, pos);
            if (begin == std::string_view::npos)
            {
                pending.append(text.substr(pos));
                break;
            }

            std::optional<word> decoded;
            std::string_view::size_type end = find_encoded_word_end(text, begin);
            if (end != std::string_view::npos)
            {
                try
                {
                    decoded = decode(text.substr(begin + 2, end - begin - 2));
                }
                catch (const codec_error&)
                {
                    decoded.reset();
                }
            }

            if (!decoded)
            {
                pending.append(text.substr(pos, begin + 2 - pos));
                pos = begin + 2;
                continue;
            }

            pending.append(text.substr(pos, begin - pos));
            if (after_encoded && detail::trim_view(pending).empty())
                pending.clear();
            flush_plain();

            if (!words.empty() && words.back().method != codec_t::ASCII && words.back().charset == decoded->charset)
                words.back().text += decoded->text;
            else
                words.push_back(std::move(*decoded));
            after_encoded = true;
            pos = end + 2;
        }

        flush_plain();
        return words;
    }

private:

    /**
    String representation of Base64 method.
    **/
    inline static const std::string BASE64_CODEC_STR{"B"};

    /**
    String representation of Quoted Printable method.
    **/
    inline static const std::string QP_CODEC_STR{"Q"};

    /**
    Start of an encoded word.
    **/
    inline static const std::string ENCODED_WORD_BEGIN{"=?"};

    /**
    End of an encoded word.
    **/
    inline static const std::string ENCODED_WORD_END{"?="};

    /**
    Locating the closing `?=` of the encoded word starting at the given position.

    The charset and the method cannot contain a question mark, so the search for the end starts after the third one.

    @param text  Header value.
    @param begin Position of the opening `=?`.
    @return      Position of the closing `?=`, or `npos` if the word is not well formed.
    **/
    static std::string_view::size_type find_encoded_word_end(std::string_view text, std::string_view::size_type begin)
    {
        std::string_view::size_type method_pos = text.find(QUESTION_MARK_CHAR, begin + 2);
        if (method_pos == std::string_view::npos)
            return std::string_view::npos;
        std::string_view::size_type content_pos = text.find(QUESTION_MARK_CHAR, method_pos + 1);
        if (content_pos == std::string_view::npos || content_pos != method_pos + 2)
            return std::string_view::npos;
        // Whitespace is not allowed inside the charset.
        for (auto i = begin + 2; i < method_pos; ++i)
            if (detail::is_wsp(text[i]))
                return std::string_view::npos;
        return text.find(ENCODED_WORD_END, content_pos + 1);
    }
};


} // namespace emlxx


#ifdef _MSC_VER
#pragma warning(pop)
#endif
