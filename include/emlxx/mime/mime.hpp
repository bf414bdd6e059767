/*

mime.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <algorithm>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <emlxx/codec/base64.hpp>
#include <emlxx/codec/quoted_printable.hpp>
#include <emlxx/codec/uuencode.hpp>
#include <emlxx/detail/ascii.hpp>
#include <emlxx/detail/log.hpp>
#include <emlxx/detail/result.hpp>
#include <emlxx/mime/header.hpp>
#include <emlxx/export.hpp>


namespace emlxx
{


/**
Options applied while parsing a message.
**/
struct mime_options
{
    /**
    Strict mode of the body decoders; when off, characters outside of the Base64 alphabet and malformed quoted printable escapes are tolerated.
    **/
    bool strict = false;

    /**
    Deepest allowed nesting of multipart and embedded message containers.
    **/
    std::size_t max_nesting_depth = 64;
};


/**
Error thrown by the MIME parser.
**/
class mime_error : public std::runtime_error
{
public:

    /**
    Calling parent constructor and storing the error kind and details.

    @param code    Error kind.
    @param msg     Error message.
    @param details Detailed message.
    **/
    mime_error(error_code code, const std::string& msg, std::string details = std::string())
        : std::runtime_error(msg), code_(code), details_(std::move(details))
    {
    }

    /**
    Calling parent constructor as a malformed message error.

    @param msg     Error message.
    @param details Detailed message.
    **/
    explicit mime_error(const std::string& msg, std::string details = std::string())
        : mime_error(error_code::malformed_message, msg, std::move(details))
    {
    }

    error_code code() const noexcept
    {
        return code_;
    }

    const std::string& details() const noexcept
    {
        return details_;
    }

private:

    error_code code_;

    std::string details_;
};


/**
Node of a parsed message: its headers, its decoded body or its nested parts.

A node is built once by `parse()` and only read afterwards.
**/
class EMLXX_EXPORT mime
{
public:

    /**
    Header field as found in the message, name as written and value unfolded.
    **/
    using header_t = std::pair<std::string, std::string>;

    inline static const std::string CONTENT_TYPE_HEADER{"Content-Type"};
    inline static const std::string CONTENT_TRANSFER_ENCODING_HEADER{"Content-Transfer-Encoding"};
    inline static const std::string CONTENT_DISPOSITION_HEADER{"Content-Disposition"};

    mime() = default;

    mime(const mime&) = default;

    mime(mime&&) = default;

    virtual ~mime() = default;

    mime& operator=(const mime&) = default;

    mime& operator=(mime&&) = default;

    /**
    Parsing a part, including all nested parts.

    @param raw  Raw octets of the part, headers and body.
    @param opts Parsing options.
    @throw mime_error Missing header section at the top level.
    @throw mime_error Nesting deeper than allowed.
    @throw *          `base64::decode()`, `quoted_printable::decode()`, `uuencode::decode()` in the strict mode.
    **/
    void parse(std::string_view raw, const mime_options& opts = mime_options{})
    {
        parse_part(raw, opts, 0, true, false);
    }

    /**
    Headers in the order of appearance.
    **/
    const std::vector<header_t>& headers() const
    {
        return headers_;
    }

    /**
    Returning the first header of the given name.

    @param name Case insensitive header name.
    @return     Unfolded value, absent if there is no such header.
    **/
    std::optional<std::string_view> header(std::string_view name) const
    {
        for (const auto& h : headers_)
            if (detail::iequals_ascii(h.first, name))
                return std::string_view(h.second);
        return std::nullopt;
    }

    /**
    Lower cased `type/subtype`, `text/plain` when missing or invalid.
    **/
    const std::string& content_type() const
    {
        return content_type_;
    }

    /**
    Checking whether the part is a multipart container.
    **/
    bool is_multipart() const
    {
        return detail::istarts_with_ascii(content_type_, "multipart/");
    }

    /**
    Lower cased Content-Disposition value such as `attachment` or `inline`, absent when the header is missing.
    **/
    std::optional<std::string> content_disposition() const
    {
        auto value = header(CONTENT_DISPOSITION_HEADER);
        if (!value)
            return std::nullopt;
        parameterized_value disposition(*value);
        if (disposition.value().empty())
            return std::nullopt;
        return disposition.value();
    }

    /**
    Filename as written in the headers, possibly made of encoded words.

    Taken from the `filename` parameter of Content-Disposition, or else from the `name` parameter of Content-Type. RFC 2231 parameters
    are already decoded to UTF-8.

    @return Raw filename, absent if none of the parameters is there.
    **/
    std::optional<std::string> raw_filename() const
    {
        if (auto value = header(CONTENT_DISPOSITION_HEADER))
            if (auto name = parameterized_value(*value).param("filename"))
                return name;
        if (auto value = header(CONTENT_TYPE_HEADER))
            if (auto name = parameterized_value(*value).param("name"))
                return name;
        return std::nullopt;
    }

    /**
    Filename decoded to UTF-8 and trimmed, empty if there is none.
    **/
    std::string filename() const
    {
        auto raw = raw_filename();
        if (!raw)
            return {};
        return detail::trim_copy(decode_header_text(*raw));
    }

    /**
    Lower cased Content-Transfer-Encoding, `7bit` when missing.
    **/
    std::string transfer_encoding() const
    {
        auto value = header(CONTENT_TRANSFER_ENCODING_HEADER);
        if (!value || detail::trim_view(*value).empty())
            return "7bit";
        return detail::to_lower_ascii(detail::trim_view(*value));
    }

    /**
    Body octets with the transfer encoding removed; absent for containers.
    **/
    const std::optional<std::string>& payload() const
    {
        return payload_;
    }

    /**
    Nested parts of a multipart, or the single embedded message of a `message/rfc822` part.
    **/
    const std::vector<mime>& parts() const
    {
        return parts_;
    }

    /**
    Visiting this part and all nested parts depth first in document order.

    @param visitor Callable taking `const mime&`.
    **/
    template<typename Visitor>
    void walk(Visitor&& visitor) const
    {
        visitor(*this);
        for (const auto& part : parts_)
            part.walk(visitor);
    }

    /**
    Counting this part and all nested parts.
    **/
    std::size_t part_count() const
    {
        std::size_t count = 0;
        walk([&count](const mime&) { ++count; });
        return count;
    }

protected:

    /**
    Line of the raw text: its content and the position right after its line break.
    **/
    struct line_t
    {
        std::string_view text;
        std::string_view::size_type next;
    };

    /**
    Reading the line starting at the given position, without its CRLF or LF.
    **/
    static line_t read_line(std::string_view raw, std::string_view::size_type pos)
    {
        auto lf = raw.find(codec::LF_CHAR, pos);
        if (lf == std::string_view::npos)
            return {raw.substr(pos), raw.size()};
        auto end = lf;
        if (end > pos && raw[end - 1] == codec::CR_CHAR)
            --end;
        return {raw.substr(pos, end - pos), lf + 1};
    }

    /**
    Checking whether a line starts a header field and splitting it.

    @return Name and value position, absent if the line is not a header field.
    **/
    static std::optional<std::string_view::size_type> header_colon(std::string_view line)
    {
        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0)
            return std::nullopt;
        // Whitespace before the colon is obsolete syntax, still seen in the wild.
        std::string_view name = line.substr(0, colon);
        while (!name.empty() && (name.back() == ' ' || name.back() == '\t'))
            name.remove_suffix(1);
        if (!detail::is_valid_header_name(name))
            return std::nullopt;
        return colon;
    }

    /**
    Parsing the header section.

    @param raw Raw part.
    @param top Whether this is the top level message, which has to start with a header field.
    @return    Position of the body.
    @throw mime_error No header fields at the top level.
    **/
    std::string_view::size_type parse_headers(std::string_view raw, bool top)
    {
        std::string_view::size_type pos = 0;

        // Envelope line of messages saved out of an mbox.
        if (top && raw.starts_with("From "))
            pos = read_line(raw, pos).next;

        bool first = true;
        while (pos < raw.size())
        {
            line_t line = read_line(raw, pos);
            if (line.text.empty())
                return line.next;

            if (line.text.front() == codec::SPACE_CHAR || line.text.front() == '\t')
            {
                if (headers_.empty())
                {
                    if (top && first)
                        throw mime_error("Message starts with a continuation line.");
                    return pos;
                }
                headers_.back().second += line.text;
                pos = line.next;
                first = false;
                continue;
            }

            auto colon = header_colon(line.text);
            if (!colon)
            {
                if (top && first)
                    throw mime_error("No header fields found.", "line=" + std::string(line.text.substr(0, 80)));
                // The body begins without the empty separator line.
                return pos;
            }

            std::string name(detail::trim_view(line.text.substr(0, *colon)));
            std::string value(detail::trim_view(line.text.substr(*colon + 1)));
            headers_.emplace_back(std::move(name), std::move(value));
            pos = line.next;
            first = false;
        }
        return raw.size();
    }

    /**
    Finding the encapsulated parts of a multipart body.

    A delimiter line is `--boundary` followed only by optional whitespace, the closing one has an additional `--`. The line break before a
    delimiter belongs to it. The preamble and the epilogue are ignored, a missing closing delimiter ends the last part at the end of the body.
    **/
    static std::vector<std::string_view> split_multipart(std::string_view body, const std::string& boundary)
    {
        const std::string delimiter = "--" + boundary;
        std::vector<std::string_view> bodies;
        std::optional<std::string_view::size_type> part_begin;

        std::string_view::size_type pos = 0;
        while (pos < body.size())
        {
            line_t line = read_line(body, pos);
            if (line.text.starts_with(delimiter))
            {
                std::string_view rest = line.text.substr(delimiter.size());
                bool closing = rest.starts_with("--");
                if (closing)
                    rest.remove_prefix(2);
                if (detail::trim_view(rest).empty())
                {
                    if (part_begin)
                    {
                        // Drop the line break preceding the delimiter.
                        auto part_end = pos;
                        if (part_end > *part_begin && body[part_end - 1] == codec::LF_CHAR)
                            --part_end;
                        if (part_end > *part_begin && body[part_end - 1] == codec::CR_CHAR)
                            --part_end;
                        bodies.push_back(body.substr(*part_begin, part_end - *part_begin));
                    }
                    if (closing)
                        return bodies;
                    part_begin = line.next;
                }
            }
            pos = line.next;
        }

        if (part_begin)
            bodies.push_back(body.substr(std::min(*part_begin, body.size())));
        return bodies;
    }

    /**
    Parsing a part of the given nesting depth.

    @param raw    Raw part.
    @param opts   Parsing options.
    @param depth  Nesting depth, zero for the top level.
    @param top    Whether this is the top level message.
    @param digest Whether the enclosing multipart is a digest, where the default type is `message/rfc822`.
    **/
    void parse_part(std::string_view raw, const mime_options& opts, std::size_t depth, bool top, bool digest)
    {
        if (depth > opts.max_nesting_depth)
            throw mime_error(error_code::mime_nesting_too_deep, "Parts nested too deep.",
                "max_nesting_depth=" + std::to_string(opts.max_nesting_depth));
        if (top && detail::trim_view(raw).empty())
            throw mime_error("Empty message.");

        headers_.clear();
        parts_.clear();
        payload_.reset();

        auto body_pos = parse_headers(raw, top);
        std::string_view body = raw.substr(std::min(body_pos, raw.size()));

        parameterized_value type;
        if (auto value = header(CONTENT_TYPE_HEADER))
            type = parameterized_value(*value);
        const auto slash = type.value().find('/');
        if (slash != std::string::npos && slash > 0 && slash + 1 < type.value().size())
            content_type_ = type.value();
        else
            content_type_ = digest ? "message/rfc822" : "text/plain";

        if (is_multipart())
        {
            auto boundary = type.param("boundary");
            if (!boundary || boundary->empty())
            {
                // Nothing to split on; the container stays empty and its siblings are still parsed.
                EMLXX_WARN("Multipart without boundary, content type " + content_type_ + " left empty");
                return;
            }

            const bool is_digest = content_type_ == "multipart/digest";
            for (auto part_raw : split_multipart(body, *boundary))
            {
                mime part;
                part.parse_part(part_raw, opts, depth + 1, false, is_digest);
                parts_.push_back(std::move(part));
            }
        }
        else if (content_type_ == "message/rfc822" && !detail::trim_view(body).empty())
        {
            mime embedded;
            embedded.parse_part(body, opts, depth + 1, false, false);
            parts_.push_back(std::move(embedded));
        }
        else
            payload_ = decode_body(body, transfer_encoding(), opts);
    }

    /**
    Removing the transfer encoding; unknown encodings and the identity ones leave the octets as they are.
    **/
    static std::string decode_body(std::string_view body, const std::string& encoding, const mime_options& opts)
    {
        if (encoding == "base64")
        {
            base64 b64;
            b64.strict_mode(opts.strict);
            return b64.decode(body);
        }
        if (encoding == "quoted-printable")
        {
            quoted_printable qp;
            qp.strict_mode(opts.strict);
            return qp.decode(body);
        }
        if (uuencode::is_encoding_name(encoding))
        {
            uuencode uu;
            uu.strict_mode(opts.strict);
            return uu.decode(body);
        }
        return std::string(body);
    }

    std::vector<header_t> headers_;

    std::string content_type_{"text/plain"};

    std::optional<std::string> payload_;

    std::vector<mime> parts_;
};


} // namespace emlxx


#ifdef _MSC_VER
#pragma warning(pop)
#endif
