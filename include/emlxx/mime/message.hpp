/*

message.hpp
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

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include <emlxx/detail/error_detail.hpp>
#include <emlxx/detail/exception_bridge.hpp>
#include <emlxx/detail/result.hpp>
#include <emlxx/mime/header.hpp>
#include <emlxx/mime/mime.hpp>
#include <emlxx/export.hpp>


namespace emlxx
{


/**
Mail message: the top level part together with the message headers.
**/
class EMLXX_EXPORT message : public mime
{
public:

    inline static const std::string SUBJECT_HEADER{"Subject"};

    message() = default;

    message(const message&) = default;

    message(message&&) = default;

    ~message() = default;

    message& operator=(const message&) = default;

    message& operator=(message&&) = default;

    /**
    Subject decoded to UTF-8, empty if there is none.
    **/
    std::string subject() const
    {
        return decode_header_text(header(SUBJECT_HEADER));
    }

    /**
    Returning the parts that are attachments, in document order.

    A part qualifies when its disposition is `attachment`, its decoded filename is not empty and its payload is not empty.

    @return Pointers to the qualifying parts, valid as long as the message is.
    **/
    std::vector<const mime*> attachments() const
    {
        std::vector<const mime*> found;
        walk([&found](const mime& part)
        {
            auto disposition = part.content_disposition();
            if (!disposition || *disposition != "attachment")
                return;
            if (part.filename().empty())
                return;
            if (!part.payload() || part.payload()->empty())
                return;
            found.push_back(&part);
        });
        return found;
    }
};


/**
Parsing raw octets into a message.

@param raw  Message octets.
@param opts Parsing options.
@return     Parsed message, or the error kind `malformed_message` (or a more specific message error) when the octets are not a message.
**/
[[nodiscard]] inline result<message> parse_message(std::string_view raw, const mime_options& opts = mime_options{})
{
    return protect([&]()
    {
        message msg;
        msg.parse(raw, opts);
        return msg;
    }, error_code::malformed_message);
}


/**
Reading a whole file in binary mode.

@param path File to read.
@return     File octets, or `file_not_found` / `file_system_error`.
**/
[[nodiscard]] inline result<std::string> read_file(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
    {
        detail::error_detail detail;
        detail.add_path("path", path);
        if (ec)
            detail.add_ec("errc", ec);
        return fail<std::string>(error_code::file_not_found, "Not a readable file: " + path.string(), detail.str());
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return fail<std::string>(error_code::file_system_error, "Cannot open file: " + path.string(),
            detail::error_detail().add_path("path", path).add("op", "open").str());

    std::string out;
    ifs.seekg(0, std::ios::end);
    auto sz = ifs.tellg();
    if (sz > 0)
        out.resize(static_cast<std::size_t>(sz));
    ifs.seekg(0, std::ios::beg);
    ifs.read(out.data(), static_cast<std::streamsize>(out.size()));
    if (!ifs && !out.empty())
        return fail<std::string>(error_code::file_system_error, "Cannot read file: " + path.string(),
            detail::error_detail().add_path("path", path).add("op", "read").str());
    return out;
}


/**
Reading and parsing a message file.

@param path Message file.
@param opts Parsing options.
@return     Parsed message, or the error of reading or of parsing.
**/
[[nodiscard]] inline result<message> load_message(const std::filesystem::path& path, const mime_options& opts = mime_options{})
{
    auto raw = read_file(path);
    if (!raw)
        return fail<message>(std::move(raw.error()));
    return parse_message(*raw, opts);
}


} // namespace emlxx


#ifdef _MSC_VER
#pragma warning(pop)
#endif
