/*

test_mime_parse.cpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE mime_parse_test

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <emlxx/detail/log.hpp>
#include <emlxx/mime/message.hpp>


using std::string;
using emlxx::error_code;
using emlxx::load_message;
using emlxx::message;
using emlxx::mime;
using emlxx::mime_options;
using emlxx::parse_message;


// Test messages are written with bare LF and sent with CRLF.
static string crlf(std::string_view text)
{
    string out;
    for (char ch : text)
    {
        if (ch == '\n')
            out += "\r\n";
        else
            out += ch;
    }
    return out;
}

static string nested_multipart(int levels)
{
    string part = "Content-Type: text/plain\r\n\r\nleaf";
    for (int i = levels; i > 0; --i)
    {
        const string boundary = "lvl" + std::to_string(i) + "x";
        part = "Content-Type: multipart/mixed; boundary=\"" + boundary + "\"\r\n\r\n--" + boundary + "\r\n" + part +
            "\r\n--" + boundary + "--\r\n";
    }
    return part;
}

static const string MIXED_MESSAGE = crlf(R"(From: sender@example.com
To: receiver@example.com
Subject: Quarterly
 report
MIME-Version: 1.0
Content-Type: multipart/mixed; boundary="XYZ"

This is the preamble.
--XYZ
Content-Type: text/plain; charset=utf-8

Please find the report attached.
--XYZ
Content-Type: application/pdf; name="report.pdf"
Content-Disposition: attachment; filename="report.pdf"
Content-Transfer-Encoding: base64

JVBERi0xLjQg
ZmFrZQ==
--XYZ--
This is the epilogue.
)");


BOOST_AUTO_TEST_CASE(parse_single_part)
{
    auto msg = parse_message(crlf("From: a@example.com\nSubject: Hi\n\nHello\n"));
    BOOST_REQUIRE(msg);
    BOOST_CHECK_EQUAL(msg->content_type(), "text/plain");
    BOOST_CHECK_EQUAL(msg->transfer_encoding(), "7bit");
    BOOST_CHECK_EQUAL(msg->subject(), "Hi");
    BOOST_REQUIRE(msg->payload());
    BOOST_CHECK_EQUAL(*msg->payload(), "Hello\r\n");
    BOOST_CHECK(msg->parts().empty());
    BOOST_CHECK(!msg->content_disposition());
    BOOST_CHECK(msg->attachments().empty());
}


BOOST_AUTO_TEST_CASE(parse_headers_unfolded_and_case_insensitive)
{
    auto msg = parse_message(MIXED_MESSAGE);
    BOOST_REQUIRE(msg);
    BOOST_CHECK_EQUAL(msg->subject(), "Quarterly report");
    BOOST_CHECK_EQUAL(msg->header("SUBJECT").value_or(""), "Quarterly report");
    BOOST_CHECK_EQUAL(msg->header("mime-version").value_or(""), "1.0");
    BOOST_CHECK(!msg->header("X-Missing"));
    BOOST_CHECK_EQUAL(msg->headers().size(), 5u);
}


BOOST_AUTO_TEST_CASE(parse_multipart_mixed)
{
    auto msg = parse_message(MIXED_MESSAGE);
    BOOST_REQUIRE(msg);
    BOOST_CHECK(msg->is_multipart());
    BOOST_CHECK_EQUAL(msg->content_type(), "multipart/mixed");
    BOOST_CHECK(!msg->payload());
    BOOST_REQUIRE_EQUAL(msg->parts().size(), 2u);

    const mime& text = msg->parts()[0];
    BOOST_CHECK_EQUAL(text.content_type(), "text/plain");
    BOOST_CHECK_EQUAL(text.payload().value_or(""), "Please find the report attached.");

    const mime& pdf = msg->parts()[1];
    BOOST_CHECK_EQUAL(pdf.content_type(), "application/pdf");
    BOOST_CHECK_EQUAL(pdf.content_disposition().value_or(""), "attachment");
    BOOST_CHECK_EQUAL(pdf.transfer_encoding(), "base64");
    BOOST_CHECK_EQUAL(pdf.filename(), "report.pdf");
    BOOST_CHECK_EQUAL(pdf.payload().value_or(""), "%PDF-1.4 fake");

    auto attachments = msg->attachments();
    BOOST_REQUIRE_EQUAL(attachments.size(), 1u);
    BOOST_CHECK(attachments[0] == &pdf);
}


BOOST_AUTO_TEST_CASE(parse_nested_multipart_order)
{
    const string raw = crlf(R"(Subject: nested
Content-Type: multipart/mixed; boundary="outer"

--outer
Content-Type: multipart/alternative; boundary="alt"

--alt
Content-Type: text/plain

plain
--alt
Content-Type: text/html

<p>html</p>
--alt--
--outer
Content-Type: image/png
Content-Disposition: attachment; filename=pixel.png
Content-Transfer-Encoding: base64

iVBORw0K
--outer
Content-Type: text/plain
Content-Disposition: attachment; filename=notes.txt

notes
--outer--
)");
    auto msg = parse_message(raw);
    BOOST_REQUIRE(msg);
    BOOST_CHECK_EQUAL(msg->part_count(), 6u);

    std::vector<string> types;
    msg->walk([&types](const mime& part) { types.push_back(part.content_type()); });
    const std::vector<string> expected{"multipart/mixed", "multipart/alternative", "text/plain", "text/html", "image/png", "text/plain"};
    BOOST_CHECK_EQUAL_COLLECTIONS(types.begin(), types.end(), expected.begin(), expected.end());

    auto attachments = msg->attachments();
    BOOST_REQUIRE_EQUAL(attachments.size(), 2u);
    BOOST_CHECK_EQUAL(attachments[0]->filename(), "pixel.png");
    BOOST_CHECK_EQUAL(attachments[0]->payload()->substr(1, 3), "PNG");
    BOOST_CHECK_EQUAL(attachments[1]->filename(), "notes.txt");
    BOOST_CHECK_EQUAL(*attachments[1]->payload(), "notes");
}


BOOST_AUTO_TEST_CASE(parse_embedded_message)
{
    const string raw = crlf(R"(Subject: forward
Content-Type: multipart/mixed; boundary="XYZ"

--XYZ
Content-Type: text/plain

see attached
--XYZ
Content-Type: message/rfc822
Content-Disposition: attachment; filename="fwd.eml"

Subject: Inner
Content-Type: multipart/mixed; boundary="INNER"

--INNER
Content-Type: text/plain

inner body
--INNER
Content-Type: text/csv
Content-Disposition: attachment; filename="data.csv"

a,b
1,2
--INNER--
--XYZ--
)");
    auto msg = parse_message(raw);
    BOOST_REQUIRE(msg);
    BOOST_REQUIRE_EQUAL(msg->parts().size(), 2u);

    const mime& rfc822 = msg->parts()[1];
    BOOST_CHECK_EQUAL(rfc822.content_type(), "message/rfc822");
    BOOST_CHECK(!rfc822.payload());
    BOOST_REQUIRE_EQUAL(rfc822.parts().size(), 1u);
    BOOST_CHECK_EQUAL(rfc822.parts()[0].header("Subject").value_or(""), "Inner");
    BOOST_CHECK_EQUAL(msg->part_count(), 6u);

    // the container has no content, only its inner attachment counts
    auto attachments = msg->attachments();
    BOOST_REQUIRE_EQUAL(attachments.size(), 1u);
    BOOST_CHECK_EQUAL(attachments[0]->filename(), "data.csv");
    BOOST_CHECK_EQUAL(*attachments[0]->payload(), "a,b\r\n1,2");
}


BOOST_AUTO_TEST_CASE(parse_digest_defaults_to_message)
{
    const string raw = crlf(R"(Subject: digest
Content-Type: multipart/digest; boundary="D"

--D

Subject: one

first
--D--
)");
    auto msg = parse_message(raw);
    BOOST_REQUIRE(msg);
    BOOST_REQUIRE_EQUAL(msg->parts().size(), 1u);
    BOOST_CHECK_EQUAL(msg->parts()[0].content_type(), "message/rfc822");
    BOOST_REQUIRE_EQUAL(msg->parts()[0].parts().size(), 1u);
    BOOST_CHECK_EQUAL(msg->parts()[0].parts()[0].header("Subject").value_or(""), "one");
}


BOOST_AUTO_TEST_CASE(parse_filename_sources)
{
    const string raw = crlf(R"(Subject: names
Content-Type: multipart/mixed; boundary="N"

--N
Content-Type: application/octet-stream; name="=?UTF-8?B?5oql5ZGKLnBkZg==?="
Content-Disposition: attachment

one
--N
Content-Type: application/octet-stream; name="ignored.bin"
Content-Disposition: attachment; filename*=UTF-8''R%C3%A9sum%C3%A9.doc

two
--N
Content-Type: application/octet-stream
Content-Disposition: attachment; filename="   "

three
--N--
)");
    auto msg = parse_message(raw);
    BOOST_REQUIRE(msg);
    BOOST_REQUIRE_EQUAL(msg->parts().size(), 3u);
    BOOST_CHECK_EQUAL(msg->parts()[0].filename(), "\xE6\x8A\xA5\xE5\x91\x8A.pdf");
    BOOST_CHECK_EQUAL(msg->parts()[0].raw_filename().value_or(""), "=?UTF-8?B?5oql5ZGKLnBkZg==?=");
    BOOST_CHECK_EQUAL(msg->parts()[1].filename(), "R\xC3\xA9sum\xC3\xA9.doc");
    BOOST_CHECK(msg->parts()[2].filename().empty());

    auto attachments = msg->attachments();
    BOOST_CHECK_EQUAL(attachments.size(), 2u);
}


BOOST_AUTO_TEST_CASE(parse_transfer_encodings)
{
    const string raw = crlf(R"(Subject: encodings
Content-Type: multipart/mixed; boundary="E"

--E
Content-Type: text/plain
Content-Transfer-Encoding: Quoted-Printable

caf=C3=A9 soft=
break
--E
Content-Type: text/plain
Content-Transfer-Encoding: x-unknown

as is=20
--E--
)");
    auto msg = parse_message(raw);
    BOOST_REQUIRE(msg);
    BOOST_REQUIRE_EQUAL(msg->parts().size(), 2u);
    BOOST_CHECK_EQUAL(msg->parts()[0].transfer_encoding(), "quoted-printable");
    BOOST_CHECK_EQUAL(msg->parts()[0].payload().value_or(""), "caf\xC3\xA9 softbreak");
    BOOST_CHECK_EQUAL(msg->parts()[1].payload().value_or(""), "as is=20");
}


BOOST_AUTO_TEST_CASE(parse_uuencoded_body)
{
    const string raw = crlf(R"(Subject: uue
Content-Type: multipart/mixed; boundary="U"

--U
Content-Type: application/octet-stream
Content-Disposition: attachment; filename="data.bin"
Content-Transfer-Encoding: X-UUENCODE

begin 644 data.bin
#``'_
`
end
--U
Content-Type: text/plain
Content-Transfer-Encoding: uue

begin 644 cat.txt
#0V%T
end
--U--
)");
    auto msg = parse_message(raw);
    BOOST_REQUIRE(msg);
    BOOST_REQUIRE_EQUAL(msg->parts().size(), 2u);
    BOOST_CHECK_EQUAL(msg->parts()[0].transfer_encoding(), "x-uuencode");
    BOOST_CHECK(msg->parts()[0].payload().value_or("") == string("\x00\x01\xFF", 3));
    BOOST_CHECK_EQUAL(msg->parts()[1].payload().value_or(""), "Cat");
}


BOOST_AUTO_TEST_CASE(parse_skips_mbox_envelope)
{
    auto msg = parse_message(crlf("From sender@example.com Mon Jan  1 00:00:00 2024\nSubject: boxed\n\nbody"));
    BOOST_REQUIRE(msg);
    BOOST_CHECK_EQUAL(msg->subject(), "boxed");
}


BOOST_AUTO_TEST_CASE(parse_malformed_input)
{
    for (const string raw : {string(), string("   \r\n\r\n"), string("this is not a message\r\n"), string(" leading: continuation\r\n"),
        string("\x89PNG\r\n\x1A\n")})
    {
        auto msg = parse_message(raw);
        BOOST_REQUIRE(!msg);
        BOOST_CHECK(msg.error().code() == error_code::malformed_message);
        BOOST_CHECK(msg.error().is_message_error());
    }
}


BOOST_AUTO_TEST_CASE(parse_missing_boundary_leaves_container_empty)
{
    emlxx::log::logger::instance().set_level(emlxx::log::level::off);

    auto top = parse_message(crlf("Subject: x\nContent-Type: multipart/mixed\n\n--a\n\nbody\n--a--\n"));
    BOOST_REQUIRE(top);
    BOOST_CHECK(top->is_multipart());
    BOOST_CHECK(top->parts().empty());
    BOOST_CHECK(!top->payload());
    BOOST_CHECK(top->attachments().empty());

    const string raw = crlf(R"(Subject: broken sibling
Content-Type: multipart/mixed; boundary="b"

--b
Content-Type: multipart/mixed

--inner
Content-Type: text/plain

lost
--inner--
--b
Content-Type: text/plain
Content-Disposition: attachment; filename=r.pdf

report
--b--
)");
    auto msg = parse_message(raw);
    BOOST_REQUIRE(msg);
    BOOST_REQUIRE_EQUAL(msg->parts().size(), 2u);
    BOOST_CHECK(msg->parts()[0].is_multipart());
    BOOST_CHECK(msg->parts()[0].parts().empty());
    auto attachments = msg->attachments();
    BOOST_REQUIRE_EQUAL(attachments.size(), 1u);
    BOOST_CHECK_EQUAL(attachments[0]->filename(), "r.pdf");
    BOOST_CHECK_EQUAL(attachments[0]->payload().value_or(""), "report");
}


BOOST_AUTO_TEST_CASE(parse_nesting_limit)
{
    mime_options opts;
    opts.max_nesting_depth = 2;
    BOOST_CHECK(parse_message(nested_multipart(2), opts));
    auto too_deep = parse_message(nested_multipart(3), opts);
    BOOST_REQUIRE(!too_deep);
    BOOST_CHECK(too_deep.error().code() == error_code::mime_nesting_too_deep);

    BOOST_CHECK(parse_message(nested_multipart(64)));
    auto default_limit = parse_message(nested_multipart(70));
    BOOST_REQUIRE(!default_limit);
    BOOST_CHECK(default_limit.error().code() == error_code::mime_nesting_too_deep);
}


BOOST_AUTO_TEST_CASE(parse_strict_body_decoding)
{
    const string raw = crlf("Subject: strict\nContent-Transfer-Encoding: base64\n\nSGVs!bG8=\n");
    auto lenient = parse_message(raw);
    BOOST_REQUIRE(lenient);
    BOOST_CHECK_EQUAL(lenient->payload().value_or(""), "Hello");

    mime_options opts;
    opts.strict = true;
    auto strict = parse_message(raw, opts);
    BOOST_REQUIRE(!strict);
    BOOST_CHECK(strict.error().code() == error_code::mime_encoding_error);
}


BOOST_AUTO_TEST_CASE(load_message_from_file)
{
    auto dir = std::filesystem::temp_directory_path() / "emlxx_mime_parse_test" /
        std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    std::filesystem::create_directories(dir);

    auto path = dir / "mixed.eml";
    {
        std::ofstream ofs(path, std::ios::binary);
        ofs << MIXED_MESSAGE;
    }
    auto msg = load_message(path);
    BOOST_REQUIRE(msg);
    BOOST_CHECK_EQUAL(msg->attachments().size(), 1u);

    auto missing = load_message(dir / "missing.eml");
    BOOST_REQUIRE(!missing);
    BOOST_CHECK(missing.error().code() == error_code::file_not_found);
    BOOST_CHECK(missing.error().is_file_system_error());

    auto directory = load_message(dir);
    BOOST_REQUIRE(!directory);
    BOOST_CHECK(directory.error().code() == error_code::file_not_found);

    std::filesystem::remove_all(dir);
}
