/*

test_codec.cpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE codec_test

#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <emlxx/codec/base64.hpp>
#include <emlxx/codec/q_codec.hpp>
#include <emlxx/codec/quoted_printable.hpp>
#include <emlxx/codec/uuencode.hpp>


using std::string;
using emlxx::base64;
using emlxx::codec_error;
using codec_t = emlxx::codec::codec_t;
using emlxx::q_codec;
using emlxx::quoted_printable;
using emlxx::uuencode;


BOOST_AUTO_TEST_CASE(base64_decode_simple)
{
    base64 b64;
    BOOST_CHECK_EQUAL(b64.decode("SGVsbG8sIFdvcmxkIQ=="), "Hello, World!");
    BOOST_CHECK_EQUAL(b64.decode(""), "");
}


BOOST_AUTO_TEST_CASE(base64_decode_multiline)
{
    base64 b64;
    BOOST_CHECK_EQUAL(b64.decode("SGVsbG8s\r\nIFdv\r\ncmxkIQ==\r\n"), "Hello, World!");
    BOOST_CHECK_EQUAL(b64.decode("  SGVs bG8s\tIFdvcmxkIQ"), "Hello, World!");
}


BOOST_AUTO_TEST_CASE(base64_decode_binary)
{
    base64 b64;
    const string dec = b64.decode("AAH/gA==");
    BOOST_REQUIRE_EQUAL(dec.size(), 4u);
    BOOST_CHECK_EQUAL(static_cast<unsigned char>(dec[0]), 0x00);
    BOOST_CHECK_EQUAL(static_cast<unsigned char>(dec[1]), 0x01);
    BOOST_CHECK_EQUAL(static_cast<unsigned char>(dec[2]), 0xFF);
    BOOST_CHECK_EQUAL(static_cast<unsigned char>(dec[3]), 0x80);
}


BOOST_AUTO_TEST_CASE(base64_decode_lenient_skips_bad_chars)
{
    base64 b64;
    BOOST_CHECK_EQUAL(b64.decode("SGVs!bG8s#IFdv*cmxkIQ=="), "Hello, World!");
    // a lone trailing sextet carries no octet
    BOOST_CHECK_EQUAL(b64.decode("SGVsbG8"), "Hello");
}


BOOST_AUTO_TEST_CASE(base64_decode_strict_throws)
{
    base64 b64;
    b64.strict_mode(true);
    BOOST_CHECK_THROW(b64.decode("SGVs!bG8s"), codec_error);
    BOOST_CHECK_THROW(b64.decode("SGVsb"), codec_error);
    BOOST_CHECK_EQUAL(b64.decode("SGVsbG8="), "Hello");
}


BOOST_AUTO_TEST_CASE(quoted_printable_decode_escapes)
{
    quoted_printable qp;
    BOOST_CHECK_EQUAL(qp.decode("caf=C3=A9"), "caf\xC3\xA9");
    BOOST_CHECK_EQUAL(qp.decode("a=3Db"), "a=b");
    BOOST_CHECK_EQUAL(qp.decode("lower=c3=a9"), "lower\xC3\xA9");
}


BOOST_AUTO_TEST_CASE(quoted_printable_decode_soft_breaks)
{
    quoted_printable qp;
    BOOST_CHECK_EQUAL(qp.decode("Hello, =\r\nWorld!"), "Hello, World!");
    BOOST_CHECK_EQUAL(qp.decode("Hello, =\nWorld!"), "Hello, World!");
    BOOST_CHECK_EQUAL(qp.decode("Hello, =  \r\nWorld!"), "Hello, World!");
    BOOST_CHECK_EQUAL(qp.decode("line one\r\nline two"), "line one\r\nline two");
    BOOST_CHECK_EQUAL(qp.decode("trailing="), "trailing");
}


BOOST_AUTO_TEST_CASE(quoted_printable_decode_bad_escape)
{
    quoted_printable qp;
    BOOST_CHECK_EQUAL(qp.decode("100=%"), "100=%");
    BOOST_CHECK_EQUAL(qp.decode("x=4"), "x=4");

    qp.strict_mode(true);
    BOOST_CHECK_THROW(qp.decode("100=%"), codec_error);
}


BOOST_AUTO_TEST_CASE(quoted_printable_q_mode_underscore)
{
    quoted_printable qp;
    BOOST_CHECK_EQUAL(qp.decode("a_b"), "a_b");
    qp.q_codec_mode(true);
    BOOST_CHECK_EQUAL(qp.decode("a_b=5Fc"), "a b_c");
}


BOOST_AUTO_TEST_CASE(q_codec_decode_word)
{
    q_codec qc;
    auto b = qc.decode("utf-8?B?5Lit5paH");
    BOOST_CHECK_EQUAL(b.text, "\xE4\xB8\xAD\xE6\x96\x87");
    BOOST_CHECK_EQUAL(b.charset, "UTF-8");
    BOOST_CHECK(b.method == codec_t::BASE64);

    auto q = qc.decode("iso-8859-1?q?caf=E9_cr=E8me");
    BOOST_CHECK_EQUAL(q.text, "caf\xE9 cr\xE8me");
    BOOST_CHECK_EQUAL(q.charset, "ISO-8859-1");
    BOOST_CHECK(q.method == codec_t::QUOTED_PRINTABLE);

    BOOST_CHECK_THROW(qc.decode("utf-8?X?abc"), codec_error);
    BOOST_CHECK_THROW(qc.decode("utf-8"), codec_error);
    BOOST_CHECK_THROW(qc.decode("?B?abc"), codec_error);
}


BOOST_AUTO_TEST_CASE(q_codec_split_plain)
{
    q_codec qc;
    auto words = qc.split("Just a subject");
    BOOST_REQUIRE_EQUAL(words.size(), 1u);
    BOOST_CHECK_EQUAL(words[0].text, "Just a subject");
    BOOST_CHECK(words[0].charset.empty());
    BOOST_CHECK(words[0].method == codec_t::ASCII);

    BOOST_CHECK(qc.split("").empty());
}


BOOST_AUTO_TEST_CASE(q_codec_split_mixed)
{
    q_codec qc;
    auto words = qc.split("Re: =?UTF-8?B?5Lit5paH?= report");
    BOOST_REQUIRE_EQUAL(words.size(), 3u);
    BOOST_CHECK_EQUAL(words[0].text, "Re: ");
    BOOST_CHECK_EQUAL(words[1].text, "\xE4\xB8\xAD\xE6\x96\x87");
    BOOST_CHECK_EQUAL(words[1].charset, "UTF-8");
    BOOST_CHECK_EQUAL(words[2].text, " report");
}


BOOST_AUTO_TEST_CASE(q_codec_split_drops_whitespace_between_words)
{
    q_codec qc;
    auto words = qc.split("=?UTF-8?Q?Hello,?= \r\n =?UTF-8?Q?_World?=");
    BOOST_REQUIRE_EQUAL(words.size(), 1u);
    BOOST_CHECK_EQUAL(words[0].text, "Hello, World");
}


BOOST_AUTO_TEST_CASE(q_codec_split_keeps_charsets_apart)
{
    q_codec qc;
    auto words = qc.split("=?GB2312?B?1tDOxA==?= =?ISO-8859-1?Q?caf=E9?=");
    BOOST_REQUIRE_EQUAL(words.size(), 2u);
    BOOST_CHECK_EQUAL(words[0].charset, "GB2312");
    BOOST_CHECK_EQUAL(words[0].text, "\xD6\xD0\xCE\xC4");
    BOOST_CHECK_EQUAL(words[1].charset, "ISO-8859-1");
    BOOST_CHECK_EQUAL(words[1].text, "caf\xE9");
}


BOOST_AUTO_TEST_CASE(q_codec_split_merges_split_character)
{
    // the three octets of U+4E2D are spread over two words
    q_codec qc;
    auto words = qc.split("=?UTF-8?Q?=E4=B8?= =?UTF-8?Q?=AD?=");
    BOOST_REQUIRE_EQUAL(words.size(), 1u);
    BOOST_CHECK_EQUAL(words[0].text, "\xE4\xB8\xAD");
}


BOOST_AUTO_TEST_CASE(q_codec_split_malformed_is_plain)
{
    q_codec qc;
    auto words = qc.split("=?UTF-8?X?abc?= and =?broken");
    BOOST_REQUIRE_EQUAL(words.size(), 1u);
    BOOST_CHECK_EQUAL(words[0].text, "=?UTF-8?X?abc?= and =?broken");
    BOOST_CHECK(words[0].method == codec_t::ASCII);
}


BOOST_AUTO_TEST_CASE(uuencode_decode_lines)
{
    uuencode uu;
    BOOST_CHECK_EQUAL(uu.decode("begin 644 cat.txt\r\n#0V%T\r\n`\r\nend\r\n"), "Cat");

    const string text = "begin 600 hello.txt\n"
        R"(72&5L;&\L('5U96YC;V1E9"!W;W)L9"$`)" "\n"
        "`\n"
        "end\n";
    BOOST_CHECK_EQUAL(uu.decode(text), "Hello, uuencoded world!");
}


BOOST_AUTO_TEST_CASE(uuencode_decode_binary)
{
    uuencode uu;
    BOOST_CHECK_EQUAL(uu.decode("begin 644 data.bin\n#``'_\n`\nend\n"), string("\x00\x01\xFF", 3));
    // spaces stand for zero like backticks do
    BOOST_CHECK_EQUAL(uu.decode("begin 644 data.bin\n#  '_\nend\n"), string("\x00\x01\xFF", 3));
}


BOOST_AUTO_TEST_CASE(uuencode_decode_skips_preamble)
{
    uuencode uu;
    BOOST_CHECK_EQUAL(uu.decode("some text\nbegin here\nbegin 644 cat.txt\n#0V%T\nend\n"), "Cat");
}


BOOST_AUTO_TEST_CASE(uuencode_decode_broken_structure)
{
    uuencode uu;
    BOOST_CHECK_EQUAL(uu.decode("#0V%T\nend\n"), "#0V%T\nend\n");
    BOOST_CHECK_EQUAL(uu.decode("begin 644 cat.txt\n#0V%T\n"), "begin 644 cat.txt\n#0V%T\n");

    uu.strict_mode(true);
    BOOST_CHECK_THROW(uu.decode("#0V%T\nend\n"), codec_error);
    BOOST_CHECK_THROW(uu.decode("begin 644 cat.txt\n#0V%T\n"), codec_error);
    BOOST_CHECK_THROW(uu.decode("begin 644 cat.txt\n#0V\x7F" "T\nend\n"), codec_error);
}


BOOST_AUTO_TEST_CASE(uuencode_encoding_names)
{
    BOOST_CHECK(uuencode::is_encoding_name("x-uuencode"));
    BOOST_CHECK(uuencode::is_encoding_name("uuencode"));
    BOOST_CHECK(uuencode::is_encoding_name("x-uue"));
    BOOST_CHECK(uuencode::is_encoding_name("uue"));
    BOOST_CHECK(!uuencode::is_encoding_name("base64"));
}
