/*

test_codec.cpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Transfer encodings of message bodies and header encoded words.

*/


#define BOOST_TEST_MODULE codec_test

#include <string>
#include <boost/test/unit_test.hpp>
#include <triagexx/codec/base64.hpp>
#include <triagexx/codec/charset.hpp>
#include <triagexx/codec/q_codec.hpp>
#include <triagexx/codec/quoted_printable.hpp>


using triagexx::base64;
using triagexx::codec_error;
using triagexx::q_codec;
using triagexx::quoted_printable;


BOOST_AUTO_TEST_CASE(base64url_without_padding)
{
    base64 b64(base64::alphabet_t::URL_SAFE);
    BOOST_TEST(b64.decode("SGVsbG8sIHdvcmxkIQ") == "Hello, world!");
    BOOST_TEST(b64.decode("SGVsbG8sIHdvcmxkIQ==") == "Hello, world!");
}


BOOST_AUTO_TEST_CASE(base64url_alphabet)
{
    base64 b64(base64::alphabet_t::URL_SAFE);
    // 0xFB 0xFF encodes as `-_8` in the URL safe alphabet.
    BOOST_TEST(b64.decode("-_8") == std::string("\xFB\xFF"));
    BOOST_TEST(b64.encode(std::string("\xFB\xFF"), false) == "-_8");
}


BOOST_AUTO_TEST_CASE(base64url_roundtrip_utf8)
{
    base64 b64(base64::alphabet_t::URL_SAFE);
    const std::string text = "R\xC3\xA9union \xE2\x82\xAC 12";
    BOOST_TEST(b64.decode(b64.encode(text, false)) == text);
}


BOOST_AUTO_TEST_CASE(base64_ignores_line_breaks)
{
    base64 b64;
    BOOST_TEST(b64.decode("SGVs\r\nbG8=") == "Hello");
}


BOOST_AUTO_TEST_CASE(base64_bad_padding)
{
    base64 b64(base64::alphabet_t::URL_SAFE);
    BOOST_CHECK_THROW(b64.decode("SGVsbG8==="), codec_error);
    BOOST_CHECK_THROW(b64.decode("SGV=sbG8"), codec_error);
    BOOST_CHECK_THROW(b64.decode("="), codec_error);
}


BOOST_AUTO_TEST_CASE(base64_truncated_and_bad_char)
{
    base64 b64(base64::alphabet_t::URL_SAFE);
    BOOST_CHECK_THROW(b64.decode("SGVsb"), codec_error);
    BOOST_CHECK_THROW(b64.decode("SGV*bG8"), codec_error);
}


BOOST_AUTO_TEST_CASE(base64_strict_requires_padding)
{
    base64 b64(base64::alphabet_t::STANDARD, true);
    BOOST_CHECK_THROW(b64.decode("SGVsbG8"), codec_error);
    BOOST_TEST(b64.decode("SGVsbG8=") == "Hello");
}


BOOST_AUTO_TEST_CASE(quoted_printable_soft_breaks)
{
    quoted_printable qp;
    BOOST_TEST(qp.decode("Caf=C3=A9 au =\r\nlait") == "Caf\xC3\xA9 au lait");
    BOOST_TEST(qp.decode("line one=\nline two") == "line oneline two");
}


BOOST_AUTO_TEST_CASE(quoted_printable_bad_hex)
{
    quoted_printable lenient;
    BOOST_TEST(lenient.decode("100=ZZ") == "100=ZZ");
    quoted_printable strict(true);
    BOOST_CHECK_THROW(strict.decode("100=ZZ"), codec_error);
}


BOOST_AUTO_TEST_CASE(encoded_words_base64_and_q)
{
    q_codec qc;
    BOOST_TEST(qc.check_decode("=?UTF-8?B?UsOpdW5pb24=?=") == "R\xC3\xA9union");
    BOOST_TEST(qc.check_decode("=?utf-8?Q?Caf=C3=A9_cr=C3=A8me?=") == "Caf\xC3\xA9 cr\xC3\xA8me");
}


BOOST_AUTO_TEST_CASE(encoded_words_adjacent_and_mixed)
{
    q_codec qc;
    BOOST_TEST(qc.check_decode("=?UTF-8?Q?a?= =?UTF-8?Q?b?=") == "ab");
    BOOST_TEST(qc.check_decode("Re: =?UTF-8?Q?Caf=C3=A9?= today") == "Re: Caf\xC3\xA9 today");
}


BOOST_AUTO_TEST_CASE(encoded_words_latin1)
{
    q_codec qc;
    BOOST_TEST(qc.check_decode("=?ISO-8859-1?Q?Fran=E7ois?=") == "Fran\xC3\xA7ois");
}


BOOST_AUTO_TEST_CASE(malformed_encoded_word_kept)
{
    q_codec qc;
    BOOST_TEST(qc.check_decode("=?UTF-8?X?abc?=") == "=?UTF-8?X?abc?=");
    BOOST_TEST(qc.check_decode("plain subject") == "plain subject");
}


BOOST_AUTO_TEST_CASE(charset_conversion)
{
    BOOST_TEST(triagexx::to_utf8("Fran\xE7ois", "iso-8859-1") == "Fran\xC3\xA7ois");
    BOOST_TEST(triagexx::to_utf8("plain", "") == "plain");
    BOOST_TEST(triagexx::to_utf8("caf\xC3\xA9", "UTF-8") == "caf\xC3\xA9");
}


BOOST_AUTO_TEST_CASE(charset_unknown_reads_utf8)
{
    BOOST_TEST(triagexx::to_utf8("caf\xC3\xA9", "x-no-such-charset") == "caf\xC3\xA9");
    // Invalid UTF-8 maps to U+FFFD.
    BOOST_TEST(triagexx::to_utf8("a\xFF" "b", "utf-8") == "a\xEF\xBF\xBD" "b");
}


BOOST_AUTO_TEST_CASE(header_parameters)
{
    BOOST_TEST(triagexx::header_parameter("text/plain; charset=\"ISO-8859-1\"; format=flowed", "charset") == "ISO-8859-1");
    BOOST_TEST(triagexx::header_parameter("attachment; filename=report.pdf", "FILENAME") == "report.pdf");
    BOOST_TEST(triagexx::header_parameter("text/plain", "charset").empty());
}
