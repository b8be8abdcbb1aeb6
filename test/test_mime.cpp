/*

test_mime.cpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Address parsing, HTML reduction, provider JSON loading and MIME tree decoding.

*/


#define BOOST_TEST_MODULE mime_test

#include <string>
#include <utility>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <triagexx/codec/base64.hpp>
#include <triagexx/detail/utf8.hpp>
#include <triagexx/mime/decoder.hpp>
#include <triagexx/mime/html_to_text.hpp>
#include <triagexx/mime/mailboxes.hpp>
#include <triagexx/mime/raw_message_json.hpp>
#include <triagexx/timestamp.hpp>


using namespace triagexx;


namespace
{

std::string b64url(const std::string& text)
{
    base64 b64(base64::alphabet_t::URL_SAFE);
    return b64.encode(text, false);
}

part make_leaf(std::string id, std::string mime_type, const std::string& text, header_list headers = {})
{
    part p;
    p.part_id = std::move(id);
    p.mime_type = std::move(mime_type);
    p.headers = std::move(headers);
    leaf_body body;
    body.data = b64url(text);
    body.size = text.size();
    p.body = std::move(body);
    return p;
}

part make_container(std::string id, std::string subtype, std::vector<part> children)
{
    part p;
    p.part_id = std::move(id);
    p.mime_type = "multipart/" + subtype;
    container_body body;
    body.subtype = std::move(subtype);
    body.children = std::move(children);
    p.body = std::move(body);
    return p;
}

raw_message make_message(part payload)
{
    raw_message msg;
    msg.id = "msg-1";
    msg.thread_id = "thread-1";
    msg.payload = std::move(payload);
    return msg;
}

} // namespace


BOOST_AUTO_TEST_CASE(mailbox_name_and_angle_address)
{
    auto addr = parse_mailbox("Jane Doe <jane@example.com>");
    BOOST_TEST(addr.name == "Jane Doe");
    BOOST_TEST(addr.address == "jane@example.com");
}


BOOST_AUTO_TEST_CASE(mailbox_quoted_name_with_comma)
{
    auto list = parse_address_list("\"Doe, Jane\" <jane@example.com>, bob@example.com");
    BOOST_TEST_REQUIRE(list.size() == 2);
    BOOST_TEST(list[0].name == "Doe, Jane");
    BOOST_TEST(list[0].address == "jane@example.com");
    BOOST_TEST(list[1].name.empty());
    BOOST_TEST(list[1].address == "bob@example.com");
}


BOOST_AUTO_TEST_CASE(mailbox_comment_name)
{
    auto addr = parse_mailbox("jane@example.com (Jane Doe)");
    BOOST_TEST(addr.address == "jane@example.com");
    BOOST_TEST(addr.name == "Jane Doe");
}


BOOST_AUTO_TEST_CASE(mailbox_group_flattened)
{
    auto list = parse_address_list("Team: a@example.com, b@example.com;, c@example.com");
    BOOST_TEST_REQUIRE(list.size() == 3);
    BOOST_TEST(list[0].address == "a@example.com");
    BOOST_TEST(list[1].address == "b@example.com");
    BOOST_TEST(list[2].address == "c@example.com");
}


BOOST_AUTO_TEST_CASE(mailbox_encoded_word_name)
{
    auto addr = parse_mailbox("=?UTF-8?Q?Fran=C3=A7ois?= <f@example.com>");
    BOOST_TEST(addr.name == "Fran\xC3\xA7ois");
    BOOST_TEST(addr.address == "f@example.com");
}


BOOST_AUTO_TEST_CASE(mailbox_empty_header)
{
    auto addr = parse_mailbox("");
    BOOST_TEST(addr.address.empty());
    BOOST_TEST(addr.name.empty());
}


BOOST_AUTO_TEST_CASE(html_blocks_and_entities)
{
    const std::string html = "<html><head><title>x</title><style>p{color:red}</style></head>"
        "<body><p>Hello&nbsp;there,</p><div>Total: &euro;12 &amp; more</div><br>Bye&#33;</body></html>";
    BOOST_TEST(html_to_text(html) == "Hello there,\nTotal: \xE2\x82\xAC" "12 & more\nBye!");
}


BOOST_AUTO_TEST_CASE(html_script_and_comments_dropped)
{
    BOOST_TEST(html_to_text("<script>var a = '<p>';</script>A<!-- hidden -->B") == "AB");
}


BOOST_AUTO_TEST_CASE(html_whitespace_collapsed)
{
    BOOST_TEST(html_to_text("  one\n   two\t<ul><li>three</li><li>four</li></ul>  ") == "one two\nthree\nfour");
}


BOOST_AUTO_TEST_CASE(json_message_loaded)
{
    const std::string text = R"({
        "id": "18d2", "threadId": "18d1", "labelIds": ["INBOX", "UNREAD"], "snippet": "Hi",
        "historyId": "991", "internalDate": "1770715800123", "sizeEstimate": 2048,
        "payload": {
            "partId": "", "mimeType": "multipart/alternative",
            "headers": [{"name": "Subject", "value": "Hello"}, {"name": "From", "value": "a@example.com"}],
            "parts": [
                {"partId": "0", "mimeType": "text/plain", "body": {"size": 5, "data": "SGVsbG8"}},
                {"partId": "1", "mimeType": "text/html", "body": {"size": 12, "data": "PGI-SGk8L2I-", "encoding": "base64url"}}
            ]
        }
    })";
    auto msg = parse_raw_message_json(text);
    BOOST_TEST_REQUIRE(msg.has_value());
    BOOST_TEST(msg->id == "18d2");
    BOOST_TEST(msg->thread_id == "18d1");
    BOOST_TEST(msg->labels.size() == 2);
    BOOST_TEST(*msg->internal_date_ms == 1770715800123LL);
    BOOST_TEST(*msg->size_estimate == 2048);
    BOOST_TEST(msg->payload.is_container());
    BOOST_TEST(msg->payload.headers.get("subject") == "Hello");
    const auto& children = std::get<container_body>(msg->payload.body).children;
    BOOST_TEST_REQUIRE(children.size() == 2);
    BOOST_TEST(*std::get<leaf_body>(children[0].body).data == "SGVsbG8");
}


BOOST_AUTO_TEST_CASE(json_message_errors)
{
    auto bad = parse_raw_message_json("{ not json");
    BOOST_TEST_REQUIRE(!bad.has_value());
    BOOST_TEST(bad.error().is(error_code::invalid_json));

    auto no_payload = parse_raw_message_json(R"({"id": "x"})");
    BOOST_TEST_REQUIRE(!no_payload.has_value());
    BOOST_TEST(no_payload.error().is(error_code::invalid_message));
}


BOOST_AUTO_TEST_CASE(json_body_encoding_override)
{
    auto msg = parse_raw_message_json(R"({"payload": {"mimeType": "text/plain",
        "body": {"data": "Caf=C3=A9", "encoding": "quoted-printable"}}})");
    BOOST_TEST_REQUIRE(msg.has_value());
    mime_decoder decoder{triage_config{}};
    BOOST_TEST(decoder.decode(*msg).body_text == "Caf\xC3\xA9");
}


BOOST_AUTO_TEST_CASE(alternative_prefers_plain_verbatim)
{
    auto msg = make_message(make_container("", "alternative", {
        make_leaf("0", "text/plain", "Plain  version\r\nline two"),
        make_leaf("1", "text/html", "<p>HTML version</p>")
    }));
    mime_decoder decoder{triage_config{}};
    auto out = decoder.decode(msg);
    BOOST_TEST(out.body_text == "Plain  version\nline two");
    BOOST_TEST(out.body_html_present);
}


BOOST_AUTO_TEST_CASE(alternative_falls_back_to_html)
{
    auto msg = make_message(make_container("", "alternative", {
        make_leaf("0", "text/plain", "   "),
        make_leaf("1", "text/html", "<p>Only <b>HTML</b></p><p>here</p>")
    }));
    mime_decoder decoder{triage_config{}};
    BOOST_TEST(decoder.decode(msg).body_text == "Only HTML\nhere");
}


BOOST_AUTO_TEST_CASE(invalid_base64url_padding_empties_leaf)
{
    part bad;
    bad.part_id = "0";
    bad.mime_type = "text/plain";
    leaf_body body;
    body.data = "SGVsbG8===";
    bad.body = body;
    auto msg = make_message(make_container("", "mixed", {bad, make_leaf("1", "text/plain", "Second part")}));

    mime_decoder decoder{triage_config{}};
    BOOST_TEST(decoder.decode_leaf(bad, body).empty());
    BOOST_TEST(decoder.decode(msg).body_text == "Second part");
}


BOOST_AUTO_TEST_CASE(mixed_joins_texts_and_records_attachments)
{
    header_list disposition{{"Content-Disposition", "attachment; filename=\"invoice.pdf\""}};
    part pdf = make_leaf("2", "application/pdf", "%PDF", disposition);
    std::get<leaf_body>(pdf.body).attachment_id = "att-7";
    part logo = make_leaf("3", "image/png", "png", header_list{{"Content-Disposition", "inline"}});
    logo.filename = "logo.png";

    auto msg = make_message(make_container("", "mixed", {
        make_leaf("0", "text/plain", "First"),
        make_container("1", "related", {make_leaf("1.0", "text/html", "<div>Second</div>"), logo}),
        pdf
    }));
    mime_decoder decoder{triage_config{}};
    auto out = decoder.decode(msg);
    BOOST_TEST(out.body_text == "First\n\nSecond");
    BOOST_TEST_REQUIRE(out.attachments.size() == 2);
    BOOST_TEST(out.attachments[0].filename == "logo.png");
    BOOST_TEST(out.attachments[0].is_inline);
    BOOST_TEST(out.attachments[1].filename == "invoice.pdf");
    BOOST_TEST(out.attachments[1].mime_type == "application/pdf");
    BOOST_TEST(out.attachments[1].attachment_id == "att-7");
    BOOST_TEST(!out.attachments[1].is_inline);
}


BOOST_AUTO_TEST_CASE(unknown_subtype_behaves_like_mixed)
{
    auto msg = make_message(make_container("", "signed", {
        make_leaf("0", "text/plain", "Signed body"),
        make_leaf("1", "application/pgp-signature", "sig")
    }));
    mime_decoder decoder{triage_config{}};
    auto out = decoder.decode(msg);
    BOOST_TEST(out.body_text == "Signed body");
    BOOST_TEST(out.attachments.size() == 1);
}


BOOST_AUTO_TEST_CASE(deep_nesting_is_skipped)
{
    part inner = make_leaf("x", "text/plain", "deep text");
    for (int i = 0; i < 5; ++i)
        inner = make_container("c" + std::to_string(i), "mixed", {inner});
    triage_config cfg;
    cfg.max_part_depth = 2;
    mime_decoder shallow{cfg};
    BOOST_TEST(shallow.decode(make_message(inner)).body_text.empty());

    mime_decoder deep{triage_config{}};
    BOOST_TEST(deep.decode(make_message(inner)).body_text == "deep text");
}


BOOST_AUTO_TEST_CASE(body_cap_keeps_whole_characters)
{
    std::string text;
    for (int i = 0; i < 20; ++i)
        text += "\xC3\xA9";
    triage_config cfg;
    cfg.max_body_chars = 7;
    mime_decoder decoder{cfg};
    auto out = decoder.decode(make_message(make_leaf("", "text/plain", text)));
    BOOST_TEST(out.body_truncated);
    BOOST_TEST(detail::utf8_length(out.body_text) == 7u);
    BOOST_TEST(out.body_text.size() == 14u);
    BOOST_TEST(detail::is_valid_utf8(out.body_text));

    mime_decoder uncapped{triage_config{}};
    BOOST_TEST(!uncapped.decode(make_message(make_leaf("", "text/plain", text))).body_truncated);
}


BOOST_AUTO_TEST_CASE(headers_decoded)
{
    header_list headers{
        {"Subject", "=?UTF-8?Q?R=C3=A9union_budget?="},
        {"From", "\"Alice Martin\" <alice@example.com>"},
        {"To", "bob@example.com, Carol <carol@example.com>"},
        {"Cc", "Undisclosed recipients:;"},
        {"Date", "Tue, 10 Feb 2026 09:30:00 -0800"},
        {"Message-ID", "<abc@mail.example.com>"},
        {"List-Unsubscribe", "<https://example.com/unsub>"},
        {"Message-ID", "<second@mail.example.com>"}
    };
    auto msg = make_message(make_leaf("", "text/plain", "Body", headers));
    msg.labels = {"INBOX"};
    msg.snippet = "  Body  ";
    msg.internal_date_ms = 1770744600999LL;

    mime_decoder decoder{triage_config{}};
    auto out = decoder.decode(msg);
    BOOST_TEST(out.message_id == "msg-1");
    BOOST_TEST(out.thread_id == "thread-1");
    BOOST_TEST(out.snippet == "Body");
    BOOST_TEST(out.subject == "R\xC3\xA9union budget");
    BOOST_TEST(out.sender.name == "Alice Martin");
    BOOST_TEST(out.sender.address == "alice@example.com");
    BOOST_TEST((out.to == std::vector<std::string>{"bob@example.com", "carol@example.com"}));
    BOOST_TEST(out.cc.empty());
    BOOST_TEST_REQUIRE(out.sent_at.has_value());
    BOOST_TEST(format_iso(*out.sent_at) == "2026-02-10T09:30:00-08:00");
    BOOST_TEST_REQUIRE(out.internal_date.has_value());
    BOOST_TEST(format_iso_utc(*out.internal_date) == "2026-02-10T17:30:00+00:00");
    BOOST_TEST_REQUIRE(out.headers_of_interest.size() == 3);
    BOOST_TEST(out.headers_of_interest[0].first == "Message-ID");
    BOOST_TEST(out.headers_of_interest[0].second == "<abc@mail.example.com>");
    BOOST_TEST(out.headers_of_interest[1].first == "List-Unsubscribe");
    BOOST_TEST(out.headers_of_interest[2].first == "Date");
}


BOOST_AUTO_TEST_CASE(transfer_encoding_header_and_charset)
{
    part p;
    p.mime_type = "text/plain";
    p.headers = header_list{{"Content-Type", "text/plain; charset=iso-8859-1"},
        {"Content-Transfer-Encoding", "quoted-printable"}};
    leaf_body body;
    body.encoding = body_encoding_t::NONE;
    body.data = "Fran=E7ois";
    p.body = body;

    mime_decoder decoder{triage_config{}};
    BOOST_TEST(decoder.decode(make_message(p)).body_text == "Fran\xC3\xA7ois");
}


BOOST_AUTO_TEST_CASE(missing_headers_and_body)
{
    part p;
    p.mime_type = "text/plain";
    p.body = leaf_body{};
    mime_decoder decoder{triage_config{}};
    auto out = decoder.decode(make_message(p));
    BOOST_TEST(out.body_text.empty());
    BOOST_TEST(out.subject.empty());
    BOOST_TEST(out.sender.address.empty());
    BOOST_TEST(!out.sent_at.has_value());
    BOOST_TEST(!out.internal_date.has_value());
}
