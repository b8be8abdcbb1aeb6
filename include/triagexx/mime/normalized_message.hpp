/*

normalized_message.hpp
----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <triagexx/mime/mailboxes.hpp>
#include <triagexx/timestamp.hpp>


namespace triagexx
{


/**
Attachment metadata; attachment content is never fetched.
**/
struct attachment_info
{
    std::string part_id;
    std::string filename;
    std::string mime_type;
    std::uint64_t size = 0;
    std::string attachment_id;
    bool is_inline = false;

    bool operator==(const attachment_info&) const = default;
};


/**
Decoder output: the message reduced to what triage needs, all text in UTF-8.
**/
struct normalized_message
{
    std::string message_id;
    std::string thread_id;
    std::vector<std::string> labels;
    std::string snippet;
    std::string history_id;

    std::string subject;
    mail_address sender;
    std::vector<std::string> to;
    std::vector<std::string> cc;

    /// From the `Date` header, in the sender's offset
    std::optional<zoned_timestamp> sent_at;

    /// Provider receive time
    std::optional<sys_seconds> internal_date;

    std::string body_text;
    bool body_html_present = false;
    bool body_truncated = false;

    std::vector<attachment_info> attachments;

    /// Carried through headers, in a fixed order, first occurrence of each
    std::vector<std::pair<std::string, std::string>> headers_of_interest;
};


} // namespace triagexx
