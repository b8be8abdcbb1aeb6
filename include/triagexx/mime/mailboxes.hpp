/*

mailboxes.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <triagexx/codec/q_codec.hpp>
#include <triagexx/detail/ascii.hpp>


namespace triagexx
{


/**
Mail address and its display name, both decoded to UTF-8.
**/
struct mail_address
{
    std::string name;
    std::string address;

    bool operator==(const mail_address&) const = default;
};


/**
Parsing an address list header value (`From`, `To`, `Cc`, `Reply-To`).

The parser is lenient: quoted names, comments, angle addresses, groups and bare addresses are accepted, and a segment it
cannot make sense of is skipped rather than failing the list. Group members are flattened into the result.

@param address_list Raw header value.
@return             Addresses in header order; an entry may have an empty address when only a name was given.
**/
inline std::vector<mail_address> parse_address_list(std::string_view address_list)
{
    enum class state_t {TEXT, QUOTED, QUOTED_ESCAPE, ANGLE, COMMENT};

    std::vector<mail_address> mail_list;
    q_codec qc;

    // Pieces of the mailbox being parsed.
    std::string phrase;
    std::string angle_addr;
    std::string comment;
    bool angle_seen = false;
    int comment_depth = 0;
    state_t state = state_t::TEXT;
    state_t comment_return = state_t::TEXT;

    auto finish_mailbox = [&]()
    {
        mail_address addr;
        std::string name;
        if (angle_seen)
        {
            addr.address = detail::trim_copy(angle_addr);
            name = detail::collapse_whitespace(phrase);
        }
        else
        {
            // Bare address, possibly followed by an old style `(Name)` comment.
            std::string bare = detail::collapse_whitespace(phrase);
            if (detail::looks_like_address(bare))
                addr.address = bare;
            else
                name = bare;
        }
        if (name.empty())
            name = detail::collapse_whitespace(comment);
        if (!name.empty())
            addr.name = qc.check_decode(name);

        if (!addr.address.empty() || !addr.name.empty())
            mail_list.push_back(std::move(addr));

        phrase.clear();
        angle_addr.clear();
        comment.clear();
        angle_seen = false;
    };

    for (char ch : address_list)
    {
        switch (state)
        {
            case state_t::TEXT:
            {
                if (ch == '"')
                    state = state_t::QUOTED;
                else if (ch == '<')
                {
                    angle_seen = true;
                    angle_addr.clear();
                    state = state_t::ANGLE;
                }
                else if (ch == '(')
                {
                    comment_depth = 1;
                    comment_return = state_t::TEXT;
                    if (!comment.empty())
                        comment += ' ';
                    state = state_t::COMMENT;
                }
                else if (ch == ',')
                    finish_mailbox();
                else if (ch == ':')
                {
                    // Group display name, its members follow.
                    phrase.clear();
                    comment.clear();
                }
                else if (ch == ';')
                    finish_mailbox();
                else if (ch == '\r' || ch == '\n')
                    phrase += ' ';
                else if (!angle_seen)
                    phrase += ch;
                break;
            }

            case state_t::QUOTED:
            {
                if (ch == '\\')
                    state = state_t::QUOTED_ESCAPE;
                else if (ch == '"')
                    state = state_t::TEXT;
                else
                    phrase += ch;
                break;
            }

            case state_t::QUOTED_ESCAPE:
            {
                phrase += ch;
                state = state_t::QUOTED;
                break;
            }

            case state_t::ANGLE:
            {
                if (ch == '>')
                    state = state_t::TEXT;
                else if (ch == '(')
                {
                    comment_depth = 1;
                    comment_return = state_t::ANGLE;
                    state = state_t::COMMENT;
                }
                else if (!detail::is_ascii_space(ch))
                    angle_addr += ch;
                break;
            }

            case state_t::COMMENT:
            {
                if (ch == '(')
                    ++comment_depth;
                else if (ch == ')')
                {
                    if (--comment_depth == 0)
                    {
                        state = comment_return;
                        break;
                    }
                }
                if (comment_return == state_t::TEXT)
                    comment += ch;
                break;
            }
        }
    }
    finish_mailbox();

    return mail_list;
}


/**
Parsing a single mailbox header such as `From`, keeping the first usable entry.

@param header_value Raw header value.
@return             First mailbox carrying an address, else the first entry, else an empty one.
**/
inline mail_address parse_mailbox(std::string_view header_value)
{
    auto list = parse_address_list(header_value);
    for (auto& addr : list)
        if (!addr.address.empty())
            return addr;
    return list.empty() ? mail_address{} : list.front();
}


} // namespace triagexx
