/*

html_to_text.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Reducing an HTML body to plain text.

*/


#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <triagexx/detail/ascii.hpp>
#include <triagexx/detail/utf8.hpp>


namespace triagexx
{

namespace html_detail
{

struct named_entity
{
    std::string_view name;
    std::uint32_t codepoint;
};

inline constexpr std::array<named_entity, 24> NAMED_ENTITIES = {{
    {"amp", '&'}, {"lt", '<'}, {"gt", '>'}, {"quot", '"'}, {"apos", '\''}, {"nbsp", ' '},
    {"ndash", 0x2013}, {"mdash", 0x2014}, {"hellip", 0x2026}, {"lsquo", 0x2018}, {"rsquo", 0x2019},
    {"ldquo", 0x201C}, {"rdquo", 0x201D}, {"bull", 0x2022}, {"middot", 0xB7}, {"copy", 0xA9},
    {"reg", 0xAE}, {"trade", 0x2122}, {"euro", 0x20AC}, {"pound", 0xA3}, {"yen", 0xA5},
    {"cent", 0xA2}, {"zwnj", 0x200C}, {"shy", 0xAD}
}};

// Elements whose boundaries are line breaks in the text rendering.
inline constexpr std::array<std::string_view, 20> BLOCK_TAGS = {{
    "p", "div", "br", "li", "ul", "ol", "tr", "table", "blockquote", "h1", "h2", "h3", "h4", "h5", "h6",
    "hr", "section", "article", "header", "footer"
}};

// Elements whose whole content is dropped.
inline constexpr std::array<std::string_view, 5> SKIPPED_TAGS = {{
    "script", "style", "head", "noscript", "title"
}};

template<std::size_t N>
inline bool tag_in(std::string_view tag, const std::array<std::string_view, N>& tags)
{
    for (auto t : tags)
        if (detail::iequals_ascii(tag, t))
            return true;
    return false;
}

/**
Scraping context over an HTML text.
**/
class context
{
public:

    explicit context(std::string_view html) : html_(html), pos_(0)
    {
    }

    bool done() const
    {
        return pos_ >= html_.size();
    }

    char current() const
    {
        return html_[pos_];
    }

    void advance(std::size_t n = 1)
    {
        pos_ = pos_ + n > html_.size() ? html_.size() : pos_ + n;
    }

    bool looking_at(std::string_view str) const
    {
        return pos_ + str.size() <= html_.size() && detail::iequals_ascii(html_.substr(pos_, str.size()), str);
    }

    /**
    Moving past the next occurrence of the given text, or to the end.
    **/
    void skip_past(std::string_view str)
    {
        while (!done() && !looking_at(str))
            ++pos_;
        advance(str.size());
    }

    std::string_view eat_tag_name()
    {
        const std::size_t start = pos_;
        while (!done() && (detail::is_ascii_alnum(html_[pos_])))
            ++pos_;
        return html_.substr(start, pos_ - start);
    }

    /**
    Moving past the closing `>` of a tag, honouring quoted attribute values.
    **/
    void skip_tag_rest()
    {
        char quote = 0;
        while (!done())
        {
            const char ch = html_[pos_++];
            if (quote != 0)
            {
                if (ch == quote)
                    quote = 0;
            }
            else if (ch == '"' || ch == '\'')
                quote = ch;
            else if (ch == '>')
                return;
        }
    }

    /**
    Decoding the character reference at the current `&`, advancing past it.

    @param out Text receiving the decoded character, or the `&` itself if it starts no known reference.
    **/
    void eat_entity(std::string& out)
    {
        std::size_t end = pos_ + 1;
        while (end < html_.size() && end - pos_ <= 10 && html_[end] != ';' && (detail::is_ascii_alnum(html_[end]) || html_[end] == '#'))
            ++end;
        if (end >= html_.size() || html_[end] != ';' || end == pos_ + 1)
        {
            out += '&';
            ++pos_;
            return;
        }

        const std::string_view ref = html_.substr(pos_ + 1, end - pos_ - 1);
        std::uint32_t cp = 0;
        bool found = false;
        if (ref.front() == '#')
        {
            const bool hex = ref.size() > 1 && (ref[1] == 'x' || ref[1] == 'X');
            const std::string_view digits = ref.substr(hex ? 2 : 1);
            found = !digits.empty();
            for (char d : digits)
            {
                int v = -1;
                if (detail::is_ascii_digit(d))
                    v = d - '0';
                else if (hex && d >= 'a' && d <= 'f')
                    v = d - 'a' + 10;
                else if (hex && d >= 'A' && d <= 'F')
                    v = d - 'A' + 10;
                if (v < 0 || cp > 0x10FFFF)
                {
                    found = false;
                    break;
                }
                cp = cp * (hex ? 16 : 10) + static_cast<std::uint32_t>(v);
            }
            if (found && (cp == 0 || cp > 0x10FFFF))
                cp = detail::REPLACEMENT_CHAR;
        }
        else
        {
            for (const auto& e : NAMED_ENTITIES)
            {
                if (e.name == ref)
                {
                    cp = e.codepoint;
                    found = true;
                    break;
                }
            }
        }

        if (!found)
        {
            out += '&';
            ++pos_;
            return;
        }
        if (cp != 0x200C && cp != 0xAD)
            detail::append_utf8(cp, out);
        pos_ = end + 1;
    }

private:
    std::string_view html_;
    std::size_t pos_;
};

// Collapses horizontal whitespace, keeps at most one line break between paragraphs.
inline std::string cleanup(std::string_view raw)
{
    std::string clean;
    clean.reserve(raw.size());
    bool pending_space = false;
    bool pending_break = false;
    for (char c : raw)
    {
        if (c == '\n')
        {
            pending_break = true;
            continue;
        }
        if (c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v')
        {
            pending_space = true;
            continue;
        }
        if (!clean.empty())
        {
            if (pending_break)
                clean += '\n';
            else if (pending_space)
                clean += ' ';
        }
        pending_space = false;
        pending_break = false;
        clean += c;
    }
    return clean;
}

} // namespace html_detail


/**
Reducing HTML to plain text: markup is stripped, script and style content discarded, character references decoded,
whitespace collapsed, and block boundaries become single line breaks.

@param html HTML text, expected as UTF-8.
@return     Plain text without leading or trailing whitespace.
**/
inline std::string html_to_text(std::string_view html)
{
    html_detail::context ctx(html);
    std::string raw;
    raw.reserve(html.size() / 2);

    // Whitespace in the source is not significant; line breaks come from the markup only.
    auto add_text_char = [&raw](char ch)
    {
        raw += (ch == '\n' || ch == '\r') ? ' ' : ch;
    };

    while (!ctx.done())
    {
        if (ctx.looking_at("<!--"))
        {
            ctx.skip_past("-->");
            continue;
        }
        if (ctx.looking_at("<!") || ctx.looking_at("<?"))
        {
            ctx.skip_tag_rest();
            continue;
        }
        if (ctx.current() == '&')
        {
            ctx.eat_entity(raw);
            continue;
        }
        if (ctx.current() != '<')
        {
            add_text_char(ctx.current());
            ctx.advance();
            continue;
        }

        // Tag: `<name ...>` or `</name>`.
        ctx.advance();
        const bool closing = !ctx.done() && ctx.current() == '/';
        if (closing)
            ctx.advance();
        if (ctx.done() || !detail::is_ascii_alpha(ctx.current()))
        {
            // A stray `<` is text.
            raw += '<';
            if (closing)
                raw += '/';
            continue;
        }
        const std::string_view name = ctx.eat_tag_name();
        ctx.skip_tag_rest();

        if (!closing && html_detail::tag_in(name, html_detail::SKIPPED_TAGS))
        {
            ctx.skip_past("</" + std::string(name));
            ctx.skip_tag_rest();
            continue;
        }
        if (html_detail::tag_in(name, html_detail::BLOCK_TAGS))
            raw += '\n';
        else if (detail::iequals_ascii(name, "td") || detail::iequals_ascii(name, "th"))
            raw += ' ';
    }

    return html_detail::cleanup(raw);
}


} // namespace triagexx
