/*

extractor.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Scanning message text for links, money amounts and time phrases.

*/


#pragma once

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <triagexx/detail/ascii.hpp>
#include <triagexx/detail/regex.hpp>
#include <triagexx/mime/normalized_message.hpp>
#include <triagexx/signals/signals.hpp>


namespace triagexx
{

namespace signals_detail
{

// Building blocks of the time phrase patterns.
inline const std::string WEEKDAY = R"((?:mon|tues|wednes|thurs|fri|satur|sun)day)";
inline const std::string MONTH = R"((?:jan(?:uary)?|feb(?:ruary)?|mar(?:ch)?|apr(?:il)?|may|june?|july?|aug(?:ust)?|sept?(?:ember)?|oct(?:ober)?|nov(?:ember)?|dec(?:ember)?)\b\.?)";
inline const std::string CLOCK = R"((?:(?:1[0-2]|0?[1-9])(?::[0-5]\d)?\s?[ap]\.?m\.?|(?:[01]?\d|2[0-3]):[0-5]\d|noon|midnight)(?!\w))";
inline const std::string ZONE = R"((?:\s?(?:pt|pst|pdt|mt|mst|mdt|ct|cst|cdt|et|est|edt|utc|gmt)(?:[+-]\d{1,2}(?::?\d{2})?)?\b)?)";
inline const std::string LEAD = R"((?:(?:due\s+)?(?:by|on|before|until)\s+|due\s+)?)";
inline const std::string TRAIL = R"((?:,?\s+(?:at\s+)?)" + CLOCK + ZONE + R"(|\s+eod\b)?)";

// Candidate found in one text, before overlaps are resolved.
struct span
{
    std::size_t begin;
    std::size_t end;
    phrase_kind_t kind;
};

inline bool preceded_by(std::string_view text, std::size_t pos, std::string_view chars)
{
    if (pos == 0)
        return false;
    const char prev = text[pos - 1];
    return detail::is_ascii_alnum(prev) || prev == '_' || chars.find(prev) != std::string_view::npos;
}

} // namespace signals_detail


/**
Extractor of observable signals from a normalized message.

Extraction is total: anything that does not match a pattern is simply not reported. The compiled patterns are
immutable, one extractor may serve concurrent requests.
**/
class signal_extractor
{
public:

    /// Time phrases kept per message
    static constexpr std::size_t MAX_TIME_PHRASES = 20;

    signal_extractor();

    signal_extractor(const signal_extractor&) = delete;

    signal_extractor(signal_extractor&&) = delete;

    ~signal_extractor() = default;

    void operator=(const signal_extractor&) = delete;

    void operator=(signal_extractor&&) = delete;

    /**
    Extracting the signals of the subject and the body text, subject first.
    **/
    signals_bundle extract(const normalized_message& msg) const;

    /**
    Extracting normalized links from a text, in first-seen order.
    **/
    std::vector<std::string> extract_urls(std::string_view text) const;

    /**
    Extracting money mentions from a text, in first-seen order.
    **/
    std::vector<money_mention> extract_money(std::string_view text) const;

    /**
    Extracting time phrases from a text, in first-seen order.
    **/
    std::vector<time_phrase> extract_time_phrases(std::string_view text) const;

    /**
    Lower casing the scheme and the host of a link, stripping trailing punctuation and unbalanced closing brackets.

    @return Normalized link, empty if no host remains.
    **/
    static std::string normalize_url(std::string_view url);

    /**
    Reading an amount written with either `,` or `.` as thousands or decimal separator.

    The last separator is the decimal one when both are present; a single separator followed by exactly three digits
    is a thousands separator.
    **/
    static std::optional<double> parse_amount(std::string_view text);

    /**
    Mapping a currency symbol, code or word to an ISO 4217 code; nothing for unknown or ambiguous tokens.
    **/
    static std::optional<std::string> currency_code(std::string_view token);

private:

    detail::regex url_re_;
    detail::regex money_prefix_re_;
    detail::regex money_suffix_re_;
    std::vector<std::pair<detail::regex, phrase_kind_t>> phrase_res_;
};


inline signal_extractor::signal_extractor() :
    url_re_(R"(\b(?:https?|ftp)://[^\s<>"]+)", detail::icase),
    money_prefix_re_(R"((US\$|CA\$|C\$|AU\$|A\$|\$|€|£|₹|¥|(?:USD|EUR|GBP|CAD|AUD|CHF|JPY|INR)\b)\s?(\d+(?:[.,]\d+)*)(?![.,]\d|\w))",
        detail::icase),
    money_suffix_re_(R"((\d+(?:[.,]\d+)*)\s?(USD\b|EUR\b|GBP\b|CAD\b|AUD\b|CHF\b|JPY\b|INR\b|dollars?\b|bucks\b|euros?\b|pounds?\b|rupees?\b|€))",
        detail::icase)
{
    using namespace signals_detail;
    const auto add = [this](const std::string& pattern, phrase_kind_t kind)
    {
        phrase_res_.emplace_back(detail::regex(pattern, detail::icase), kind);
    };

    add(R"(\b(?:every|each)\s+(?:other\s+)?(?:)" + WEEKDAY +
        R"(|weekday|day|week|month|morning|afternoon|evening|night|quarter|year)s?\b)" + TRAIL, phrase_kind_t::RECURRING);
    add(R"(\b(?:daily|weekly|bi-?weekly|fortnightly|monthly|quarterly|annually|yearly)\b)", phrase_kind_t::RECURRING);

    add(R"(\b)" + LEAD + R"((?:asap|as\s+soon\s+as\s+possible|eod|eow|end\s+of\s+(?:the\s+)?(?:business\s+)?(?:day|week|month))\b)",
        phrase_kind_t::RELATIVE);
    add(R"(\b)" + LEAD + R"((?:today|tonight|tomorrow)\b)" + TRAIL, phrase_kind_t::RELATIVE);
    add(R"(\b)" + LEAD + R"((?:this|next|coming)\s+(?:week|weekend|month|)" + WEEKDAY + R"()\b)" + TRAIL,
        phrase_kind_t::RELATIVE);
    add(R"(\b(?:in|within)\s+(?:\d+|an?|one|two|three|four|five|six|seven|ten|a\s+few|a\s+couple\s+of)\s+(?:business\s+)?(?:minute|hour|day|week|month)s?\b)",
        phrase_kind_t::RELATIVE);

    add(R"(\b)" + LEAD + WEEKDAY + R"(\b)" + TRAIL, phrase_kind_t::ABSOLUTE);
    add(R"(\b)" + LEAD + R"((?:)" + MONTH + R"(\s+\d{1,2}(?:st|nd|rd|th)?(?:,?\s+\d{4})?|\d{1,2}(?:st|nd|rd|th)?\s+(?:of\s+)?)" +
        MONTH + R"((?:,?\s+\d{4})?)(?!\w))" + TRAIL, phrase_kind_t::ABSOLUTE);
    add(R"(\b)" + LEAD + R"(\d{4}-\d{2}-\d{2}(?:[T ]\d{2}:\d{2}(?::\d{2})?(?:Z|[+-]\d{2}:?\d{2})?)?(?![\w-]))", phrase_kind_t::ABSOLUTE);
    add(R"(\b)" + LEAD + R"((?:at\s+)?)" + CLOCK + ZONE, phrase_kind_t::ABSOLUTE);
}


inline std::string signal_extractor::normalize_url(std::string_view url)
{
    // Trailing sentence punctuation and closing brackets without an opening one inside the link.
    while (!url.empty())
    {
        const char last = url.back();
        if (std::string_view(".,;:!?'\"*").find(last) != std::string_view::npos)
        {
            url.remove_suffix(1);
            continue;
        }
        const std::string_view closing = ")]}";
        const std::string_view opening = "([{";
        const auto bracket = closing.find(last);
        if (bracket != std::string_view::npos &&
            std::count(url.begin(), url.end(), opening[bracket]) < std::count(url.begin(), url.end(), last))
        {
            url.remove_suffix(1);
            continue;
        }
        break;
    }

    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos)
        return {};
    const std::size_t authority_begin = scheme_end + 3;
    std::size_t authority_end = url.find_first_of("/?#", authority_begin);
    if (authority_end == std::string_view::npos)
        authority_end = url.size();
    const std::string_view authority = url.substr(authority_begin, authority_end - authority_begin);
    const auto at = authority.rfind('@');
    const std::string_view userinfo = at == std::string_view::npos ? std::string_view() : authority.substr(0, at + 1);
    const std::string_view host = at == std::string_view::npos ? authority : authority.substr(at + 1);
    if (host.empty() || host.front() == ':')
        return {};

    std::string out = boost::algorithm::to_lower_copy(std::string(url.substr(0, authority_begin)));
    out += userinfo;
    out += boost::algorithm::to_lower_copy(std::string(host));
    out += url.substr(authority_end);
    return out;
}


inline std::optional<double> signal_extractor::parse_amount(std::string_view text)
{
    const auto last_dot = text.rfind('.');
    const auto last_comma = text.rfind(',');
    char decimal = 0;
    if (last_dot != std::string_view::npos && last_comma != std::string_view::npos)
        decimal = last_dot > last_comma ? '.' : ',';
    else if (last_dot != std::string_view::npos || last_comma != std::string_view::npos)
    {
        const char sep = last_dot != std::string_view::npos ? '.' : ',';
        const auto pos = sep == '.' ? last_dot : last_comma;
        const bool single = text.find(sep) == pos;
        if (single && text.size() - pos - 1 != 3)
            decimal = sep;
    }

    std::string digits;
    digits.reserve(text.size());
    for (char ch : text)
    {
        if (detail::is_ascii_digit(ch))
            digits += ch;
        else if (ch == decimal)
            digits += '.';
        else if (ch != '.' && ch != ',')
            return std::nullopt;
    }
    if (digits.empty())
        return std::nullopt;

    double value = 0.0;
    auto res = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (res.ec != std::errc{} || res.ptr != digits.data() + digits.size())
        return std::nullopt;
    return value;
}


inline std::optional<std::string> signal_extractor::currency_code(std::string_view token)
{
    const std::string t = boost::algorithm::to_upper_copy(detail::trim_copy(token));
    if (t == "$" || t == "US$" || t == "USD" || t == "DOLLAR" || t == "DOLLARS" || t == "BUCKS")
        return "USD";
    if (t == "€" || t == "EUR" || t == "EURO" || t == "EUROS")
        return "EUR";
    if (t == "£" || t == "GBP" || t == "POUND" || t == "POUNDS")
        return "GBP";
    if (t == "CA$" || t == "C$" || t == "CAD")
        return "CAD";
    if (t == "A$" || t == "AU$" || t == "AUD")
        return "AUD";
    if (t == "₹" || t == "INR" || t == "RUPEE" || t == "RUPEES")
        return "INR";
    if (t == "CHF" || t == "JPY")
        return t;
    // `¥` is both yen and yuan.
    return std::nullopt;
}


inline std::vector<std::string> signal_extractor::extract_urls(std::string_view text) const
{
    std::vector<std::string> urls;
    const std::string input(text);
    for (detail::sregex_iterator it(input.begin(), input.end(), url_re_), end; it != end; ++it)
    {
        std::string url = normalize_url(it->str());
        if (!url.empty() && std::find(urls.begin(), urls.end(), url) == urls.end())
            urls.push_back(std::move(url));
    }
    return urls;
}


inline std::vector<money_mention> signal_extractor::extract_money(std::string_view text) const
{
    struct candidate
    {
        std::size_t begin;
        std::size_t end;
        money_mention mention;
    };
    std::vector<candidate> candidates;
    const std::string input(text);

    for (detail::sregex_iterator it(input.begin(), input.end(), money_prefix_re_), end; it != end; ++it)
    {
        const auto begin = static_cast<std::size_t>(it->position());
        if (signals_detail::preceded_by(input, begin, "$"))
            continue;
        auto amount = parse_amount((*it)[2].str());
        if (!amount)
            continue;
        candidates.push_back({begin, begin + static_cast<std::size_t>(it->length()),
            money_mention{detail::collapse_whitespace(it->str()), currency_code((*it)[1].str()), amount}});
    }
    for (detail::sregex_iterator it(input.begin(), input.end(), money_suffix_re_), end; it != end; ++it)
    {
        const auto begin = static_cast<std::size_t>(it->position());
        if (signals_detail::preceded_by(input, begin, "$.,"))
            continue;
        auto amount = parse_amount((*it)[1].str());
        if (!amount)
            continue;
        candidates.push_back({begin, begin + static_cast<std::size_t>(it->length()),
            money_mention{detail::collapse_whitespace(it->str()), currency_code((*it)[2].str()), amount}});
    }

    std::stable_sort(candidates.begin(), candidates.end(), [](const candidate& a, const candidate& b)
    {
        return a.begin < b.begin;
    });
    std::vector<money_mention> money;
    std::size_t covered = 0;
    for (auto& c : candidates)
    {
        if (c.begin < covered)
            continue;
        covered = c.end;
        const bool seen = std::any_of(money.begin(), money.end(), [&c](const money_mention& m)
        {
            return m.raw_text == c.mention.raw_text;
        });
        if (!seen)
            money.push_back(std::move(c.mention));
    }
    return money;
}


inline std::vector<time_phrase> signal_extractor::extract_time_phrases(std::string_view text) const
{
    using signals_detail::span;
    std::vector<span> spans;
    const std::string input(text);
    for (const auto& [re, kind] : phrase_res_)
    {
        for (detail::sregex_iterator it(input.begin(), input.end(), re), end; it != end; ++it)
        {
            if (it->length() == 0)
                continue;
            const auto begin = static_cast<std::size_t>(it->position());
            spans.push_back(span{begin, begin + static_cast<std::size_t>(it->length()), kind});
        }
    }

    // Earliest first, the longest of those starting together wins, overlapped spans are dropped.
    std::stable_sort(spans.begin(), spans.end(), [](const span& a, const span& b)
    {
        return a.begin != b.begin ? a.begin < b.begin : a.end > b.end;
    });
    std::vector<time_phrase> phrases;
    std::size_t covered = 0;
    for (const auto& s : spans)
    {
        if (s.begin < covered)
            continue;
        covered = s.end;
        std::string raw = detail::collapse_whitespace(std::string_view(input).substr(s.begin, s.end - s.begin));
        const bool seen = std::any_of(phrases.begin(), phrases.end(), [&raw](const time_phrase& p)
        {
            return boost::algorithm::iequals(p.raw_text, raw);
        });
        if (!seen)
            phrases.push_back(time_phrase{std::move(raw), s.kind});
        if (phrases.size() == MAX_TIME_PHRASES)
            break;
    }
    return phrases;
}


inline signals_bundle signal_extractor::extract(const normalized_message& msg) const
{
    signals_bundle bundle;
    for (std::string_view text : {std::string_view(msg.subject), std::string_view(msg.body_text)})
    {
        for (auto& url : extract_urls(text))
            if (std::find(bundle.urls.begin(), bundle.urls.end(), url) == bundle.urls.end())
                bundle.urls.push_back(std::move(url));

        for (auto& m : extract_money(text))
        {
            const bool seen = std::any_of(bundle.money.begin(), bundle.money.end(), [&m](const money_mention& o)
            {
                return o.raw_text == m.raw_text;
            });
            if (!seen)
                bundle.money.push_back(std::move(m));
        }

        for (auto& p : extract_time_phrases(text))
        {
            if (bundle.time_phrases.size() == MAX_TIME_PHRASES)
                break;
            const bool seen = std::any_of(bundle.time_phrases.begin(), bundle.time_phrases.end(), [&p](const time_phrase& o)
            {
                return boost::algorithm::iequals(o.raw_text, p.raw_text);
            });
            if (!seen)
                bundle.time_phrases.push_back(std::move(p));
        }
    }
    return bundle;
}


} // namespace triagexx
