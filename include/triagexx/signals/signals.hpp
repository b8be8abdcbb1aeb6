/*

signals.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>


namespace triagexx
{


/**
Rough nature of a time phrase; phrases are never resolved at this stage.
**/
enum class phrase_kind_t {ABSOLUTE, RELATIVE, RECURRING};


inline std::string_view to_string(phrase_kind_t kind)
{
    switch (kind)
    {
        case phrase_kind_t::ABSOLUTE:
            return "absolute";
        case phrase_kind_t::RELATIVE:
            return "relative";
        case phrase_kind_t::RECURRING:
            return "recurring";
    }
    return "absolute";
}


struct money_mention
{
    std::string raw_text;

    /// ISO 4217 code, unset when the notation is ambiguous
    std::optional<std::string> currency;

    std::optional<double> amount;

    bool operator==(const money_mention&) const = default;
};


struct time_phrase
{
    std::string raw_text;
    phrase_kind_t kind = phrase_kind_t::ABSOLUTE;

    bool operator==(const time_phrase&) const = default;
};


/**
Observable mentions found in a message, each list in first-seen order without duplicates.
**/
struct signals_bundle
{
    std::vector<std::string> urls;
    std::vector<money_mention> money;
    std::vector<time_phrase> time_phrases;

    bool empty() const
    {
        return urls.empty() && money.empty() && time_phrases.empty();
    }
};


} // namespace triagexx
