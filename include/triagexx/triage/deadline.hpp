/*

deadline.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Resolving date and deadline text to instants with an explicit offset.

*/


#pragma once

#include <array>
#include <charconv>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <triagexx/detail/ascii.hpp>
#include <triagexx/detail/regex.hpp>
#include <triagexx/timestamp.hpp>


namespace triagexx
{


/**
Date or date time a text was resolved to.
**/
struct resolved_time
{
    zoned_timestamp when;

    /// False when the text names a day only; `when` is then the local midnight
    bool has_time = false;

    /// IANA name of the zone, when it is known
    std::optional<std::string> zone_name;

    /**
    ISO-8601 form: date time with offset, or the bare date when no clock time was given.
    **/
    std::string iso() const
    {
        return has_time ? format_iso(when) : format_iso_date(when.local());
    }
};


namespace deadline_detail
{

using namespace std::chrono;

inline constexpr char MONTH_NAMES[] = "(jan(?:uary)?|feb(?:ruary)?|mar(?:ch)?|apr(?:il)?|may|june?|july?|aug(?:ust)?|sept?(?:ember)?|oct(?:ober)?|nov(?:ember)?|dec(?:ember)?)";

// Patterns over lower cased text, compiled once.
struct patterns
{
    detail::regex clock_12h{R"(\b(\d{1,2})(?::([0-5]\d))?\s*([ap])\.?m\b\.?)"};
    detail::regex clock_24h{R"(\b([01]?\d|2[0-3]):([0-5]\d)\b)"};
    detail::regex noon{R"(\bnoon\b)"};
    detail::regex midnight{R"(\bmidnight\b)"};
    detail::regex end_of_day{R"(\b(?:eod|cob|end\s+of\s+(?:the\s+)?(?:business\s+)?day|close\s+of\s+business)\b)"};
    detail::regex zone{R"(\b(?:(utc|gmt)\s*([+-]\d{1,2}(?::?\d{2})?)|(pt|pst|pdt|mt|mst|mdt|ct|cst|cdt|et|est|edt|utc|gmt))\b)"};
    detail::regex iso_date{R"(\b(\d{4})-(\d{2})-(\d{2})(?:[t ](\d{2}):(\d{2})(?::(\d{2}))?(z|[+-]\d{2}:?\d{2})?)?)"};
    detail::regex month_day{std::string(R"(\b)") + MONTH_NAMES + R"(\.?\s+(\d{1,2})(?:st|nd|rd|th)?\b(?:,?\s+(\d{4})\b)?)"};
    detail::regex day_month{std::string(R"(\b(\d{1,2})(?:st|nd|rd|th)?\s+(?:of\s+)?)") + MONTH_NAMES + R"(\b\.?(?:,?\s+(\d{4})\b)?)"};
    detail::regex numeric_date{R"(\b(\d{1,2})/(\d{1,2})(?:/(\d{4}|\d{2}))?\b)"};
    detail::regex weekday_name{R"(\b(monday|tuesday|wednesday|thursday|friday|saturday|sunday)\b)"};
    detail::regex next{R"(\bnext\b)"};
    detail::regex day_after_tomorrow{R"(\bday\s+after\s+tomorrow\b)"};
    detail::regex tomorrow{R"(\btomorrow\b)"};
    detail::regex today{R"(\btoday\b)"};
    detail::regex tonight{R"(\btonight\b)"};
    detail::regex offset{R"(\b(?:in|within)\s+(\d+|an?|one|two|three|four|five|six|seven|eight|nine|ten)\s+(business\s+)?(minute|hour|day|week|month)s?\b)"};
    detail::regex end_of_week{R"(\b(?:eow|end\s+of\s+(?:the\s+)?week)\b)"};
    detail::regex end_of_month{R"(\bend\s+of\s+(?:the\s+)?month\b)"};
    detail::regex next_week{R"(\bnext\s+week\b)"};
    detail::regex next_month{R"(\bnext\s+month\b)"};
};

inline const patterns& compiled()
{
    static const patterns instance;
    return instance;
}

inline bool contains(const std::string& lower, const detail::regex& re)
{
    detail::smatch m;
    return detail::regex_search(lower, m, re);
}

// Largest relative offset honoured, about ten years; longer ones are unresolvable.
inline constexpr int MAX_OFFSET_DAYS = 3660;
inline constexpr int MAX_OFFSET_MONTHS = 120;

// Count of an `in N <unit>` phrase, nothing when the digits overflow.
inline std::optional<int> count_from_word(const std::string& word)
{
    static constexpr std::array<std::pair<std::string_view, int>, 12> words = {{
        {"a", 1}, {"an", 1}, {"one", 1}, {"two", 2}, {"three", 3}, {"four", 4}, {"five", 5}, {"six", 6},
        {"seven", 7}, {"eight", 8}, {"nine", 9}, {"ten", 10}
    }};
    for (const auto& [w, n] : words)
        if (word == w)
            return n;
    int n = 0;
    const auto [end, ec] = std::from_chars(word.data(), word.data() + word.size(), n);
    if (ec != std::errc{} || end != word.data() + word.size())
        return std::nullopt;
    return n;
}

// Largest count accepted for a unit of the `in N <unit>` phrase.
inline int max_count(const std::string& unit)
{
    if (unit == "minute")
        return MAX_OFFSET_DAYS * 24 * 60;
    if (unit == "hour")
        return MAX_OFFSET_DAYS * 24;
    if (unit == "week")
        return MAX_OFFSET_DAYS / 7;
    if (unit == "month")
        return MAX_OFFSET_MONTHS;
    return MAX_OFFSET_DAYS;
}

inline unsigned weekday_from_name(const std::string& name)
{
    static constexpr std::array<std::string_view, 7> names = {{
        "sunday", "monday", "tuesday", "wednesday", "thursday", "friday", "saturday"
    }};
    for (unsigned i = 0; i < names.size(); ++i)
        if (name == names[i])
            return i;
    return 0;
}

// Days after `from` until the next `target`, a full week when they coincide.
inline days days_until(local_days from, weekday target)
{
    const days delta = target - weekday{from};
    return delta == days{0} ? days{7} : delta;
}

inline local_days add_business_days(local_days day, int count)
{
    if (count <= 0)
        return day;
    // Every seven days hold five business days; the last one to five are walked.
    const int weeks = (count - 1) / 5;
    day += days{7 * weeks};
    count -= 5 * weeks;
    while (count > 0)
    {
        day += days{1};
        const weekday wd{day};
        if (wd != Saturday && wd != Sunday)
            --count;
    }
    return day;
}

inline local_days add_months(local_days day, int count)
{
    year_month_day ymd{day};
    ymd += months{count};
    if (!ymd.ok())
        ymd = ymd.year() / ymd.month() / last;
    return local_days{ymd};
}

} // namespace deadline_detail


/**
Resolver of date and deadline text against a reference instant.

The reference is passed in, the wall clock is never read. Text without a zone is read in the default offset.
**/
class deadline_resolver
{
public:

    deadline_resolver(sys_seconds reference, std::chrono::minutes default_offset) :
        reference_(reference), default_offset_(default_offset)
    {
    }

    sys_seconds reference() const
    {
        return reference_;
    }

    std::chrono::minutes default_offset() const
    {
        return default_offset_;
    }

    /**
    Resolving a text.

    Accepted forms, tried in order: a whole ISO-8601 value, a whole RFC 5322 date, then free text holding an
    embedded ISO date, a month name date, a `M/D[/Y]` date, `today`, `tonight`, `tomorrow`, a weekday name (strictly
    after the reference day, `next` adds a week), `in|within N minutes|hours|days|weeks|months` up to about ten
    years, `end of week`, `end of month`, `next week`, `next month`, `eod`, or a clock time alone. A clock time
    (`3pm`, `15:30`, `noon`, `midnight`, `eod` for 17:00) and a zone (`PT`, `EST`, `UTC-8`, ...) found anywhere in the
    text apply. Dates outside years 0001 to 9999 are unresolvable.

    @param text Text to resolve.
    @return     Resolved value, or nothing when the text names no recognizable date.
    **/
    std::optional<resolved_time> resolve(std::string_view text) const;

    /**
    Finding the clock time named in a text.

    @return Hour and minute, or nothing.
    **/
    static std::optional<std::pair<int, int>> clock_time(const std::string& lower_text);

    /**
    IANA zone conventionally associated with an offset, when there is one.
    **/
    static std::optional<std::string> zone_name_for_offset(std::chrono::minutes offset);

private:

    resolved_time make_result(local_seconds local, bool has_time, std::optional<std::chrono::minutes> offset) const
    {
        resolved_time out;
        const auto effective = offset.value_or(default_offset_);
        out.when = zoned_timestamp::from_local(local, effective);
        out.has_time = has_time;
        out.zone_name = zone_name_for_offset(effective);
        return out;
    }

    sys_seconds reference_;
    std::chrono::minutes default_offset_;
};


inline std::optional<std::pair<int, int>> deadline_resolver::clock_time(const std::string& lower_text)
{
    using namespace deadline_detail;
    const patterns& re = compiled();
    if (contains(lower_text, re.noon))
        return std::make_pair(12, 0);
    if (contains(lower_text, re.midnight))
        return std::make_pair(0, 0);
    if (contains(lower_text, re.end_of_day))
        return std::make_pair(17, 0);

    detail::smatch m;
    if (detail::regex_search(lower_text, m, re.clock_12h))
    {
        int hour = std::stoi(m[1].str());
        const int minute = m[2].matched ? std::stoi(m[2].str()) : 0;
        if (hour >= 1 && hour <= 12)
        {
            if (m[3].str() == "a")
                hour = hour == 12 ? 0 : hour;
            else
                hour = hour == 12 ? 12 : hour + 12;
            return std::make_pair(hour, minute);
        }
    }
    if (detail::regex_search(lower_text, m, re.clock_24h))
        return std::make_pair(std::stoi(m[1].str()), std::stoi(m[2].str()));
    return std::nullopt;
}


inline std::optional<std::string> deadline_resolver::zone_name_for_offset(std::chrono::minutes offset)
{
    switch (offset.count())
    {
        case -480:
        case -420:
            return "America/Los_Angeles";
        case -360:
            return "America/Chicago";
        case -300:
            return "America/New_York";
        case 0:
            return "UTC";
        default:
            return std::nullopt;
    }
}


inline std::optional<resolved_time> deadline_resolver::resolve(std::string_view text) const
{
    using namespace deadline_detail;
    text = detail::trim_view(text);
    if (text.empty())
        return std::nullopt;

    if (auto iso = parse_iso8601(text))
    {
        if (!in_iso_year_range(iso->local))
            return std::nullopt;
        return make_result(iso->local, iso->has_time, iso->offset);
    }
    if (auto date = parse_rfc5322_date(text))
    {
        if (!in_iso_year_range(date->local()))
            return std::nullopt;
        resolved_time out;
        out.when = *date;
        out.has_time = true;
        out.zone_name = zone_name_for_offset(date->offset);
        return out;
    }

    const patterns& re = compiled();
    const std::string lower = detail::to_lower_ascii(text);
    detail::smatch m;

    // Zone named in the text, otherwise the default offset.
    std::optional<minutes> fixed_offset;
    const zone_info* zone = nullptr;
    if (detail::regex_search(lower, m, re.zone))
    {
        if (m[2].matched)
            fixed_offset = parse_offset("UTC" + m[2].str());
        else
        {
            zone = find_zone(m[3].str());
            if (zone != nullptr && !zone->us_rule)
                fixed_offset = minutes{zone->standard_minutes};
        }
    }
    const auto offset_at = [&](local_seconds local) -> minutes
    {
        if (zone != nullptr && zone->us_rule)
            return zone_offset(*zone, local);
        return fixed_offset.value_or(default_offset_);
    };

    const minutes base_offset = zone != nullptr && zone->us_rule ?
        zone_offset(*zone, local_seconds{reference_.time_since_epoch() + minutes{zone->standard_minutes}}) :
        fixed_offset.value_or(default_offset_);
    const local_seconds base_local{reference_.time_since_epoch() + base_offset};
    const local_days base_day = floor<days>(base_local);
    const int base_year = static_cast<int>(year_month_day{base_day}.year());
    std::optional<std::pair<int, int>> clock = clock_time(lower);

    std::optional<local_days> day;
    std::optional<local_seconds> exact;
    std::optional<minutes> explicit_offset;

    if (detail::regex_search(lower, m, re.iso_date))
    {
        const int y = std::stoi(m[1].str());
        const int mo = std::stoi(m[2].str());
        const int d = std::stoi(m[3].str());
        if (time_detail::valid_date(y, mo, d))
        {
            day = floor<days>(time_detail::make_local(y, mo, d));
            if (m[4].matched)
            {
                const int hh = std::stoi(m[4].str());
                const int mm = std::stoi(m[5].str());
                if (hh <= 23 && mm <= 59)
                    clock = std::make_pair(hh, mm);
            }
            if (m[7].matched)
                explicit_offset = parse_offset(m[7].str());
        }
    }
    if (!day && (detail::regex_search(lower, m, re.month_day) || detail::regex_search(lower, m, re.day_month)))
    {
        const bool month_first = !detail::is_ascii_digit(m[1].str().front());
        const unsigned month = month_from_name(m[month_first ? 1 : 2].str());
        const int d = std::stoi(m[month_first ? 2 : 1].str());
        const int y = m[3].matched ? std::stoi(m[3].str()) : base_year;
        if (month != 0 && time_detail::valid_date(y, static_cast<int>(month), d))
            day = floor<days>(time_detail::make_local(y, static_cast<int>(month), d));
    }
    if (!day && detail::regex_search(lower, m, re.numeric_date))
    {
        const int mo = std::stoi(m[1].str());
        const int d = std::stoi(m[2].str());
        int y = base_year;
        if (m[3].matched)
        {
            y = std::stoi(m[3].str());
            if (y < 100)
                y += 2000;
        }
        if (mo >= 1 && mo <= 12 && time_detail::valid_date(y, mo, d))
            day = floor<days>(time_detail::make_local(y, mo, d));
    }
    if (!day)
    {
        if (contains(lower, re.day_after_tomorrow))
            day = base_day + days{2};
        else if (contains(lower, re.tomorrow))
            day = base_day + days{1};
        else if (contains(lower, re.today))
            day = base_day;
        else if (contains(lower, re.tonight))
        {
            day = base_day;
            if (!clock)
                clock = std::make_pair(20, 0);
        }
    }
    if (!day && detail::regex_search(lower, m, re.weekday_name))
    {
        days delta = days_until(base_day, weekday{weekday_from_name(m[1].str())});
        if (contains(lower, re.next))
            delta += days{7};
        day = base_day + delta;
    }
    if (!day && detail::regex_search(lower, m, re.offset))
    {
        const std::string unit = m[3].str();
        const std::optional<int> count = count_from_word(m[1].str());
        if (!count || *count > max_count(unit))
            return std::nullopt;
        const int n = *count;
        if (unit == "minute")
            exact = base_local + minutes{n};
        else if (unit == "hour")
            exact = base_local + hours{n};
        else if (unit == "day")
            day = m[2].matched ? add_business_days(base_day, n) : base_day + days{n};
        else if (unit == "week")
            day = base_day + days{7 * n};
        else
            day = add_months(base_day, n);
    }
    if (!day && !exact)
    {
        if (contains(lower, re.end_of_week))
        {
            day = base_day + (Friday - weekday{base_day});
            if (!clock)
                clock = std::make_pair(17, 0);
        }
        else if (contains(lower, re.end_of_month))
        {
            const year_month_day ymd{base_day};
            day = local_days{ymd.year() / ymd.month() / last};
            if (!clock)
                clock = std::make_pair(17, 0);
        }
        else if (contains(lower, re.next_week))
            day = base_day + days_until(base_day, Monday);
        else if (contains(lower, re.next_month))
        {
            const year_month_day ymd{base_day};
            day = add_months(local_days{ymd.year() / ymd.month() / 1}, 1);
        }
        else if (clock)
            day = base_day;
    }
    if (!day && !exact)
        return std::nullopt;

    bool has_time = true;
    local_seconds local;
    if (exact)
        local = floor<minutes>(*exact);
    else
    {
        has_time = clock.has_value();
        local = local_seconds{day->time_since_epoch()};
        if (has_time)
            local += hours{clock->first} + minutes{clock->second};
    }

    if (!in_iso_year_range(local))
        return std::nullopt;

    resolved_time out = make_result(local, has_time, explicit_offset ? explicit_offset : std::optional<minutes>(offset_at(local)));
    if (zone != nullptr && !explicit_offset)
        out.zone_name = std::string(zone->iana);
    return out;
}


} // namespace triagexx
