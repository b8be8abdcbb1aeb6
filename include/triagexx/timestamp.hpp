/*

timestamp.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Instants with an explicit UTC offset, ISO-8601 and RFC 5322 date handling.

*/


#pragma once

#include <array>
#include <charconv>
#include <chrono>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <triagexx/detail/ascii.hpp>


namespace triagexx
{

using sys_seconds = std::chrono::sys_seconds;
using local_seconds = std::chrono::local_seconds;


/**
Instant together with the UTC offset it is to be displayed in.
**/
struct zoned_timestamp
{
    sys_seconds utc{};
    std::chrono::minutes offset{0};

    [[nodiscard]] local_seconds local() const
    {
        return local_seconds{utc.time_since_epoch() + offset};
    }

    [[nodiscard]] static zoned_timestamp from_local(local_seconds local, std::chrono::minutes offset)
    {
        return zoned_timestamp{sys_seconds{local.time_since_epoch() - offset}, offset};
    }

    bool operator==(const zoned_timestamp&) const = default;
};


/// Largest offset accepted anywhere, in minutes.
inline constexpr int MAX_OFFSET_MINUTES = 14 * 60;


/**
Whether a local time falls in years 0001 to 9999, the range an ISO-8601 date can spell.
**/
inline bool in_iso_year_range(local_seconds local)
{
    using namespace std::chrono;
    constexpr local_days first{year{1} / January / 1};
    constexpr local_days past_last{year{10000} / January / 1};
    return local >= first && local < past_last;
}


/**
Formatting an offset as `+HH:MM`.
**/
inline std::string format_offset(std::chrono::minutes offset)
{
    const long total = static_cast<long>(offset.count());
    const long abs_total = total < 0 ? -total : total;
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%c%02ld:%02ld", total < 0 ? '-' : '+', abs_total / 60, abs_total % 60);
    return buf;
}


/**
Formatting the calendar date of a local time as `YYYY-MM-DD`.
**/
inline std::string format_iso_date(local_seconds local)
{
    const std::chrono::year_month_day ymd{std::chrono::floor<std::chrono::days>(local)};
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
    return buf;
}


/**
Formatting as `YYYY-MM-DDTHH:MM:SS+HH:MM`, in the instant's own offset.
**/
inline std::string format_iso(const zoned_timestamp& ts)
{
    const local_seconds local = ts.local();
    const auto day = std::chrono::floor<std::chrono::days>(local);
    const std::chrono::hh_mm_ss<std::chrono::seconds> hms{local - day};
    char buf[16];
    std::snprintf(buf, sizeof(buf), "T%02ld:%02ld:%02ld", static_cast<long>(hms.hours().count()),
        static_cast<long>(hms.minutes().count()), static_cast<long>(hms.seconds().count()));
    return format_iso_date(local) + buf + format_offset(ts.offset);
}


/**
Formatting a UTC instant as ISO-8601 with a `+00:00` offset.
**/
inline std::string format_iso_utc(sys_seconds utc)
{
    return format_iso(zoned_timestamp{utc, std::chrono::minutes{0}});
}


namespace time_detail
{

inline bool parse_digits(std::string_view& in, std::size_t count, int& out)
{
    if (in.size() < count)
        return false;
    int value = 0;
    for (std::size_t i = 0; i < count; ++i)
    {
        if (!detail::is_ascii_digit(in[i]))
            return false;
        value = value * 10 + (in[i] - '0');
    }
    out = value;
    in.remove_prefix(count);
    return true;
}

inline bool valid_date(int y, int m, int d)
{
    const std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(m)},
        std::chrono::day{static_cast<unsigned>(d)}};
    return ymd.ok();
}

inline local_seconds make_local(int y, int m, int d, int hh = 0, int mm = 0, int ss = 0)
{
    const std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(m)},
        std::chrono::day{static_cast<unsigned>(d)}};
    return local_seconds{std::chrono::local_days{ymd}.time_since_epoch()} + std::chrono::hours{hh} +
        std::chrono::minutes{mm} + std::chrono::seconds{ss};
}

// Numeric offset body without the sign: `HH`, `H`, `HH:MM`, `HHMM`, `H:MM`.
inline std::optional<int> parse_offset_body(std::string_view body)
{
    int hours = 0;
    int minutes = 0;
    const auto colon = body.find(':');
    std::string_view h = colon == std::string_view::npos ? body : body.substr(0, colon);
    std::string_view m = colon == std::string_view::npos ? std::string_view() : body.substr(colon + 1);
    if (colon == std::string_view::npos && body.size() == 4)
    {
        h = body.substr(0, 2);
        m = body.substr(2);
    }
    if (h.empty() || h.size() > 2 || (colon != std::string_view::npos && m.size() != 2))
        return std::nullopt;
    if (!parse_digits(h, h.size(), hours))
        return std::nullopt;
    if (!m.empty() && !parse_digits(m, 2, minutes))
        return std::nullopt;
    if (minutes > 59)
        return std::nullopt;
    const int total = hours * 60 + minutes;
    if (total > MAX_OFFSET_MINUTES)
        return std::nullopt;
    return total;
}

} // namespace time_detail


/**
Parsing a UTC offset designation.

Accepted: `Z`, `UTC`, `GMT`, `UT`, `+HH:MM`, `-HHMM`, `+H`, and the same numbers prefixed by `UTC` or `GMT` such as
`UTC-8` or `GMT+05:30`.

@param text Offset text.
@return     Offset or nothing.
**/
inline std::optional<std::chrono::minutes> parse_offset(std::string_view text)
{
    text = detail::trim_view(text);
    if (text == "Z" || text == "z")
        return std::chrono::minutes{0};
    for (std::string_view prefix : {std::string_view("UTC"), std::string_view("GMT"), std::string_view("UT")})
    {
        if (detail::istarts_with_ascii(text, prefix))
        {
            text.remove_prefix(prefix.size());
            text = detail::trim_view(text);
            if (text.empty())
                return std::chrono::minutes{0};
            break;
        }
    }
    if (text.empty() || (text.front() != '+' && text.front() != '-'))
        return std::nullopt;
    const bool negative = text.front() == '-';
    auto total = time_detail::parse_offset_body(detail::trim_view(text.substr(1)));
    if (!total)
        return std::nullopt;
    return std::chrono::minutes{negative ? -*total : *total};
}


/**
Result of parsing an ISO-8601 date or date time.
**/
struct iso_datetime
{
    local_seconds local{};
    bool has_time = false;
    std::optional<std::chrono::minutes> offset;
};


/**
Parsing `YYYY-MM-DD`, optionally followed by `THH:MM[:SS[.fff]]` (a space is also accepted as the separator) and
an offset `Z`, `+HH:MM` or `+HHMM`. The whole text must match.

@param text ISO-8601 text.
@return     Parsed value or nothing.
**/
inline std::optional<iso_datetime> parse_iso8601(std::string_view text)
{
    using namespace time_detail;
    text = detail::trim_view(text);
    int y = 0, mo = 0, d = 0;
    if (!parse_digits(text, 4, y) || text.empty() || text.front() != '-')
        return std::nullopt;
    text.remove_prefix(1);
    if (!parse_digits(text, 2, mo) || text.empty() || text.front() != '-')
        return std::nullopt;
    text.remove_prefix(1);
    if (!parse_digits(text, 2, d) || mo < 1 || mo > 12 || !valid_date(y, mo, d))
        return std::nullopt;

    iso_datetime out;
    if (text.empty())
    {
        out.local = make_local(y, mo, d);
        return out;
    }

    if (text.front() != 'T' && text.front() != 't' && text.front() != ' ')
        return std::nullopt;
    text.remove_prefix(1);
    int hh = 0, mm = 0, ss = 0;
    if (!parse_digits(text, 2, hh) || text.empty() || text.front() != ':')
        return std::nullopt;
    text.remove_prefix(1);
    if (!parse_digits(text, 2, mm))
        return std::nullopt;
    if (!text.empty() && text.front() == ':')
    {
        text.remove_prefix(1);
        if (!parse_digits(text, 2, ss))
            return std::nullopt;
        if (!text.empty() && (text.front() == '.' || text.front() == ','))
        {
            text.remove_prefix(1);
            std::size_t n = 0;
            while (n < text.size() && detail::is_ascii_digit(text[n]))
                ++n;
            if (n == 0)
                return std::nullopt;
            text.remove_prefix(n);
        }
    }
    if (hh > 23 || mm > 59 || ss > 60)
        return std::nullopt;
    if (ss == 60)
        ss = 59;
    out.local = make_local(y, mo, d, hh, mm, ss);
    out.has_time = true;

    if (text.empty())
        return out;
    if (text.front() != 'Z' && text.front() != 'z' && text.front() != '+' && text.front() != '-')
        return std::nullopt;
    auto offset = parse_offset(text);
    if (!offset)
        return std::nullopt;
    out.offset = offset;
    return out;
}


/**
Checking a value already has the output form: ISO-8601 date time with an explicit offset.
**/
inline std::optional<zoned_timestamp> parse_iso_with_offset(std::string_view text)
{
    auto iso = parse_iso8601(text);
    if (!iso || !iso->has_time || !iso->offset)
        return std::nullopt;
    return zoned_timestamp::from_local(iso->local, *iso->offset);
}


/**
Looking up a month name or its three letter abbreviation.

@return Month number 1-12, or 0.
**/
inline unsigned month_from_name(std::string_view name)
{
    static constexpr std::array<std::string_view, 12> months = {{
        "january", "february", "march", "april", "may", "june",
        "july", "august", "september", "october", "november", "december"
    }};
    if (name.size() < 3)
        return 0;
    for (unsigned i = 0; i < months.size(); ++i)
    {
        const std::string_view full = months[i];
        if (detail::iequals_ascii(name, full) || detail::iequals_ascii(name, full.substr(0, 3)))
            return i + 1;
        // `Sept`
        if (i == 8 && detail::iequals_ascii(name, "sept"))
            return i + 1;
    }
    return 0;
}


/**
US time zone rule: daylight time from the second Sunday of March to the first Sunday of November, 02:00 local.

@param local Local standard time to check.
@return      True if daylight time applies.
**/
inline bool us_daylight_time(local_seconds local)
{
    using namespace std::chrono;
    const year_month_day ymd{floor<days>(local)};
    const local_days start{ymd.year() / March / Sunday[2]};
    const local_days end{ymd.year() / November / Sunday[1]};
    return local >= local_seconds{start.time_since_epoch()} + hours{2} &&
        local < local_seconds{end.time_since_epoch()} + hours{1};
}


/**
Zone designation recognized in free text and in `Date` headers.
**/
struct zone_info
{
    std::string_view name;
    int standard_minutes;
    // Generic names (`PT`) follow the US daylight rule, explicit ones (`PST`, `PDT`) are fixed.
    bool us_rule;
    std::string_view iana;
};

inline constexpr std::array<zone_info, 17> ZONES = {{
    {"pt", -480, true, "America/Los_Angeles"}, {"pst", -480, false, "America/Los_Angeles"}, {"pdt", -420, false, "America/Los_Angeles"},
    {"mt", -420, true, "America/Denver"}, {"mst", -420, false, "America/Denver"}, {"mdt", -360, false, "America/Denver"},
    {"ct", -360, true, "America/Chicago"}, {"cst", -360, false, "America/Chicago"}, {"cdt", -300, false, "America/Chicago"},
    {"et", -300, true, "America/New_York"}, {"est", -300, false, "America/New_York"}, {"edt", -240, false, "America/New_York"},
    {"utc", 0, false, "UTC"}, {"gmt", 0, false, "UTC"}, {"ut", 0, false, "UTC"}, {"z", 0, false, "UTC"},
    {"wet", 0, false, "UTC"}
}};


/**
Finding a zone by its abbreviation.
**/
inline const zone_info* find_zone(std::string_view name)
{
    for (const auto& z : ZONES)
        if (detail::iequals_ascii(z.name, name))
            return &z;
    return nullptr;
}


/**
Offset of a zone at a given local time.
**/
inline std::chrono::minutes zone_offset(const zone_info& zone, local_seconds local)
{
    int minutes = zone.standard_minutes;
    if (zone.us_rule && us_daylight_time(local))
        minutes += 60;
    return std::chrono::minutes{minutes};
}


/**
Parsing an RFC 5322 date such as `Fri, 21 Nov 1997 09:55:06 -0600` or `Thu, 17 Jul 2014 10:31:49 +0200 (CET)`.

Seconds are optional, two digit years are accepted, the zone may be numeric or one of the RFC 822 names. A missing
or unknown zone is read as UTC.

@param date_str Header value.
@return         Instant in the sender's offset, or nothing.
**/
inline std::optional<zoned_timestamp> parse_rfc5322_date(std::string_view date_str)
{
    using namespace time_detail;
    std::string_view sv = detail::trim_view(date_str);

    // Optional day-of-week: letters, optional WSP, then comma.
    {
        std::size_t i = 0;
        while (i < sv.size() && detail::is_ascii_alpha(sv[i]))
            ++i;
        std::size_t j = i;
        while (j < sv.size() && (sv[j] == ' ' || sv[j] == '\t'))
            ++j;
        if (i >= 3 && j < sv.size() && sv[j] == ',')
            sv = detail::trim_view(sv.substr(j + 1));
    }

    auto parse_int = [](std::string_view& in, std::size_t min_digits, std::size_t max_digits, int& out) -> bool
    {
        in = detail::trim_view(in);
        std::size_t digits = 0;
        while (digits < in.size() && digits < max_digits && detail::is_ascii_digit(in[digits]))
            ++digits;
        if (digits < min_digits)
            return false;
        auto res = std::from_chars(in.data(), in.data() + digits, out);
        if (res.ec != std::errc{})
            return false;
        in.remove_prefix(digits);
        return true;
    };

    auto consume_char = [](std::string_view& in, char expected) -> bool
    {
        if (!in.empty() && in.front() == expected)
        {
            in.remove_prefix(1);
            return true;
        }
        return false;
    };

    int day = 0;
    if (!parse_int(sv, 1, 2, day))
        return std::nullopt;

    sv = detail::trim_view(sv);
    std::size_t mlen = 0;
    while (mlen < sv.size() && detail::is_ascii_alpha(sv[mlen]))
        ++mlen;
    const unsigned month = month_from_name(sv.substr(0, mlen));
    if (month == 0)
        return std::nullopt;
    sv.remove_prefix(mlen);

    int year = 0;
    std::string_view year_start = detail::trim_view(sv);
    if (!parse_int(sv, 2, 4, year))
        return std::nullopt;
    const std::size_t year_digits = year_start.size() - sv.size();
    if (year_digits == 2)
        year += year < 50 ? 2000 : 1900;
    else if (year_digits == 3)
        year += 1900;

    int hour = 0, minute = 0, second = 0;
    if (!parse_int(sv, 1, 2, hour) || !consume_char(sv, ':') || !parse_int(sv, 2, 2, minute))
        return std::nullopt;
    if (consume_char(sv, ':') && !parse_int(sv, 2, 2, second))
        return std::nullopt;
    if (!valid_date(year, static_cast<int>(month), day) || hour > 23 || minute > 59 || second > 60)
        return std::nullopt;
    if (second == 60)
        second = 59;

    const local_seconds local = make_local(year, static_cast<int>(month), day, hour, minute, second);

    sv = detail::trim_view(sv);
    std::chrono::minutes offset{0};
    if (!sv.empty() && (sv.front() == '+' || sv.front() == '-'))
    {
        const bool negative = sv.front() == '-';
        sv.remove_prefix(1);
        int tz_h = 0, tz_m = 0;
        if (!parse_digits(sv, 2, tz_h) || !parse_digits(sv, 2, tz_m) || tz_m > 59 || tz_h * 60 + tz_m > MAX_OFFSET_MINUTES)
            return std::nullopt;
        offset = std::chrono::minutes{negative ? -(tz_h * 60 + tz_m) : tz_h * 60 + tz_m};
    }
    else if (!sv.empty())
    {
        std::size_t zlen = 0;
        while (zlen < sv.size() && detail::is_ascii_alpha(sv[zlen]))
            ++zlen;
        if (const zone_info* zone = find_zone(sv.substr(0, zlen)))
            offset = zone_offset(*zone, local);
    }

    return zoned_timestamp::from_local(local, offset);
}


} // namespace triagexx
