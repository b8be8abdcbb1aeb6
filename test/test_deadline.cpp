/*

test_deadline.cpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE deadline_test

#include <chrono>
#include <optional>
#include <string>
#include <boost/test/unit_test.hpp>
#include <triagexx/triage/deadline.hpp>


using namespace triagexx;
using namespace std::chrono;


namespace
{

// Tuesday 2026-02-10, 04:00 in Pacific standard time.
const sys_seconds REFERENCE = sys_days{year{2026} / 2 / 10} + hours{12};

const deadline_resolver& pacific()
{
    static const deadline_resolver resolver(REFERENCE, minutes{-480});
    return resolver;
}

std::string resolve_iso(const deadline_resolver& resolver, const std::string& text)
{
    auto res = resolver.resolve(text);
    return res ? res->iso() : std::string("<none>");
}

} // namespace


BOOST_AUTO_TEST_CASE(tomorrow_with_clock)
{
    auto res = pacific().resolve("tomorrow 3pm");
    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(res->has_time);
    BOOST_TEST(res->iso() == "2026-02-11T15:00:00-08:00");
    BOOST_TEST_REQUIRE(res->zone_name.has_value());
    BOOST_TEST(*res->zone_name == "America/Los_Angeles");
}


BOOST_AUTO_TEST_CASE(named_zone_applies)
{
    auto res = pacific().resolve("by tomorrow 3pm PT");
    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(res->iso() == "2026-02-11T15:00:00-08:00");
    BOOST_TEST(*res->zone_name == "America/Los_Angeles");

    auto est = pacific().resolve("March 3, 2026 at 10am EST");
    BOOST_TEST_REQUIRE(est.has_value());
    BOOST_TEST(est->iso() == "2026-03-03T10:00:00-05:00");
    BOOST_TEST(*est->zone_name == "America/New_York");
}


BOOST_AUTO_TEST_CASE(generic_zone_follows_daylight_time)
{
    const deadline_resolver summer(sys_days{year{2026} / 6 / 10} + hours{12}, minutes{-480});
    BOOST_TEST(resolve_iso(summer, "tomorrow 9am PT") == "2026-06-11T09:00:00-07:00");
}


BOOST_AUTO_TEST_CASE(numeric_zone_offset)
{
    auto res = pacific().resolve("tomorrow at 15:30 UTC+1");
    BOOST_TEST_REQUIRE(res.has_value());
    BOOST_TEST(res->iso() == "2026-02-11T15:30:00+01:00");
    BOOST_TEST(!res->zone_name.has_value());
}


BOOST_AUTO_TEST_CASE(reference_day_is_local)
{
    // 03:00 UTC on the 11th is still the evening of the 10th in Pacific time.
    const deadline_resolver evening(sys_days{year{2026} / 2 / 11} + hours{3}, minutes{-480});
    BOOST_TEST(resolve_iso(evening, "tomorrow 9am") == "2026-02-11T09:00:00-08:00");
    BOOST_TEST(resolve_iso(evening, "today") == "2026-02-10");
}


BOOST_AUTO_TEST_CASE(day_words)
{
    BOOST_TEST(resolve_iso(pacific(), "today") == "2026-02-10");
    BOOST_TEST(resolve_iso(pacific(), "tonight") == "2026-02-10T20:00:00-08:00");
    BOOST_TEST(resolve_iso(pacific(), "tonight at 11pm") == "2026-02-10T23:00:00-08:00");
    BOOST_TEST(resolve_iso(pacific(), "noon tomorrow") == "2026-02-11T12:00:00-08:00");
    BOOST_TEST(resolve_iso(pacific(), "day after tomorrow") == "2026-02-12");
}


BOOST_AUTO_TEST_CASE(weekdays_after_reference_day)
{
    BOOST_TEST(resolve_iso(pacific(), "Friday") == "2026-02-13");
    BOOST_TEST(resolve_iso(pacific(), "next Friday") == "2026-02-20");
    // Same weekday as the reference means the following week.
    BOOST_TEST(resolve_iso(pacific(), "Tuesday") == "2026-02-17");
    BOOST_TEST(resolve_iso(pacific(), "Monday 10:00") == "2026-02-16T10:00:00-08:00");
}


BOOST_AUTO_TEST_CASE(offsets_from_reference)
{
    BOOST_TEST(resolve_iso(pacific(), "in 3 days") == "2026-02-13");
    BOOST_TEST(resolve_iso(pacific(), "within two weeks") == "2026-02-24");
    BOOST_TEST(resolve_iso(pacific(), "in 2 hours") == "2026-02-10T06:00:00-08:00");
    BOOST_TEST(resolve_iso(pacific(), "in 30 minutes") == "2026-02-10T04:30:00-08:00");
    BOOST_TEST(resolve_iso(pacific(), "in a month") == "2026-03-10");
}


BOOST_AUTO_TEST_CASE(business_days_skip_weekends)
{
    BOOST_TEST(resolve_iso(pacific(), "in 2 business days") == "2026-02-12");
    BOOST_TEST(resolve_iso(pacific(), "in 4 business days") == "2026-02-16");
    BOOST_TEST(resolve_iso(pacific(), "in 5 business days") == "2026-02-17");
    BOOST_TEST(resolve_iso(pacific(), "in 6 business days") == "2026-02-18");
    BOOST_TEST(resolve_iso(pacific(), "in 25 business days") == "2026-03-17");

    const deadline_resolver saturday(sys_days{year{2026} / 2 / 14} + hours{12}, minutes{-480});
    BOOST_TEST(resolve_iso(saturday, "in 5 business days") == "2026-02-20");
    BOOST_TEST(resolve_iso(saturday, "in 1 business day") == "2026-02-16");
}


BOOST_AUTO_TEST_CASE(long_offsets_bounded)
{
    BOOST_TEST(resolve_iso(pacific(), "in 120 months") == "2036-02-10");
    BOOST_TEST(resolve_iso(pacific(), "in 121 months") == "<none>");
    BOOST_TEST(resolve_iso(pacific(), "in 3661 days") == "<none>");
    BOOST_TEST(resolve_iso(pacific(), "in 2000000000 days") == "<none>");
    BOOST_TEST(resolve_iso(pacific(), "in 2000000000 months") == "<none>");
    BOOST_TEST(resolve_iso(pacific(), "in 2000000000 business days") == "<none>");
    BOOST_TEST(resolve_iso(pacific(), "reply in 99999999999 days") == "<none>");
    BOOST_TEST(resolve_iso(pacific(), "in 99999999999 hours at 3pm") == "<none>");
}


BOOST_AUTO_TEST_CASE(years_outside_iso_range_rejected)
{
    BOOST_TEST(resolve_iso(pacific(), "0000-01-01") == "<none>");
    BOOST_TEST(resolve_iso(pacific(), "due 0000-06-01 09:00") == "<none>");
    BOOST_TEST(resolve_iso(pacific(), "9999-12-31") == "9999-12-31");
}


BOOST_AUTO_TEST_CASE(period_ends)
{
    BOOST_TEST(resolve_iso(pacific(), "EOD") == "2026-02-10T17:00:00-08:00");
    BOOST_TEST(resolve_iso(pacific(), "end of week") == "2026-02-13T17:00:00-08:00");
    BOOST_TEST(resolve_iso(pacific(), "EOW") == "2026-02-13T17:00:00-08:00");
    BOOST_TEST(resolve_iso(pacific(), "end of the month") == "2026-02-28T17:00:00-08:00");
    BOOST_TEST(resolve_iso(pacific(), "next week") == "2026-02-16");
    BOOST_TEST(resolve_iso(pacific(), "next month") == "2026-03-01");
}


BOOST_AUTO_TEST_CASE(calendar_dates)
{
    BOOST_TEST(resolve_iso(pacific(), "March 3") == "2026-03-03");
    BOOST_TEST(resolve_iso(pacific(), "3rd of March, 2027") == "2027-03-03");
    BOOST_TEST(resolve_iso(pacific(), "due 3/15") == "2026-03-15");
    BOOST_TEST(resolve_iso(pacific(), "3/15/27 at 9am") == "2027-03-15T09:00:00-08:00");
    BOOST_TEST(resolve_iso(pacific(), "deadline 2026-03-01 17:00") == "2026-03-01T17:00:00-08:00");
}


BOOST_AUTO_TEST_CASE(whole_values_pass_through)
{
    BOOST_TEST(resolve_iso(pacific(), "2026-03-01T09:00:00Z") == "2026-03-01T09:00:00+00:00");
    BOOST_TEST(resolve_iso(pacific(), "2026-03-01T09:00:00+05:30") == "2026-03-01T09:00:00+05:30");
    BOOST_TEST(resolve_iso(pacific(), "2026-03-01T09:00") == "2026-03-01T09:00:00-08:00");

    auto date_only = pacific().resolve("2026-03-01");
    BOOST_TEST_REQUIRE(date_only.has_value());
    BOOST_TEST(!date_only->has_time);
    BOOST_TEST(date_only->iso() == "2026-03-01");
    BOOST_TEST(format_iso(date_only->when) == "2026-03-01T00:00:00-08:00");

    auto rfc = pacific().resolve("Tue, 10 Feb 2026 09:30:00 -0500");
    BOOST_TEST_REQUIRE(rfc.has_value());
    BOOST_TEST(rfc->iso() == "2026-02-10T09:30:00-05:00");
    BOOST_TEST(*rfc->zone_name == "America/New_York");
}


BOOST_AUTO_TEST_CASE(clock_forms)
{
    BOOST_TEST((*deadline_resolver::clock_time("at 3pm") == std::make_pair(15, 0)));
    BOOST_TEST((*deadline_resolver::clock_time("12am") == std::make_pair(0, 0)));
    BOOST_TEST((*deadline_resolver::clock_time("12:15 p.m.") == std::make_pair(12, 15)));
    BOOST_TEST((*deadline_resolver::clock_time("at 09:45") == std::make_pair(9, 45)));
    BOOST_TEST((*deadline_resolver::clock_time("by close of business") == std::make_pair(17, 0)));
    BOOST_TEST(!deadline_resolver::clock_time("13pm").has_value());
    BOOST_TEST(!deadline_resolver::clock_time("no time here").has_value());
}


BOOST_AUTO_TEST_CASE(zone_names_for_offsets)
{
    BOOST_TEST(*deadline_resolver::zone_name_for_offset(minutes{-420}) == "America/Los_Angeles");
    BOOST_TEST(*deadline_resolver::zone_name_for_offset(minutes{-360}) == "America/Chicago");
    BOOST_TEST(*deadline_resolver::zone_name_for_offset(minutes{0}) == "UTC");
    BOOST_TEST(!deadline_resolver::zone_name_for_offset(minutes{60}).has_value());
}


BOOST_AUTO_TEST_CASE(unresolvable_text)
{
    BOOST_TEST(!pacific().resolve("").has_value());
    BOOST_TEST(!pacific().resolve("   ").has_value());
    BOOST_TEST(!pacific().resolve("ASAP").has_value());
    BOOST_TEST(!pacific().resolve("when you get a chance").has_value());
    BOOST_TEST(!pacific().resolve("February 30").has_value());
}
