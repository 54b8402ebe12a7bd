///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "calendar.hpp"
#include "doctest.h"


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST_CASE("Calendar: Civil dates round trip through day numbers") {
    CHECK(daysFromCivil(1970, 1, 1) == 0);
    CHECK(daysFromCivil(2000, 3, 1) == 11017);

    int y = 0, m = 0, d = 0;
    civilFromDays(daysFromCivil(2024, 2, 29), y, m, d);
    CHECK(y == 2024);
    CHECK(m == 2);
    CHECK(d == 29);

    civilFromDays(-1, y, m, d);
    CHECK(y == 1969);
    CHECK(m == 12);
    CHECK(d == 31);
}

TEST_CASE("Calendar: Parses and formats iso dates") {
    auto day = parseIsoDate("2024-02-05");
    REQUIRE(day.has_value());
    CHECK(formatIsoDate(*day) == "2024-02-05");

    CHECK_FALSE(parseIsoDate("2024-02-30").has_value());
    CHECK_FALSE(parseIsoDate("2023-02-29").has_value());
    CHECK_FALSE(parseIsoDate("2024/02/05").has_value());
}

TEST_CASE("Calendar: Timestamps honour offsets") {
    int day = daysFromCivil(2024, 2, 5);
    CHECK(*parseTimestamp("2024-02-05T09:00Z") == instantAt(day, 540));
    CHECK(*parseTimestamp("2024-02-05T10:00:00.000+01:00") == instantAt(day, 540));
    CHECK(*parseTimestamp("2024-02-05T04:00:00-05:00") == instantAt(day, 540));
    CHECK_FALSE(parseTimestamp("2024-02-05 09:00").has_value());

    CHECK(formatTimestamp(instantAt(day, 540)) == "2024-02-05T09:00:00.000Z");
}

TEST_CASE("Calendar: Formatted timestamps sort chronologically") {
    long long early = *parseTimestamp("2024-02-05T23:59Z");
    long long late = *parseTimestamp("2024-02-06T00:00Z");
    CHECK(early < late);
    CHECK(formatTimestamp(early) < formatTimestamp(late));
}

TEST_CASE("Calendar: Clock times") {
    CHECK(*parseClockTime("17:30") == 17 * 60 + 30);
    CHECK(*parseClockTime("24:00") == MINUTES_IN_DAY);
    CHECK_FALSE(parseClockTime("25:00").has_value());
    CHECK(formatClockTime(9 * 60 + 5) == "09:05");
}

TEST_CASE("Calendar: Weekdays and week start") {
    int monday = daysFromCivil(2024, 2, 5);
    CHECK(weekdayOf(0) == Weekday::THURSDAY);
    CHECK(weekdayOf(monday) == Weekday::MONDAY);
    CHECK(weekdayName(weekdayOf(monday + 5)) == "saturday");

    // Weeks start on Sunday.
    CHECK(weekStartOf(monday) == monday - 1);
    CHECK(weekStartOf(monday - 1) == monday - 1);
    CHECK(weekStartOf(monday + 5) == monday - 1);
}

TEST_CASE("Calendar: Local day follows offset") {
    int monday = daysFromCivil(2024, 2, 5);
    long long lateUtc = instantAt(monday, 23 * 60 + 30);
    CHECK(dayOfInstant(lateUtc) == monday);
    CHECK(localDayOf(lateUtc, 60) == monday + 1);
    CHECK(localMinuteOfDay(lateUtc, 60) == 30);
    CHECK(localDayOf(instantAt(monday, 30), -60) == monday - 1);
    CHECK(minuteOfDay(lateUtc) == 23 * 60 + 30);
}
