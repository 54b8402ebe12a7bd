#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <optional>
#include <string>


///////////////////////////
///      CALENDAR       ///
///////////////////////////
/**
 * @brief Convert a proleptic Gregorian date to a day number (days since 1970-01-01).
 */
int daysFromCivil(int year, int month, int day);

/**
 * @brief Convert a day number back to its Gregorian year, month and day.
 */
void civilFromDays(int dayNumber, int& year, int& month, int& day);

/**
 * @brief Parse "YYYY-MM-DD" into a day number, or std::nullopt if malformed.
 */
std::optional<int> parseIsoDate(const std::string& text);

/**
 * @brief Format a day number as "YYYY-MM-DD".
 */
std::string formatIsoDate(int dayNumber);

/**
 * @brief Parse a clock-of-day value into minutes from midnight.
 *
 * Accepts "HH:MM", "HH:MM:SS" and "HH:MM:SS.fff", with an optional trailing
 * 'Z'. Seconds are truncated.
 */
std::optional<int> parseClockTime(const std::string& text);

/**
 * @brief Format minutes from midnight as "HH:MM".
 */
std::string formatClockTime(int minutes);

/**
 * @brief Parse an ISO-8601 timestamp into an instant (minutes since the epoch, UTC).
 *
 * Accepts "YYYY-MM-DDTHH:MM[:SS[.fff]]" followed by 'Z', "+HH:MM", "-HH:MM" or
 * nothing (UTC assumed).
 */
std::optional<long long> parseTimestamp(const std::string& text);

/**
 * @brief Format an instant as "YYYY-MM-DDTHH:MM:00.000Z".
 *
 * The fixed-width form sorts lexicographically in chronological order.
 */
std::string formatTimestamp(long long instant);

/// Day number containing an instant, in UTC.
int dayOfInstant(long long instant);

/// Minutes from midnight of an instant, in UTC.
int minuteOfDay(long long instant);

/// Day number containing an instant, shifted by a UTC offset.
int localDayOf(long long instant, int offsetMinutes);

/// Minutes from local midnight of an instant, shifted by a UTC offset.
int localMinuteOfDay(long long instant, int offsetMinutes);

/// Weekday of a day number (Sunday = 0).
Weekday weekdayOf(int dayNumber);

/// First day (Sunday) of the week containing a day number.
int weekStartOf(int dayNumber);

/// Lower-case weekday name ("monday").
std::string weekdayName(Weekday day);

/// Instant at a given clock time of a day number.
long long instantAt(int dayNumber, int minuteOfDay);
