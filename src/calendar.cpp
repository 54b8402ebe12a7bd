///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "calendar.hpp"
#include <array>
#include <cctype>
#include <cstdio>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Floor division for possibly negative numerators.
 */
static long long floorDiv(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

static long long floorMod(long long a, long long b) {
    return a - floorDiv(a, b) * b;
}

/**
 * @brief Read exactly `width` digits starting at `pos`.
 */
static bool readDigits(const std::string& text, size_t pos, size_t width, int& out) {
    if (pos + width > text.size()) return false;
    int value = 0;
    for (size_t i = pos; i < pos + width; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

static bool isValidDate(int year, int month, int day) {
    static const std::array<int, 12> kDaysInMonth = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12 || day < 1) return false;
    int limit = kDaysInMonth[month - 1];
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    if (month == 2 && leap) limit = 29;
    return day <= limit;
}

/**
 * @brief Parse "HH:MM[:SS[.fff]]" starting at `pos`; returns position after it.
 */
static std::optional<size_t> readClock(const std::string& text, size_t pos, int& minutes) {
    int hours = 0;
    int mins = 0;
    if (!readDigits(text, pos, 2, hours) || pos + 2 >= text.size() || text[pos + 2] != ':')
        return std::nullopt;
    if (!readDigits(text, pos + 3, 2, mins)) return std::nullopt;
    if (hours > 24 || mins > 59 || (hours == 24 && mins != 0)) return std::nullopt;
    pos += 5;

    // Optional seconds and fraction, truncated to the minute.
    if (pos < text.size() && text[pos] == ':') {
        int secs = 0;
        if (!readDigits(text, pos + 1, 2, secs) || secs > 59) return std::nullopt;
        pos += 3;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            size_t digits = 0;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                ++pos;
                ++digits;
            }
            if (digits == 0) return std::nullopt;
        }
    }

    minutes = hours * 60 + mins;
    return pos;
}


///////////////////////////
///      CALENDAR       ///
///////////////////////////
/**
 * Days-from-civil over 400-year eras, valid for the whole proleptic
 * Gregorian calendar.
 */
int daysFromCivil(int year, int month, int day) {
    long long y = year - (month <= 2 ? 1 : 0);
    long long era = floorDiv(y, 400);
    long long yoe = y - era * 400;                                        // [0, 399]
    long long mp = (month + 9) % 12;                                      // March = 0
    long long doy = (153 * mp + 2) / 5 + day - 1;                         // [0, 365]
    long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;                // [0, 146096]
    return static_cast<int>(era * 146097 + doe - 719468);
}

void civilFromDays(int dayNumber, int& year, int& month, int& day) {
    long long z = static_cast<long long>(dayNumber) + 719468;
    long long era = floorDiv(z, 146097);
    long long doe = z - era * 146097;
    long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    long long mp = (5 * doy + 2) / 153;
    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));
}

std::optional<int> parseIsoDate(const std::string& text) {
    int year = 0, month = 0, day = 0;
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;
    if (!readDigits(text, 0, 4, year) || !readDigits(text, 5, 2, month) || !readDigits(text, 8, 2, day))
        return std::nullopt;
    if (!isValidDate(year, month, day)) return std::nullopt;
    return daysFromCivil(year, month, day);
}

std::string formatIsoDate(int dayNumber) {
    int year = 0, month = 0, day = 0;
    civilFromDays(dayNumber, year, month, day);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return std::string(buf);
}

std::optional<int> parseClockTime(const std::string& text) {
    int minutes = 0;
    auto end = readClock(text, 0, minutes);
    if (!end) return std::nullopt;
    size_t pos = *end;
    if (pos < text.size() && text[pos] == 'Z') ++pos;
    if (pos != text.size()) return std::nullopt;
    return minutes;
}

std::string formatClockTime(int minutes) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", minutes / 60, minutes % 60);
    return std::string(buf);
}

std::optional<long long> parseTimestamp(const std::string& text) {
    if (text.size() < 16 || text[10] != 'T') return std::nullopt;
    auto date = parseIsoDate(text.substr(0, 10));
    if (!date) return std::nullopt;

    int minutes = 0;
    auto end = readClock(text, 11, minutes);
    if (!end) return std::nullopt;
    size_t pos = *end;

    long long offset = 0;
    if (pos < text.size()) {
        char sign = text[pos];
        if (sign == 'Z') {
            ++pos;
        } else if (sign == '+' || sign == '-') {
            int oh = 0, om = 0;
            if (!readDigits(text, pos + 1, 2, oh) || pos + 3 >= text.size() || text[pos + 3] != ':' ||
                !readDigits(text, pos + 4, 2, om))
                return std::nullopt;
            offset = oh * 60 + om;
            if (sign == '-') offset = -offset;
            pos += 6;
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) return std::nullopt;

    // Local wall clock minus its offset gives UTC.
    return instantAt(*date, minutes) - offset;
}

std::string formatTimestamp(long long instant) {
    int day = dayOfInstant(instant);
    int minutes = minuteOfDay(instant);
    return formatIsoDate(day) + "T" + formatClockTime(minutes) + ":00.000Z";
}

int dayOfInstant(long long instant) {
    return static_cast<int>(floorDiv(instant, MINUTES_IN_DAY));
}

int minuteOfDay(long long instant) {
    return static_cast<int>(floorMod(instant, MINUTES_IN_DAY));
}

int localDayOf(long long instant, int offsetMinutes) {
    return dayOfInstant(instant + offsetMinutes);
}

int localMinuteOfDay(long long instant, int offsetMinutes) {
    return minuteOfDay(instant + offsetMinutes);
}

Weekday weekdayOf(int dayNumber) {
    // 1970-01-01 was a Thursday.
    return static_cast<Weekday>(floorMod(static_cast<long long>(dayNumber) + 4, DAYS_IN_WEEK));
}

int weekStartOf(int dayNumber) {
    return dayNumber - static_cast<int>(weekdayOf(dayNumber));
}

std::string weekdayName(Weekday day) {
    static const std::array<std::string, DAYS_IN_WEEK> kNames = {
            "sunday", "monday", "tuesday", "wednesday", "thursday", "friday", "saturday"
    };
    return kNames[static_cast<int>(day)];
}

long long instantAt(int dayNumber, int minuteOfDay) {
    return static_cast<long long>(dayNumber) * MINUTES_IN_DAY + minuteOfDay;
}
