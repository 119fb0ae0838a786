/**
 * @file CalendarTime.hpp
 * @brief Value objects for local wall-clock time and calendar days.
 *
 * All instants handled by the planner are local wall-clock times with seconds
 * resolution. No time-zone arithmetic happens here; the caller converts the
 * system clock to local time before handing instants over.
 */

#pragma once

#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace fieldplan::domain {

using Clock = std::chrono::system_clock;
using Seconds = std::chrono::seconds;
using Minutes = std::chrono::minutes;
using Hours = std::chrono::hours;

/// Local wall-clock instant.
using TimePoint = std::chrono::time_point<Clock, Seconds>;

constexpr long long kSecondsPerDay = 86400;

/**
 * @enum Weekday
 * @brief Day of week, Sunday first (matches the collection-day tables).
 */
enum class Weekday {
    Sunday = 0,
    Monday,
    Tuesday,
    Wednesday,
    Thursday,
    Friday,
    Saturday
};

inline std::string WeekdayToString(Weekday day) {
    switch (day) {
        case Weekday::Sunday: return "sunday";
        case Weekday::Monday: return "monday";
        case Weekday::Tuesday: return "tuesday";
        case Weekday::Wednesday: return "wednesday";
        case Weekday::Thursday: return "thursday";
        case Weekday::Friday: return "friday";
        case Weekday::Saturday: return "saturday";
        default: return "unknown";
    }
}

/**
 * @brief Parses a weekday name ("tuesday", "Tue", "TU").
 * @throws std::invalid_argument if the name is not a weekday.
 */
inline Weekday WeekdayFromString(const std::string& name) {
    std::string key;
    for (char c : name) {
        if (key.size() == 2) break;
        key.push_back(static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c));
    }
    if (key == "su") return Weekday::Sunday;
    if (key == "mo") return Weekday::Monday;
    if (key == "tu") return Weekday::Tuesday;
    if (key == "we") return Weekday::Wednesday;
    if (key == "th") return Weekday::Thursday;
    if (key == "fr") return Weekday::Friday;
    if (key == "sa") return Weekday::Saturday;
    throw std::invalid_argument("Unknown weekday: " + name);
}

inline Weekday NextWeekday(Weekday day) {
    return static_cast<Weekday>((static_cast<int>(day) + 1) % 7);
}

inline Weekday PreviousWeekday(Weekday day) {
    return static_cast<Weekday>((static_cast<int>(day) + 6) % 7);
}

/**
 * @class CivilDate
 * @brief A proleptic Gregorian calendar day.
 *
 * Invariant: names a real calendar day. Anything else is structurally invalid
 * input and is rejected with std::invalid_argument.
 */
class CivilDate {
public:
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;

    CivilDate() = default;

    CivilDate(int y, unsigned m, unsigned d) : year(y), month(m), day(d) {
        validate();
    }

    void validate() const {
        if (month < 1 || month > 12) {
            throw std::invalid_argument("CivilDate: month out of range in " + toString());
        }
        if (day < 1 || day > DaysInMonth(year, month)) {
            throw std::invalid_argument("CivilDate: day out of range in " + toString());
        }
    }

    /** @brief Days since 1970-01-01 (Howard Hinnant's days_from_civil). */
    long long toDays() const {
        const int y = year - (month <= 2 ? 1 : 0);
        const long long era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned mp = month > 2 ? month - 3 : month + 9;
        const unsigned doy = (153 * mp + 2) / 5 + day - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<long long>(doe) - 719468;
    }

    static CivilDate fromDays(long long z) {
        z += 719468;
        const long long era = (z >= 0 ? z : z - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(z - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const long long y = static_cast<long long>(yoe) + era * 400;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        const unsigned d = doy - (153 * mp + 2) / 5 + 1;
        const unsigned m = mp < 10 ? mp + 3 : mp - 9;
        return CivilDate(static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d);
    }

    /** @brief The calendar day containing a wall-clock instant. */
    static CivilDate fromTimePoint(TimePoint t) {
        long long secs = t.time_since_epoch().count();
        long long days = secs / kSecondsPerDay;
        if (secs % kSecondsPerDay < 0) --days;
        return fromDays(days);
    }

    /**
     * @brief Parses "YYYY-MM-DD".
     * @throws std::invalid_argument on malformed text or an impossible day.
     */
    static CivilDate parse(const std::string& text) {
        int y = 0;
        unsigned m = 0, d = 0;
        char trailing = 0;
        if (std::sscanf(text.c_str(), "%d-%u-%u%c", &y, &m, &d, &trailing) != 3) {
            throw std::invalid_argument("CivilDate: malformed date '" + text + "'");
        }
        return CivilDate(y, m, d);
    }

    TimePoint startOfDay() const {
        return TimePoint(Seconds(toDays() * kSecondsPerDay));
    }

    TimePoint endOfDay() const {
        return startOfDay() + Hours(24);
    }

    /** @brief Wall-clock instant at hh:mm on this day. */
    TimePoint at(int hour, int minute = 0) const {
        return startOfDay() + Hours(hour) + Minutes(minute);
    }

    TimePoint atMinuteOfDay(int minuteOfDay) const {
        return startOfDay() + Minutes(minuteOfDay);
    }

    bool contains(TimePoint t) const {
        return t >= startOfDay() && t < endOfDay();
    }

    CivilDate addDays(long long n) const {
        return fromDays(toDays() + n);
    }

    Weekday weekday() const {
        const long long z = toDays();
        // 1970-01-01 was a Thursday.
        return static_cast<Weekday>(((z + 4) % 7 + 7) % 7);
    }

    std::string toString() const {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, day);
        return buf;
    }

    bool operator==(const CivilDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const CivilDate& other) const { return !(*this == other); }
    bool operator<(const CivilDate& other) const { return toDays() < other.toDays(); }

    static unsigned DaysInMonth(int y, unsigned m) {
        static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (m < 1 || m > 12) return 0;
        if (m == 2 && ((y % 4 == 0 && y % 100 != 0) || y % 400 == 0)) return 29;
        return kDays[m - 1];
    }
};

inline TimePoint TruncateToMinute(TimePoint t) {
    return std::chrono::floor<Minutes>(t);
}

/** @brief Minutes after local midnight. */
inline int MinuteOfDay(TimePoint t) {
    return static_cast<int>((t - CivilDate::fromTimePoint(t).startOfDay()).count() / 60);
}

/** @brief Formats an instant as "YYYY-MM-DDTHH:MM". */
inline std::string FormatTimePoint(TimePoint t) {
    const int minutes = MinuteOfDay(t);
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", minutes / 60, minutes % 60);
    return CivilDate::fromTimePoint(t).toString() + "T" + buf;
}

/**
 * @brief Parses "HH:MM" into minutes after midnight.
 * @throws std::invalid_argument on malformed text.
 */
inline int ParseMinuteOfDay(const std::string& text) {
    int h = -1, m = -1;
    char trailing = 0;
    if (std::sscanf(text.c_str(), "%d:%d%c", &h, &m, &trailing) != 2 || h < 0 || h > 24 || m < 0 || m > 59 ||
        (h == 24 && m != 0)) {
        throw std::invalid_argument("Malformed time of day '" + text + "'");
    }
    return h * 60 + m;
}

/**
 * @brief Parses "YYYY-MM-DDTHH:MM" (or with a space separator).
 * @throws std::invalid_argument on malformed text.
 */
inline TimePoint ParseTimePoint(const std::string& text) {
    if (text.size() < 16 || (text[10] != 'T' && text[10] != ' ')) {
        throw std::invalid_argument("Malformed timestamp '" + text + "'");
    }
    return CivilDate::parse(text.substr(0, 10)).atMinuteOfDay(ParseMinuteOfDay(text.substr(11, 5)));
}

inline double HoursBetween(TimePoint start, TimePoint end) {
    return static_cast<double>((end - start).count()) / 3600.0;
}

} // namespace fieldplan::domain
