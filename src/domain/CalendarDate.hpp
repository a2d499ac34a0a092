/**
 * @file CalendarDate.hpp
 * @brief Value Object for a proleptic Gregorian calendar day.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace docverify::domain {

/**
 * @class CalendarDate
 * @brief A validated year/month/day triple. Parsing yields std::nullopt instead of throwing.
 */
class CalendarDate {
public:
    /**
     * @brief Builds a date if the triple names a real calendar day.
     */
    static std::optional<CalendarDate> FromYmd(int year, int month, int day);

    /**
     * @brief Parses exactly "YYYY-MM-DD".
     * @return The date, or std::nullopt for any other shape or an impossible day.
     */
    static std::optional<CalendarDate> ParseIso(const std::string& text);

    /** @brief Current local calendar date. */
    static CalendarDate Today();

    /**
     * @brief Completed years between birth and the reference date.
     *
     * One year is subtracted when the reference month/day precedes the birth month/day.
     */
    static int AgeOn(const CalendarDate& birth, const CalendarDate& today);

    static bool IsLeapYear(int year);
    static int DaysInMonth(int year, int month);

    int year() const { return m_year; }
    int month() const { return m_month; }
    int day() const { return m_day; }

    /** @brief Days since 1970-01-01 (negative before). */
    std::int64_t ToEpochDays() const;

    /** @brief Signed number of days from this date to @p other. */
    std::int64_t DaysUntil(const CalendarDate& other) const { return other.ToEpochDays() - ToEpochDays(); }

    std::string ToIsoString() const;

    bool operator==(const CalendarDate& o) const { return m_year == o.m_year && m_month == o.m_month && m_day == o.m_day; }
    bool operator!=(const CalendarDate& o) const { return !(*this == o); }
    bool operator<(const CalendarDate& o) const { return ToEpochDays() < o.ToEpochDays(); }
    bool operator>(const CalendarDate& o) const { return o < *this; }
    bool operator<=(const CalendarDate& o) const { return !(o < *this); }
    bool operator>=(const CalendarDate& o) const { return !(*this < o); }

private:
    CalendarDate(int year, int month, int day) : m_year(year), m_month(month), m_day(day) {}

    int m_year;
    int m_month;
    int m_day;
};

} // namespace docverify::domain
