/**
 * @file CalendarDate.cpp
 * @brief Implementation of CalendarDate.
 */

#include "domain/CalendarDate.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace docverify::domain {

std::optional<CalendarDate> CalendarDate::FromYmd(int year, int month, int day) {
    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > DaysInMonth(year, month)) return std::nullopt;
    return CalendarDate(year, month, day);
}

std::optional<CalendarDate> CalendarDate::ParseIso(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;
    for (size_t i = 0; i < text.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
    }
    const int year = std::stoi(text.substr(0, 4));
    const int month = std::stoi(text.substr(5, 2));
    const int day = std::stoi(text.substr(8, 2));
    return FromYmd(year, month, day);
}

CalendarDate CalendarDate::Today() {
    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return CalendarDate(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
}

int CalendarDate::AgeOn(const CalendarDate& birth, const CalendarDate& today) {
    int age = today.m_year - birth.m_year;
    if (today.m_month < birth.m_month ||
        (today.m_month == birth.m_month && today.m_day < birth.m_day)) {
        --age;
    }
    return age;
}

bool CalendarDate::IsLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int CalendarDate::DaysInMonth(int year, int month) {
    static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && IsLeapYear(year)) return 29;
    return kDays[month - 1];
}

std::int64_t CalendarDate::ToEpochDays() const {
    // days_from_civil (H. Hinnant)
    const std::int64_t y = static_cast<std::int64_t>(m_year) - (m_month <= 2 ? 1 : 0);
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t mp = (m_month + 9) % 12;
    const std::int64_t doy = (153 * mp + 2) / 5 + m_day - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

std::string CalendarDate::ToIsoString() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << m_year << '-'
        << std::setw(2) << m_month << '-'
        << std::setw(2) << m_day;
    return oss.str();
}

} // namespace docverify::domain
