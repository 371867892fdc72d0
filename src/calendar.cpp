#include "calendar.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace loancalc {

// ============================================================================
// YearMonth Implementation
// ============================================================================

YearMonth::YearMonth() : year(1970), month(1) {}

YearMonth::YearMonth(int y, int m) : year(y), month(m) {
    if (m < 1 || m > 12) {
        throw std::invalid_argument("Month out of range: " + std::to_string(m));
    }
}

std::string YearMonth::to_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d", year, month);
    return std::string(buf);
}

bool YearMonth::operator==(const YearMonth& other) const {
    return year == other.year && month == other.month;
}

bool YearMonth::operator!=(const YearMonth& other) const {
    return !(*this == other);
}

bool YearMonth::operator<(const YearMonth& other) const {
    return year < other.year || (year == other.year && month < other.month);
}

bool YearMonth::operator<=(const YearMonth& other) const {
    return !(other < *this);
}

bool YearMonth::operator>(const YearMonth& other) const {
    return other < *this;
}

bool YearMonth::operator>=(const YearMonth& other) const {
    return !(*this < other);
}

// ============================================================================
// CalendarDate Implementation
// ============================================================================

CalendarDate::CalendarDate() : year(1970), month(1), day(1) {}

CalendarDate::CalendarDate(int y, int m, int d) : year(y), month(m), day(d) {
    if (m < 1 || m > 12) {
        throw std::invalid_argument("Month out of range: " + std::to_string(m));
    }
    if (d < 1 || d > days_in_month(y, m)) {
        throw std::invalid_argument("Day out of range: " + std::to_string(d));
    }
}

bool CalendarDate::operator==(const CalendarDate& other) const {
    return year == other.year && month == other.month && day == other.day;
}

// ============================================================================
// Month Arithmetic
// ============================================================================

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        throw std::invalid_argument("Month out of range: " + std::to_string(month));
    }
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return DAYS[month - 1];
}

namespace {

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c);
    });
}

// Months elapsed since January of year 0
int to_month_index(int year, int month) {
    return year * 12 + (month - 1);
}

} // anonymous namespace

YearMonth parse_year_month(const std::string& text) {
    const size_t dash = text.find('-');
    if (dash == std::string::npos) {
        throw std::invalid_argument("Invalid year-month string: " + text);
    }

    const std::string year_str = text.substr(0, dash);
    std::string month_str = text.substr(dash + 1);
    const size_t day_dash = month_str.find('-');
    if (day_dash != std::string::npos) {
        if (!all_digits(month_str.substr(day_dash + 1))) {
            throw std::invalid_argument("Invalid year-month string: " + text);
        }
        month_str = month_str.substr(0, day_dash);
    }

    if (!all_digits(year_str) || !all_digits(month_str) || month_str.size() > 2) {
        throw std::invalid_argument("Invalid year-month string: " + text);
    }

    const int month = std::stoi(month_str);
    if (month < 1 || month > 12) {
        throw std::invalid_argument("Invalid year-month string: " + text);
    }
    return YearMonth(std::stoi(year_str), month);
}

YearMonth add_months(const YearMonth& ym, int n) {
    const int index = to_month_index(ym.year, ym.month) + n;
    int year = index / 12;
    int month0 = index % 12;
    if (month0 < 0) {
        month0 += 12;
        year -= 1;
    }
    return YearMonth(year, month0 + 1);
}

CalendarDate add_months(const CalendarDate& date, int n) {
    const YearMonth target = add_months(date.year_month(), n);
    const int day = std::min(date.day, days_in_month(target.year, target.month));
    return CalendarDate(target.year, target.month, day);
}

int months_between(const YearMonth& a, const YearMonth& b) {
    return to_month_index(b.year, b.month) - to_month_index(a.year, a.month);
}

} // namespace loancalc
