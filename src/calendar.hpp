#ifndef LOANCALC_CALENDAR_HPP
#define LOANCALC_CALENDAR_HPP

#include <string>

namespace loancalc {

// A calendar month. All schedule arithmetic happens at month granularity;
// the day of month is irrelevant to the engine.
struct YearMonth {
    int year;
    int month;  // 1-12

    YearMonth();
    YearMonth(int y, int m);

    // "YYYY-MM"
    std::string to_string() const;

    bool operator==(const YearMonth& other) const;
    bool operator!=(const YearMonth& other) const;
    bool operator<(const YearMonth& other) const;
    bool operator<=(const YearMonth& other) const;
    bool operator>(const YearMonth& other) const;
    bool operator>=(const YearMonth& other) const;
};

// A full date, used where a collaborator needs day-level clamping
struct CalendarDate {
    int year;
    int month;
    int day;

    CalendarDate();
    CalendarDate(int y, int m, int d);

    YearMonth year_month() const { return YearMonth(year, month); }

    bool operator==(const CalendarDate& other) const;
};

bool is_leap_year(int year);
int days_in_month(int year, int month);

// Parse "YYYY-MM" (a trailing "-DD" is accepted and ignored).
// Throws std::invalid_argument on malformed input.
YearMonth parse_year_month(const std::string& text);

// Advance by n calendar months (n may be negative)
YearMonth add_months(const YearMonth& ym, int n);

// Advance by n calendar months, clamping the day to the last valid day of
// the target month (Jan 31 + 1 month -> Feb 28/29)
CalendarDate add_months(const CalendarDate& date, int n);

// Number of months from a to b (negative when b is earlier)
int months_between(const YearMonth& a, const YearMonth& b);

} // namespace loancalc

#endif // LOANCALC_CALENDAR_HPP
