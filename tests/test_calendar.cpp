#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include "calendar.hpp"

using namespace loancalc;

TEST_CASE("YearMonth construction and formatting", "[calendar]") {
    SECTION("Default is January 1970") {
        YearMonth ym;
        REQUIRE(ym.year == 1970);
        REQUIRE(ym.month == 1);
    }

    SECTION("Formats as zero-padded YYYY-MM") {
        REQUIRE(YearMonth(2024, 3).to_string() == "2024-03");
        REQUIRE(YearMonth(987, 11).to_string() == "0987-11");
    }

    SECTION("Rejects months outside 1-12") {
        REQUIRE_THROWS_AS(YearMonth(2024, 0), std::invalid_argument);
        REQUIRE_THROWS_AS(YearMonth(2024, 13), std::invalid_argument);
    }

    SECTION("Orders chronologically") {
        REQUIRE(YearMonth(2023, 12) < YearMonth(2024, 1));
        REQUIRE(YearMonth(2024, 2) > YearMonth(2024, 1));
        REQUIRE(YearMonth(2024, 5) <= YearMonth(2024, 5));
        REQUIRE(YearMonth(2024, 5) >= YearMonth(2024, 5));
        REQUIRE(YearMonth(2024, 5) != YearMonth(2025, 5));
    }
}

TEST_CASE("Leap years and month lengths", "[calendar]") {
    REQUIRE(is_leap_year(2024));
    REQUIRE(is_leap_year(2000));
    REQUIRE_FALSE(is_leap_year(1900));
    REQUIRE_FALSE(is_leap_year(2023));

    REQUIRE(days_in_month(2024, 2) == 29);
    REQUIRE(days_in_month(2023, 2) == 28);
    REQUIRE(days_in_month(2024, 4) == 30);
    REQUIRE(days_in_month(2024, 12) == 31);
}

TEST_CASE("parse_year_month", "[calendar]") {
    SECTION("Accepts YYYY-MM") {
        REQUIRE(parse_year_month("2024-01") == YearMonth(2024, 1));
        REQUIRE(parse_year_month("2030-12") == YearMonth(2030, 12));
    }

    SECTION("Ignores a trailing day") {
        REQUIRE(parse_year_month("2024-06-15") == YearMonth(2024, 6));
    }

    SECTION("Rejects malformed input") {
        REQUIRE_THROWS_AS(parse_year_month(""), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_year_month("2024"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_year_month("2024-13"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_year_month("2024-00"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_year_month("20x4-01"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_year_month("2024-1a"), std::invalid_argument);
    }
}

TEST_CASE("add_months on year-months", "[calendar]") {
    REQUIRE(add_months(YearMonth(2024, 1), 0) == YearMonth(2024, 1));
    REQUIRE(add_months(YearMonth(2024, 1), 1) == YearMonth(2024, 2));
    REQUIRE(add_months(YearMonth(2024, 11), 2) == YearMonth(2025, 1));
    REQUIRE(add_months(YearMonth(2024, 1), 359) == YearMonth(2053, 12));

    SECTION("Negative offsets go backwards across years") {
        REQUIRE(add_months(YearMonth(2024, 1), -1) == YearMonth(2023, 12));
        REQUIRE(add_months(YearMonth(2024, 3), -15) == YearMonth(2022, 12));
    }
}

TEST_CASE("add_months clamps the day of month", "[calendar]") {
    REQUIRE(add_months(CalendarDate(2024, 1, 31), 1) == CalendarDate(2024, 2, 29));
    REQUIRE(add_months(CalendarDate(2023, 1, 31), 1) == CalendarDate(2023, 2, 28));
    REQUIRE(add_months(CalendarDate(2024, 3, 31), 1) == CalendarDate(2024, 4, 30));
    REQUIRE(add_months(CalendarDate(2024, 5, 15), 12) == CalendarDate(2025, 5, 15));
    REQUIRE(add_months(CalendarDate(2024, 3, 31), -1) == CalendarDate(2024, 2, 29));
    REQUIRE(CalendarDate(2024, 8, 9).year_month() == YearMonth(2024, 8));
}

TEST_CASE("months_between", "[calendar]") {
    REQUIRE(months_between(YearMonth(2024, 1), YearMonth(2024, 1)) == 0);
    REQUIRE(months_between(YearMonth(2024, 1), YearMonth(2024, 12)) == 11);
    REQUIRE(months_between(YearMonth(2024, 1), YearMonth(2025, 1)) == 12);
    REQUIRE(months_between(YearMonth(2024, 3), YearMonth(2023, 12)) == -3);

    const YearMonth start(2021, 7);
    for (int n = -30; n <= 30; n += 7) {
        REQUIRE(months_between(start, add_months(start, n)) == n);
    }
}
