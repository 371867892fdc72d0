#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <stdexcept>
#include "schedule.hpp"
#include "summary.hpp"

using namespace loancalc;
using Catch::Approx;

namespace {

LoanConfig scenario_a() {
    LoanConfig config;
    config.principal = Decimal(100000);
    config.rate = Decimal(6);
    config.term = 12;
    config.start_month = YearMonth(2024, 1);
    return config;
}

} // anonymous namespace

TEST_CASE("Summary of a plain annuity loan", "[summary]") {
    const ScheduleResult result = compute_schedule(scenario_a());
    const LoanSummary& s = result.summary;

    REQUIRE(s.principal_financed == Decimal(100000));
    REQUIRE(to_double(s.total_interest) == Approx(3279.72).margin(0.01));
    REQUIRE(s.total_overpayment == 0);
    REQUIRE(s.total_cost == s.principal_financed + s.total_interest);
    REQUIRE(to_double(s.apr) == Approx(0.0616778118645));
    REQUIRE(s.term_months == 12);
    REQUIRE(s.original_end_date == YearMonth(2024, 12));
    REQUIRE(s.new_end_date == YearMonth(2024, 12));
    REQUIRE(s.payments_made == 12);
    REQUIRE(to_double(s.max_payment) == Approx(8606.64).margin(0.01));
}

TEST_CASE("Summary totals follow the schedule", "[summary]") {
    LoanConfig config = scenario_a();
    config.down_payment = Decimal(10000);
    config.holidays.insert(YearMonth(2024, 5));
    config.overpayments.push_back(Overpayment{YearMonth(2024, 3), Decimal(15000), OverpaymentKind::Term});

    const ScheduleResult result = compute_schedule(config);
    const LoanSummary& s = result.summary;

    Decimal interest(0);
    int payments = 0;
    for (const auto& entry : result.entries) {
        interest += entry.interest_component;
        if (!entry.is_holiday && entry.payment > 0) {
            ++payments;
        }
    }

    REQUIRE(s.principal_financed == Decimal(90000));
    REQUIRE(s.total_interest == interest);
    REQUIRE(s.total_overpayment == Decimal(15000));
    REQUIRE(s.payments_made == payments);
    REQUIRE(s.new_end_date == result.entries.back().month);
    REQUIRE(s.original_end_date == YearMonth(2024, 12));

    SECTION("Peak outflow includes the overpayment") {
        const auto& march = result.entries[2];
        REQUIRE(march.month == YearMonth(2024, 3));
        REQUIRE(s.max_payment == march.payment + march.overpayment_amount);
    }
}

TEST_CASE("Holiday extends the payoff date but not the payment count", "[summary]") {
    LoanConfig config = scenario_a();
    config.holidays.insert(YearMonth(2024, 3));

    const LoanSummary s = compute_schedule(config).summary;
    const LoanSummary plain = compute_schedule(scenario_a()).summary;

    REQUIRE(s.new_end_date == YearMonth(2025, 1));
    REQUIRE(s.original_end_date == YearMonth(2024, 12));
    REQUIRE(s.payments_made == 12);
    REQUIRE(s.total_interest > plain.total_interest);
}

TEST_CASE("Summary of an empty schedule", "[summary]") {
    const LoanSummary s = summarize(scenario_a(), {});
    REQUIRE(s.new_end_date == YearMonth(2024, 1));
    REQUIRE(s.total_interest == 0);
    REQUIRE(s.payments_made == 0);
    REQUIRE(s.max_payment == 0);
}

TEST_CASE("Summary export keys", "[summary]") {
    const std::vector<std::string> expected = {
        "principal_financed", "total_interest", "total_overpayment", "total_cost", "apr",
        "term_months", "original_end_date", "new_end_date", "payments_made", "max_payment"
    };
    REQUIRE(SUMMARY_KEYS == expected);

    const LoanSummary s = compute_schedule(scenario_a()).summary;

    REQUIRE(summary_value(s, "principal_financed") == "100000.000000");
    REQUIRE(summary_value(s, "principal_financed", 2) == "100000.00");
    REQUIRE(summary_value(s, "term_months") == "12");
    REQUIRE(summary_value(s, "payments_made") == "12");
    REQUIRE(summary_value(s, "original_end_date") == "2024-12");
    REQUIRE(summary_value(s, "new_end_date") == "2024-12");
    REQUIRE(summary_value(s, "apr", 4) == "0.0617");
    REQUIRE_THROWS_AS(summary_value(s, "bogus"), std::out_of_range);
}
