#include <catch2/catch_test_macros.hpp>
#include "loan_config.hpp"
#include "schedule.hpp"

using namespace loancalc;

namespace {

LoanConfig make_config() {
    LoanConfig config;
    config.principal = Decimal(100000);
    config.rate = Decimal(6);
    config.term = 12;
    config.start_month = YearMonth(2024, 1);
    return config;
}

// Field named by the ConfigurationError that validate() raises
std::string rejected_field(const LoanConfig& config) {
    try {
        config.validate();
    } catch (const ConfigurationError& e) {
        return e.field();
    }
    return "";
}

} // anonymous namespace

TEST_CASE("LoanConfig derived values", "[loan_config]") {
    LoanConfig config = make_config();
    config.down_payment = Decimal(20000);

    REQUIRE(config.financed_principal() == Decimal(80000));
    REQUIRE(config.monthly_rate() == Decimal("0.005"));
    REQUIRE(config.nominal_end_month() == YearMonth(2024, 12));

    config.term = 360;
    REQUIRE(config.nominal_end_month() == YearMonth(2053, 12));
}

TEST_CASE("LoanConfig enum names", "[loan_config]") {
    REQUIRE(to_string(LoanType::Annuity) == "annuity");
    REQUIRE(to_string(LoanType::Decreasing) == "decreasing");
    REQUIRE(to_string(OverpaymentKind::Term) == "term");
    REQUIRE(to_string(OverpaymentKind::Installment) == "installment");
}

TEST_CASE("LoanConfig validation", "[loan_config]") {
    SECTION("A plain loan is valid") {
        REQUIRE_NOTHROW(make_config().validate());
    }

    SECTION("Financed principal must be positive") {
        LoanConfig config = make_config();
        config.down_payment = Decimal(100000);
        REQUIRE(rejected_field(config) == "down_payment");

        config.down_payment = Decimal(150000);
        REQUIRE(rejected_field(config) == "down_payment");
    }

    SECTION("Term must be positive") {
        LoanConfig config = make_config();
        config.term = 0;
        REQUIRE(rejected_field(config) == "term");
        config.term = -12;
        REQUIRE(rejected_field(config) == "term");
    }

    SECTION("Term has an upper bound") {
        LoanConfig config = make_config();
        config.term = MAX_TERM_MONTHS;
        REQUIRE_NOTHROW(config.validate());

        config.term = MAX_TERM_MONTHS + 1;
        REQUIRE(rejected_field(config) == "term");
        config.term = 1500000000;
        REQUIRE(rejected_field(config) == "term");
        REQUIRE_THROWS_AS(compute_schedule(config), ConfigurationError);
    }

    SECTION("Rate must not be negative") {
        LoanConfig config = make_config();
        config.rate = Decimal("-0.5");
        REQUIRE(rejected_field(config) == "rate");

        config.rate = Decimal(0);
        REQUIRE_NOTHROW(config.validate());
    }

    SECTION("Tranche percentages stay within [0, 1]") {
        LoanConfig config = make_config();
        config.tranches.push_back(Tranche{YearMonth(2024, 1), Decimal("1.5")});
        REQUIRE(rejected_field(config) == "tranches");

        config.tranches[0].cumulative_percent = Decimal("-0.1");
        REQUIRE(rejected_field(config) == "tranches");
    }

    SECTION("Tranches must disburse something") {
        LoanConfig config = make_config();
        config.tranches.push_back(Tranche{YearMonth(2024, 1), Decimal(0)});
        REQUIRE(rejected_field(config) == "tranches");
    }

    SECTION("Tranches may not fall after the final scheduled month") {
        LoanConfig config = make_config();
        config.tranches.push_back(Tranche{YearMonth(2024, 1), Decimal("0.5")});
        config.tranches.push_back(Tranche{YearMonth(2025, 1), Decimal(1)});
        REQUIRE(rejected_field(config) == "tranches");
    }

    SECTION("Tranches before the start month are allowed") {
        LoanConfig config = make_config();
        config.tranches.push_back(Tranche{YearMonth(2023, 10), Decimal("0.3")});
        REQUIRE_NOTHROW(config.validate());
    }

    SECTION("Overpayment amounts must be positive") {
        LoanConfig config = make_config();
        config.overpayments.push_back(Overpayment{YearMonth(2024, 6), Decimal(0), OverpaymentKind::Term});
        REQUIRE(rejected_field(config) == "overpayments");
    }

    SECTION("Target payment must be positive") {
        LoanConfig config = make_config();
        config.target_payment = Decimal(0);
        REQUIRE(rejected_field(config) == "target_payment");
    }

    SECTION("The engine validates before computing") {
        LoanConfig config = make_config();
        config.term = 0;
        REQUIRE_THROWS_AS(compute_schedule(config), ConfigurationError);
    }

    SECTION("Error message names the field") {
        LoanConfig config = make_config();
        config.rate = Decimal(-1);
        try {
            config.validate();
            FAIL("Expected ConfigurationError");
        } catch (const ConfigurationError& e) {
            REQUIRE(std::string(e.what()).find("rate") == 0);
        }
    }
}
