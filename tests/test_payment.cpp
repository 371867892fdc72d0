#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "decimal.hpp"
#include "payment.hpp"

using namespace loancalc;
using Catch::Approx;

TEST_CASE("Decimal parsing and formatting", "[decimal]") {
    SECTION("Parses plain literals") {
        REQUIRE(parse_decimal("100000") == Decimal(100000));
        REQUIRE(parse_decimal("3.5") == Decimal("3.5"));
        REQUIRE(parse_decimal("-0.25") == Decimal("-0.25"));
        REQUIRE(parse_decimal("+12") == Decimal(12));
    }

    SECTION("Rejects anything else") {
        REQUIRE_THROWS_AS(parse_decimal(""), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_decimal("-"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_decimal("1.2.3"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_decimal("12a"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_decimal("1e5"), std::invalid_argument);
    }

    SECTION("Formats with fixed places") {
        REQUIRE(format_decimal(Decimal("8606.642970"), 2) == "8606.64");
        REQUIRE(format_decimal(Decimal("0.005"), 6) == "0.005000");
    }

    SECTION("Negative zero prints without sign") {
        REQUIRE(format_decimal(Decimal("-0.001"), 2) == "0.00");
    }

    SECTION("Ten cents added ten times is exactly one") {
        Decimal total(0);
        for (int i = 0; i < 10; ++i) {
            total += Decimal("0.1");
        }
        REQUIRE(total == Decimal(1));
    }
}

TEST_CASE("Monthly rate from annual percent", "[payment]") {
    REQUIRE(monthly_rate(Decimal(6)) == Decimal("0.005"));
    REQUIRE(monthly_rate(Decimal(0)) == Decimal(0));
    REQUIRE(to_double(monthly_rate(Decimal("3.5"))) == Approx(0.035 / 12));
}

TEST_CASE("Annuity payment", "[payment]") {
    SECTION("100,000 at 6% over 12 months") {
        const Decimal payment = annuity_payment(Decimal(100000), Decimal("0.005"), 12);
        REQUIRE(to_double(payment) == Approx(8606.64).margin(0.005));
    }

    SECTION("Zero rate divides evenly") {
        REQUIRE(annuity_payment(Decimal(1200), Decimal(0), 12) == Decimal(100));
    }

    SECTION("Single period repays principal plus one month's interest") {
        const Decimal payment = annuity_payment(Decimal(1000), Decimal("0.01"), 1);
        REQUIRE(to_double(payment) == Approx(1010.0));
    }

    SECTION("Installments amortize the principal exactly") {
        const Decimal rate("0.005");
        const Decimal payment = annuity_payment(Decimal(100000), rate, 12);
        Decimal balance(100000);
        for (int i = 0; i < 12; ++i) {
            balance = balance + balance * rate - payment;
        }
        REQUIRE(to_double(boost::multiprecision::abs(balance)) < 1e-12);
    }

    SECTION("Non-positive term is rejected") {
        REQUIRE_THROWS_AS(annuity_payment(Decimal(1000), Decimal("0.005"), 0), InvalidTermError);
        try {
            annuity_payment(Decimal(1000), Decimal("0.005"), -3);
            FAIL("Expected InvalidTermError");
        } catch (const InvalidTermError& e) {
            REQUIRE(e.term() == -3);
        }
    }
}

TEST_CASE("Decreasing installments", "[payment]") {
    REQUIRE(decreasing_principal_component(Decimal(120000), 12) == Decimal(10000));
    REQUIRE(decreasing_payment(Decimal(120000), Decimal("0.005"), 12) == Decimal(10600));
    REQUIRE_THROWS_AS(decreasing_principal_component(Decimal(1000), 0), InvalidTermError);
    REQUIRE_THROWS_AS(decreasing_payment(Decimal(1000), Decimal("0.005"), 0), InvalidTermError);
}

TEST_CASE("Effective annual rate", "[payment]") {
    REQUIRE(to_double(effective_annual_rate(Decimal("0.005"))) == Approx(0.0616778118645));
    REQUIRE(effective_annual_rate(Decimal(0)) == Decimal(0));
}
