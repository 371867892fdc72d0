#ifndef LOANCALC_LOAN_CONFIG_HPP
#define LOANCALC_LOAN_CONFIG_HPP

#include "calendar.hpp"
#include "decimal.hpp"
#include <cstdint>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace loancalc {

enum class LoanType : uint8_t {
    Annuity = 0,     // Equal total installments
    Decreasing = 1   // Equal principal components
};

enum class OverpaymentKind : uint8_t {
    Term = 0,        // Keep installment, shorten the schedule
    Installment = 1  // Re-amortize, lower future installments
};

std::string to_string(LoanType type);
std::string to_string(OverpaymentKind kind);

// Raised before simulation for a scenario that cannot be amortized.
// field() names the offending configuration field.
class ConfigurationError : public std::invalid_argument {
public:
    ConfigurationError(const std::string& field, const std::string& message)
        : std::invalid_argument(field + ": " + message), field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

// Phased disbursement: share of the financed principal released by `month`.
// Percentages are cumulative, expressed as a fraction in [0, 1].
struct Tranche {
    YearMonth month;
    Decimal cumulative_percent;
};

struct Overpayment {
    YearMonth month;
    Decimal amount;
    OverpaymentKind kind;
};

// Longest accepted term (100 years). Keeps period arithmetic well inside int.
constexpr int MAX_TERM_MONTHS = 1200;

// One loan scenario. Built once by an input collaborator, read-only afterwards.
struct LoanConfig {
    Decimal principal;               // Total loan amount before down payment
    Decimal down_payment;
    Decimal rate;                    // Nominal annual rate in percent (3.5 == 3.5%)
    int term;                        // Scheduled number of monthly payments
    YearMonth start_month;           // First payment month
    LoanType loan_type;
    std::vector<Tranche> tranches;
    std::vector<Overpayment> overpayments;
    std::set<YearMonth> holidays;
    std::optional<Decimal> target_payment;  // Fixed monthly budget

    LoanConfig();

    // principal - down_payment; the unit tranche percentages apply to
    Decimal financed_principal() const;

    Decimal monthly_rate() const;

    // start_month + term - 1
    YearMonth nominal_end_month() const;

    // Throws ConfigurationError naming the first invalid field
    void validate() const;
};

} // namespace loancalc

#endif // LOANCALC_LOAN_CONFIG_HPP
