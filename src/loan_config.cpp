#include "loan_config.hpp"
#include "payment.hpp"

namespace loancalc {

std::string to_string(LoanType type) {
    switch (type) {
        case LoanType::Annuity: return "annuity";
        case LoanType::Decreasing: return "decreasing";
    }
    return "unknown";
}

std::string to_string(OverpaymentKind kind) {
    switch (kind) {
        case OverpaymentKind::Term: return "term";
        case OverpaymentKind::Installment: return "installment";
    }
    return "unknown";
}

LoanConfig::LoanConfig()
    : principal(0),
      down_payment(0),
      rate(0),
      term(0),
      start_month(),
      loan_type(LoanType::Annuity) {}

Decimal LoanConfig::financed_principal() const {
    return principal - down_payment;
}

Decimal LoanConfig::monthly_rate() const {
    return loancalc::monthly_rate(rate);
}

YearMonth LoanConfig::nominal_end_month() const {
    return add_months(start_month, term - 1);
}

void LoanConfig::validate() const {
    if (financed_principal() <= 0) {
        throw ConfigurationError("down_payment",
            "financed principal must be positive (principal " + format_decimal(principal) +
            ", down payment " + format_decimal(down_payment) + ")");
    }
    if (term <= 0) {
        throw ConfigurationError("term", "must be positive, got " + std::to_string(term));
    }
    if (term > MAX_TERM_MONTHS) {
        throw ConfigurationError("term", "must be at most " + std::to_string(MAX_TERM_MONTHS) +
                                         " months, got " + std::to_string(term));
    }
    if (rate < 0) {
        throw ConfigurationError("rate", "must not be negative, got " + format_decimal(rate, 4));
    }

    if (!tranches.empty()) {
        const YearMonth last_month = nominal_end_month();
        bool any_disbursed = false;
        for (const auto& tranche : tranches) {
            if (tranche.cumulative_percent < 0 || tranche.cumulative_percent > 1) {
                throw ConfigurationError("tranches",
                    "cumulative percent for " + tranche.month.to_string() +
                    " must be within [0, 1], got " + format_decimal(tranche.cumulative_percent, 4));
            }
            if (tranche.month > last_month) {
                throw ConfigurationError("tranches",
                    "tranche " + tranche.month.to_string() +
                    " falls after the final scheduled month " + last_month.to_string());
            }
            if (tranche.cumulative_percent > 0) {
                any_disbursed = true;
            }
        }
        if (!any_disbursed) {
            throw ConfigurationError("tranches", "no tranche disburses any principal");
        }
    }

    for (const auto& op : overpayments) {
        if (op.amount <= 0) {
            throw ConfigurationError("overpayments",
                "amount for " + op.month.to_string() + " must be positive, got " +
                format_decimal(op.amount));
        }
    }

    if (target_payment && *target_payment <= 0) {
        throw ConfigurationError("target_payment",
            "must be positive, got " + format_decimal(*target_payment));
    }
}

} // namespace loancalc
