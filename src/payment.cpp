#include "payment.hpp"

namespace loancalc {

Decimal monthly_rate(const Decimal& annual_percent) {
    return annual_percent / 100 / 12;
}

Decimal annuity_payment(const Decimal& principal, const Decimal& rate_per_month, int term) {
    if (term <= 0) {
        throw InvalidTermError(term);
    }
    if (rate_per_month == 0) {
        return principal / term;
    }
    const Decimal factor = boost::multiprecision::pow(Decimal(1) + rate_per_month, term);
    return principal * rate_per_month * factor / (factor - 1);
}

Decimal decreasing_principal_component(const Decimal& principal, int term) {
    if (term <= 0) {
        throw InvalidTermError(term);
    }
    return principal / term;
}

Decimal decreasing_payment(const Decimal& principal, const Decimal& rate_per_month, int term) {
    return decreasing_principal_component(principal, term) + principal * rate_per_month;
}

Decimal effective_annual_rate(const Decimal& rate_per_month) {
    return boost::multiprecision::pow(Decimal(1) + rate_per_month, 12) - 1;
}

} // namespace loancalc
