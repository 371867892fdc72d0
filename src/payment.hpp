#ifndef LOANCALC_PAYMENT_HPP
#define LOANCALC_PAYMENT_HPP

#include "decimal.hpp"
#include <stdexcept>
#include <string>

namespace loancalc {

// Thrown when an installment is requested over a non-positive number of periods
class InvalidTermError : public std::invalid_argument {
public:
    explicit InvalidTermError(int term)
        : std::invalid_argument("Term must be positive, got " + std::to_string(term)),
          term_(term) {}

    int term() const { return term_; }

private:
    int term_;
};

// Monthly rate from a nominal annual percentage (3.5 -> 0.035 / 12)
Decimal monthly_rate(const Decimal& annual_percent);

// Equal-installment payment:
//   i == 0: P / n
//   else:   P * i * (1+i)^n / ((1+i)^n - 1)
Decimal annuity_payment(const Decimal& principal, const Decimal& rate_per_month, int term);

// Fixed principal part of a decreasing-installment loan: P / n
Decimal decreasing_principal_component(const Decimal& principal, int term);

// First-period payment of a decreasing loan: P / n + P * i
Decimal decreasing_payment(const Decimal& principal, const Decimal& rate_per_month, int term);

// Effective annual rate from the monthly nominal rate: (1+i)^12 - 1
Decimal effective_annual_rate(const Decimal& rate_per_month);

} // namespace loancalc

#endif // LOANCALC_PAYMENT_HPP
