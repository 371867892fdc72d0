#ifndef LOANCALC_SCHEDULE_HPP
#define LOANCALC_SCHEDULE_HPP

#include "loan_config.hpp"
#include "schedule_entry.hpp"
#include "summary.hpp"
#include <stdexcept>
#include <vector>

namespace loancalc {

// Raised when the iteration bound (2 x term periods) is hit with a balance
// still outstanding, instead of returning a truncated schedule.
class SimulationDivergence : public std::runtime_error {
public:
    SimulationDivergence(int period_index, const Decimal& balance);

    int period_index() const { return period_index_; }
    const Decimal& balance() const { return balance_; }

private:
    int period_index_;
    Decimal balance_;
};

struct ScheduleResult {
    std::vector<ScheduleEntry> entries;
    LoanSummary summary;
};

// Balance at or below this value ends the simulation
extern const Decimal TERMINATION_EPSILON;

// Residual balances smaller than half a cent are snapped to exactly zero
extern const Decimal DUST_THRESHOLD;

// Run the month-by-month amortization for one scenario.
//
// Phases:
// - Pre-start: walk from the earliest tranche to start_month releasing tranches
//   and capitalizing interest on disbursed principal (no payments).
// - Main loop, each month in order:
//   1. Release a tranche dated this month and re-amortize over the remaining term
//   2. Holiday: capitalize interest, emit a zero-payment entry, keep the term
//   3. Standard payment: interest on balance, principal per loan type
//   4. Add overpayments dated this month
//   5. Top up to target_payment as an installment-kind overpayment
//   6. Apply principal; snap dust; re-amortize if required
//   7. Correct overshoot on the final payment
//   8. Force payoff if the term is exhausted with a balance left
//
// Throws ConfigurationError for an invalid config and SimulationDivergence if
// the loop bound is reached. Pure: no I/O, no shared state.
std::vector<ScheduleEntry> simulate_schedule(const LoanConfig& config);

// simulate_schedule + summarize
ScheduleResult compute_schedule(const LoanConfig& config);

} // namespace loancalc

#endif // LOANCALC_SCHEDULE_HPP
