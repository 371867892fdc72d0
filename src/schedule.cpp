#include "schedule.hpp"
#include "payment.hpp"
#include <algorithm>
#include <map>

namespace loancalc {

const Decimal TERMINATION_EPSILON("0.01");
const Decimal DUST_THRESHOLD("0.005");

// ============================================================================
// ScheduleEntry / SimulationDivergence Implementation
// ============================================================================

ScheduleEntry::ScheduleEntry()
    : period_index(0),
      month(),
      starting_balance(0),
      payment(0),
      principal_component(0),
      interest_component(0),
      overpayment_amount(0),
      ending_balance(0),
      tranche_disbursed_amount(0),
      is_holiday(false) {}

SimulationDivergence::SimulationDivergence(int period_index, const Decimal& balance)
    : std::runtime_error("Schedule did not converge: balance " + format_decimal(balance) +
                         " still outstanding at period " + std::to_string(period_index)),
      period_index_(period_index),
      balance_(balance) {}

namespace {

// ============================================================================
// Simulation State
// ============================================================================

// Everything carried from one period to the next. Step functions take it by
// value and return the updated copy.
struct SimulationState {
    Decimal balance;
    Decimal current_percent;        // Cumulative tranche percent released so far
    Decimal disbursed_principal;
    int remaining_term;
    Decimal installment;            // Annuity payment, or first payment of a decreasing loan
    Decimal constant_principal;     // Decreasing loans: fixed principal per period
    YearMonth month;
    int period_index;

    SimulationState()
        : balance(0), current_percent(0), disbursed_principal(0), remaining_term(0),
          installment(0), constant_principal(0), month(), period_index(1) {}
};

// Read-only lookups derived from the config once per run
struct ScheduleInputs {
    const LoanConfig& config;
    Decimal financed_principal;
    Decimal rate;
    std::map<YearMonth, Decimal> tranche_percent;
    std::map<YearMonth, std::vector<Overpayment>> overpayments;

    explicit ScheduleInputs(const LoanConfig& cfg)
        : config(cfg),
          financed_principal(cfg.financed_principal()),
          rate(cfg.monthly_rate()) {
        // Several tranches in one month: the highest cumulative percent wins
        for (const auto& tranche : cfg.tranches) {
            auto it = tranche_percent.find(tranche.month);
            if (it == tranche_percent.end()) {
                tranche_percent.emplace(tranche.month, tranche.cumulative_percent);
            } else if (tranche.cumulative_percent > it->second) {
                it->second = tranche.cumulative_percent;
            }
        }
        for (const auto& op : cfg.overpayments) {
            overpayments[op.month].push_back(op);
        }
    }
};

struct PeriodStep {
    SimulationState state;
    ScheduleEntry entry;
};

struct TrancheRelease {
    SimulationState state;
    Decimal released;
};

// Recompute the installment (annuity) or per-period principal (decreasing)
// against the current balance and remaining term
SimulationState reamortize(SimulationState state, const ScheduleInputs& in) {
    if (in.config.loan_type == LoanType::Annuity) {
        state.installment = annuity_payment(state.balance, in.rate, state.remaining_term);
    } else {
        state.constant_principal = decreasing_principal_component(state.balance, state.remaining_term);
        state.installment = state.constant_principal + state.balance * in.rate;
    }
    return state;
}

SimulationState advance_month(SimulationState state) {
    state.month = add_months(state.month, 1);
    ++state.period_index;
    return state;
}

// Release the increment of a tranche dated in state.month. A percent at or
// below the running cumulative releases nothing.
TrancheRelease release_tranche(SimulationState state, const ScheduleInputs& in) {
    TrancheRelease release{state, Decimal(0)};
    auto it = in.tranche_percent.find(state.month);
    if (it == in.tranche_percent.end() || it->second <= state.current_percent) {
        return release;
    }

    release.released = in.financed_principal * (it->second - state.current_percent);
    release.state.current_percent = it->second;
    release.state.disbursed_principal += release.released;
    release.state.balance += release.released;
    return release;
}

bool has_pending_tranche(const SimulationState& state, const ScheduleInputs& in) {
    for (auto it = in.tranche_percent.lower_bound(state.month); it != in.tranche_percent.end(); ++it) {
        if (it->second > state.current_percent) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Phases
// ============================================================================

// Disburse tranches dated before start_month and capitalize interest on the
// disbursed principal. Without tranches the full financed principal is
// outstanding at start_month.
SimulationState run_pre_start_phase(const ScheduleInputs& in) {
    SimulationState state;
    state.month = in.config.start_month;
    state.remaining_term = in.config.term;

    if (in.tranche_percent.empty()) {
        state.balance = in.financed_principal;
        state.disbursed_principal = in.financed_principal;
        state.current_percent = 1;
        return state;
    }

    YearMonth month = std::min(in.config.start_month, in.tranche_percent.begin()->first);
    Decimal capitalized_interest(0);
    while (month < in.config.start_month) {
        state.month = month;
        const TrancheRelease release = release_tranche(state, in);
        state = release.state;
        capitalized_interest += state.disbursed_principal * in.rate;
        month = add_months(month, 1);
    }

    state.month = in.config.start_month;
    state.balance = state.disbursed_principal + capitalized_interest;
    return state;
}

PeriodStep holiday_period(SimulationState state, const ScheduleInputs& in,
                          const Decimal& starting_balance, const Decimal& released) {
    PeriodStep step;
    const Decimal interest = state.balance * in.rate;
    state.balance += interest;

    step.entry.period_index = state.period_index;
    step.entry.month = state.month;
    step.entry.starting_balance = starting_balance;
    step.entry.interest_component = interest;
    step.entry.ending_balance = state.balance;
    step.entry.tranche_disbursed_amount = released;
    step.entry.is_holiday = true;

    // The remaining term is not consumed. Raise the installment just enough to
    // amortize the capitalized balance within it; never lower it, so a term
    // already shortened by overpayments stays short.
    if (state.remaining_term > 0 && state.balance > 0) {
        const SimulationState recomputed = reamortize(state, in);
        if (in.config.loan_type == LoanType::Annuity) {
            state.installment = std::max(state.installment, recomputed.installment);
        } else if (recomputed.constant_principal > state.constant_principal) {
            state.constant_principal = recomputed.constant_principal;
            state.installment = recomputed.installment;
        }
    }

    step.state = advance_month(state);
    return step;
}

PeriodStep standard_period(SimulationState state, const ScheduleInputs& in,
                           const Decimal& starting_balance, const Decimal& released) {
    const Decimal interest = state.balance * in.rate;

    Decimal payment;
    Decimal principal;
    if (in.config.loan_type == LoanType::Annuity) {
        payment = state.installment;
        principal = payment - interest;
    } else {
        principal = state.constant_principal;
        payment = principal + interest;
    }

    // Explicit overpayments for this month
    Decimal overpayment(0);
    bool reamortize_after = false;
    auto ops = in.overpayments.find(state.month);
    if (ops != in.overpayments.end()) {
        for (const auto& op : ops->second) {
            overpayment += op.amount;
            if (op.kind == OverpaymentKind::Installment) {
                reamortize_after = true;
            }
        }
    }

    // Budget slack becomes an installment-kind overpayment
    if (in.config.target_payment) {
        const Decimal slack = *in.config.target_payment - (payment + overpayment);
        if (slack > 0) {
            overpayment += slack;
            reamortize_after = true;
        }
    }

    principal += overpayment;
    state.balance -= principal;

    if (boost::multiprecision::abs(state.balance) < DUST_THRESHOLD) {
        state.balance = 0;
    } else if (state.balance > 0 && state.balance <= TERMINATION_EPSILON) {
        // Would end the loop with a residual: settle it in this payment
        principal += state.balance;
        payment += state.balance;
        state.balance = 0;
    }

    state.remaining_term -= 1;
    if (reamortize_after && state.balance > 0 && state.remaining_term > 0) {
        state = reamortize(state, in);
    }

    // Final payment overshoot: trim the overpayment first, then the installment
    if (state.balance < 0) {
        const Decimal overshoot = -state.balance;
        const Decimal from_overpayment = std::min(overshoot, overpayment);
        principal -= overshoot;
        overpayment -= from_overpayment;
        payment -= overshoot - from_overpayment;
        state.balance = 0;
    }

    PeriodStep step;
    step.entry.period_index = state.period_index;
    step.entry.month = state.month;
    step.entry.starting_balance = starting_balance;
    step.entry.payment = payment;
    step.entry.principal_component = principal;
    step.entry.interest_component = interest;
    step.entry.overpayment_amount = overpayment;
    step.entry.ending_balance = state.balance;
    step.entry.tranche_disbursed_amount = released;
    step.entry.is_holiday = false;

    step.state = advance_month(state);
    return step;
}

// Term exhausted with a balance left: one lump payment of balance + interest
PeriodStep forced_payoff(SimulationState state, const ScheduleInputs& in) {
    PeriodStep step;
    const Decimal interest = state.balance * in.rate;

    step.entry.period_index = state.period_index;
    step.entry.month = state.month;
    step.entry.starting_balance = state.balance;
    step.entry.payment = state.balance + interest;
    step.entry.principal_component = state.balance;
    step.entry.interest_component = interest;
    step.entry.ending_balance = 0;

    state.balance = 0;
    state.remaining_term = 0;
    step.state = advance_month(state);
    return step;
}

} // anonymous namespace

// ============================================================================
// Schedule Simulation
// ============================================================================

std::vector<ScheduleEntry> simulate_schedule(const LoanConfig& config) {
    config.validate();

    const ScheduleInputs in(config);
    SimulationState state = reamortize(run_pre_start_phase(in), in);
    const int max_period = 2 * config.term;

    std::vector<ScheduleEntry> entries;
    entries.reserve(static_cast<size_t>(config.term) + config.holidays.size() + 1);

    while (state.balance > TERMINATION_EPSILON || has_pending_tranche(state, in)) {
        if (state.period_index > max_period) {
            throw SimulationDivergence(state.period_index, state.balance);
        }

        const Decimal starting_balance = state.balance;
        const TrancheRelease release = release_tranche(state, in);
        state = release.state;
        if (release.released > 0 && state.remaining_term > 0) {
            state = reamortize(state, in);
        }

        const bool holiday = config.holidays.count(state.month) > 0;
        PeriodStep step = holiday
            ? holiday_period(state, in, starting_balance, release.released)
            : standard_period(state, in, starting_balance, release.released);
        entries.push_back(step.entry);
        state = step.state;

        if (!holiday && state.remaining_term <= 0 && state.balance > 0) {
            step = forced_payoff(state, in);
            entries.push_back(step.entry);
            state = step.state;
            break;
        }
    }

    return entries;
}

ScheduleResult compute_schedule(const LoanConfig& config) {
    ScheduleResult result;
    result.entries = simulate_schedule(config);
    result.summary = summarize(config, result.entries);
    return result;
}

} // namespace loancalc
