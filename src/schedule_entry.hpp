#ifndef LOANCALC_SCHEDULE_ENTRY_HPP
#define LOANCALC_SCHEDULE_ENTRY_HPP

#include "calendar.hpp"
#include "decimal.hpp"

namespace loancalc {

// One simulated month.
//
// principal_component includes any overpayment applied this month, while
// payment excludes it: for every non-holiday entry
//   payment + overpayment_amount == principal_component + interest_component
// Holiday entries carry zero payment/principal/overpayment and capitalize
// interest_component into ending_balance.
struct ScheduleEntry {
    int period_index;                   // 1-based, holidays included
    YearMonth month;
    Decimal starting_balance;           // Balance before this month's tranche
    Decimal payment;                    // Scheduled installment actually paid
    Decimal principal_component;        // Total balance reduction
    Decimal interest_component;
    Decimal overpayment_amount;         // Explicit plus automatic (target) overpayment
    Decimal ending_balance;
    Decimal tranche_disbursed_amount;
    bool is_holiday;

    ScheduleEntry();
};

} // namespace loancalc

#endif // LOANCALC_SCHEDULE_ENTRY_HPP
