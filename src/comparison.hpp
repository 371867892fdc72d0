#ifndef LOANCALC_COMPARISON_HPP
#define LOANCALC_COMPARISON_HPP

#include "schedule.hpp"
#include <string>
#include <vector>

namespace loancalc {

// Effect of overpayments and target payment against the same loan paid
// strictly on schedule
struct BaselineComparison {
    Decimal baseline_total_interest;
    Decimal interest_saved;        // baseline - actual
    Decimal total_cost_saved;      // baseline - actual
    int months_saved;              // baseline entries - actual entries

    BaselineComparison();
};

// Re-run `config` without overpayments and without target_payment and
// compare against `result` (which must come from `config`)
BaselineComparison compare_with_baseline(const LoanConfig& config, const ScheduleResult& result);

// One metric of a side-by-side comparison; difference = scenario2 - scenario1,
// so a negative difference means scenario 2 is cheaper or shorter
struct MetricDifference {
    std::string metric;
    Decimal scenario1;
    Decimal scenario2;
    Decimal difference;
};

// Rows for total_cost, total_interest and payments_made
std::vector<MetricDifference> compare_summaries(const LoanSummary& s1, const LoanSummary& s2);

} // namespace loancalc

#endif // LOANCALC_COMPARISON_HPP
