#include "comparison.hpp"

namespace loancalc {

BaselineComparison::BaselineComparison()
    : baseline_total_interest(0),
      interest_saved(0),
      total_cost_saved(0),
      months_saved(0) {}

BaselineComparison compare_with_baseline(const LoanConfig& config, const ScheduleResult& result) {
    LoanConfig baseline_config = config;
    baseline_config.overpayments.clear();
    baseline_config.target_payment.reset();

    const ScheduleResult baseline = compute_schedule(baseline_config);

    BaselineComparison comparison;
    comparison.baseline_total_interest = baseline.summary.total_interest;
    comparison.interest_saved = baseline.summary.total_interest - result.summary.total_interest;
    comparison.total_cost_saved = baseline.summary.total_cost - result.summary.total_cost;
    comparison.months_saved =
        static_cast<int>(baseline.entries.size()) - static_cast<int>(result.entries.size());
    return comparison;
}

std::vector<MetricDifference> compare_summaries(const LoanSummary& s1, const LoanSummary& s2) {
    std::vector<MetricDifference> rows;
    rows.push_back({"total_cost", s1.total_cost, s2.total_cost, s2.total_cost - s1.total_cost});
    rows.push_back({"total_interest", s1.total_interest, s2.total_interest,
                    s2.total_interest - s1.total_interest});
    rows.push_back({"payments_made", Decimal(s1.payments_made), Decimal(s2.payments_made),
                    Decimal(s2.payments_made - s1.payments_made)});
    return rows;
}

} // namespace loancalc
