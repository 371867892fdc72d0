#include "text_report.hpp"
#include <iomanip>
#include <string>

namespace loancalc {
namespace io {

namespace {

const std::string RULE(72, '-');

bool is_blank_row(const ScheduleEntry& e) {
    return e.payment == 0 && e.principal_component == 0 && e.interest_component == 0 &&
           e.overpayment_amount == 0 && e.starting_balance == 0 && e.ending_balance == 0;
}

} // anonymous namespace

void print_summary(std::ostream& os, const LoanSummary& summary,
                   const std::optional<BaselineComparison>& comparison) {
    os << "Summary\n";
    os << RULE << "\n";
    os << "Principal financed : " << format_decimal(summary.principal_financed) << "\n";
    os << "Total interest     : " << format_decimal(summary.total_interest) << "\n";
    if (summary.total_overpayment != 0) {
        os << "Total overpayment  : " << format_decimal(summary.total_overpayment) << "\n";
    }
    os << "Total cost         : " << format_decimal(summary.total_cost) << "\n";
    os << "APR (approx)       : " << format_decimal(summary.apr * 100) << "%\n";
    os << "Original end date  : " << summary.original_end_date.to_string() << "\n";
    os << "New end date       : " << summary.new_end_date.to_string() << "\n";
    os << "Payments made      : " << summary.payments_made << "\n";
    if (summary.max_payment != 0) {
        os << "Highest payment    : " << format_decimal(summary.max_payment) << "\n";
    }
    if (comparison) {
        os << "Baseline interest  : " << format_decimal(comparison->baseline_total_interest) << "\n";
        os << "Interest saved     : " << format_decimal(comparison->interest_saved) << "\n";
        os << "Total cost saved   : " << format_decimal(comparison->total_cost_saved) << "\n";
        if (comparison->months_saved != 0) {
            os << "Term reduction     : " << comparison->months_saved << " months\n";
        }
    }
    os << RULE << "\n";
}

void print_schedule(std::ostream& os, const std::vector<ScheduleEntry>& entries,
                    size_t max_rows, bool show_tranche) {
    os << "Period\tDate\tStartBal\tPayment\tPrincipal\tInterest\tOverpay\tEndBal";
    if (show_tranche) {
        os << "\tTranche";
    }
    os << "\tHoliday\n";

    size_t printed = 0;
    size_t omitted = 0;
    for (const auto& e : entries) {
        if (is_blank_row(e)) {
            continue;
        }
        if (max_rows > 0 && printed >= max_rows) {
            ++omitted;
            continue;
        }
        os << e.period_index << "\t"
           << e.month.to_string() << "\t"
           << format_decimal(e.starting_balance) << "\t"
           << format_decimal(e.payment) << "\t"
           << format_decimal(e.principal_component) << "\t"
           << format_decimal(e.interest_component) << "\t"
           << format_decimal(e.overpayment_amount) << "\t"
           << format_decimal(e.ending_balance);
        if (show_tranche) {
            os << "\t" << format_decimal(e.tranche_disbursed_amount);
        }
        os << "\t" << (e.is_holiday ? "Yes" : "No") << "\n";
        ++printed;
    }

    if (omitted > 0) {
        os << "... " << omitted << " more rows (use --output or --max-rows to see all)\n";
    }
}

void print_comparison(std::ostream& os, const LoanSummary& s1, const LoanSummary& s2) {
    const std::string rule(72, '=');
    os << "Comparison\n";
    os << rule << "\n";
    os << std::left << std::setw(20) << "Metric" << std::right
       << " " << std::setw(15) << "Scenario1"
       << " " << std::setw(15) << "Scenario2"
       << " " << std::setw(15) << "Difference" << "\n";
    for (const auto& row : compare_summaries(s1, s2)) {
        os << std::left << std::setw(20) << row.metric << std::right
           << " " << std::setw(15) << format_decimal(row.scenario1)
           << " " << std::setw(15) << format_decimal(row.scenario2)
           << " " << std::setw(15) << format_decimal(row.difference) << "\n";
    }
    os << rule << "\n";
}

} // namespace io
} // namespace loancalc
