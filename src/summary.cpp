#include "summary.hpp"
#include "payment.hpp"
#include <stdexcept>

namespace loancalc {

const std::vector<std::string> SUMMARY_KEYS = {
    "principal_financed",
    "total_interest",
    "total_overpayment",
    "total_cost",
    "apr",
    "term_months",
    "original_end_date",
    "new_end_date",
    "payments_made",
    "max_payment"
};

LoanSummary::LoanSummary()
    : principal_financed(0),
      total_interest(0),
      total_overpayment(0),
      total_cost(0),
      apr(0),
      term_months(0),
      original_end_date(),
      new_end_date(),
      payments_made(0),
      max_payment(0) {}

LoanSummary summarize(const LoanConfig& config, const std::vector<ScheduleEntry>& entries) {
    LoanSummary summary;
    summary.principal_financed = config.financed_principal();
    summary.term_months = config.term;
    summary.original_end_date = config.nominal_end_month();
    summary.new_end_date = entries.empty() ? config.start_month : entries.back().month;
    summary.apr = effective_annual_rate(config.monthly_rate());

    for (const auto& entry : entries) {
        summary.total_interest += entry.interest_component;
        summary.total_overpayment += entry.overpayment_amount;

        if (!entry.is_holiday && entry.payment > 0) {
            ++summary.payments_made;
        }

        // Holidays have zero outflow and never set the peak
        const Decimal outflow = entry.payment + entry.overpayment_amount;
        if (outflow > summary.max_payment) {
            summary.max_payment = outflow;
        }
    }

    summary.total_cost = summary.principal_financed + summary.total_interest;
    return summary;
}

std::string summary_value(const LoanSummary& summary, const std::string& key, int places) {
    if (key == "principal_financed") return format_decimal(summary.principal_financed, places);
    if (key == "total_interest") return format_decimal(summary.total_interest, places);
    if (key == "total_overpayment") return format_decimal(summary.total_overpayment, places);
    if (key == "total_cost") return format_decimal(summary.total_cost, places);
    if (key == "apr") return format_decimal(summary.apr, places);
    if (key == "term_months") return std::to_string(summary.term_months);
    if (key == "original_end_date") return summary.original_end_date.to_string();
    if (key == "new_end_date") return summary.new_end_date.to_string();
    if (key == "payments_made") return std::to_string(summary.payments_made);
    if (key == "max_payment") return format_decimal(summary.max_payment, places);
    throw std::out_of_range("Unknown summary key: " + key);
}

} // namespace loancalc
