#ifndef LOANCALC_SUMMARY_HPP
#define LOANCALC_SUMMARY_HPP

#include "loan_config.hpp"
#include "schedule_entry.hpp"
#include <string>
#include <vector>

namespace loancalc {

// Headline metrics reduced from a schedule. The field names double as the
// stable export keys (see SUMMARY_KEYS).
struct LoanSummary {
    Decimal principal_financed;
    Decimal total_interest;        // Sum of interest_component (holidays included)
    Decimal total_overpayment;     // Sum of overpayment_amount
    Decimal total_cost;            // principal_financed + total_interest
    Decimal apr;                   // (1 + monthly rate)^12 - 1, not a regulatory APR
    int term_months;
    YearMonth original_end_date;   // start_month + term - 1
    YearMonth new_end_date;        // Month of the last entry
    int payments_made;             // Non-holiday entries with a positive payment
    Decimal max_payment;           // Largest payment + overpayment in any month

    LoanSummary();
};

// Export key order shared by every output collaborator
extern const std::vector<std::string> SUMMARY_KEYS;

LoanSummary summarize(const LoanConfig& config, const std::vector<ScheduleEntry>& entries);

// Value of one summary key rendered as text (money/rates with `places`
// fractional digits, dates as YYYY-MM, counts as integers).
// Throws std::out_of_range for an unknown key.
std::string summary_value(const LoanSummary& summary, const std::string& key, int places = 6);

} // namespace loancalc

#endif // LOANCALC_SUMMARY_HPP
