#ifndef LOANCALC_IO_TEXT_REPORT_HPP
#define LOANCALC_IO_TEXT_REPORT_HPP

#include <optional>
#include <ostream>
#include <vector>
#include "../comparison.hpp"
#include "../schedule.hpp"

namespace loancalc {
namespace io {

// Human-readable summary block; the baseline lines are added when
// `comparison` is present
void print_summary(std::ostream& os, const LoanSummary& summary,
                   const std::optional<BaselineComparison>& comparison = std::nullopt);

// Tab-separated schedule table. Rows with every amount zero are skipped and
// at most `max_rows` rows are printed (0 prints all), followed by a line
// counting the omitted rows.
void print_schedule(std::ostream& os, const std::vector<ScheduleEntry>& entries,
                    size_t max_rows = 0, bool show_tranche = false);

// Side-by-side metrics, difference = scenario 2 - scenario 1
void print_comparison(std::ostream& os, const LoanSummary& s1, const LoanSummary& s2);

} // namespace io
} // namespace loancalc

#endif // LOANCALC_IO_TEXT_REPORT_HPP
