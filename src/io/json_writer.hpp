#ifndef LOANCALC_IO_JSON_WRITER_HPP
#define LOANCALC_IO_JSON_WRITER_HPP

#include <optional>
#include <ostream>
#include <string>
#include "../batch.hpp"
#include "../comparison.hpp"
#include "../schedule.hpp"

namespace loancalc {
namespace io {

// Write a schedule result as {"summary": {...}, "schedule": [...]}
// Money and rate fields are written as numbers with 6 fractional digits,
// months as "YYYY-MM" strings.
void write_schedule_json(std::ostream& os, const ScheduleResult& result,
                         bool pretty_print = true);

// Write schedule result to JSON file
void write_schedule_json(const std::string& filepath, const ScheduleResult& result,
                         bool pretty_print = true);

// Write {"summary": {...}} with an optional "comparison" block holding the
// baseline comparison
void write_summary_json(std::ostream& os, const LoanSummary& summary,
                        const std::optional<BaselineComparison>& comparison = std::nullopt,
                        bool pretty_print = true);

void write_summary_json(const std::string& filepath, const LoanSummary& summary,
                        const std::optional<BaselineComparison>& comparison = std::nullopt,
                        bool pretty_print = true);

// Write batch outcomes: one object per scenario holding either its summary
// or its error message, followed by the failure count and execution time
void write_batch_json(std::ostream& os, const BatchResult& batch, bool pretty_print = true);

void write_batch_json(const std::string& filepath, const BatchResult& batch,
                      bool pretty_print = true);

} // namespace io
} // namespace loancalc

#endif // LOANCALC_IO_JSON_WRITER_HPP
