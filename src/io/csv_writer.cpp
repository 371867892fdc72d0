#include "csv_writer.hpp"
#include <fstream>
#include <stdexcept>

namespace loancalc {
namespace io {

const std::vector<std::string> SCHEDULE_COLUMNS = {
    "period_index",
    "month",
    "starting_balance",
    "payment",
    "principal_component",
    "interest_component",
    "overpayment_amount",
    "ending_balance",
    "tranche_disbursed_amount",
    "is_holiday"
};

void write_schedule_csv(std::ostream& os, const std::vector<ScheduleEntry>& entries) {
    for (size_t i = 0; i < SCHEDULE_COLUMNS.size(); ++i) {
        if (i > 0) os << ",";
        os << SCHEDULE_COLUMNS[i];
    }
    os << "\n";

    for (const auto& e : entries) {
        os << e.period_index << ","
           << e.month.to_string() << ","
           << format_decimal(e.starting_balance, 6) << ","
           << format_decimal(e.payment, 6) << ","
           << format_decimal(e.principal_component, 6) << ","
           << format_decimal(e.interest_component, 6) << ","
           << format_decimal(e.overpayment_amount, 6) << ","
           << format_decimal(e.ending_balance, 6) << ","
           << format_decimal(e.tranche_disbursed_amount, 6) << ","
           << (e.is_holiday ? "true" : "false") << "\n";
    }
}

void write_schedule_csv(const std::string& filepath, const std::vector<ScheduleEntry>& entries) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_schedule_csv(file, entries);
}

} // namespace io
} // namespace loancalc
