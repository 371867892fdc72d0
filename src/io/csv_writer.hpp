#ifndef LOANCALC_IO_CSV_WRITER_HPP
#define LOANCALC_IO_CSV_WRITER_HPP

#include <ostream>
#include <string>
#include <vector>
#include "../schedule_entry.hpp"

namespace loancalc {
namespace io {

// Header row written by write_schedule_csv, in column order
extern const std::vector<std::string> SCHEDULE_COLUMNS;

// Write schedule entries as CSV: one header row, then one row per entry
void write_schedule_csv(std::ostream& os, const std::vector<ScheduleEntry>& entries);

void write_schedule_csv(const std::string& filepath, const std::vector<ScheduleEntry>& entries);

} // namespace io
} // namespace loancalc

#endif // LOANCALC_IO_CSV_WRITER_HPP
