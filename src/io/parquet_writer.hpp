#ifndef LOANCALC_PARQUET_WRITER_HPP
#define LOANCALC_PARQUET_WRITER_HPP

#include "../schedule_entry.hpp"
#include <string>
#include <vector>

namespace loancalc {

class ParquetWriter {
public:
    /**
     * Write a payment schedule to a Parquet file.
     *
     * Output schema:
     *   - period_index: int32
     *   - month: utf8 (YYYY-MM)
     *   - starting_balance, payment, principal_component, interest_component,
     *     overpayment_amount, ending_balance, tranche_disbursed_amount: float64
     *   - is_holiday: bool
     *
     * Money columns are converted from decimal to float64 on export only.
     *
     * @param entries Schedule entries in period order
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if the file cannot be written, or when built without Arrow
     */
    static void write_schedule(const std::vector<ScheduleEntry>& entries, const std::string& filepath);

private:
    // Apache Arrow implementation details
    struct Impl;
};

} // namespace loancalc

#endif // LOANCALC_PARQUET_WRITER_HPP
