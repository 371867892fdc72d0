#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace loancalc {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

std::shared_ptr<arrow::Array> money_column(const std::vector<ScheduleEntry>& entries,
                                           Decimal ScheduleEntry::*member,
                                           const std::string& name) {
    arrow::DoubleBuilder builder;
    check(builder.Reserve(static_cast<int64_t>(entries.size())), "reserve memory for " + name + " column");
    for (const auto& entry : entries) {
        check(builder.Append(to_double(entry.*member)), "append " + name);
    }
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + name + " array");
    return array;
}

} // anonymous namespace

void ParquetWriter::write_schedule(const std::vector<ScheduleEntry>& entries, const std::string& filepath) {
    if (entries.empty()) {
        throw std::runtime_error("Schedule has no entries to write");
    }

    // Build Arrow schema
    auto schema = arrow::schema({
        arrow::field("period_index", arrow::int32()),
        arrow::field("month", arrow::utf8()),
        arrow::field("starting_balance", arrow::float64()),
        arrow::field("payment", arrow::float64()),
        arrow::field("principal_component", arrow::float64()),
        arrow::field("interest_component", arrow::float64()),
        arrow::field("overpayment_amount", arrow::float64()),
        arrow::field("ending_balance", arrow::float64()),
        arrow::field("tranche_disbursed_amount", arrow::float64()),
        arrow::field("is_holiday", arrow::boolean())
    });

    arrow::Int32Builder period_builder;
    arrow::StringBuilder month_builder;
    arrow::BooleanBuilder holiday_builder;

    const auto count = static_cast<int64_t>(entries.size());
    check(period_builder.Reserve(count), "reserve memory for period_index column");
    check(month_builder.Reserve(count), "reserve memory for month column");
    check(holiday_builder.Reserve(count), "reserve memory for is_holiday column");

    for (const auto& entry : entries) {
        check(period_builder.Append(entry.period_index), "append period_index");
        check(month_builder.Append(entry.month.to_string()), "append month");
        check(holiday_builder.Append(entry.is_holiday), "append is_holiday");
    }

    std::shared_ptr<arrow::Array> period_array;
    check(period_builder.Finish(&period_array), "finish period_index array");
    std::shared_ptr<arrow::Array> month_array;
    check(month_builder.Finish(&month_array), "finish month array");
    std::shared_ptr<arrow::Array> holiday_array;
    check(holiday_builder.Finish(&holiday_array), "finish is_holiday array");

    // Create Arrow table
    auto table = arrow::Table::Make(schema, {
        period_array,
        month_array,
        money_column(entries, &ScheduleEntry::starting_balance, "starting_balance"),
        money_column(entries, &ScheduleEntry::payment, "payment"),
        money_column(entries, &ScheduleEntry::principal_component, "principal_component"),
        money_column(entries, &ScheduleEntry::interest_component, "interest_component"),
        money_column(entries, &ScheduleEntry::overpayment_amount, "overpayment_amount"),
        money_column(entries, &ScheduleEntry::ending_balance, "ending_balance"),
        money_column(entries, &ScheduleEntry::tranche_disbursed_amount, "tranche_disbursed_amount"),
        holiday_array
    });

    // Open output file
    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

void ParquetWriter::write_schedule(const std::vector<ScheduleEntry>& /* entries */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace loancalc
