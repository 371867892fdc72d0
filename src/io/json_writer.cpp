#include "json_writer.hpp"
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace loancalc {
namespace io {

namespace {

constexpr int EXPORT_PLACES = 6;
// apr is a rate; money places would truncate it
constexpr int RATE_EXPORT_PLACES = 12;

struct Layout {
    std::string indent;
    std::string newline;
    std::string space;

    explicit Layout(bool pretty_print)
        : indent(pretty_print ? "  " : ""),
          newline(pretty_print ? "\n" : ""),
          space(pretty_print ? " " : "") {}
};

bool is_month_key(const std::string& key) {
    return key == "original_end_date" || key == "new_end_date";
}

std::string number(const Decimal& value) {
    return format_decimal(value, EXPORT_PLACES);
}

void write_summary_object(std::ostream& os, const LoanSummary& summary,
                          const Layout& l, const std::string& prefix) {
    os << "{" << l.newline;
    for (size_t i = 0; i < SUMMARY_KEYS.size(); ++i) {
        const std::string& key = SUMMARY_KEYS[i];
        const int places = key == "apr" ? RATE_EXPORT_PLACES : EXPORT_PLACES;
        const std::string value = summary_value(summary, key, places);
        os << prefix << l.indent << "\"" << key << "\":" << l.space;
        if (is_month_key(key)) {
            os << "\"" << value << "\"";
        } else {
            os << value;
        }
        if (i + 1 < SUMMARY_KEYS.size()) {
            os << ",";
        }
        os << l.newline;
    }
    os << prefix << "}";
}

void write_entry_object(std::ostream& os, const ScheduleEntry& e, const Layout& l,
                        const std::string& prefix) {
    const std::string field = prefix + l.indent;
    os << prefix << "{" << l.newline;
    os << field << "\"period_index\":" << l.space << e.period_index << "," << l.newline;
    os << field << "\"month\":" << l.space << "\"" << e.month.to_string() << "\"," << l.newline;
    os << field << "\"starting_balance\":" << l.space << number(e.starting_balance) << "," << l.newline;
    os << field << "\"payment\":" << l.space << number(e.payment) << "," << l.newline;
    os << field << "\"principal_component\":" << l.space << number(e.principal_component) << "," << l.newline;
    os << field << "\"interest_component\":" << l.space << number(e.interest_component) << "," << l.newline;
    os << field << "\"overpayment_amount\":" << l.space << number(e.overpayment_amount) << "," << l.newline;
    os << field << "\"ending_balance\":" << l.space << number(e.ending_balance) << "," << l.newline;
    os << field << "\"tranche_disbursed_amount\":" << l.space << number(e.tranche_disbursed_amount) << "," << l.newline;
    os << field << "\"is_holiday\":" << l.space << (e.is_holiday ? "true" : "false") << l.newline;
    os << prefix << "}";
}

// Quoted and escaped JSON string literal
std::string quoted(const std::string& text) {
    return nlohmann::json(text).dump();
}

std::ofstream open_output(const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    return file;
}

} // anonymous namespace

void write_schedule_json(std::ostream& os, const ScheduleResult& result, bool pretty_print) {
    const Layout l(pretty_print);

    os << "{" << l.newline;

    os << l.indent << "\"summary\":" << l.space;
    write_summary_object(os, result.summary, l, l.indent);
    os << "," << l.newline;

    os << l.indent << "\"schedule\":" << l.space << "[";
    if (!result.entries.empty()) {
        os << l.newline;
        for (size_t i = 0; i < result.entries.size(); ++i) {
            write_entry_object(os, result.entries[i], l, l.indent + l.indent);
            if (i + 1 < result.entries.size()) {
                os << ",";
            }
            os << l.newline;
        }
        os << l.indent;
    }
    os << "]" << l.newline;

    os << "}" << l.newline;
}

void write_schedule_json(const std::string& filepath, const ScheduleResult& result,
                         bool pretty_print) {
    std::ofstream file = open_output(filepath);
    write_schedule_json(file, result, pretty_print);
}

void write_summary_json(std::ostream& os, const LoanSummary& summary,
                        const std::optional<BaselineComparison>& comparison,
                        bool pretty_print) {
    const Layout l(pretty_print);
    const std::string field = l.indent + l.indent;

    os << "{" << l.newline;
    os << l.indent << "\"summary\":" << l.space;
    write_summary_object(os, summary, l, l.indent);

    if (comparison) {
        os << "," << l.newline;
        os << l.indent << "\"comparison\":" << l.space << "{" << l.newline;
        os << field << "\"baseline_total_interest\":" << l.space
           << number(comparison->baseline_total_interest) << "," << l.newline;
        os << field << "\"interest_saved\":" << l.space << number(comparison->interest_saved) << "," << l.newline;
        os << field << "\"total_cost_saved\":" << l.space << number(comparison->total_cost_saved) << "," << l.newline;
        os << field << "\"months_saved\":" << l.space << comparison->months_saved << l.newline;
        os << l.indent << "}";
    }

    os << l.newline << "}" << l.newline;
}

void write_summary_json(const std::string& filepath, const LoanSummary& summary,
                        const std::optional<BaselineComparison>& comparison,
                        bool pretty_print) {
    std::ofstream file = open_output(filepath);
    write_summary_json(file, summary, comparison, pretty_print);
}

void write_batch_json(std::ostream& os, const BatchResult& batch, bool pretty_print) {
    const Layout l(pretty_print);
    const std::string item = l.indent + l.indent;
    const std::string field = item + l.indent;

    os << "{" << l.newline;
    os << l.indent << "\"scenarios\":" << l.space << "[";
    if (!batch.outcomes.empty()) {
        os << l.newline;
        for (size_t i = 0; i < batch.outcomes.size(); ++i) {
            const ScenarioOutcome& outcome = batch.outcomes[i];
            os << item << "{" << l.newline;
            os << field << "\"name\":" << l.space << quoted(outcome.name) << "," << l.newline;
            os << field << "\"success\":" << l.space << (outcome.success ? "true" : "false") << "," << l.newline;
            if (outcome.success) {
                os << field << "\"summary\":" << l.space;
                write_summary_object(os, outcome.result.summary, l, field);
            } else {
                os << field << "\"error\":" << l.space << quoted(outcome.error_message);
            }
            os << l.newline << item << "}";
            if (i + 1 < batch.outcomes.size()) {
                os << ",";
            }
            os << l.newline;
        }
        os << l.indent;
    }
    os << "]," << l.newline;

    os << l.indent << "\"scenarios_failed\":" << l.space << batch.scenarios_failed << "," << l.newline;
    os << l.indent << "\"execution_time_ms\":" << l.space << std::fixed << std::setprecision(2)
       << batch.execution_time_ms << l.newline;
    os << "}" << l.newline;
}

void write_batch_json(const std::string& filepath, const BatchResult& batch, bool pretty_print) {
    std::ofstream file = open_output(filepath);
    write_batch_json(file, batch, pretty_print);
}

} // namespace io
} // namespace loancalc
