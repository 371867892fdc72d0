#include "logger.hpp"
#include <array>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <nlohmann/json.hpp>
#include <utility>

namespace loancalc {

namespace {

constexpr std::array<const char*, 4> LEVEL_NAMES = {"DEBUG", "INFO", "WARN", "ERROR"};

} // anonymous namespace

std::string level_to_string(LogLevel level) {
    return LEVEL_NAMES[static_cast<size_t>(level)];
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    for (size_t i = 0; i < LEVEL_NAMES.size(); ++i) {
        if (name == LEVEL_NAMES[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    return std::nullopt;
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::configure(const LoggerConfig& config) {
    if (file_.is_open()) {
        file_.close();
    }
    config_ = config;

    if (config_.enable_file) {
        file_.open(config_.log_file_path, std::ios::out | std::ios::app);
        if (!file_) {
            std::cerr << "Warning: cannot open log file " << config_.log_file_path
                      << "; logging to file disabled\n";
            file_.clear();
        }
    }
}

void Logger::log_scenario_loaded(const RunContext& ctx, const LoanConfig& config) {
    Fields fields = event_fields(ctx, "scenario_loaded");
    fields["principal"] = format_decimal(config.principal);
    fields["down_payment"] = format_decimal(config.down_payment);
    fields["rate"] = format_decimal(config.rate, 4);
    fields["term"] = std::to_string(config.term);
    fields["start_month"] = config.start_month.to_string();
    fields["loan_type"] = to_string(config.loan_type);
    fields["tranches"] = std::to_string(config.tranches.size());
    fields["overpayments"] = std::to_string(config.overpayments.size());
    fields["holidays"] = std::to_string(config.holidays.size());
    fields["target_payment"] = config.target_payment ? format_decimal(*config.target_payment) : "none";

    emit(LogLevel::DEBUG, "Scenario loaded", std::move(fields));
}

void Logger::log_schedule_complete(const RunContext& ctx, const ScheduleResult& result, double elapsed_ms) {
    Fields fields = event_fields(ctx, "schedule_complete");
    fields["entries"] = std::to_string(result.entries.size());
    fields["total_interest"] = format_decimal(result.summary.total_interest);
    fields["total_cost"] = format_decimal(result.summary.total_cost);
    fields["new_end_date"] = result.summary.new_end_date.to_string();
    fields["elapsed_ms"] = std::to_string(elapsed_ms);

    emit(LogLevel::INFO, "Schedule computed", std::move(fields));
}

void Logger::log_batch_complete(const RunContext& ctx, const BatchResult& batch) {
    for (const auto& outcome : batch.outcomes) {
        if (!outcome.success) {
            log_warning(RunContext(ctx.command, outcome.name), outcome.error_message);
        }
    }

    Fields fields = event_fields(ctx, "batch_complete");
    fields["scenarios"] = std::to_string(batch.outcomes.size());
    fields["scenarios_failed"] = std::to_string(batch.scenarios_failed);
    fields["execution_time_ms"] = std::to_string(batch.execution_time_ms);

    emit(batch.scenarios_failed > 0 ? LogLevel::WARN : LogLevel::INFO, "Batch completed", std::move(fields));
}

void Logger::log_error(const RunContext& ctx, const std::string& error_message) {
    Fields fields = event_fields(ctx, "error");
    fields["error_message"] = error_message;
    emit(LogLevel::ERROR, "Command failed", std::move(fields));
}

void Logger::log_warning(const RunContext& ctx, const std::string& warning_message) {
    emit(LogLevel::WARN, warning_message, event_fields(ctx, "warning"));
}

void Logger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_.is_open()) {
        file_.flush();
    }
}

Logger::Fields Logger::event_fields(const RunContext& ctx, const std::string& event) {
    Fields fields{{"event", event}, {"command", ctx.command}};
    if (!ctx.scenario.empty()) {
        fields["scenario"] = ctx.scenario;
    }
    return fields;
}

// UTC, ISO 8601 with milliseconds
std::string Logger::timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buf[32];
    const size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
    char out[40];
    std::snprintf(out, sizeof(out), "%.*s.%03dZ", static_cast<int>(len), buf, static_cast<int>(millis));
    return out;
}

void Logger::emit(LogLevel level, const std::string& message, Fields fields) {
    if (level < config_.min_level) {
        return;
    }

    std::string line;
    if (config_.enable_json) {
        nlohmann::json record(fields);
        record["timestamp"] = timestamp();
        record["level"] = level_to_string(level);
        record["message"] = message;
        // User input may carry invalid UTF-8; replace it rather than throw
        line = record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } else {
        line = timestamp() + " " + level_to_string(level) + " " + message;
        for (const auto& [key, value] : fields) {
            line += " " + key + "=" + value;
        }
    }

    if (config_.enable_console) {
        std::cerr << line << '\n';
    }
    if (file_.is_open()) {
        file_ << line << '\n';
    }
}

} // namespace loancalc
