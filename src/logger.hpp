/**
 * @file logger.hpp
 * @brief Structured event logging for the loancalc CLI and batch runner
 *
 * One line per event, either a JSON object or "timestamp LEVEL message k=v ...".
 * Lines go to stderr and/or an append-mode file. Every event carries the
 * command being run and, inside a batch or compare, the scenario name.
 *
 * The schedule engine itself never logs; callers log around it.
 */

#ifndef LOANCALC_LOGGER_HPP
#define LOANCALC_LOGGER_HPP

#include "batch.hpp"
#include "schedule.hpp"
#include <fstream>
#include <map>
#include <optional>
#include <string>

namespace loancalc {

enum class LogLevel {
    DEBUG,   ///< Parsed scenario configuration
    INFO,    ///< Timings and headline results
    WARN,    ///< A scenario failed inside a batch
    ERROR    ///< The command was aborted
};

std::string level_to_string(LogLevel level);

/**
 * @brief Level for an upper-case name, or nullopt if the name is unknown
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief What is being run when an event is logged
 */
struct RunContext {
    std::string command;         ///< schedule, summary, compare, batch
    std::string scenario;        ///< Empty for single-scenario commands

    RunContext() = default;

    explicit RunContext(const std::string& cmd, const std::string& name = "")
        : command(cmd), scenario(name) {}
};

struct LoggerConfig {
    LogLevel min_level = LogLevel::WARN;
    bool enable_console = true;                 ///< Write to stderr
    bool enable_file = false;
    std::string log_file_path = "loancalc.log";
    bool enable_json = true;                    ///< JSON objects rather than plain lines
};

/**
 * @brief Process-wide event logger
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::INFO;
 *   Logger::get_instance().configure(config);
 *
 *   Logger::get_instance().log_scenario_loaded(RunContext("schedule"), loan_config);
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    /**
     * @brief Replace the configuration
     *
     * Closes any open log file and opens the configured one in append mode.
     * A file that cannot be opened is reported on stderr and skipped.
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief DEBUG event with the validated inputs of one scenario
     */
    void log_scenario_loaded(const RunContext& ctx, const LoanConfig& config);

    /**
     * @brief INFO event with entry count, totals and payoff month
     *
     * @param elapsed_ms Wall time spent in compute_schedule
     */
    void log_schedule_complete(const RunContext& ctx, const ScheduleResult& result, double elapsed_ms);

    /**
     * @brief One WARN event per failed scenario, then the batch totals
     *
     * The totals are logged at WARN when any scenario failed, INFO otherwise.
     */
    void log_batch_complete(const RunContext& ctx, const BatchResult& batch);

    void log_error(const RunContext& ctx, const std::string& error_message);

    void log_warning(const RunContext& ctx, const std::string& warning_message);

    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    using Fields = std::map<std::string, std::string>;

    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LoggerConfig config_;
    std::ofstream file_;

    static Fields event_fields(const RunContext& ctx, const std::string& event);
    static std::string timestamp();

    void emit(LogLevel level, const std::string& message, Fields fields);
};

} // namespace loancalc

#endif // LOANCALC_LOGGER_HPP
