#ifndef LOANCALC_BATCH_HPP
#define LOANCALC_BATCH_HPP

#include "config_parser.hpp"
#include "schedule.hpp"
#include <istream>
#include <string>
#include <vector>

namespace loancalc {

struct NamedScenario {
    std::string name;
    LoanConfig config;
};

// Result of one scenario in a batch. Exactly one of `result` (success) or
// `error_message` (failure) is meaningful.
struct ScenarioOutcome {
    std::string name;
    bool success;
    ScheduleResult result;
    std::string error_message;

    ScenarioOutcome();
};

struct BatchResult {
    std::vector<ScenarioOutcome> outcomes;   // Same order as the input scenarios
    int scenarios_failed;
    double execution_time_ms;

    BatchResult();
};

// Evaluate every scenario independently. Scenarios share no mutable state, so
// with OpenMP they run in parallel without locking. A failing scenario (bad
// config, divergence) is recorded and does not affect the others.
BatchResult evaluate_scenarios(const std::vector<NamedScenario>& scenarios);

// Load scenarios from CSV. Header row names the columns:
//   name,principal,rate,term,type,start_date,down_payment,tranches,
//   overpayments,holidays,monthly_overpayment,constant_payment
// Only principal, rate, term and start_date are required. List cells
// (tranches, overpayments, holidays) separate items with ';'.
// Throws ParseError naming the offending line.
std::vector<NamedScenario> load_scenarios_from_csv(const std::string& filepath);
std::vector<NamedScenario> load_scenarios_from_csv(std::istream& is);

} // namespace loancalc

#endif // LOANCALC_BATCH_HPP
