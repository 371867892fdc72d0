#include "batch.hpp"
#include "io/csv_reader.hpp"
#include <chrono>
#include <fstream>
#include <map>
#include <utility>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace loancalc {

ScenarioOutcome::ScenarioOutcome() : success(false) {}

BatchResult::BatchResult() : scenarios_failed(0), execution_time_ms(0.0) {}

namespace {

ScenarioOutcome evaluate_one(const NamedScenario& scenario) {
    ScenarioOutcome outcome;
    outcome.name = scenario.name;
    try {
        outcome.result = compute_schedule(scenario.config);
        outcome.success = true;
    } catch (const std::exception& e) {
        outcome.success = false;
        outcome.error_message = e.what();
    }
    return outcome;
}

} // anonymous namespace

BatchResult evaluate_scenarios(const std::vector<NamedScenario>& scenarios) {
    BatchResult batch;
    auto start_time = std::chrono::high_resolution_clock::now();

    batch.outcomes.resize(scenarios.size());

#ifdef HAVE_OPENMP
    // Each iteration writes only its own slot
    #pragma omp parallel for schedule(dynamic, 1)
    for (long i = 0; i < static_cast<long>(scenarios.size()); ++i) {
        batch.outcomes[static_cast<size_t>(i)] = evaluate_one(scenarios[static_cast<size_t>(i)]);
    }
#else
    for (size_t i = 0; i < scenarios.size(); ++i) {
        batch.outcomes[i] = evaluate_one(scenarios[i]);
    }
#endif

    for (const auto& outcome : batch.outcomes) {
        if (!outcome.success) {
            ++batch.scenarios_failed;
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    batch.execution_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();
    return batch;
}

std::vector<NamedScenario> load_scenarios_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw ParseError("Cannot open file: " + filepath);
    }
    return load_scenarios_from_csv(file);
}

std::vector<NamedScenario> load_scenarios_from_csv(std::istream& is) {
    std::vector<NamedScenario> scenarios;
    io::CsvReader reader(is);

    const auto header = reader.read_row();
    if (header.empty()) {
        return scenarios;
    }

    std::map<std::string, size_t> columns;
    for (size_t i = 0; i < header.size(); ++i) {
        columns[header[i]] = i;
    }
    for (const char* required : {"principal", "rate", "term", "start_date"}) {
        if (columns.find(required) == columns.end()) {
            throw ParseError(std::string("Scenario CSV missing required column: ") + required);
        }
    }

    while (reader.has_more()) {
        const auto row = reader.read_row();
        if (row.empty()) {
            break;
        }

        auto cell = [&](const std::string& column) -> std::string {
            auto it = columns.find(column);
            return (it != columns.end() && it->second < row.size()) ? row[it->second] : std::string();
        };

        ScenarioOptions options;
        options.principal = cell("principal");
        options.rate = cell("rate");
        options.term = cell("term");
        if (!cell("type").empty()) {
            options.loan_type = cell("type");
        }
        options.start_date = cell("start_date");
        options.down_payment = cell("down_payment");
        options.tranches = split_list(cell("tranches"));
        options.overpayments = split_list(cell("overpayments"));
        options.holidays = split_list(cell("holidays"));
        options.monthly_overpayment = cell("monthly_overpayment");
        options.constant_payment = cell("constant_payment");

        NamedScenario scenario;
        scenario.name = cell("name").empty()
            ? "scenario_" + std::to_string(scenarios.size() + 1)
            : cell("name");
        try {
            scenario.config = build_config(options);
        } catch (const ParseError& e) {
            throw ParseError("Line " + std::to_string(reader.line_number()) + ": " + e.what());
        }
        scenarios.push_back(std::move(scenario));
    }

    return scenarios;
}

} // namespace loancalc
