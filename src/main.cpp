#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "batch.hpp"
#include "comparison.hpp"
#include "config_parser.hpp"
#include "logger.hpp"
#include "schedule.hpp"
#include "io/csv_writer.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"
#include "io/text_report.hpp"

namespace {

struct CLIArgs {
    std::string command;
    // Scenario flags in command-line order, applied on top of --config
    std::vector<std::pair<std::string, std::string>> scenario_flags;
    std::string config_path;
    std::string output_path;
    bool baseline = false;
    bool show_tranche = false;
    size_t max_rows = 120;
    // compare
    std::string scenario1;
    std::string scenario2;
    // batch
    std::string scenarios_path;
    // logging
    std::string log_level = "WARN";
    std::string log_file;
    bool log_text = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "loancalc v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " <command> [options]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  schedule                     Compute and print the payment schedule\n";
    std::cerr << "  summary                      Compute and print the summary metrics only\n";
    std::cerr << "  compare                      Compare two scenarios side by side\n";
    std::cerr << "  batch                        Evaluate every scenario of a CSV file\n\n";
    std::cerr << "Scenario options (schedule, summary):\n";
    std::cerr << "  -p, --principal <amount>     Total loan amount (500000, 500k, 1.2m)\n";
    std::cerr << "  -r, --rate <percent>         Nominal annual interest rate (3.5 = 3.5%)\n";
    std::cerr << "  -t, --term <months>          Loan term in months\n";
    std::cerr << "  --type <annuity|decreasing>  Installment type (default: annuity)\n";
    std::cerr << "  -s, --start-date <YYYY-MM>   First payment month\n";
    std::cerr << "  -d, --down-payment <amount>  Down payment\n";
    std::cerr << "  --tranche <YYYY-MM:PERCENT>  Cumulative disbursement (repeatable)\n";
    std::cerr << "  --overpayment <YYYY-MM:AMOUNT:term|installment>\n";
    std::cerr << "                               Extra principal payment (repeatable)\n";
    std::cerr << "  --holiday <YYYY-MM>          Payment holiday month (repeatable)\n";
    std::cerr << "  --monthly-overpayment <AMOUNT:term|installment>\n";
    std::cerr << "                               Same overpayment every month of the term\n";
    std::cerr << "  --constant-payment <amount>  Fixed monthly budget; slack becomes an overpayment\n";
    std::cerr << "  --config <path>              JSON scenario file (flags override its values)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>              schedule: .json, .csv or .parquet\n";
    std::cerr << "                               summary, batch: .json\n";
    std::cerr << "  --baseline                   summary: compare against paying strictly on schedule\n";
    std::cerr << "  --show-tranche               schedule: add the tranche column to the table\n";
    std::cerr << "  --max-rows <n>               schedule: rows printed to the terminal (default: 120, 0 = all)\n\n";
    std::cerr << "Compare options:\n";
    std::cerr << "  --scenario1 \"<options>\"      First scenario as a quoted option string\n";
    std::cerr << "  --scenario2 \"<options>\"      Second scenario as a quoted option string\n\n";
    std::cerr << "Batch options:\n";
    std::cerr << "  --scenarios <path>           CSV file with one scenario per row\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>          DEBUG, INFO, WARN or ERROR (default: WARN)\n";
    std::cerr << "  --log-file <path>            Also append log lines to this file\n";
    std::cerr << "  --log-text                   Plain-text log lines instead of JSON\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                       Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  " << program_name << " schedule -p 500k -r 3.5 -t 360 -s 2024-01 \\\n";
    std::cerr << "      --overpayment 2025-01:10k:term --holiday 2024-08\n\n";
    std::cerr << "  " << program_name << " compare --scenario1 \"-p 500k -r 3.5 -t 360 -s 2024-01\" \\\n";
    std::cerr << "      --scenario2 \"-p 500k -r 3.2 -t 300 -s 2024-01\"\n\n";
    std::cerr << "  " << program_name << " batch --scenarios scenarios.csv --output results.json\n";
}

bool is_scenario_flag(const std::string& arg) {
    loancalc::ScenarioOptions probe;
    return loancalc::apply_scenario_option(probe, arg, "");
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    int first = 1;
    if (argc > 1 && argv[1][0] != '-') {
        args.command = argv[1];
        first = 2;
    }

    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (is_scenario_flag(arg) && i + 1 < argc) {
            args.scenario_flags.emplace_back(arg, argv[++i]);
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--baseline") {
            args.baseline = true;
        } else if (arg == "--show-tranche") {
            args.show_tranche = true;
        } else if (arg == "--max-rows" && i + 1 < argc) {
            args.max_rows = static_cast<size_t>(std::stoul(argv[++i]));
        } else if (arg == "--scenario1" && i + 1 < argc) {
            args.scenario1 = argv[++i];
        } else if (arg == "--scenario2" && i + 1 < argc) {
            args.scenario2 = argv[++i];
        } else if (arg == "--scenarios" && i + 1 < argc) {
            args.scenarios_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else if (arg == "--log-text") {
            args.log_text = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.command != "schedule" && args.command != "summary" &&
        args.command != "compare" && args.command != "batch") {
        std::cerr << "Error: Unknown command: " << (args.command.empty() ? "(none)" : args.command) << "\n";
        return false;
    }

    if (!loancalc::parse_log_level(args.log_level)) {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    if (args.command == "compare") {
        if (args.scenario1.empty() || args.scenario2.empty()) {
            std::cerr << "Error: compare requires --scenario1 and --scenario2\n";
            valid = false;
        }
    } else if (args.command == "batch") {
        if (args.scenarios_path.empty()) {
            std::cerr << "Error: batch requires --scenarios\n";
            valid = false;
        }
    } else if (args.scenario_flags.empty() && args.config_path.empty()) {
        std::cerr << "Error: " << args.command << " requires scenario options or --config\n";
        valid = false;
    }

    return valid;
}

// Helper function to check if string ends with suffix
bool ends_with(const std::string& str, const std::string& suffix) {
    if (str.length() < suffix.length()) return false;
    return str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}

loancalc::LoanConfig load_scenario(const CLIArgs& args) {
    loancalc::ScenarioOptions options;
    if (!args.config_path.empty()) {
        options = loancalc::parse_options_from_json_file(args.config_path);
    }
    for (const auto& [flag, value] : args.scenario_flags) {
        loancalc::apply_scenario_option(options, flag, value);
    }
    return loancalc::build_config(options);
}

loancalc::ScheduleResult run_scenario(const loancalc::RunContext& ctx,
                                      const loancalc::LoanConfig& config) {
    auto& logger = loancalc::Logger::get_instance();
    logger.log_scenario_loaded(ctx, config);

    auto start = std::chrono::high_resolution_clock::now();
    loancalc::ScheduleResult result = loancalc::compute_schedule(config);
    auto end = std::chrono::high_resolution_clock::now();

    logger.log_schedule_complete(ctx, result,
        std::chrono::duration<double, std::milli>(end - start).count());
    return result;
}

int run_schedule(const CLIArgs& args) {
    const loancalc::RunContext ctx("schedule");
    const loancalc::LoanConfig config = load_scenario(args);
    const loancalc::ScheduleResult result = run_scenario(ctx, config);

    if (args.output_path.empty()) {
        loancalc::io::print_summary(std::cout, result.summary);
        if (args.max_rows > 0 && result.entries.size() > args.max_rows) {
            std::cout << "Schedule has " << result.entries.size() << " rows; showing first "
                      << args.max_rows << " rows.\n";
        }
        loancalc::io::print_schedule(std::cout, result.entries, args.max_rows, args.show_tranche);
        return 0;
    }

    if (ends_with(args.output_path, ".json")) {
        loancalc::io::write_schedule_json(args.output_path, result);
    } else if (ends_with(args.output_path, ".csv")) {
        loancalc::io::write_schedule_csv(args.output_path, result.entries);
    } else if (ends_with(args.output_path, ".parquet")) {
        loancalc::ParquetWriter::write_schedule(result.entries, args.output_path);
    } else {
        throw std::invalid_argument("Unsupported output format; use .json, .csv or .parquet");
    }
    std::cout << "Schedule exported to " << args.output_path << "\n";
    return 0;
}

int run_summary(const CLIArgs& args) {
    const loancalc::RunContext ctx("summary");
    const loancalc::LoanConfig config = load_scenario(args);
    const loancalc::ScheduleResult result = run_scenario(ctx, config);

    std::optional<loancalc::BaselineComparison> comparison;
    if (args.baseline) {
        comparison = loancalc::compare_with_baseline(config, result);
    }

    if (args.output_path.empty()) {
        loancalc::io::print_summary(std::cout, result.summary, comparison);
        return 0;
    }

    if (!ends_with(args.output_path, ".json")) {
        throw std::invalid_argument("Summary export must use .json extension");
    }
    loancalc::io::write_summary_json(args.output_path, result.summary, comparison);
    std::cout << "Summary exported to " << args.output_path << "\n";
    return 0;
}

int run_compare(const CLIArgs& args) {
    const loancalc::LoanConfig config1 =
        loancalc::build_config(loancalc::parse_scenario_options(args.scenario1));
    const loancalc::LoanConfig config2 =
        loancalc::build_config(loancalc::parse_scenario_options(args.scenario2));

    const loancalc::ScheduleResult result1 = run_scenario(loancalc::RunContext("compare", "scenario1"), config1);
    const loancalc::ScheduleResult result2 = run_scenario(loancalc::RunContext("compare", "scenario2"), config2);

    loancalc::io::print_comparison(std::cout, result1.summary, result2.summary);
    return 0;
}

int run_batch(const CLIArgs& args) {
    const loancalc::RunContext ctx("batch");
    auto& logger = loancalc::Logger::get_instance();

    const std::vector<loancalc::NamedScenario> scenarios =
        loancalc::load_scenarios_from_csv(args.scenarios_path);
    for (const auto& scenario : scenarios) {
        logger.log_scenario_loaded(loancalc::RunContext("batch", scenario.name), scenario.config);
    }

    const loancalc::BatchResult batch = loancalc::evaluate_scenarios(scenarios);
    logger.log_batch_complete(ctx, batch);

    if (!args.output_path.empty()) {
        if (!ends_with(args.output_path, ".json")) {
            throw std::invalid_argument("Batch export must use .json extension");
        }
        loancalc::io::write_batch_json(args.output_path, batch);
        std::cout << "Batch results exported to " << args.output_path << "\n";
    } else {
        loancalc::io::write_batch_json(std::cout, batch);
    }

    // Partial failure is still a failed run
    return batch.scenarios_failed > 0 ? 1 : 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    // If no arguments provided, show usage
    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    // Parse arguments
    try {
        if (!parse_args(argc, argv, args)) {
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid option value: " << e.what() << "\n";
        return 1;
    }

    // Handle help
    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    // Validate arguments
    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    loancalc::LoggerConfig log_config;
    log_config.min_level = *loancalc::parse_log_level(args.log_level);
    log_config.enable_json = !args.log_text;
    if (!args.log_file.empty()) {
        log_config.enable_file = true;
        log_config.log_file_path = args.log_file;
    }
    auto& logger = loancalc::Logger::get_instance();
    logger.configure(log_config);

    try {
        int exit_code = 0;
        if (args.command == "schedule") {
            exit_code = run_schedule(args);
        } else if (args.command == "summary") {
            exit_code = run_summary(args);
        } else if (args.command == "compare") {
            exit_code = run_compare(args);
        } else {
            exit_code = run_batch(args);
        }
        logger.flush();
        return exit_code;
    } catch (const std::exception& e) {
        logger.log_error(loancalc::RunContext(args.command), e.what());
        logger.flush();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
