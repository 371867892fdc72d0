#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include "batch.hpp"
#include "comparison.hpp"
#include "io/csv_writer.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"
#include "io/text_report.hpp"

using namespace loancalc;
using Catch::Approx;
using json = nlohmann::json;

namespace {

LoanConfig holiday_loan() {
    LoanConfig config;
    config.principal = Decimal(100000);
    config.rate = Decimal(6);
    config.term = 12;
    config.start_month = YearMonth(2024, 1);
    config.holidays.insert(YearMonth(2024, 3));
    return config;
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

} // anonymous namespace

// ============================================================================
// JSON
// ============================================================================

TEST_CASE("Schedule JSON export", "[io][json]") {
    const ScheduleResult result = compute_schedule(holiday_loan());

    std::ostringstream oss;
    io::write_schedule_json(oss, result);
    const json doc = json::parse(oss.str());

    REQUIRE(doc.contains("summary"));
    REQUIRE(doc.contains("schedule"));

    SECTION("Summary carries every export key") {
        const json& summary = doc["summary"];
        REQUIRE(summary.size() == SUMMARY_KEYS.size());
        for (const auto& key : SUMMARY_KEYS) {
            REQUIRE(summary.contains(key));
        }
        REQUIRE(summary["original_end_date"] == "2024-12");
        REQUIRE(summary["new_end_date"] == "2025-01");
        REQUIRE(summary["term_months"] == 12);
        REQUIRE(summary["payments_made"] == 12);
        REQUIRE(summary["principal_financed"].get<double>() == Approx(100000.0));
        REQUIRE(summary["apr"].get<double>() == Approx(0.0616778118645).margin(1e-12));
    }

    SECTION("One object per entry with the entry fields") {
        const json& schedule = doc["schedule"];
        REQUIRE(schedule.size() == result.entries.size());

        const json& holiday = schedule[2];
        REQUIRE(holiday["period_index"] == 3);
        REQUIRE(holiday["month"] == "2024-03");
        REQUIRE(holiday["is_holiday"] == true);
        REQUIRE(holiday["payment"].get<double>() == 0.0);
        REQUIRE(holiday["interest_component"].get<double>() ==
                Approx(to_double(result.entries[2].interest_component)).margin(1e-6));

        for (const auto& key : io::SCHEDULE_COLUMNS) {
            REQUIRE(schedule[0].contains(key));
        }
    }

    SECTION("Compact output is equivalent") {
        std::ostringstream compact;
        io::write_schedule_json(compact, result, false);
        REQUIRE(compact.str().find('\n') == std::string::npos);
        REQUIRE(json::parse(compact.str()) == doc);
    }
}

TEST_CASE("Summary JSON export", "[io][json]") {
    LoanConfig config = holiday_loan();
    config.overpayments.push_back(Overpayment{YearMonth(2024, 6), Decimal(20000), OverpaymentKind::Term});
    const ScheduleResult result = compute_schedule(config);

    SECTION("Without comparison") {
        std::ostringstream oss;
        io::write_summary_json(oss, result.summary);
        const json doc = json::parse(oss.str());
        REQUIRE(doc.size() == 1);
        REQUIRE(doc["summary"]["total_overpayment"].get<double>() == Approx(20000.0));
    }

    SECTION("With baseline comparison") {
        std::ostringstream oss;
        io::write_summary_json(oss, result.summary, compare_with_baseline(config, result));
        const json doc = json::parse(oss.str());
        REQUIRE(doc.contains("comparison"));
        REQUIRE(doc["comparison"]["months_saved"].get<int>() > 0);
        REQUIRE(doc["comparison"]["interest_saved"].get<double>() > 0.0);
    }

    SECTION("Unwritable path") {
        REQUIRE_THROWS_AS(io::write_summary_json("/nonexistent/dir/summary.json", result.summary),
                          std::runtime_error);
    }
}

TEST_CASE("Batch JSON export", "[io][json]") {
    std::vector<NamedScenario> scenarios(2);
    scenarios[0].name = "ok \"quoted\"";
    scenarios[0].config = holiday_loan();
    scenarios[1].name = "broken";
    scenarios[1].config = holiday_loan();
    scenarios[1].config.term = 0;

    const BatchResult batch = evaluate_scenarios(scenarios);

    std::ostringstream oss;
    io::write_batch_json(oss, batch);
    const json doc = json::parse(oss.str());

    REQUIRE(doc["scenarios"].size() == 2);
    REQUIRE(doc["scenarios"][0]["name"] == "ok \"quoted\"");
    REQUIRE(doc["scenarios"][0]["success"] == true);
    REQUIRE(doc["scenarios"][0]["summary"]["new_end_date"] == "2025-01");
    REQUIRE(doc["scenarios"][1]["success"] == false);
    REQUIRE(doc["scenarios"][1].contains("error"));
    REQUIRE(doc["scenarios_failed"] == 1);
}

// ============================================================================
// CSV
// ============================================================================

TEST_CASE("Schedule CSV export", "[io][csv]") {
    const ScheduleResult result = compute_schedule(holiday_loan());

    std::ostringstream oss;
    io::write_schedule_csv(oss, result.entries);

    std::istringstream lines(oss.str());
    std::string line;
    std::getline(lines, line);
    REQUIRE(line == "period_index,month,starting_balance,payment,principal_component,"
                    "interest_component,overpayment_amount,ending_balance,"
                    "tranche_disbursed_amount,is_holiday");

    std::getline(lines, line);
    REQUIRE(line.rfind("1,2024-01,100000.000000,", 0) == 0);
    REQUIRE(line.substr(line.size() - 6) == ",false");

    size_t rows = 1;
    while (std::getline(lines, line)) {
        if (rows == 2) {
            REQUIRE(line.rfind("3,2024-03,", 0) == 0);
            REQUIRE(line.substr(line.size() - 5) == ",true");
        }
        ++rows;
    }
    REQUIRE(rows == result.entries.size());

    SECTION("File output") {
        const std::string path = "/tmp/loancalc_test_schedule.csv";
        io::write_schedule_csv(path, result.entries);
        REQUIRE(file_exists(path));
        std::remove(path.c_str());
    }
}

// ============================================================================
// Parquet
// ============================================================================

TEST_CASE("Schedule Parquet export", "[io][parquet]") {
    const ScheduleResult result = compute_schedule(holiday_loan());
    const std::string path = "/tmp/loancalc_test_schedule.parquet";

#ifdef HAVE_ARROW
    ParquetWriter::write_schedule(result.entries, path);
    REQUIRE(file_exists(path));
    std::remove(path.c_str());

    REQUIRE_THROWS_AS(ParquetWriter::write_schedule({}, path), std::runtime_error);
#else
    REQUIRE_THROWS_AS(ParquetWriter::write_schedule(result.entries, path), std::runtime_error);
#endif
}

// ============================================================================
// Text Report
// ============================================================================

TEST_CASE("Text summary", "[io][text]") {
    const ScheduleResult result = compute_schedule(holiday_loan());

    std::ostringstream oss;
    io::print_summary(oss, result.summary);
    const std::string text = oss.str();

    REQUIRE(text.find("Principal financed : 100000.00") != std::string::npos);
    REQUIRE(text.find("APR (approx)       : 6.17%") != std::string::npos);
    REQUIRE(text.find("New end date       : 2025-01") != std::string::npos);
    REQUIRE(text.find("Payments made      : 12") != std::string::npos);
    REQUIRE(text.find("Total overpayment") == std::string::npos);
    REQUIRE(text.find("Interest saved") == std::string::npos);

    SECTION("Baseline lines") {
        LoanConfig config = holiday_loan();
        config.overpayments.push_back(Overpayment{YearMonth(2024, 6), Decimal(20000), OverpaymentKind::Term});
        const ScheduleResult with_overpayment = compute_schedule(config);

        std::ostringstream out;
        io::print_summary(out, with_overpayment.summary, compare_with_baseline(config, with_overpayment));
        REQUIRE(out.str().find("Total overpayment  : 20000.00") != std::string::npos);
        REQUIRE(out.str().find("Interest saved") != std::string::npos);
        REQUIRE(out.str().find("Term reduction") != std::string::npos);
    }
}

TEST_CASE("Text schedule", "[io][text]") {
    const ScheduleResult result = compute_schedule(holiday_loan());

    SECTION("All rows") {
        std::ostringstream oss;
        io::print_schedule(oss, result.entries);
        const std::string text = oss.str();
        REQUIRE(text.rfind("Period\tDate\tStartBal", 0) == 0);
        REQUIRE(text.find("\tTranche") == std::string::npos);
        REQUIRE(text.find("3\t2024-03\t") != std::string::npos);
        REQUIRE(text.find("\tYes\n") != std::string::npos);
        REQUIRE(text.find("more rows") == std::string::npos);
    }

    SECTION("Row limit") {
        std::ostringstream oss;
        io::print_schedule(oss, result.entries, 5, true);
        const std::string text = oss.str();
        REQUIRE(text.find("\tTranche") != std::string::npos);
        REQUIRE(text.find("6\t2024-06") == std::string::npos);
        REQUIRE(text.find("... 8 more rows") != std::string::npos);
    }

    SECTION("Blank rows are skipped") {
        std::vector<ScheduleEntry> entries(2);
        entries[1].period_index = 2;
        entries[1].month = YearMonth(2024, 2);
        entries[1].starting_balance = Decimal(10);
        entries[1].ending_balance = Decimal(10);

        std::ostringstream oss;
        io::print_schedule(oss, entries);
        REQUIRE(oss.str().find("\n0\t") == std::string::npos);
        REQUIRE(oss.str().find("\n2\t2024-02") != std::string::npos);
    }
}

TEST_CASE("Text comparison", "[io][text]") {
    LoanConfig cheaper = holiday_loan();
    cheaper.rate = Decimal(3);

    std::ostringstream oss;
    io::print_comparison(oss, compute_schedule(holiday_loan()).summary, compute_schedule(cheaper).summary);
    const std::string text = oss.str();

    REQUIRE(text.find("Comparison") == 0);
    REQUIRE(text.find("Scenario1") != std::string::npos);
    REQUIRE(text.find("total_cost") != std::string::npos);
    REQUIRE(text.find("total_interest") != std::string::npos);
    REQUIRE(text.find("payments_made") != std::string::npos);
    REQUIRE(text.find("Difference") != std::string::npos);
}
