#ifndef LOANCALC_CONFIG_PARSER_HPP
#define LOANCALC_CONFIG_PARSER_HPP

#include "loan_config.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace loancalc {

/**
 * @brief Exception thrown when scenario input text is malformed
 */
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raw scenario options as typed by a user
 *
 * Every value is kept as text until build_config() so that the same parsing
 * rules apply to command-line flags, compare strings, CSV cells and JSON files.
 */
struct ScenarioOptions {
    std::string principal;
    std::string rate;
    std::string term;
    std::string loan_type = "annuity";
    std::string start_date;
    std::string down_payment;
    std::vector<std::string> tranches;         ///< "YYYY-MM:PERCENT"
    std::vector<std::string> overpayments;     ///< "YYYY-MM:AMOUNT:TYPE"
    std::vector<std::string> holidays;         ///< "YYYY-MM"
    std::string monthly_overpayment;           ///< "AMOUNT:TYPE", applied every month of the term
    std::string constant_payment;              ///< Target monthly budget
};

/**
 * @brief Parses a money amount with optional k/m suffix and thousands commas
 *
 * "500000", "500k", "1.2m", "250,000" are accepted.
 *
 * @throws ParseError if the text is not a number
 */
Decimal parse_amount(const std::string& text);

/**
 * @brief Parses a percentage into a fraction
 *
 * "80", "80%" and "0.8" all yield 0.8: values above 1 are read as percent.
 *
 * @throws ParseError if the text is not a number
 */
Decimal parse_percent(const std::string& text);

/**
 * @brief Parses a YYYY-MM month, rethrowing calendar errors as ParseError
 */
YearMonth parse_month(const std::string& text);

/**
 * @brief Parses "YYYY-MM:PERCENT"
 */
Tranche parse_tranche(const std::string& text);

/**
 * @brief Parses "YYYY-MM:AMOUNT:term|installment"
 */
Overpayment parse_overpayment(const std::string& text);

LoanType parse_loan_type(const std::string& text);
OverpaymentKind parse_overpayment_kind(const std::string& text);

/**
 * @brief Expands "AMOUNT:TYPE" into one overpayment per month
 *
 * @param text Monthly overpayment as AMOUNT:TYPE
 * @param start First month receiving the overpayment
 * @param term Number of consecutive months
 */
std::vector<Overpayment> expand_monthly_overpayment(const std::string& text,
                                                    const YearMonth& start, int term);

/**
 * @brief Builds a LoanConfig from raw options
 *
 * Required: principal, rate, term, start_date. The resulting config is not
 * validated here; the engine validates before simulating.
 *
 * @throws ParseError on missing or malformed values
 */
LoanConfig build_config(const ScenarioOptions& options);

/**
 * @brief Stores one "-p 500k" style option into `options`
 *
 * Repeatable options (--tranche, --overpayment, --holiday) append.
 *
 * @return false if `option` is not a scenario option
 */
bool apply_scenario_option(ScenarioOptions& options, const std::string& option,
                           const std::string& value);

/**
 * @brief Parses a quoted option string such as "-p 500k -r 3.5 -t 360 -s 2024-01"
 *
 * Accepts the same option names as the command line. Single and double
 * quotes group words.
 *
 * @throws ParseError on unknown options, missing values or missing required options
 */
ScenarioOptions parse_scenario_options(const std::string& text);

/**
 * @brief Parses scenario options from a JSON document
 *
 * Example:
 * @code
 * {
 *   "principal": "500k", "rate": 3.5, "term": 360, "type": "annuity",
 *   "start_date": "2024-01", "down_payment": "100k",
 *   "tranches": ["2024-01:50", "2024-06:100"],
 *   "overpayments": [{"month": "2025-01", "amount": "10k", "type": "term"}],
 *   "holidays": ["2024-08"],
 *   "monthly_overpayment": "500:installment",
 *   "constant_payment": "6000"
 * }
 * @endcode
 *
 * @throws ParseError if the JSON is invalid or a field has the wrong shape
 */
ScenarioOptions parse_options_from_json_string(const std::string& json_string);

/**
 * @brief Reads and parses a JSON scenario file
 *
 * @throws ParseError if the file cannot be read or is invalid
 */
ScenarioOptions parse_options_from_json_file(const std::string& file_path);

/**
 * @brief Splits a list cell ("a;b;c", also accepting newlines) into trimmed items
 */
std::vector<std::string> split_list(const std::string& text, char separator = ';');

} // namespace loancalc

#endif // LOANCALC_CONFIG_PARSER_HPP
