#include "config_parser.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace loancalc {

namespace {

std::string trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

std::vector<std::string> split_fields(const std::string& text, char separator) {
    std::vector<std::string> fields;
    std::stringstream ss(text);
    std::string field;
    while (std::getline(ss, field, separator)) {
        fields.push_back(trim(field));
    }
    return fields;
}

int parse_term(const std::string& text) {
    const std::string value = trim(text);
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) {
            return std::isdigit(c);
        })) {
        throw ParseError("Invalid term: '" + text + "'");
    }
    try {
        return std::stoi(value);
    } catch (const std::out_of_range&) {
        throw ParseError("Term out of range: '" + text + "'");
    }
}

// JSON scalars may be given either as strings or as numbers
std::string scalar_to_string(const json& value, const std::string& field) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    if (value.is_number()) {
        // dump() keeps the shortest round-trip representation (3.5 -> "3.5")
        return value.dump();
    }
    throw ParseError("Field '" + field + "' must be a string or number");
}

std::vector<std::string> string_list(const json& value, const std::string& field) {
    std::vector<std::string> items;
    if (!value.is_array()) {
        throw ParseError("Field '" + field + "' must be an array");
    }
    for (const auto& item : value) {
        items.push_back(scalar_to_string(item, field));
    }
    return items;
}

} // anonymous namespace

Decimal parse_amount(const std::string& text) {
    std::string value = to_lower(trim(text));
    value.erase(std::remove(value.begin(), value.end(), ','), value.end());

    Decimal factor(1);
    if (!value.empty() && value.back() == 'k') {
        factor = 1000;
        value.pop_back();
    } else if (!value.empty() && value.back() == 'm') {
        factor = 1000000;
        value.pop_back();
    }

    try {
        return parse_decimal(value) * factor;
    } catch (const std::invalid_argument&) {
        throw ParseError("Invalid amount: '" + text + "'");
    }
}

Decimal parse_percent(const std::string& text) {
    std::string value = trim(text);
    if (!value.empty() && value.back() == '%') {
        value.pop_back();
    }

    Decimal percent;
    try {
        percent = parse_decimal(trim(value));
    } catch (const std::invalid_argument&) {
        throw ParseError("Invalid percentage: '" + text + "'");
    }
    if (percent > 1) {
        percent /= 100;
    }
    return percent;
}

YearMonth parse_month(const std::string& text) {
    try {
        return parse_year_month(trim(text));
    } catch (const std::invalid_argument& e) {
        throw ParseError(e.what());
    }
}

Tranche parse_tranche(const std::string& text) {
    const auto parts = split_fields(text, ':');
    if (parts.size() != 2) {
        throw ParseError("Tranche must be in YYYY-MM:PERCENT format; got " + text);
    }
    return Tranche{parse_month(parts[0]), parse_percent(parts[1])};
}

LoanType parse_loan_type(const std::string& text) {
    const std::string value = to_lower(trim(text));
    if (value == "annuity") return LoanType::Annuity;
    if (value == "decreasing") return LoanType::Decreasing;
    throw ParseError("Loan type must be 'annuity' or 'decreasing'; got " + text);
}

OverpaymentKind parse_overpayment_kind(const std::string& text) {
    const std::string value = to_lower(trim(text));
    if (value == "term") return OverpaymentKind::Term;
    if (value == "installment") return OverpaymentKind::Installment;
    throw ParseError("Overpayment type must be 'term' or 'installment'; got " + text);
}

Overpayment parse_overpayment(const std::string& text) {
    const auto parts = split_fields(text, ':');
    if (parts.size() != 3) {
        throw ParseError("Overpayment must be in YYYY-MM:AMOUNT:TYPE format; got " + text);
    }
    return Overpayment{parse_month(parts[0]), parse_amount(parts[1]),
                       parse_overpayment_kind(parts[2])};
}

std::vector<Overpayment> expand_monthly_overpayment(const std::string& text,
                                                    const YearMonth& start, int term) {
    const auto parts = split_fields(text, ':');
    if (parts.size() != 2) {
        throw ParseError("Monthly overpayment must be in AMOUNT:TYPE format, e.g. '500:term'; got " + text);
    }
    if (term > MAX_TERM_MONTHS) {
        throw ParseError("Monthly overpayment cannot span a term of " + std::to_string(term) +
                         " months (maximum " + std::to_string(MAX_TERM_MONTHS) + ")");
    }
    const Decimal amount = parse_amount(parts[0]);
    const OverpaymentKind kind = parse_overpayment_kind(parts[1]);

    std::vector<Overpayment> overpayments;
    overpayments.reserve(term > 0 ? static_cast<size_t>(term) : 0);
    for (int i = 0; i < term; ++i) {
        overpayments.push_back(Overpayment{add_months(start, i), amount, kind});
    }
    return overpayments;
}

LoanConfig build_config(const ScenarioOptions& options) {
    if (trim(options.principal).empty()) throw ParseError("Missing required option: principal");
    if (trim(options.rate).empty()) throw ParseError("Missing required option: rate");
    if (trim(options.term).empty()) throw ParseError("Missing required option: term");
    if (trim(options.start_date).empty()) throw ParseError("Missing required option: start_date");

    LoanConfig config;
    config.principal = parse_amount(options.principal);
    config.down_payment = trim(options.down_payment).empty() ? Decimal(0)
                                                             : parse_amount(options.down_payment);
    try {
        config.rate = parse_decimal(trim(options.rate));
    } catch (const std::invalid_argument&) {
        throw ParseError("Invalid rate: '" + options.rate + "'");
    }
    config.term = parse_term(options.term);
    config.start_month = parse_month(options.start_date);
    config.loan_type = parse_loan_type(options.loan_type.empty() ? "annuity" : options.loan_type);

    for (const auto& tranche : options.tranches) {
        config.tranches.push_back(parse_tranche(tranche));
    }
    for (const auto& overpayment : options.overpayments) {
        config.overpayments.push_back(parse_overpayment(overpayment));
    }
    for (const auto& holiday : options.holidays) {
        config.holidays.insert(parse_month(holiday));
    }
    if (!trim(options.monthly_overpayment).empty()) {
        auto monthly = expand_monthly_overpayment(options.monthly_overpayment,
                                                  config.start_month, config.term);
        config.overpayments.insert(config.overpayments.end(), monthly.begin(), monthly.end());
    }
    if (!trim(options.constant_payment).empty()) {
        config.target_payment = parse_amount(options.constant_payment);
    }

    return config;
}

bool apply_scenario_option(ScenarioOptions& options, const std::string& option,
                           const std::string& value) {
    if (option == "-p" || option == "--principal") {
        options.principal = value;
    } else if (option == "-r" || option == "--rate") {
        options.rate = value;
    } else if (option == "-t" || option == "--term") {
        options.term = value;
    } else if (option == "--type") {
        options.loan_type = value;
    } else if (option == "-s" || option == "--start-date") {
        options.start_date = value;
    } else if (option == "-d" || option == "--down-payment") {
        options.down_payment = value;
    } else if (option == "--tranche") {
        options.tranches.push_back(value);
    } else if (option == "--overpayment") {
        options.overpayments.push_back(value);
    } else if (option == "--holiday") {
        options.holidays.push_back(value);
    } else if (option == "--monthly-overpayment") {
        options.monthly_overpayment = value;
    } else if (option == "--constant-payment") {
        options.constant_payment = value;
    } else {
        return false;
    }
    return true;
}

ScenarioOptions parse_scenario_options(const std::string& text) {
    // Tokenize, honouring simple quoting
    std::vector<std::string> tokens;
    std::string current;
    bool in_token = false;
    char quote = '\0';
    for (char c : text) {
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            } else {
                current += c;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
            in_token = true;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_token) {
                tokens.push_back(current);
                current.clear();
                in_token = false;
            }
        } else {
            current += c;
            in_token = true;
        }
    }
    if (quote != '\0') {
        throw ParseError("Unterminated quote in scenario: " + text);
    }
    if (in_token) {
        tokens.push_back(current);
    }

    ScenarioOptions options;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];
        if (i + 1 >= tokens.size()) {
            throw ParseError("Missing value for option in scenario: " + token);
        }
        const std::string& value = tokens[++i];

        if (!apply_scenario_option(options, token, value)) {
            throw ParseError("Unknown option in scenario: " + token);
        }
    }

    const std::pair<const std::string*, const char*> required[] = {
        {&options.principal, "principal"},
        {&options.rate, "rate"},
        {&options.term, "term"},
        {&options.start_date, "start_date"}
    };
    for (const auto& [value, name] : required) {
        if (value->empty()) {
            throw ParseError(std::string("Scenario missing required option ") + name);
        }
    }
    return options;
}

ScenarioOptions parse_options_from_json_string(const std::string& json_string) {
    ScenarioOptions options;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ParseError("Scenario config must be a JSON object");
        }

        if (j.contains("principal")) options.principal = scalar_to_string(j["principal"], "principal");
        if (j.contains("rate")) options.rate = scalar_to_string(j["rate"], "rate");
        if (j.contains("term")) options.term = scalar_to_string(j["term"], "term");
        if (j.contains("type")) options.loan_type = scalar_to_string(j["type"], "type");
        if (j.contains("start_date")) options.start_date = scalar_to_string(j["start_date"], "start_date");
        if (j.contains("down_payment")) {
            options.down_payment = scalar_to_string(j["down_payment"], "down_payment");
        }
        if (j.contains("tranches")) {
            if (!j["tranches"].is_array()) {
                throw ParseError("Field 'tranches' must be an array");
            }
            for (const auto& item : j["tranches"]) {
                if (item.is_object()) {
                    if (!item.contains("month") || !item.contains("percent")) {
                        throw ParseError("Tranche object requires 'month' and 'percent'");
                    }
                    options.tranches.push_back(scalar_to_string(item["month"], "tranches.month") + ":" +
                                               scalar_to_string(item["percent"], "tranches.percent"));
                } else {
                    options.tranches.push_back(scalar_to_string(item, "tranches"));
                }
            }
        }
        if (j.contains("overpayments")) {
            if (!j["overpayments"].is_array()) {
                throw ParseError("Field 'overpayments' must be an array");
            }
            for (const auto& item : j["overpayments"]) {
                if (item.is_object()) {
                    if (!item.contains("month") || !item.contains("amount")) {
                        throw ParseError("Overpayment object requires 'month' and 'amount'");
                    }
                    const std::string kind = item.contains("type")
                        ? scalar_to_string(item["type"], "overpayments.type")
                        : "term";
                    options.overpayments.push_back(
                        scalar_to_string(item["month"], "overpayments.month") + ":" +
                        scalar_to_string(item["amount"], "overpayments.amount") + ":" + kind);
                } else {
                    options.overpayments.push_back(scalar_to_string(item, "overpayments"));
                }
            }
        }
        if (j.contains("holidays")) {
            options.holidays = string_list(j["holidays"], "holidays");
        }
        if (j.contains("monthly_overpayment")) {
            options.monthly_overpayment = scalar_to_string(j["monthly_overpayment"], "monthly_overpayment");
        }
        if (j.contains("constant_payment")) {
            options.constant_payment = scalar_to_string(j["constant_payment"], "constant_payment");
        }
    } catch (const json::exception& e) {
        throw ParseError("Failed to parse scenario JSON: " + std::string(e.what()));
    }

    return options;
}

ScenarioOptions parse_options_from_json_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ParseError("Failed to open scenario config: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_options_from_json_string(buffer.str());
}

std::vector<std::string> split_list(const std::string& text, char separator) {
    std::string normalized = text;
    std::replace(normalized.begin(), normalized.end(), '\n', separator);

    std::vector<std::string> items;
    for (const auto& item : split_fields(normalized, separator)) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

} // namespace loancalc
