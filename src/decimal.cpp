#include "decimal.hpp"
#include <cctype>
#include <stdexcept>

namespace loancalc {

Decimal parse_decimal(const std::string& text) {
    size_t pos = 0;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        ++pos;
    }

    size_t digits = 0;
    bool seen_point = false;
    for (; pos < text.size(); ++pos) {
        const unsigned char c = static_cast<unsigned char>(text[pos]);
        if (std::isdigit(c)) {
            ++digits;
        } else if (c == '.' && !seen_point) {
            seen_point = true;
        } else {
            throw std::invalid_argument("Invalid decimal value: '" + text + "'");
        }
    }
    if (digits == 0) {
        throw std::invalid_argument("Invalid decimal value: '" + text + "'");
    }

    return Decimal(text[0] == '+' ? text.substr(1) : text);
}

std::string format_decimal(const Decimal& value, int places) {
    std::string out = value.str(places, std::ios_base::fixed);
    if (!out.empty() && out[0] == '-' &&
        out.find_first_not_of("-0.") == std::string::npos) {
        out.erase(0, 1);
    }
    return out;
}

double to_double(const Decimal& value) {
    return value.convert_to<double>();
}

} // namespace loancalc
