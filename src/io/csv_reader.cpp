#include "csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace loancalc {
namespace io {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter), line_number_(0) {}

std::vector<std::string> CsvReader::read_row() {
    std::string line;
    while (std::getline(is_, line)) {
        ++line_number_;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!trim(line).empty()) {
            return split(line);
        }
    }
    return {};
}

bool CsvReader::has_more() {
    return is_.good() && is_.peek() != std::char_traits<char>::eof();
}

std::vector<std::string> CsvReader::split(const std::string& line) const {
    std::vector<std::string> row;
    std::string cell;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                cell += '"';
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                cell += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == delimiter_) {
            row.push_back(trim(cell));
            cell.clear();
        } else {
            cell += c;
        }
    }

    if (quoted) {
        throw std::runtime_error("Unterminated quoted cell on line " + std::to_string(line_number_));
    }
    row.push_back(trim(cell));
    return row;
}

std::string CsvReader::trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

} // namespace io
} // namespace loancalc
