#ifndef LOANCALC_IO_CSV_READER_HPP
#define LOANCALC_IO_CSV_READER_HPP

#include <istream>
#include <string>
#include <vector>

namespace loancalc {
namespace io {

// Line-oriented CSV reader. Cells are trimmed; a cell wrapped in double quotes
// may contain the delimiter, and "" inside quotes is a literal quote.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    // Next non-blank row, or an empty vector at end of input
    std::vector<std::string> read_row();
    bool has_more();

    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    std::vector<std::string> split(const std::string& line) const;
    static std::string trim(const std::string& s);
};

} // namespace io
} // namespace loancalc

#endif // LOANCALC_IO_CSV_READER_HPP
