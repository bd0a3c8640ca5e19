#ifndef SEISRISK_CSV_READER_HPP
#define SEISRISK_CSV_READER_HPP

#include <istream>
#include <map>
#include <string>
#include <vector>

namespace seisrisk {

// Minimal CSV reader: trims cells, honours double-quoted cells, returns an
// empty row for blank lines and lines starting with '#'.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more() const;

    // Consumes the first non-empty row as the header
    void read_header();
    bool has_column(const std::string& name) const;
    size_t column(const std::string& name) const;

    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;
    std::map<std::string, size_t> header_;

    std::vector<std::string> split(const std::string& line) const;
    static std::string trim(const std::string& s);
};

// Parses a numeric cell with the row position in the error message
double parse_double(const std::string& cell, const std::string& column, size_t line);

} // namespace seisrisk

#endif // SEISRISK_CSV_READER_HPP
