#include "csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace seisrisk {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter), line_number_(0) {}

std::vector<std::string> CsvReader::read_row() {
    std::string line;
    if (!std::getline(is_, line)) {
        return {};
    }
    ++line_number_;

    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    std::string stripped = trim(line);
    if (stripped.empty() || stripped[0] == '#') {
        return {};
    }
    return split(line);
}

bool CsvReader::has_more() const {
    return is_.good() && is_.peek() != EOF;
}

void CsvReader::read_header() {
    while (has_more()) {
        std::vector<std::string> row = read_row();
        if (row.empty()) continue;
        header_.clear();
        for (size_t i = 0; i < row.size(); ++i) {
            header_[row[i]] = i;
        }
        return;
    }
    throw std::runtime_error("CSV input has no header row");
}

bool CsvReader::has_column(const std::string& name) const {
    return header_.count(name) > 0;
}

size_t CsvReader::column(const std::string& name) const {
    auto it = header_.find(name);
    if (it == header_.end()) {
        throw std::runtime_error("CSV input missing required column: " + name);
    }
    return it->second;
}

std::vector<std::string> CsvReader::split(const std::string& line) const {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '"') {
            if (quoted && i + 1 < line.size() && line[i + 1] == '"') {
                cell += '"';
                ++i;
            } else {
                quoted = !quoted;
            }
        } else if (c == delimiter_ && !quoted) {
            cells.push_back(trim(cell));
            cell.clear();
        } else {
            cell += c;
        }
    }
    cells.push_back(trim(cell));
    return cells;
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

double parse_double(const std::string& cell, const std::string& column, size_t line) {
    try {
        size_t consumed = 0;
        double value = std::stod(cell, &consumed);
        if (consumed != cell.size()) {
            throw std::invalid_argument(cell);
        }
        return value;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid number '" + cell + "' in column " + column +
                                 " at line " + std::to_string(line));
    }
}

} // namespace seisrisk
