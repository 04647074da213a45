#include <fundunit/io/csv_table.hpp>
#include <fundunit/core/errors.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>

namespace fundunit::io {

namespace {

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

} // namespace

std::vector<std::string> CsvTable::split_line(const std::string& line) {
    std::vector<std::string> cells;
    std::string current;
    bool in_quotes = false;
    bool was_quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                current += c;
            }
        } else if (c == '"' && !was_quoted && trim(current).empty()) {
            current.clear();
            in_quotes = true;
            was_quoted = true;
        } else if (c == ',') {
            cells.push_back(was_quoted ? current : trim(current));
            current.clear();
            was_quoted = false;
        } else if (was_quoted && (c == ' ' || c == '\t' || c == '\r')) {
            // whitespace after a closing quote
            continue;
        } else {
            current += c;
        }
    }
    cells.push_back(was_quoted ? current : trim(current));

    return cells;
}

CsvTable CsvTable::read(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw core::IoError("Failed to open CSV file: " + path);
    }
    return parse(file, path);
}

CsvTable CsvTable::parse(std::istream& input, const std::string& source) {
    CsvTable table;
    table.source_ = source;

    std::string line;
    size_t line_num = 0;
    bool have_header = false;

    while (std::getline(input, line)) {
        line_num++;
        if (trim(line).empty()) {
            continue;
        }

        if (!have_header) {
            // Spreadsheet exports often start with a UTF-8 byte order mark
            if (line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
                line.erase(0, 3);
            }
            table.header_ = split_line(line);
            have_header = true;
            continue;
        }

        auto cells = split_line(line);
        if (cells.size() != table.header_.size()) {
            std::ostringstream msg;
            msg << source << ":" << line_num << ": expected " << table.header_.size()
                << " columns, found " << cells.size();
            throw core::SchemaError(msg.str());
        }

        table.rows_.push_back(std::move(cells));
        table.line_numbers_.push_back(line_num);
    }

    if (!have_header) {
        throw core::IoError("CSV file has no header row: " + source);
    }

    return table;
}

std::optional<size_t> CsvTable::column(const std::string& name) const {
    auto it = std::find(header_.begin(), header_.end(), name);
    if (it == header_.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - header_.begin());
}

void CsvTable::require_columns(const std::vector<std::string>& names, const std::string& context) const {
    std::vector<std::string> missing;
    for (const auto& name : names) {
        if (!column(name)) {
            missing.push_back(name);
        }
    }
    if (missing.empty()) {
        return;
    }

    std::sort(missing.begin(), missing.end());
    std::ostringstream msg;
    msg << "Missing columns in " << context << ": ";
    for (size_t i = 0; i < missing.size(); ++i) {
        if (i > 0) {
            msg << ", ";
        }
        msg << missing[i];
    }
    throw core::SchemaError(msg.str());
}

const std::string& CsvTable::cell(size_t row, const std::string& column_name) const {
    auto index = column(column_name);
    if (!index) {
        throw core::SchemaError("Missing column " + column_name + " in " + source_);
    }
    return rows_.at(row)[*index];
}

} // namespace fundunit::io
