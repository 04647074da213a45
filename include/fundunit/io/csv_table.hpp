#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace fundunit::io {

// Header-addressed view of a comma separated file.
// Cells are trimmed, blank lines are skipped and double-quoted cells may
// contain commas or doubled quotes.
class CsvTable {
private:
    std::string source_;
    std::vector<std::string> header_;
    std::vector<std::vector<std::string>> rows_;
    std::vector<size_t> line_numbers_;

public:
    // Throws core::IoError if the file cannot be opened or has no header,
    // core::SchemaError if a row is ragged.
    static CsvTable read(const std::string& path);
    static CsvTable parse(std::istream& input, const std::string& source);

    static std::vector<std::string> split_line(const std::string& line);

    const std::string& source() const { return source_; }
    const std::vector<std::string>& header() const { return header_; }
    size_t row_count() const { return rows_.size(); }

    // 1-based line in the source file, for error messages
    size_t line_number(size_t row) const { return line_numbers_.at(row); }

    std::optional<size_t> column(const std::string& name) const;

    // Throws core::SchemaError listing every absent column, sorted by name.
    void require_columns(const std::vector<std::string>& names, const std::string& context) const;

    const std::string& cell(size_t row, const std::string& column_name) const;
};

} // namespace fundunit::io
