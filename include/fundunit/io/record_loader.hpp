#pragma once
#include <string>
#include <vector>
#include <fundunit/core/nav_quotes.hpp>
#include <fundunit/core/transaction.hpp>
#include <fundunit/nav/nav_aggregator.hpp>

namespace fundunit::io {

class CsvTable;

// Decodes the administrator's CSV inputs into typed records.
// Every failure throws: core::IoError for file access, core::SchemaError for
// missing columns or cells that do not decode.
class RecordLoader {
public:
    // Date, Investor, Type, Amount_Base. Type is kept verbatim; the engine
    // decides whether it is a recognised kind.
    static std::vector<core::Transaction> load_transactions(const std::string& path);
    static std::vector<core::Transaction> transactions_from(const CsvTable& table);

    // Instrument, Quantity, Price, Base_CCY, FX_to_Base
    static std::vector<nav::Holding> load_positions(const std::string& path);
    static std::vector<nav::Holding> positions_from(const CsvTable& table);

    // Liability, Amount, Base_CCY
    static std::vector<nav::Liability> load_liabilities(const std::string& path);
    static std::vector<nav::Liability> liabilities_from(const CsvTable& table);

    // Date, NAV_Per_Unit. A date listed twice is rejected.
    static core::NavQuotes load_nav_quotes(const std::string& path);
    static core::NavQuotes nav_quotes_from(const CsvTable& table);

    static double parse_number(const std::string& text, const CsvTable& table,
                               size_t row, const std::string& column_name);
    static core::Date parse_date(const std::string& text, const CsvTable& table,
                                 size_t row, const std::string& column_name);
};

} // namespace fundunit::io
