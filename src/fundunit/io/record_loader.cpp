#include <fundunit/io/record_loader.hpp>
#include <fundunit/io/csv_table.hpp>
#include <fundunit/core/errors.hpp>
#include <fundunit/utils/logger.hpp>
#include <sstream>
#include <stdexcept>

namespace fundunit::io {

namespace {

[[noreturn]] void bad_cell(const CsvTable& table, size_t row, const std::string& column_name,
                           const std::string& text, const std::string& expected) {
    std::ostringstream msg;
    msg << table.source() << ":" << table.line_number(row) << ": " << column_name
        << " value '" << text << "' is not " << expected;
    throw core::SchemaError(msg.str());
}

} // namespace

double RecordLoader::parse_number(const std::string& text, const CsvTable& table,
                                  size_t row, const std::string& column_name) {
    if (text.empty()) {
        bad_cell(table, row, column_name, text, "a number");
    }

    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::invalid_argument&) {
        bad_cell(table, row, column_name, text, "a number");
    } catch (const std::out_of_range&) {
        bad_cell(table, row, column_name, text, "a representable number");
    }

    if (consumed != text.size()) {
        bad_cell(table, row, column_name, text, "a number");
    }
    return value;
}

core::Date RecordLoader::parse_date(const std::string& text, const CsvTable& table,
                                    size_t row, const std::string& column_name) {
    auto date = core::Date::parse(text);
    if (!date) {
        bad_cell(table, row, column_name, text, "a YYYY-MM-DD date");
    }
    return *date;
}

std::vector<core::Transaction> RecordLoader::transactions_from(const CsvTable& table) {
    table.require_columns({"Date", "Investor", "Type", "Amount_Base"}, "transactions file");

    std::vector<core::Transaction> transactions;
    transactions.reserve(table.row_count());

    for (size_t row = 0; row < table.row_count(); ++row) {
        core::Date date = parse_date(table.cell(row, "Date"), table, row, "Date");

        const std::string& investor = table.cell(row, "Investor");
        if (investor.empty()) {
            bad_cell(table, row, "Investor", investor, "an investor identifier");
        }

        double amount = parse_number(table.cell(row, "Amount_Base"), table, row, "Amount_Base");
        transactions.emplace_back(date, investor, table.cell(row, "Type"), amount);
    }

    return transactions;
}

std::vector<core::Transaction> RecordLoader::load_transactions(const std::string& path) {
    auto transactions = transactions_from(CsvTable::read(path));
    utils::Logger::info() << "Loaded " << transactions.size() << " transactions from "
                          << path << utils::Logger::endl;
    return transactions;
}

std::vector<nav::Holding> RecordLoader::positions_from(const CsvTable& table) {
    table.require_columns({"Instrument", "Quantity", "Price", "Base_CCY", "FX_to_Base"},
                          "positions file");

    std::vector<nav::Holding> holdings;
    holdings.reserve(table.row_count());

    for (size_t row = 0; row < table.row_count(); ++row) {
        nav::Holding holding;
        holding.instrument = table.cell(row, "Instrument");
        holding.quantity = parse_number(table.cell(row, "Quantity"), table, row, "Quantity");
        holding.price = parse_number(table.cell(row, "Price"), table, row, "Price");
        holding.base_ccy = table.cell(row, "Base_CCY");
        holding.fx_to_base = parse_number(table.cell(row, "FX_to_Base"), table, row, "FX_to_Base");
        holdings.push_back(holding);
    }

    return holdings;
}

std::vector<nav::Holding> RecordLoader::load_positions(const std::string& path) {
    auto holdings = positions_from(CsvTable::read(path));
    utils::Logger::info() << "Loaded " << holdings.size() << " positions from "
                          << path << utils::Logger::endl;
    return holdings;
}

std::vector<nav::Liability> RecordLoader::liabilities_from(const CsvTable& table) {
    table.require_columns({"Liability", "Amount", "Base_CCY"}, "liabilities file");

    std::vector<nav::Liability> liabilities;
    liabilities.reserve(table.row_count());

    for (size_t row = 0; row < table.row_count(); ++row) {
        nav::Liability liability;
        liability.name = table.cell(row, "Liability");
        liability.amount = parse_number(table.cell(row, "Amount"), table, row, "Amount");
        liability.base_ccy = table.cell(row, "Base_CCY");
        liabilities.push_back(liability);
    }

    return liabilities;
}

std::vector<nav::Liability> RecordLoader::load_liabilities(const std::string& path) {
    auto liabilities = liabilities_from(CsvTable::read(path));
    utils::Logger::info() << "Loaded " << liabilities.size() << " liabilities from "
                          << path << utils::Logger::endl;
    return liabilities;
}

core::NavQuotes RecordLoader::nav_quotes_from(const CsvTable& table) {
    table.require_columns({"Date", "NAV_Per_Unit"}, "NAV quotes file");

    core::NavQuotes quotes;
    for (size_t row = 0; row < table.row_count(); ++row) {
        core::Date date = parse_date(table.cell(row, "Date"), table, row, "Date");
        if (quotes.contains(date)) {
            std::ostringstream msg;
            msg << table.source() << ":" << table.line_number(row)
                << ": duplicate NAV per unit for date " << date;
            throw core::SchemaError(msg.str());
        }
        quotes.set(date, parse_number(table.cell(row, "NAV_Per_Unit"), table, row, "NAV_Per_Unit"));
    }

    return quotes;
}

core::NavQuotes RecordLoader::load_nav_quotes(const std::string& path) {
    auto quotes = nav_quotes_from(CsvTable::read(path));
    utils::Logger::info() << "Loaded " << quotes.size() << " NAV quotes from "
                          << path << utils::Logger::endl;
    return quotes;
}

} // namespace fundunit::io
