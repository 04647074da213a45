#include <fundunit/io/report_writer.hpp>
#include <fundunit/core/errors.hpp>
#include <fundunit/utils/logger.hpp>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

namespace fundunit::io {

namespace {

std::string fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    std::string text = oss.str();

    // -0.000000 after rounding is printed as 0.000000
    if (!text.empty() && text[0] == '-' &&
        text.find_first_not_of("0.", 1) == std::string::npos) {
        text.erase(0, 1);
    }
    return text;
}

std::string field(const std::string& text) {
    if (text.find_first_of(",\"\r\n") == std::string::npos) {
        return text;
    }
    std::string quoted = "\"";
    for (char c : text) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

} // namespace

ReportWriter::ReportWriter(std::string output_dir)
    : output_dir_(std::move(output_dir)) {}

std::string ReportWriter::open_report(const std::string& file_name, std::ofstream& file) const {
    std::filesystem::path dir(output_dir_);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw core::IoError("Failed to create output directory " + output_dir_ + ": " + ec.message());
    }

    std::string path = (dir / file_name).string();
    file.open(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        throw core::IoError("Failed to create CSV file: " + path);
    }
    return path;
}

void ReportWriter::finish_report(const std::string& path, std::ofstream& file) const {
    file.flush();
    if (!file) {
        throw core::IoError("Failed to write CSV file: " + path);
    }
    file.close();
    if (file.fail()) {
        throw core::IoError("Failed to close CSV file: " + path);
    }
}

void ReportWriter::format_ledger(std::ostream& out, const std::vector<core::LedgerEntry>& ledger) {
    out << "Date,Investor,Type,Amount_Base,NAV_Per_Unit,Units_Change,"
        << "Investor_Units_After,Total_Units_After\n";
    for (const auto& entry : ledger) {
        out << entry.date << ","
            << field(entry.investor) << ","
            << core::to_string(entry.kind) << ","
            << fixed(entry.amount, 2) << ","
            << fixed(entry.nav_per_unit, 6) << ","
            << fixed(entry.units_change, 6) << ","
            << fixed(entry.investor_units_after, 6) << ","
            << fixed(entry.total_units_after, 6) << "\n";
    }
}

void ReportWriter::format_investor_summary(std::ostream& out, const std::map<std::string, double>& summary) {
    out << "Investor,Units\n";
    for (const auto& [investor, units] : summary) {
        out << field(investor) << "," << fixed(units, 6) << "\n";
    }
}

void ReportWriter::format_totals(std::ostream& out, const core::UnitisationTotals& totals) {
    out << "Opening_Units,Opening_NAV_Per_Unit,Closing_Units\n"
        << fixed(totals.opening_units, 6) << ","
        << fixed(totals.opening_nav_per_unit, 6) << ","
        << fixed(totals.closing_units, 6) << "\n";
}

void ReportWriter::format_valued_positions(std::ostream& out, const std::vector<nav::ValuedHolding>& holdings) {
    out << "Instrument,Quantity,Price,Base_CCY,FX_to_Base,Market_Value_Base\n";
    for (const auto& valued : holdings) {
        const nav::Holding& h = valued.holding;
        out << field(h.instrument) << ","
            << fixed(h.quantity, 6) << ","
            << fixed(h.price, 6) << ","
            << field(h.base_ccy) << ","
            << fixed(h.fx_to_base, 6) << ","
            << fixed(valued.market_value_base, 2) << "\n";
    }
}

void ReportWriter::format_liabilities(std::ostream& out, const std::vector<nav::Liability>& liabilities) {
    out << "Liability,Amount,Base_CCY\n";
    for (const auto& liability : liabilities) {
        out << field(liability.name) << ","
            << fixed(liability.amount, 2) << ","
            << field(liability.base_ccy) << "\n";
    }
}

void ReportWriter::format_nav_summary(std::ostream& out, const nav::NavSummary& summary) {
    out << "Base_CCY,Total_Assets,Total_Liabilities,Net_Assets,Units_Outstanding,NAV_Per_Unit\n"
        << field(summary.base_ccy) << ","
        << fixed(summary.total_assets, 2) << ","
        << fixed(summary.total_liabilities, 2) << ","
        << fixed(summary.net_assets, 2) << ","
        << fixed(summary.units_outstanding, 6) << ","
        << fixed(summary.nav_per_unit, 6) << "\n";
}

std::string ReportWriter::write_ledger(const std::vector<core::LedgerEntry>& ledger) const {
    std::ofstream file;
    std::string path = open_report("unitisation_ledger.csv", file);
    format_ledger(file, ledger);
    finish_report(path, file);
    utils::Logger::info() << "Wrote " << ledger.size() << " ledger entries to " << path << utils::Logger::endl;
    return path;
}

std::string ReportWriter::write_investor_summary(const std::map<std::string, double>& summary) const {
    std::ofstream file;
    std::string path = open_report("investor_units_summary.csv", file);
    format_investor_summary(file, summary);
    finish_report(path, file);
    utils::Logger::info() << "Wrote investor summary to " << path << utils::Logger::endl;
    return path;
}

std::string ReportWriter::write_totals(const core::UnitisationTotals& totals) const {
    std::ofstream file;
    std::string path = open_report("unitisation_totals.csv", file);
    format_totals(file, totals);
    finish_report(path, file);
    utils::Logger::info() << "Wrote unitisation totals to " << path << utils::Logger::endl;
    return path;
}

std::string ReportWriter::write_valued_positions(const std::vector<nav::ValuedHolding>& holdings) const {
    std::ofstream file;
    std::string path = open_report("nav_positions_valued.csv", file);
    format_valued_positions(file, holdings);
    finish_report(path, file);
    utils::Logger::info() << "Wrote " << holdings.size() << " valued positions to " << path << utils::Logger::endl;
    return path;
}

std::string ReportWriter::write_liabilities(const std::vector<nav::Liability>& liabilities) const {
    std::ofstream file;
    std::string path = open_report("nav_liabilities.csv", file);
    format_liabilities(file, liabilities);
    finish_report(path, file);
    utils::Logger::info() << "Wrote " << liabilities.size() << " liabilities to " << path << utils::Logger::endl;
    return path;
}

std::string ReportWriter::write_nav_summary(const nav::NavSummary& summary) const {
    std::ofstream file;
    std::string path = open_report("nav_summary.csv", file);
    format_nav_summary(file, summary);
    finish_report(path, file);
    utils::Logger::info() << "Wrote NAV summary to " << path << utils::Logger::endl;
    return path;
}

} // namespace fundunit::io
