#pragma once
#include <fstream>
#include <map>
#include <ostream>
#include <string>
#include <vector>
#include <fundunit/core/unitisation_engine.hpp>
#include <fundunit/nav/nav_aggregator.hpp>

namespace fundunit::io {

// Writes engine and NAV outputs as CSV. Values are rounded here and only here:
// money to 2 decimals, units and NAV per unit to 6.
class ReportWriter {
private:
    std::string output_dir_;

    std::string open_report(const std::string& file_name, std::ofstream& file) const;
    void finish_report(const std::string& path, std::ofstream& file) const;

public:
    // The directory is created on first write if it does not exist.
    explicit ReportWriter(std::string output_dir);

    const std::string& output_dir() const { return output_dir_; }

    // Each returns the path written; core::IoError if the file cannot be created or written.
    std::string write_ledger(const std::vector<core::LedgerEntry>& ledger) const;
    std::string write_investor_summary(const std::map<std::string, double>& summary) const;
    std::string write_totals(const core::UnitisationTotals& totals) const;
    std::string write_valued_positions(const std::vector<nav::ValuedHolding>& holdings) const;
    std::string write_liabilities(const std::vector<nav::Liability>& liabilities) const;
    std::string write_nav_summary(const nav::NavSummary& summary) const;

    static void format_ledger(std::ostream& out, const std::vector<core::LedgerEntry>& ledger);
    static void format_investor_summary(std::ostream& out, const std::map<std::string, double>& summary);
    static void format_totals(std::ostream& out, const core::UnitisationTotals& totals);
    static void format_valued_positions(std::ostream& out, const std::vector<nav::ValuedHolding>& holdings);
    static void format_liabilities(std::ostream& out, const std::vector<nav::Liability>& liabilities);
    static void format_nav_summary(std::ostream& out, const nav::NavSummary& summary);
};

} // namespace fundunit::io
