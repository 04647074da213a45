#pragma once
#include <ostream>
#include <fundunit/io/report_writer.hpp>
#include <fundunit/utils/config.hpp>

namespace fundunit::app {

// Values the configured positions and liabilities and writes the NAV reports.
// Returns false without doing anything when either input file is not configured.
bool run_nav(const utils::Config& config, const io::ReportWriter& writer, std::ostream& out);

// Unitises the configured transactions against the NAV quote file and writes
// the ledger, investor summary and totals. Returns false when not configured.
bool run_unitisation(const utils::Config& config, const io::ReportWriter& writer, std::ostream& out);

// Applies log_level, then runs both pipelines. Any FundError is logged and
// turned into exit status 1; success is 0.
int run(const utils::Config& config, std::ostream& out);

} // namespace fundunit::app
