#include <fundunit/app/fund_admin.hpp>
#include <fundunit/core/errors.hpp>
#include <fundunit/core/unitisation_engine.hpp>
#include <fundunit/io/record_loader.hpp>
#include <fundunit/nav/nav_aggregator.hpp>
#include <fundunit/utils/logger.hpp>
#include <iomanip>
#include <string>

namespace fundunit::app {

using utils::Logger;

bool run_nav(const utils::Config& config, const io::ReportWriter& writer, std::ostream& out) {
    std::string positions_file = config.get("positions_file", "");
    std::string liabilities_file = config.get("liabilities_file", "");
    if (positions_file.empty() || liabilities_file.empty()) {
        Logger::info() << "positions_file/liabilities_file not configured; skipping NAV" << Logger::endl;
        return false;
    }

    double units_outstanding = config.get_checked<double>("units_outstanding", 100000.0);

    auto holdings = io::RecordLoader::load_positions(positions_file);
    auto liabilities = io::RecordLoader::load_liabilities(liabilities_file);

    nav::NavAggregator aggregator(config.get("base_ccy", "USD"));
    auto result = aggregator.calculate(holdings, liabilities, units_outstanding);

    writer.write_valued_positions(result.holdings);
    writer.write_liabilities(result.liabilities);
    writer.write_nav_summary(result.summary);

    out << "NAV Summary:" << std::endl;
    io::ReportWriter::format_nav_summary(out, result.summary);
    return true;
}

bool run_unitisation(const utils::Config& config, const io::ReportWriter& writer, std::ostream& out) {
    std::string transactions_file = config.get("transactions_file", "");
    std::string nav_quotes_file = config.get("nav_quotes_file", "");
    if (transactions_file.empty() || nav_quotes_file.empty()) {
        Logger::info() << "transactions_file/nav_quotes_file not configured; skipping unitisation" << Logger::endl;
        return false;
    }

    core::EngineConfiguration engine_config;
    engine_config.balance_tolerance = config.get_checked<double>("balance_tolerance", 1e-12);
    engine_config.log_transactions = Logger::enabled(utils::LogLevel::DEBUG);
    core::UnitisationEngine engine(engine_config);

    double opening_units = config.get_checked<double>("opening_units", 100000.0);
    double opening_nav_per_unit = config.get_checked<double>("opening_nav_per_unit", 1.0);

    auto transactions = io::RecordLoader::load_transactions(transactions_file);
    auto quotes = io::RecordLoader::load_nav_quotes(nav_quotes_file);

    auto result = engine.process(opening_units, opening_nav_per_unit, transactions, quotes);

    writer.write_ledger(result.ledger);
    writer.write_investor_summary(result.investor_summary);
    writer.write_totals(result.totals);

    out << "Closing Units: " << std::fixed << std::setprecision(6)
        << result.totals.closing_units << std::endl;
    return true;
}

int run(const utils::Config& config, std::ostream& out) {
    Logger::set_level(utils::parse_level(config.get("log_level", "info")));

    try {
        io::ReportWriter writer(config.get("output_dir", "outputs"));
        bool ran_nav = run_nav(config, writer, out);
        bool ran_unitisation = run_unitisation(config, writer, out);
        if (!ran_nav && !ran_unitisation) {
            Logger::warn() << "Nothing to do: no NAV or unitisation inputs configured" << Logger::endl;
        }
        return 0;
    } catch (const core::FundError& e) {
        Logger::error() << e.what() << Logger::endl;
        return 1;
    }
}

} // namespace fundunit::app
