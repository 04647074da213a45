#include <fundunit/nav/nav_aggregator.hpp>
#include <fundunit/core/errors.hpp>
#include <fundunit/utils/logger.hpp>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace fundunit::nav {

NavAggregator::NavAggregator(std::string base_ccy)
    : base_ccy_(std::move(base_ccy)) {}

double NavAggregator::market_value(const Holding& holding) {
    return holding.quantity * holding.price * holding.fx_to_base;
}

NavResult NavAggregator::calculate(const std::vector<Holding>& holdings,
                                   const std::vector<Liability>& liabilities,
                                   double units_outstanding) const {
    if (!std::isfinite(units_outstanding) || units_outstanding <= 0.0) {
        std::ostringstream msg;
        msg << "Units outstanding must be greater than 0 (got " << units_outstanding << ")";
        throw core::ArgumentError(msg.str());
    }

    NavResult result;
    result.holdings.reserve(holdings.size());

    double total_assets = 0.0;
    for (const auto& holding : holdings) {
        ValuedHolding valued;
        valued.holding = holding;
        valued.market_value_base = market_value(holding);
        total_assets += valued.market_value_base;
        result.holdings.push_back(valued);
    }

    double total_liabilities = 0.0;
    for (const auto& liability : liabilities) {
        total_liabilities += liability.amount;
    }
    result.liabilities = liabilities;

    NavSummary& summary = result.summary;
    summary.base_ccy = base_ccy_;
    summary.total_assets = total_assets;
    summary.total_liabilities = total_liabilities;
    summary.net_assets = total_assets - total_liabilities;
    summary.units_outstanding = units_outstanding;
    summary.nav_per_unit = summary.net_assets / units_outstanding;

    if (summary.net_assets < 0.0) {
        utils::Logger::warn() << "Net assets negative: " << std::fixed << std::setprecision(2)
                              << summary.net_assets << " " << base_ccy_ << utils::Logger::endl;
    }

    utils::Logger::info() << "NAV per unit " << std::fixed << std::setprecision(6)
                          << summary.nav_per_unit << " " << base_ccy_ << " from "
                          << holdings.size() << " positions and " << liabilities.size()
                          << " liabilities" << utils::Logger::endl;

    return result;
}

} // namespace fundunit::nav
