#pragma once
#include <string>
#include <vector>

namespace fundunit::nav {

struct Holding {
    std::string instrument;
    double quantity = 0.0;
    double price = 0.0;
    std::string base_ccy;
    double fx_to_base = 1.0;
};

struct ValuedHolding {
    Holding holding;
    double market_value_base = 0.0;
};

struct Liability {
    std::string name;
    double amount = 0.0;
    std::string base_ccy;
};

struct NavSummary {
    std::string base_ccy;
    double total_assets = 0.0;
    double total_liabilities = 0.0;
    double net_assets = 0.0;
    double units_outstanding = 0.0;
    double nav_per_unit = 0.0;
};

struct NavResult {
    std::vector<ValuedHolding> holdings;
    std::vector<Liability> liabilities;
    NavSummary summary;
};

// Values the fund's book and derives NAV per unit.
// Positions are expected to carry their FX rate to the base currency already.
class NavAggregator {
private:
    std::string base_ccy_;

public:
    explicit NavAggregator(std::string base_ccy = "USD");

    const std::string& base_ccy() const { return base_ccy_; }

    static double market_value(const Holding& holding);

    // Throws core::ArgumentError when units_outstanding is not a positive number.
    NavResult calculate(const std::vector<Holding>& holdings,
                        const std::vector<Liability>& liabilities,
                        double units_outstanding) const;
};

} // namespace fundunit::nav
