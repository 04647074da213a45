#pragma once
#include <map>
#include <string>
#include <vector>
#include <fundunit/core/date.hpp>
#include <fundunit/core/nav_quotes.hpp>
#include <fundunit/core/transaction.hpp>

namespace fundunit::core {

struct EngineConfiguration {
    // Slack allowed when a redemption meets the investor's full balance.
    // 0.0 rejects anything that would take a balance below exactly zero.
    double balance_tolerance = 1e-12;

    // Log every ledger entry at DEBUG level
    bool log_transactions = false;
};

// One processed transaction. Values carry full precision; rounding is a reporting concern.
struct LedgerEntry {
    Date date;
    std::string investor;
    TransactionKind kind;
    double amount;
    double nav_per_unit;
    double units_change;
    double investor_units_after;
    double total_units_after;
};

struct UnitisationTotals {
    double opening_units = 0.0;
    double opening_nav_per_unit = 0.0;
    double closing_units = 0.0;
};

struct UnitisationResult {
    std::vector<LedgerEntry> ledger;
    std::map<std::string, double> investor_summary;
    UnitisationTotals totals;
};

// Converts dealing transactions into units at each date's NAV per unit.
//
// Transactions are processed in (date, investor) order with a stable sort, so
// the caller's ordering never affects the result. Any invalid input aborts the
// whole batch with a FundError and nothing is returned.
class UnitisationEngine {
private:
    EngineConfiguration config_;

    struct PendingTransaction {
        const Transaction* transaction;
        TransactionKind kind;
    };

    std::vector<PendingTransaction> prepare(const std::vector<Transaction>& transactions) const;
    double resolve_quote(const NavQuotes& nav_by_date, const Date& date) const;

public:
    UnitisationEngine();
    explicit UnitisationEngine(const EngineConfiguration& config);

    void configure(const EngineConfiguration& config);
    const EngineConfiguration& configuration() const { return config_; }

    // Each call starts from fresh state. To chain dealing days, pass the previous
    // closing_units back in as opening_units.
    UnitisationResult process(double opening_units,
                              double opening_nav_per_unit,
                              const std::vector<Transaction>& transactions,
                              const NavQuotes& nav_by_date) const;
};

} // namespace fundunit::core
