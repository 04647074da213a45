#include <fundunit/core/unitisation_engine.hpp>
#include <fundunit/core/errors.hpp>
#include <fundunit/core/investor_register.hpp>
#include <fundunit/utils/logger.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace fundunit::core {

UnitisationEngine::UnitisationEngine() = default;

namespace {

void check_configuration(const EngineConfiguration& config) {
    if (!std::isfinite(config.balance_tolerance) || config.balance_tolerance < 0.0) {
        std::ostringstream msg;
        msg << "Balance tolerance must be a non-negative number (got "
            << config.balance_tolerance << ")";
        throw ArgumentError(msg.str());
    }
}

} // namespace

UnitisationEngine::UnitisationEngine(const EngineConfiguration& config)
    : config_(config) {
    check_configuration(config_);
}

void UnitisationEngine::configure(const EngineConfiguration& config) {
    check_configuration(config);
    config_ = config;
}

std::vector<UnitisationEngine::PendingTransaction>
UnitisationEngine::prepare(const std::vector<Transaction>& transactions) const {
    std::vector<PendingTransaction> pending;
    pending.reserve(transactions.size());

    for (size_t i = 0; i < transactions.size(); ++i) {
        const Transaction& tx = transactions[i];

        if (!tx.date.valid()) {
            std::ostringstream msg;
            msg << "Transaction " << i << " is missing a valid Date";
            throw SchemaError(msg.str());
        }
        if (tx.investor.find_first_not_of(" \t\r\n") == std::string::npos) {
            std::ostringstream msg;
            msg << "Transaction " << i << " on " << tx.date << " is missing an Investor";
            throw SchemaError(msg.str());
        }
        if (!std::isfinite(tx.amount) || tx.amount <= 0.0) {
            std::ostringstream msg;
            msg << "Transaction " << i << " for " << tx.investor << " on " << tx.date
                << " has invalid Amount_Base " << tx.amount << " (must be > 0)";
            throw SchemaError(msg.str());
        }

        auto kind = parse_kind(tx.kind);
        if (!kind) {
            throw InvalidKindError(tx.kind, i);
        }

        pending.push_back({&tx, *kind});
    }

    std::stable_sort(pending.begin(), pending.end(),
                     [](const PendingTransaction& a, const PendingTransaction& b) {
        if (a.transaction->date != b.transaction->date) {
            return a.transaction->date < b.transaction->date;
        }
        return a.transaction->investor < b.transaction->investor;
    });

    return pending;
}

double UnitisationEngine::resolve_quote(const NavQuotes& nav_by_date, const Date& date) const {
    auto quote = nav_by_date.lookup(date);
    if (!quote) {
        throw MissingQuoteError(date);
    }
    if (!std::isfinite(*quote) || *quote <= 0.0) {
        throw InvalidQuoteError(date, *quote);
    }
    return *quote;
}

UnitisationResult UnitisationEngine::process(double opening_units,
                                             double opening_nav_per_unit,
                                             const std::vector<Transaction>& transactions,
                                             const NavQuotes& nav_by_date) const {
    if (!std::isfinite(opening_units) || opening_units < 0.0) {
        std::ostringstream msg;
        msg << "Opening units must be a non-negative number (got " << opening_units << ")";
        throw ArgumentError(msg.str());
    }

    auto pending = prepare(transactions);

    InvestorRegister investors;
    double total_units = opening_units;

    UnitisationResult result;
    result.ledger.reserve(pending.size());

    for (const auto& item : pending) {
        const Transaction& tx = *item.transaction;
        double nav_per_unit = resolve_quote(nav_by_date, tx.date);
        double units_delta = tx.amount / nav_per_unit;
        double units_change = 0.0;

        if (item.kind == TransactionKind::SUBSCRIPTION) {
            investors.credit(tx.investor, units_delta);
            total_units += units_delta;
            units_change = units_delta;
        } else {
            if (!investors.debit(tx.investor, units_delta, config_.balance_tolerance)) {
                throw InsufficientBalanceError(tx.investor, tx.date,
                                               investors.units(tx.investor), units_delta);
            }
            total_units -= units_delta;
            units_change = -units_delta;
        }

        LedgerEntry entry;
        entry.date = tx.date;
        entry.investor = tx.investor;
        entry.kind = item.kind;
        entry.amount = tx.amount;
        entry.nav_per_unit = nav_per_unit;
        entry.units_change = units_change;
        entry.investor_units_after = investors.units(tx.investor);
        entry.total_units_after = total_units;

        if (config_.log_transactions) {
            utils::Logger::debug() << entry.date << " " << to_string(entry.kind) << " "
                                   << entry.investor << " " << std::fixed << std::setprecision(6)
                                   << entry.units_change << " units @ " << entry.nav_per_unit
                                   << " -> " << entry.investor_units_after
                                   << utils::Logger::endl;
        }

        result.ledger.push_back(std::move(entry));
    }

    result.investor_summary = investors.snapshot();
    result.totals.opening_units = opening_units;
    result.totals.opening_nav_per_unit = opening_nav_per_unit;
    result.totals.closing_units = total_units;

    utils::Logger::info() << "Unitised " << result.ledger.size() << " transactions for "
                          << result.investor_summary.size() << " investors; closing units "
                          << std::fixed << std::setprecision(6) << total_units
                          << utils::Logger::endl;

    return result;
}

} // namespace fundunit::core
