#include <gtest/gtest.h>
#include <fundunit/core/date.hpp>
#include <fundunit/core/errors.hpp>
#include <fundunit/core/investor_register.hpp>
#include <fundunit/core/nav_quotes.hpp>
#include <fundunit/core/transaction.hpp>
#include <fundunit/core/unitisation_engine.hpp>
#include <fundunit/utils/logger.hpp>

#include <algorithm>
#include <cstddef>
#include <limits>
#include <numeric>
#include <string>
#include <vector>

using fundunit::core::Date;
using fundunit::core::NavQuotes;
using fundunit::core::Transaction;
using fundunit::core::TransactionKind;
using fundunit::core::UnitisationEngine;
using fundunit::core::UnitisationResult;

namespace {

const Date kJan2(2026, 1, 2);
const Date kJan3(2026, 1, 3);
const Date kJan4(2026, 1, 4);

void expect_same_ledger(const UnitisationResult& a, const UnitisationResult& b) {
    ASSERT_EQ(a.ledger.size(), b.ledger.size());
    for (size_t i = 0; i < a.ledger.size(); ++i) {
        const auto& x = a.ledger[i];
        const auto& y = b.ledger[i];
        EXPECT_EQ(x.date, y.date) << "entry " << i;
        EXPECT_EQ(x.investor, y.investor) << "entry " << i;
        EXPECT_EQ(x.kind, y.kind) << "entry " << i;
        EXPECT_EQ(x.amount, y.amount) << "entry " << i;
        EXPECT_EQ(x.nav_per_unit, y.nav_per_unit) << "entry " << i;
        EXPECT_EQ(x.units_change, y.units_change) << "entry " << i;
        EXPECT_EQ(x.investor_units_after, y.investor_units_after) << "entry " << i;
        EXPECT_EQ(x.total_units_after, y.total_units_after) << "entry " << i;
    }
    EXPECT_EQ(a.investor_summary, b.investor_summary);
    EXPECT_EQ(a.totals.opening_units, b.totals.opening_units);
    EXPECT_EQ(a.totals.opening_nav_per_unit, b.totals.opening_nav_per_unit);
    EXPECT_EQ(a.totals.closing_units, b.totals.closing_units);
}

} // namespace

// Date

TEST(DateTest, ParsesIsoAndSlashForms) {
    auto iso = Date::parse("2026-01-02");
    ASSERT_TRUE(iso.has_value());
    EXPECT_EQ(*iso, kJan2);

    auto slashed = Date::parse("2026/01/02");
    ASSERT_TRUE(slashed.has_value());
    EXPECT_EQ(*slashed, kJan2);
}

TEST(DateTest, DropsTimeComponent) {
    auto with_t = Date::parse("2026-01-03T15:30:00");
    ASSERT_TRUE(with_t.has_value());
    EXPECT_EQ(*with_t, kJan3);

    auto with_space = Date::parse(" 2026-01-03 09:00");
    ASSERT_TRUE(with_space.has_value());
    EXPECT_EQ(*with_space, kJan3);
}

TEST(DateTest, RejectsMalformedAndImpossibleDates) {
    EXPECT_FALSE(Date::parse("").has_value());
    EXPECT_FALSE(Date::parse("2026-1-2").has_value());
    EXPECT_FALSE(Date::parse("2026-01/02").has_value());
    EXPECT_FALSE(Date::parse("20260102").has_value());
    EXPECT_FALSE(Date::parse("2026-13-01").has_value());
    EXPECT_FALSE(Date::parse("2026-02-29").has_value());
    EXPECT_FALSE(Date::parse("2026-04-31").has_value());
    EXPECT_FALSE(Date::parse("abcd-ef-gh").has_value());
    EXPECT_FALSE(Date().valid());
}

TEST(DateTest, LeapYears) {
    EXPECT_TRUE(Date::parse("2024-02-29").has_value());
    EXPECT_TRUE(Date::parse("2000-02-29").has_value());
    EXPECT_FALSE(Date::parse("1900-02-29").has_value());
    EXPECT_EQ(fundunit::core::days_in_month(2024, 2), 29);
    EXPECT_EQ(fundunit::core::days_in_month(2025, 2), 28);
}

TEST(DateTest, OrderingAndFormatting) {
    EXPECT_LT(kJan2, kJan3);
    EXPECT_LT(Date(2025, 12, 31), kJan2);
    EXPECT_GT(Date(2026, 2, 1), Date(2026, 1, 31));
    EXPECT_EQ(Date(2026, 3, 7).to_string(), "2026-03-07");
}

// Transaction kinds

TEST(TransactionKindTest, NormalisesCaseAndWhitespace) {
    EXPECT_EQ(fundunit::core::parse_kind("Subscription"), TransactionKind::SUBSCRIPTION);
    EXPECT_EQ(fundunit::core::parse_kind("  REDEMPTION\t"), TransactionKind::REDEMPTION);
    EXPECT_EQ(fundunit::core::parse_kind("subscription"), TransactionKind::SUBSCRIPTION);
}

TEST(TransactionKindTest, RejectsUnknownKinds) {
    EXPECT_FALSE(fundunit::core::parse_kind("Purchase").has_value());
    EXPECT_FALSE(fundunit::core::parse_kind("").has_value());
    EXPECT_FALSE(fundunit::core::parse_kind("sub scription").has_value());
}

TEST(TransactionKindTest, DisplayNames) {
    EXPECT_EQ(fundunit::core::to_string(TransactionKind::SUBSCRIPTION), "Subscription");
    EXPECT_EQ(fundunit::core::to_string(TransactionKind::REDEMPTION), "Redemption");
}

// NAV quotes

TEST(NavQuotesTest, LookupDistinguishesAbsence) {
    NavQuotes quotes{{kJan2, 1.0125}};
    quotes.set(kJan3, 1.008);

    EXPECT_EQ(quotes.size(), 2u);
    ASSERT_TRUE(quotes.lookup(kJan2).has_value());
    EXPECT_DOUBLE_EQ(*quotes.lookup(kJan2), 1.0125);
    EXPECT_FALSE(quotes.lookup(kJan4).has_value());
    EXPECT_FALSE(quotes.contains(kJan4));

    quotes.set(kJan3, 1.01);
    EXPECT_DOUBLE_EQ(*quotes.lookup(kJan3), 1.01);
    EXPECT_EQ(quotes.size(), 2u);
}

// Investor register

TEST(InvestorRegisterTest, LazyOpeningAndZeroBalances) {
    fundunit::core::InvestorRegister investors;
    EXPECT_FALSE(investors.contains("A"));
    EXPECT_EQ(investors.units("A"), 0.0);

    investors.open("A");
    EXPECT_TRUE(investors.contains("A"));
    EXPECT_EQ(investors.size(), 1u);

    EXPECT_DOUBLE_EQ(investors.credit("A", 100.0), 100.0);
    EXPECT_TRUE(investors.debit("A", 100.0, 1e-12));
    EXPECT_TRUE(investors.contains("A"));
    EXPECT_EQ(investors.units("A"), 0.0);
}

TEST(InvestorRegisterTest, DebitRespectsTolerance) {
    fundunit::core::InvestorRegister investors;
    investors.credit("A", 1.0);

    EXPECT_FALSE(investors.debit("A", 1.0 + 1e-9, 1e-12));
    EXPECT_EQ(investors.units("A"), 1.0);

    EXPECT_TRUE(investors.debit("A", 1.0 + 5e-13, 1e-12));
    EXPECT_GE(investors.units("A"), -1e-12);
}

TEST(InvestorRegisterTest, StrictToleranceRejectsAnyShortfall) {
    fundunit::core::InvestorRegister investors;
    investors.credit("A", 1.0);
    EXPECT_FALSE(investors.debit("A", 1.0 + 5e-13, 0.0));
    EXPECT_TRUE(investors.debit("A", 1.0, 0.0));
}

TEST(InvestorRegisterTest, FailedDebitOpensNoAccount) {
    fundunit::core::InvestorRegister investors;
    EXPECT_FALSE(investors.debit("Ghost", 1.0, 1e-12));
    EXPECT_FALSE(investors.contains("Ghost"));
    EXPECT_EQ(investors.size(), 0u);
    EXPECT_TRUE(investors.snapshot().empty());
}

TEST(InvestorRegisterTest, SnapshotIsSortedAndTotals) {
    fundunit::core::InvestorRegister investors;
    investors.credit("Zeta", 3.0);
    investors.credit("Alpha", 1.0);
    investors.credit("Mu", 2.0);

    auto snapshot = investors.snapshot();
    std::vector<std::string> names;
    for (const auto& [name, units] : snapshot) {
        names.push_back(name);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"Alpha", "Mu", "Zeta"}));
    EXPECT_DOUBLE_EQ(investors.total_units(), 6.0);
}

// Unitisation engine

class UnitisationEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        fundunit::utils::Logger::set_level(fundunit::utils::LogLevel::WARN);
        quotes_.set(kJan2, 1.0125);
        quotes_.set(kJan3, 1.008);
        quotes_.set(kJan4, 1.0152);
    }

    void TearDown() override {
        fundunit::utils::Logger::set_level(fundunit::utils::LogLevel::INFO);
    }

    std::vector<Transaction> sample_transactions() const {
        return {
            Transaction(kJan3, "Investor B", "Redemption", 2016.00),
            Transaction(kJan2, "Investor A", "Subscription", 10125.00),
            Transaction(kJan2, "Investor B", "Subscription", 5062.50),
            Transaction(kJan3, "Investor C", "subscription", 20160.00),
            Transaction(kJan4, "Investor A", "Redemption", 5076.00),
            Transaction(kJan4, "Investor C", " Redemption ", 10152.00),
        };
    }

    UnitisationEngine engine_;
    NavQuotes quotes_;
};

TEST_F(UnitisationEngineTest, SingleSubscriptionAtNav) {
    std::vector<Transaction> txs = {Transaction(kJan2, "Investor A", "Subscription", 10125.00)};

    auto result = engine_.process(100000.0, 1.0, txs, quotes_);

    ASSERT_EQ(result.ledger.size(), 1u);
    const auto& entry = result.ledger[0];
    EXPECT_EQ(entry.kind, TransactionKind::SUBSCRIPTION);
    EXPECT_DOUBLE_EQ(entry.nav_per_unit, 1.0125);
    EXPECT_NEAR(entry.units_change, 10000.0, 1e-9);
    EXPECT_NEAR(entry.investor_units_after, 10000.0, 1e-9);
    EXPECT_NEAR(entry.total_units_after, 110000.0, 1e-9);
    EXPECT_NEAR(result.totals.closing_units, 110000.0, 1e-9);
    EXPECT_EQ(result.totals.opening_units, 100000.0);
    EXPECT_EQ(result.totals.opening_nav_per_unit, 1.0);
}

TEST_F(UnitisationEngineTest, RedemptionOfWholeBalanceSucceeds) {
    NavQuotes quotes{{kJan2, 1.0}, {kJan3, 1.02}};
    std::vector<Transaction> txs = {
        Transaction(kJan2, "Investor A", "Subscription", 5000.00),
        Transaction(kJan3, "Investor A", "Redemption", 5100.00),
    };

    auto result = engine_.process(0.0, 1.0, txs, quotes);

    ASSERT_EQ(result.ledger.size(), 2u);
    EXPECT_NEAR(result.ledger[1].units_change, -5000.0, 1e-9);
    EXPECT_NEAR(result.ledger[1].investor_units_after, 0.0, 1e-9);
    EXPECT_GE(result.ledger[1].investor_units_after, -1e-12);
    ASSERT_EQ(result.investor_summary.count("Investor A"), 1u);
    EXPECT_NEAR(result.investor_summary.at("Investor A"), 0.0, 1e-9);
}

TEST_F(UnitisationEngineTest, RedemptionBeyondBalanceFails) {
    NavQuotes quotes{{kJan2, 1.0}, {kJan3, 1.02}};
    std::vector<Transaction> txs = {
        Transaction(kJan2, "Investor A", "Subscription", 5000.00),
        Transaction(kJan3, "Investor A", "Redemption", 5200.00),
    };

    try {
        engine_.process(0.0, 1.0, txs, quotes);
        FAIL() << "expected InsufficientBalanceError";
    } catch (const fundunit::core::InsufficientBalanceError& e) {
        EXPECT_EQ(e.investor(), "Investor A");
        EXPECT_EQ(e.date(), kJan3);
        EXPECT_DOUBLE_EQ(e.held_units(), 5000.0);
        EXPECT_NEAR(e.requested_units(), 5098.039216, 1e-6);
        EXPECT_NE(std::string(e.what()).find("Investor A"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("2026-01-03"), std::string::npos);
    }
}

TEST_F(UnitisationEngineTest, RedemptionByUnknownInvestorFails) {
    std::vector<Transaction> txs = {Transaction(kJan2, "Nobody", "Redemption", 1.00)};
    EXPECT_THROW(engine_.process(100000.0, 1.0, txs, quotes_),
                 fundunit::core::InsufficientBalanceError);
}

TEST_F(UnitisationEngineTest, OpeningUnitsAreNotRedeemable) {
    // The opening float belongs to the fund, not to any named investor
    std::vector<Transaction> txs = {Transaction(kJan2, "Investor A", "Redemption", 10.00)};
    EXPECT_THROW(engine_.process(1e9, 1.0, txs, quotes_),
                 fundunit::core::InsufficientBalanceError);
}

TEST_F(UnitisationEngineTest, UnknownKindFailsWherever) {
    auto base = sample_transactions();
    for (size_t position = 0; position <= base.size(); ++position) {
        auto txs = base;
        txs.insert(txs.begin() + static_cast<std::ptrdiff_t>(position),
                   Transaction(kJan2, "Investor Z", "Purchase", 100.00));
        try {
            engine_.process(100000.0, 1.0, txs, quotes_);
            FAIL() << "expected InvalidKindError at position " << position;
        } catch (const fundunit::core::InvalidKindError& e) {
            EXPECT_EQ(e.kind(), "Purchase");
            EXPECT_EQ(e.index(), position);
        }
    }
}

TEST_F(UnitisationEngineTest, MissingQuoteNamesTheDate) {
    auto txs = sample_transactions();
    txs.emplace_back(Date(2026, 1, 5), "Investor A", "Subscription", 100.00);

    try {
        engine_.process(100000.0, 1.0, txs, quotes_);
        FAIL() << "expected MissingQuoteError";
    } catch (const fundunit::core::MissingQuoteError& e) {
        EXPECT_EQ(e.date(), Date(2026, 1, 5));
        EXPECT_NE(std::string(e.what()).find("2026-01-05"), std::string::npos);
    }
}

TEST_F(UnitisationEngineTest, NonPositiveQuoteIsRejected) {
    std::vector<Transaction> txs = {Transaction(kJan2, "Investor A", "Subscription", 100.00)};

    NavQuotes zero{{kJan2, 0.0}};
    EXPECT_THROW(engine_.process(0.0, 1.0, txs, zero), fundunit::core::InvalidQuoteError);

    NavQuotes negative{{kJan2, -1.5}};
    try {
        engine_.process(0.0, 1.0, txs, negative);
        FAIL() << "expected InvalidQuoteError";
    } catch (const fundunit::core::InvalidQuoteError& e) {
        EXPECT_EQ(e.date(), kJan2);
        EXPECT_EQ(e.nav_per_unit(), -1.5);
    }
}

TEST_F(UnitisationEngineTest, QuotesForUnusedDatesAreIgnored) {
    NavQuotes quotes{{kJan2, 1.0}, {kJan3, -1.0}};
    std::vector<Transaction> txs = {Transaction(kJan2, "Investor A", "Subscription", 100.00)};
    auto result = engine_.process(0.0, 1.0, txs, quotes);
    EXPECT_EQ(result.ledger.size(), 1u);
}

TEST_F(UnitisationEngineTest, MissingFieldsAreSchemaErrors) {
    std::vector<Transaction> no_investor = {Transaction(kJan2, "  ", "Subscription", 100.00)};
    EXPECT_THROW(engine_.process(0.0, 1.0, no_investor, quotes_), fundunit::core::SchemaError);

    std::vector<Transaction> no_date = {Transaction(Date(), "Investor A", "Subscription", 100.00)};
    EXPECT_THROW(engine_.process(0.0, 1.0, no_date, quotes_), fundunit::core::SchemaError);

    std::vector<Transaction> no_amount = {
        Transaction(kJan2, "Investor A", "Subscription", std::numeric_limits<double>::quiet_NaN())};
    EXPECT_THROW(engine_.process(0.0, 1.0, no_amount, quotes_), fundunit::core::SchemaError);

    std::vector<Transaction> negative_amount = {Transaction(kJan2, "Investor A", "Subscription", -5.00)};
    EXPECT_THROW(engine_.process(0.0, 1.0, negative_amount, quotes_), fundunit::core::SchemaError);
}

TEST_F(UnitisationEngineTest, NegativeOpeningUnitsRejected) {
    EXPECT_THROW(engine_.process(-1.0, 1.0, {}, quotes_), fundunit::core::ArgumentError);
}

TEST_F(UnitisationEngineTest, EmptyBatchKeepsOpeningUnits) {
    auto result = engine_.process(0.0, 1.0, {}, quotes_);
    EXPECT_TRUE(result.ledger.empty());
    EXPECT_TRUE(result.investor_summary.empty());
    EXPECT_EQ(result.totals.closing_units, 0.0);
}

TEST_F(UnitisationEngineTest, ProcessesInDateThenInvestorOrder) {
    auto result = engine_.process(100000.0, 1.0, sample_transactions(), quotes_);

    ASSERT_EQ(result.ledger.size(), 6u);
    std::vector<std::pair<Date, std::string>> order;
    for (const auto& entry : result.ledger) {
        order.emplace_back(entry.date, entry.investor);
    }
    std::vector<std::pair<Date, std::string>> expected = {
        {kJan2, "Investor A"}, {kJan2, "Investor B"},
        {kJan3, "Investor B"}, {kJan3, "Investor C"},
        {kJan4, "Investor A"}, {kJan4, "Investor C"},
    };
    EXPECT_EQ(order, expected);
}

TEST_F(UnitisationEngineTest, SameDayTiesKeepInputOrder) {
    std::vector<Transaction> txs = {
        Transaction(kJan2, "Investor A", "Subscription", 1012.50),
        Transaction(kJan2, "Investor A", "Redemption", 506.25),
        Transaction(kJan2, "Investor A", "Subscription", 2025.00),
    };

    auto result = engine_.process(0.0, 1.0, txs, quotes_);

    ASSERT_EQ(result.ledger.size(), 3u);
    EXPECT_DOUBLE_EQ(result.ledger[0].amount, 1012.50);
    EXPECT_DOUBLE_EQ(result.ledger[1].amount, 506.25);
    EXPECT_EQ(result.ledger[1].kind, TransactionKind::REDEMPTION);
    EXPECT_DOUBLE_EQ(result.ledger[2].amount, 2025.00);
    EXPECT_NEAR(result.ledger[2].investor_units_after, 2500.0, 1e-9);
}

TEST_F(UnitisationEngineTest, UnitsAreConserved) {
    const double opening = 100000.0;
    auto result = engine_.process(opening, 1.0, sample_transactions(), quotes_);

    double net_units = std::accumulate(result.ledger.begin(), result.ledger.end(), 0.0,
        [](double sum, const fundunit::core::LedgerEntry& e) { return sum + e.units_change; });
    EXPECT_NEAR(result.totals.closing_units, opening + net_units, 1e-6);

    double held = 0.0;
    for (const auto& [investor, units] : result.investor_summary) {
        held += units;
    }
    EXPECT_NEAR(result.totals.closing_units, opening + held, 1e-6);

    EXPECT_DOUBLE_EQ(result.ledger.back().total_units_after, result.totals.closing_units);
}

TEST_F(UnitisationEngineTest, BalancesNeverGoNegative) {
    auto result = engine_.process(100000.0, 1.0, sample_transactions(), quotes_);
    for (const auto& entry : result.ledger) {
        EXPECT_GE(entry.investor_units_after, -1e-12) << entry.investor << " on " << entry.date;
    }
}

TEST_F(UnitisationEngineTest, SummaryCoversEveryInvestorSorted) {
    auto result = engine_.process(100000.0, 1.0, sample_transactions(), quotes_);

    ASSERT_EQ(result.investor_summary.size(), 3u);
    auto it = result.investor_summary.begin();
    EXPECT_EQ((it++)->first, "Investor A");
    EXPECT_EQ((it++)->first, "Investor B");
    EXPECT_EQ(it->first, "Investor C");

    EXPECT_NEAR(result.investor_summary.at("Investor A"), 10000.0 - 5000.0, 1e-6);
    EXPECT_NEAR(result.investor_summary.at("Investor B"), 5000.0 - 2000.0, 1e-6);
    EXPECT_NEAR(result.investor_summary.at("Investor C"), 20000.0 - 10000.0, 1e-6);
}

TEST_F(UnitisationEngineTest, InputOrderDoesNotMatter) {
    auto txs = sample_transactions();
    auto reference = engine_.process(100000.0, 1.0, txs, quotes_);

    std::vector<size_t> index(txs.size());
    std::iota(index.begin(), index.end(), 0);
    int permutations = 0;
    do {
        std::vector<Transaction> shuffled;
        for (size_t i : index) {
            shuffled.push_back(txs[i]);
        }
        auto result = engine_.process(100000.0, 1.0, shuffled, quotes_);
        expect_same_ledger(reference, result);
        ++permutations;
    } while (std::next_permutation(index.begin(), index.end()) && permutations < 200);
}

TEST_F(UnitisationEngineTest, RepeatedRunsAreIdentical) {
    auto first = engine_.process(100000.0, 1.0, sample_transactions(), quotes_);
    auto second = engine_.process(100000.0, 1.0, sample_transactions(), quotes_);
    expect_same_ledger(first, second);
}

TEST_F(UnitisationEngineTest, ClosingUnitsChainIntoNextRun) {
    std::vector<Transaction> day_one = {
        Transaction(kJan2, "Investor A", "Subscription", 10125.00),
        Transaction(kJan2, "Investor B", "Subscription", 5062.50),
    };
    std::vector<Transaction> day_two = {
        Transaction(kJan3, "Investor C", "Subscription", 20160.00),
    };
    std::vector<Transaction> both = day_one;
    both.insert(both.end(), day_two.begin(), day_two.end());

    auto first = engine_.process(100000.0, 1.0, day_one, quotes_);
    auto second = engine_.process(first.totals.closing_units, 1.0125, day_two, quotes_);
    auto whole = engine_.process(100000.0, 1.0, both, quotes_);

    EXPECT_NEAR(first.totals.closing_units, 115000.0, 1e-6);
    EXPECT_EQ(second.totals.opening_units, first.totals.closing_units);
    EXPECT_DOUBLE_EQ(second.totals.closing_units, whole.totals.closing_units);
    EXPECT_NEAR(whole.totals.closing_units, 135000.0, 1e-6);
}

TEST_F(UnitisationEngineTest, StrictToleranceConfiguration) {
    fundunit::core::EngineConfiguration config;
    config.balance_tolerance = 0.0;
    UnitisationEngine strict(config);
    EXPECT_EQ(strict.configuration().balance_tolerance, 0.0);

    NavQuotes quotes{{kJan2, 1.0}, {kJan3, 1.0}};
    std::vector<Transaction> txs = {
        Transaction(kJan2, "Investor A", "Subscription", 100.00),
        Transaction(kJan3, "Investor A", "Redemption", 100.00),
    };
    auto result = strict.process(0.0, 1.0, txs, quotes);
    EXPECT_EQ(result.investor_summary.at("Investor A"), 0.0);
}

TEST_F(UnitisationEngineTest, NegativeToleranceIsRejected) {
    fundunit::core::EngineConfiguration config;
    config.balance_tolerance = -1e-6;
    EXPECT_THROW(UnitisationEngine{config}, fundunit::core::ArgumentError);

    config.balance_tolerance = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(UnitisationEngine{config}, fundunit::core::ArgumentError);

    UnitisationEngine engine;
    config.balance_tolerance = -1.0;
    EXPECT_THROW(engine.configure(config), fundunit::core::ArgumentError);
    EXPECT_EQ(engine.configuration().balance_tolerance, 1e-12);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
