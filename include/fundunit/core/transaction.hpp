#pragma once

#include <optional>
#include <string>
#include <fundunit/core/date.hpp>

namespace fundunit::core {

enum class TransactionKind {
    SUBSCRIPTION,
    REDEMPTION
};

// Investor dealing instruction. amount is a base-currency value, never a unit count.
struct Transaction {
    Date date;
    std::string investor;
    std::string kind;
    double amount;

    Transaction();
    Transaction(const Date& d, const std::string& inv, const std::string& k, double amt);
};

// Case-insensitive match on "subscription"/"redemption" after trimming whitespace.
std::optional<TransactionKind> parse_kind(const std::string& kind);

// "Subscription" or "Redemption".
std::string to_string(TransactionKind kind);

} // namespace fundunit::core
