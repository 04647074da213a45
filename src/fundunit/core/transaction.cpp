#include <fundunit/core/transaction.hpp>
#include <algorithm>
#include <cctype>

namespace fundunit::core {

Transaction::Transaction()
    : amount(0.0) {}

Transaction::Transaction(const Date& d, const std::string& inv, const std::string& k, double amt)
    : date(d), investor(inv), kind(k), amount(amt) {}

std::optional<TransactionKind> parse_kind(const std::string& kind) {
    size_t begin = kind.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return std::nullopt;
    }
    size_t end = kind.find_last_not_of(" \t\r\n");

    std::string normalised = kind.substr(begin, end - begin + 1);
    std::transform(normalised.begin(), normalised.end(), normalised.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (normalised == "subscription") {
        return TransactionKind::SUBSCRIPTION;
    }
    if (normalised == "redemption") {
        return TransactionKind::REDEMPTION;
    }
    return std::nullopt;
}

std::string to_string(TransactionKind kind) {
    return kind == TransactionKind::SUBSCRIPTION ? "Subscription" : "Redemption";
}

} // namespace fundunit::core
