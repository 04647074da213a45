#pragma once
#include <map>
#include <string>
#include <unordered_map>

namespace fundunit::core {

// Units held per investor. Entries are created at 0.0 on first use and never removed,
// so an investor redeemed down to zero is still distinct from one never seen.
class InvestorRegister {
private:
    std::unordered_map<std::string, double> units_;

public:
    InvestorRegister() = default;

    void open(const std::string& investor);
    bool contains(const std::string& investor) const;

    double units(const std::string& investor) const;

    // Adds units, opening the account if needed. Returns the new balance.
    double credit(const std::string& investor, double units);

    // Removes units unless the balance is short by more than tolerance, in which
    // case nothing changes and false is returned.
    bool debit(const std::string& investor, double units, double tolerance);

    double total_units() const;
    std::map<std::string, double> snapshot() const;
    size_t size() const { return units_.size(); }
};

} // namespace fundunit::core
