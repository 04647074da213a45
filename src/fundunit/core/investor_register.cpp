#include <fundunit/core/investor_register.hpp>

namespace fundunit::core {

void InvestorRegister::open(const std::string& investor) {
    units_.emplace(investor, 0.0);
}

bool InvestorRegister::contains(const std::string& investor) const {
    return units_.find(investor) != units_.end();
}

double InvestorRegister::units(const std::string& investor) const {
    auto it = units_.find(investor);
    if (it != units_.end()) {
        return it->second;
    }
    return 0.0;
}

double InvestorRegister::credit(const std::string& investor, double units) {
    double& held = units_[investor];
    held += units;
    return held;
}

bool InvestorRegister::debit(const std::string& investor, double units, double tolerance) {
    auto it = units_.find(investor);
    double held = (it != units_.end()) ? it->second : 0.0;
    if (held + tolerance < units) {
        return false;
    }
    if (it == units_.end()) {
        it = units_.emplace(investor, 0.0).first;
    }
    it->second -= units;
    return true;
}

double InvestorRegister::total_units() const {
    // Summed in investor order so the result does not depend on hash layout
    double total = 0.0;
    for (const auto& [investor, units] : snapshot()) {
        total += units;
    }
    return total;
}

std::map<std::string, double> InvestorRegister::snapshot() const {
    return std::map<std::string, double>(units_.begin(), units_.end());
}

} // namespace fundunit::core
