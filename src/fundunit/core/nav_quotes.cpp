#include <fundunit/core/nav_quotes.hpp>

namespace fundunit::core {

NavQuotes::NavQuotes(std::initializer_list<std::pair<const Date, double>> quotes)
    : quotes_(quotes) {}

void NavQuotes::set(const Date& date, double nav_per_unit) {
    quotes_[date] = nav_per_unit;
}

std::optional<double> NavQuotes::lookup(const Date& date) const {
    auto it = quotes_.find(date);
    if (it != quotes_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool NavQuotes::contains(const Date& date) const {
    return quotes_.find(date) != quotes_.end();
}

} // namespace fundunit::core
