#pragma once
#include <map>
#include <optional>
#include <fundunit/core/date.hpp>

namespace fundunit::core {

// Dealing-date NAV per unit table. Read-only while the engine runs.
class NavQuotes {
private:
    std::map<Date, double> quotes_;

public:
    using const_iterator = std::map<Date, double>::const_iterator;

    NavQuotes() = default;
    NavQuotes(std::initializer_list<std::pair<const Date, double>> quotes);

    void set(const Date& date, double nav_per_unit);
    std::optional<double> lookup(const Date& date) const;
    bool contains(const Date& date) const;

    size_t size() const { return quotes_.size(); }
    bool empty() const { return quotes_.empty(); }

    const_iterator begin() const { return quotes_.begin(); }
    const_iterator end() const { return quotes_.end(); }
};

} // namespace fundunit::core
