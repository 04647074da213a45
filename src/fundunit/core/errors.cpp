#include <fundunit/core/errors.hpp>
#include <iomanip>
#include <sstream>

namespace fundunit::core {

namespace {

std::string kind_message(const std::string& kind, size_t index) {
    std::ostringstream msg;
    msg << "Transaction " << index << " has type '" << kind
        << "'; expected 'Subscription' or 'Redemption'";
    return msg.str();
}

std::string quote_message(const Date& date, double nav_per_unit) {
    std::ostringstream msg;
    msg << "NAV per unit must be > 0 for date " << date << " (got " << nav_per_unit << ")";
    return msg.str();
}

std::string balance_message(const std::string& investor, const Date& date,
                            double held_units, double requested_units) {
    std::ostringstream msg;
    msg << std::fixed << std::setprecision(6)
        << "Redemption exceeds available units for " << investor << " on " << date
        << ". Has " << held_units << ", trying to redeem " << requested_units;
    return msg.str();
}

} // namespace

InvalidKindError::InvalidKindError(const std::string& kind, size_t index)
    : FundError(kind_message(kind, index)), kind_(kind), index_(index) {}

MissingQuoteError::MissingQuoteError(const Date& date)
    : FundError("NAV per unit missing for date " + date.to_string()), date_(date) {}

InvalidQuoteError::InvalidQuoteError(const Date& date, double nav_per_unit)
    : FundError(quote_message(date, nav_per_unit)), date_(date), nav_per_unit_(nav_per_unit) {}

InsufficientBalanceError::InsufficientBalanceError(const std::string& investor, const Date& date,
                                                   double held_units, double requested_units)
    : FundError(balance_message(investor, date, held_units, requested_units)),
      investor_(investor),
      date_(date),
      held_units_(held_units),
      requested_units_(requested_units) {}

} // namespace fundunit::core
