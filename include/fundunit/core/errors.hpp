#pragma once
#include <stdexcept>
#include <string>
#include <fundunit/core/date.hpp>

namespace fundunit::core {

// Base of every failure raised by fundunit. Any of these aborts the whole batch.
class FundError : public std::runtime_error {
public:
    explicit FundError(const std::string& message) : std::runtime_error(message) {}
};

// Required field or column absent, or a record that cannot be decoded.
class SchemaError : public FundError {
public:
    explicit SchemaError(const std::string& message) : FundError(message) {}
};

class InvalidKindError : public FundError {
public:
    InvalidKindError(const std::string& kind, size_t index);

    const std::string& kind() const { return kind_; }
    size_t index() const { return index_; }

private:
    std::string kind_;
    size_t index_;
};

class MissingQuoteError : public FundError {
public:
    explicit MissingQuoteError(const Date& date);

    const Date& date() const { return date_; }

private:
    Date date_;
};

class InvalidQuoteError : public FundError {
public:
    InvalidQuoteError(const Date& date, double nav_per_unit);

    const Date& date() const { return date_; }
    double nav_per_unit() const { return nav_per_unit_; }

private:
    Date date_;
    double nav_per_unit_;
};

class InsufficientBalanceError : public FundError {
public:
    InsufficientBalanceError(const std::string& investor, const Date& date,
                             double held_units, double requested_units);

    const std::string& investor() const { return investor_; }
    const Date& date() const { return date_; }
    double held_units() const { return held_units_; }
    double requested_units() const { return requested_units_; }

private:
    std::string investor_;
    Date date_;
    double held_units_;
    double requested_units_;
};

// Caller-supplied scalar out of range.
class ArgumentError : public FundError {
public:
    explicit ArgumentError(const std::string& message) : FundError(message) {}
};

// File could not be opened, read or written.
class IoError : public FundError {
public:
    explicit IoError(const std::string& message) : FundError(message) {}
};

} // namespace fundunit::core
