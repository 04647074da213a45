#pragma once
#include <string>
#include <optional>
#include <ostream>

namespace fundunit::core {

// Calendar date without a time component.
struct Date {
    int year;
    int month;
    int day;

    Date();
    Date(int y, int m, int d);

    // Accepts YYYY-MM-DD or YYYY/MM/DD, optionally followed by a time part
    // introduced by 'T' or a space, which is discarded.
    static std::optional<Date> parse(const std::string& text);

    bool valid() const;
    std::string to_string() const;
};

bool is_leap_year(int year);
int days_in_month(int year, int month);

bool operator==(const Date& a, const Date& b);
bool operator!=(const Date& a, const Date& b);
bool operator<(const Date& a, const Date& b);
bool operator<=(const Date& a, const Date& b);
bool operator>(const Date& a, const Date& b);
bool operator>=(const Date& a, const Date& b);

std::ostream& operator<<(std::ostream& os, const Date& date);

} // namespace fundunit::core
