#include <fundunit/core/date.hpp>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <tuple>

namespace fundunit::core {

Date::Date() : year(0), month(0), day(0) {}

Date::Date(int y, int m, int d) : year(y), month(m), day(d) {}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return days[month - 1];
}

bool Date::valid() const {
    if (year < 1 || year > 9999) {
        return false;
    }
    if (month < 1 || month > 12) {
        return false;
    }
    return day >= 1 && day <= days_in_month(year, month);
}

std::optional<Date> Date::parse(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return std::nullopt;
    }

    std::string body = text.substr(begin);
    size_t time_part = body.find_first_of("T ");
    if (time_part != std::string::npos) {
        body = body.substr(0, time_part);
    }

    // YYYY-MM-DD is exactly ten characters with matching separators
    if (body.size() != 10) {
        return std::nullopt;
    }
    char sep = body[4];
    if ((sep != '-' && sep != '/') || body[7] != sep) {
        return std::nullopt;
    }
    for (size_t i = 0; i < body.size(); ++i) {
        if (i == 4 || i == 7) {
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(body[i]))) {
            return std::nullopt;
        }
    }

    Date date(std::stoi(body.substr(0, 4)),
              std::stoi(body.substr(5, 2)),
              std::stoi(body.substr(8, 2)));
    if (!date.valid()) {
        return std::nullopt;
    }
    return date;
}

std::string Date::to_string() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year << '-'
        << std::setw(2) << month << '-'
        << std::setw(2) << day;
    return oss.str();
}

bool operator==(const Date& a, const Date& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

bool operator!=(const Date& a, const Date& b) {
    return !(a == b);
}

bool operator<(const Date& a, const Date& b) {
    return std::tie(a.year, a.month, a.day) < std::tie(b.year, b.month, b.day);
}

bool operator<=(const Date& a, const Date& b) {
    return !(b < a);
}

bool operator>(const Date& a, const Date& b) {
    return b < a;
}

bool operator>=(const Date& a, const Date& b) {
    return !(a < b);
}

std::ostream& operator<<(std::ostream& os, const Date& date) {
    return os << date.to_string();
}

} // namespace fundunit::core
