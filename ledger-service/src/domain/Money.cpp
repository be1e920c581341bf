#include "domain/Money.hpp"

#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace pharmacy::domain {

Money Money::fromDouble(double value, const std::string& curr) {
    double minor = value * 100.0;
    // 2^63 точно представимо в double
    if (!std::isfinite(minor) || std::fabs(minor) >= 9223372036854775808.0) {
        throw std::invalid_argument("Amount out of range");
    }
    return Money(static_cast<int64_t>(std::llround(minor)), curr);
}

Money Money::parse(const std::string& text, const std::string& curr) {
    std::string s;
    s.reserve(text.size());
    for (char c : text) {
        // Разделители разрядов (1,05,000.00) и пробелы игнорируем
        if (c == ',' || c == ' ') {
            continue;
        }
        s.push_back(c);
    }

    if (s.empty()) {
        throw std::invalid_argument("Empty amount");
    }

    bool negative = false;
    std::size_t pos = 0;
    if (s[0] == '-' || s[0] == '+') {
        negative = (s[0] == '-');
        pos = 1;
    }

    int64_t units = 0;
    int64_t fraction = 0;
    int fractionDigits = 0;
    bool seenDigit = false;
    bool seenPoint = false;

    for (; pos < s.size(); ++pos) {
        char c = s[pos];
        if (c == '.') {
            if (seenPoint) {
                throw std::invalid_argument("Invalid amount: " + text);
            }
            seenPoint = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Invalid amount: " + text);
        }
        seenDigit = true;
        int digit = c - '0';
        if (!seenPoint) {
            if (units > (std::numeric_limits<int64_t>::max() / 100 - digit) / 10) {
                throw std::invalid_argument("Amount out of range: " + text);
            }
            units = units * 10 + digit;
        } else {
            if (fractionDigits >= 2) {
                throw std::invalid_argument("Amount has more than 2 decimal places: " + text);
            }
            fraction = fraction * 10 + digit;
            ++fractionDigits;
        }
    }

    if (!seenDigit) {
        throw std::invalid_argument("Invalid amount: " + text);
    }

    if (fractionDigits == 1) {
        fraction *= 10;
    }

    int64_t total = units * 100 + fraction;
    return Money(negative ? -total : total, curr);
}

std::string Money::toString() const {
    int64_t absolute = minor < 0 ? -minor : minor;
    int64_t units = absolute / 100;
    int64_t fraction = absolute % 100;

    std::string result = minor < 0 ? "-" : "";
    result += std::to_string(units);
    result += '.';
    if (fraction < 10) {
        result += '0';
    }
    result += std::to_string(fraction);
    return result;
}

} // namespace pharmacy::domain
