// include/domain/Timestamp.hpp
#pragma once

#include <string>
#include <chrono>
#include <cctype>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace pharmacy::domain {

/**
 * @brief Момент времени в ISO 8601 (UTC, точность - миллисекунды)
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    /**
     * @brief Текущее время
     */
    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Разбор строки ISO 8601
     *
     * Смещение зоны переводится в UTC: "10:30:00+05:30" == "05:00:00Z".
     * Без суффикса время считается UTC. Текст после зоны не допускается.
     *
     * @param isoString "2024-01-15", "2024-01-15T10:30:00Z", "2024-01-15T10:30:00.250Z"
     *                  или "2024-01-15T10:30:00+05:30"
     * @throws std::invalid_argument при неверном формате
     */
    static Timestamp fromString(const std::string& isoString) {
        std::tm tm = {};
        std::istringstream ss(isoString);
        const auto eof = std::char_traits<char>::eof();

        bool dateOnly = isoString.size() == 10;
        if (dateOnly) {
            ss >> std::get_time(&tm, "%Y-%m-%d");
        } else {
            ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        }

        if (ss.fail()) {
            throw std::invalid_argument("Invalid timestamp: " + isoString);
        }

        int64_t millis = 0;
        int64_t offsetMinutes = 0;
        if (!dateOnly) {
            if (ss.peek() == '.') {
                ss.get();
                int digits = 0;
                while (ss.peek() != eof && std::isdigit(ss.peek())) {
                    int digit = ss.get() - '0';
                    if (digits < 3) {
                        millis = millis * 10 + digit;
                    }
                    ++digits;
                }
                if (digits == 0) {
                    throw std::invalid_argument("Invalid timestamp fraction: " + isoString);
                }
                for (; digits < 3; ++digits) {
                    millis *= 10;
                }
            }

            int zone = ss.peek();
            if (zone == 'Z' || zone == 'z') {
                ss.get();
            } else if (zone == '+' || zone == '-') {
                ss.get();
                offsetMinutes = parseOffset(ss, isoString) * (zone == '-' ? -1 : 1);
            }
        }

        if (ss.peek() != eof) {
            throw std::invalid_argument("Unexpected text after timestamp: " + isoString);
        }

        auto seconds = static_cast<int64_t>(timegm(&tm));
        return fromUnixMillis((seconds - offsetMinutes * 60) * 1000 + millis);
    }

    /**
     * @brief Строка ISO 8601 в UTC; миллисекунды только если не ноль
     */
    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");

        auto millis = toUnixMillis() % 1000;
        if (millis != 0) {
            ss << '.' << std::setw(3) << std::setfill('0') << millis;
        }
        ss << 'Z';
        return ss.str();
    }

    /**
     * @brief Календарная дата: "2024-01-15"
     */
    std::string toDateString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%d");
        return ss.str();
    }

    /**
     * @brief Сдвиг на целое число суток
     */
    Timestamp plusDays(int days) const {
        return Timestamp(value + std::chrono::hours(24 * days));
    }

    /**
     * @brief Unix-время в миллисекундах
     */
    int64_t toUnixMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            value.time_since_epoch()
        ).count();
    }

    /**
     * @brief Из Unix-времени в миллисекундах
     */
    static Timestamp fromUnixMillis(int64_t millis) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::milliseconds(millis)
        ));
    }

    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }

private:
    /**
     * @brief "HH:MM" или "HHMM" после знака зоны, в минутах
     */
    static int64_t parseOffset(std::istringstream& ss, const std::string& isoString) {
        auto readTwoDigits = [&ss, &isoString]() {
            int value = 0;
            for (int i = 0; i < 2; ++i) {
                int c = ss.peek();
                if (c == std::char_traits<char>::eof() || !std::isdigit(c)) {
                    throw std::invalid_argument("Invalid zone offset: " + isoString);
                }
                value = value * 10 + (ss.get() - '0');
            }
            return value;
        };

        int hours = readTwoDigits();
        if (ss.peek() == ':') {
            ss.get();
        }
        int minutes = readTwoDigits();
        if (hours > 23 || minutes > 59) {
            throw std::invalid_argument("Invalid zone offset: " + isoString);
        }
        return static_cast<int64_t>(hours) * 60 + minutes;
    }
};

} // namespace pharmacy::domain
