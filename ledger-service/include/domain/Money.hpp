#pragma once

#include <string>
#include <cstdint>

namespace pharmacy::domain {

/**
 * @brief Денежная сумма в минимальных единицах валюты
 *
 * Суммы хранятся в пайсах (int64_t, 1/100 рупии) для точности:
 * сложение и вычитание никогда не теряют копейки, в отличие от double.
 *
 * Пример: 5000.00 INR = {minor: 500000, currency: "INR"}
 */
struct Money {
    int64_t minor = 0;              ///< Сумма в минимальных единицах (пайсы)
    std::string currency = "INR";   ///< Код валюты (ISO 4217)

    Money() = default;

    explicit Money(int64_t m, const std::string& curr = "INR")
        : minor(m), currency(curr) {}

    /**
     * @brief Преобразовать в double (только для отображения)
     */
    double toDouble() const {
        return static_cast<double>(minor) / 100.0;
    }

    /**
     * @brief Создать Money из double (округление до пайса)
     * @throws std::invalid_argument если сумма не помещается в int64 пайсов
     */
    static Money fromDouble(double value, const std::string& curr = "INR");

    /**
     * @brief Разобрать десятичную строку без потери точности
     *
     * Принимает "5000", "5000.5", "5000.00", "-20000.00", "1,05,000.00".
     * @throws std::invalid_argument если строка не является суммой
     */
    static Money parse(const std::string& text, const std::string& curr = "INR");

    /**
     * @brief Строка с двумя знаками после точки: "105000.00"
     */
    std::string toString() const;

    Money operator+(const Money& other) const { return Money(minor + other.minor, currency); }
    Money operator-(const Money& other) const { return Money(minor - other.minor, currency); }
    Money operator-() const { return Money(-minor, currency); }

    /**
     * @brief Умножение на количество
     */
    Money operator*(int64_t qty) const { return Money(minor * qty, currency); }

    bool operator==(const Money& other) const {
        return minor == other.minor && currency == other.currency;
    }
    bool operator!=(const Money& other) const { return !(*this == other); }
    bool operator<(const Money& other) const { return minor < other.minor; }
    bool operator>(const Money& other) const { return other < *this; }
    bool operator<=(const Money& other) const { return !(other < *this); }
    bool operator>=(const Money& other) const { return !(*this < other); }

    bool isZero() const { return minor == 0; }
    bool isNegative() const { return minor < 0; }
    bool isPositive() const { return minor > 0; }
};

} // namespace pharmacy::domain
