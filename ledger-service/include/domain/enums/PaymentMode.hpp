#pragma once

#include <cctype>
#include <string>

namespace pharmacy::domain {

/**
 * @brief Способ оплаты на кассе
 */
enum class PaymentMode {
    CASH,
    CARD,
    UPI,
    INSURANCE
};

inline std::string toString(PaymentMode mode) {
    switch (mode) {
        case PaymentMode::CASH:      return "CASH";
        case PaymentMode::CARD:      return "CARD";
        case PaymentMode::UPI:       return "UPI";
        case PaymentMode::INSURANCE: return "INSURANCE";
    }
    return "UNKNOWN";
}

/**
 * @brief Разбор без учёта регистра, по умолчанию CASH
 */
inline PaymentMode paymentModeFromString(const std::string& str) {
    std::string upper;
    for (char c : str) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (upper == "CARD")      return PaymentMode::CARD;
    if (upper == "UPI")       return PaymentMode::UPI;
    if (upper == "INSURANCE") return PaymentMode::INSURANCE;
    return PaymentMode::CASH;
}

} // namespace pharmacy::domain
