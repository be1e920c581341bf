#pragma once

#include <string>
#include <stdexcept>

namespace pharmacy::domain {

/**
 * @brief Статус оплаты документа (единственное изменяемое поле документа)
 */
enum class PaymentStatus {
    PENDING,
    PARTIAL,
    PAID
};

inline std::string toString(PaymentStatus status) {
    switch (status) {
        case PaymentStatus::PENDING: return "PENDING";
        case PaymentStatus::PARTIAL: return "PARTIAL";
        case PaymentStatus::PAID:    return "PAID";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline PaymentStatus paymentStatusFromString(const std::string& str) {
    if (str == "PENDING") return PaymentStatus::PENDING;
    if (str == "PARTIAL") return PaymentStatus::PARTIAL;
    if (str == "PAID")    return PaymentStatus::PAID;
    throw std::invalid_argument("Unknown PaymentStatus: " + str);
}

} // namespace pharmacy::domain
