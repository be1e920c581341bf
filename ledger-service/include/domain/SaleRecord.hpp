#pragma once

#include "domain/BatchKey.hpp"
#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/PaymentMode.hpp"
#include "domain/enums/PaymentStatus.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace pharmacy::domain {

/**
 * @brief Строка чека
 */
struct SaleLine {
    BatchKey batch;
    int64_t quantity = 0;
    Money unitPrice;

    Money lineTotal() const { return unitPrice * quantity; }
};

/**
 * @brief Чек кассы (родительская запись продажи)
 *
 * Неизменяем после создания, кроме status.
 */
struct SaleRecord {
    std::string receiptNumber;              ///< reference id для POS
    Timestamp saleDate;
    std::string pharmacistName;
    PaymentMode paymentMode = PaymentMode::CASH;
    std::vector<SaleLine> lines;
    Money subtotal;
    Money cgstAmount;
    Money sgstAmount;
    Money totalAmount;
    PaymentStatus status = PaymentStatus::PAID;
    Timestamp createdAt;
};

} // namespace pharmacy::domain
