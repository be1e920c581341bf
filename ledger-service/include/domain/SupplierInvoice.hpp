#pragma once

#include "domain/BatchKey.hpp"
#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/PaymentStatus.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pharmacy::domain {

/**
 * @brief Строка накладной поставщика
 *
 * Кроме количества несёт метаданные партии, которые используются,
 * если партия приходит впервые.
 */
struct ReceiptLine {
    BatchKey batch;
    int64_t quantity = 0;
    Money unitCost;
    std::string manufacturer;
    std::optional<Timestamp> expiryDate;
    std::optional<Money> sellingPrice;
    std::optional<int64_t> reorderLevel;
    std::string location;

    Money lineTotal() const { return unitCost * quantity; }
};

/**
 * @brief Накладная поставщика (родительская запись прихода)
 */
struct SupplierInvoice {
    std::string invoiceNumber;              ///< reference id для SUPPLIER_INVOICE
    Timestamp invoiceDate;
    std::string supplierName;
    std::string supplierGstin;
    std::string poReference;
    std::optional<Timestamp> deliveryDate;
    std::string vehicleNumber;
    std::vector<ReceiptLine> lines;
    Money subtotal;
    Money cgstAmount;
    Money sgstAmount;
    Money totalAmount;
    PaymentStatus paymentStatus = PaymentStatus::PENDING;
    Timestamp createdAt;
};

} // namespace pharmacy::domain
