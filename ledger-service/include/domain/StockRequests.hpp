#pragma once

#include "domain/BatchKey.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/Money.hpp"
#include "domain/Reference.hpp"
#include "domain/SaleRecord.hpp"
#include "domain/SupplierInvoice.hpp"
#include "domain/Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pharmacy::domain {

/**
 * @brief Приход одной партии
 */
struct ReceiveRequest {
    BatchKey batch;
    int64_t quantity = 0;
    Money unitCost;
    Reference reference;
    std::string manufacturer;
    std::optional<Timestamp> expiryDate;
    std::optional<Money> sellingPrice;
    std::optional<int64_t> reorderLevel;
    std::string location;
    std::optional<Timestamp> occurredAt;    ///< По умолчанию - момент вызова
    std::string remarks;
};

/**
 * @brief Продажа из одной партии
 */
struct SellRequest {
    BatchKey batch;
    int64_t quantity = 0;
    Money unitPrice;
    Reference reference;
    std::optional<Timestamp> occurredAt;
    std::string remarks;
};

/**
 * @brief Ручная корректировка (инвентаризация, бой, списание)
 */
struct AdjustRequest {
    BatchKey batch;
    int64_t delta = 0;
    std::string reason;
    Reference reference;                    ///< Обычно MANUAL
    std::optional<Timestamp> occurredAt;
};

/**
 * @brief Многострочная продажа (чек)
 *
 * subtotal по умолчанию - сумма строк, total - subtotal + CGST + SGST.
 */
struct SaleEvent {
    std::string receiptNumber;
    std::optional<Timestamp> saleDate;
    std::string pharmacistName;
    PaymentMode paymentMode = PaymentMode::CASH;
    std::vector<SaleLine> lines;
    std::optional<Money> subtotal;
    Money cgstAmount;
    Money sgstAmount;
    std::optional<Money> totalAmount;
};

/**
 * @brief Многострочный приход (накладная поставщика)
 */
struct ReceiptEvent {
    std::string invoiceNumber;
    std::optional<Timestamp> invoiceDate;
    std::string supplierName;
    std::string supplierGstin;
    std::string poReference;
    std::optional<Timestamp> deliveryDate;
    std::string vehicleNumber;
    std::vector<ReceiptLine> lines;
    std::optional<Money> subtotal;
    Money cgstAmount;
    Money sgstAmount;
    std::optional<Money> totalAmount;
    PaymentStatus paymentStatus = PaymentStatus::PENDING;
};

/**
 * @brief Нефатальное предупреждение операции (например, продажа просроченной партии)
 */
struct StockWarning {
    std::string code;                       ///< "EXPIRED_BATCH"
    std::string message;
};

/**
 * @brief Результат принятого складского движения
 */
struct StockMovementResult {
    EntryIds entryIds;
    std::vector<int64_t> quantitiesAfter;   ///< По строкам, в порядке запроса
    std::vector<StockWarning> warnings;

    int64_t quantityAfter() const {
        return quantitiesAfter.empty() ? 0 : quantitiesAfter.front();
    }

    bool hasWarnings() const { return !warnings.empty(); }
};

} // namespace pharmacy::domain
