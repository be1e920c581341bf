#pragma once

#include "domain/BatchKey.hpp"
#include "domain/SaleRecord.hpp"
#include "domain/StockPosition.hpp"
#include "domain/StockRequests.hpp"
#include "domain/SupplierInvoice.hpp"
#include "domain/Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pharmacy::ports::input {

/**
 * @brief Сервис сверки склада
 */
class IStockService {
public:
    virtual ~IStockService() = default;

    virtual domain::StockMovementResult receive(const domain::ReceiveRequest& request) = 0;

    virtual domain::StockMovementResult sell(const domain::SellRequest& request) = 0;

    virtual domain::StockMovementResult adjust(const domain::AdjustRequest& request) = 0;

    virtual domain::StockMovementResult recordSale(const domain::SaleEvent& event) = 0;

    virtual domain::StockMovementResult recordReceipt(const domain::ReceiptEvent& event) = 0;

    /**
     * @brief Партии с количеством ниже уровня дозаказа, по возрастанию количества
     */
    virtual std::vector<domain::StockPosition> reorderCandidates() = 0;

    virtual std::vector<domain::StockPosition> lowStock(int64_t threshold) = 0;

    virtual std::vector<domain::StockPosition> expiringWithin(int days, const domain::Timestamp& today) = 0;

    virtual std::vector<domain::StockPosition> inventory() = 0;

    virtual std::optional<domain::StockPosition> position(const domain::BatchKey& batch) = 0;

    virtual std::optional<domain::SaleRecord> findSale(const std::string& receiptNumber) = 0;

    virtual std::optional<domain::SupplierInvoice> findInvoice(const std::string& invoiceNumber) = 0;

    virtual domain::SupplierInvoice updateInvoicePaymentStatus(const std::string& invoiceNumber,
                                                               domain::PaymentStatus status) = 0;
};

} // namespace pharmacy::ports::input
