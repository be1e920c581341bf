#pragma once

#include <gmock/gmock.h>
#include "ports/input/IStockService.hpp"

namespace pharmacy::tests {

class MockStockService : public ports::input::IStockService {
public:
    MOCK_METHOD(domain::StockMovementResult, receive, (const domain::ReceiveRequest&), (override));
    MOCK_METHOD(domain::StockMovementResult, sell, (const domain::SellRequest&), (override));
    MOCK_METHOD(domain::StockMovementResult, adjust, (const domain::AdjustRequest&), (override));
    MOCK_METHOD(domain::StockMovementResult, recordSale, (const domain::SaleEvent&), (override));
    MOCK_METHOD(domain::StockMovementResult, recordReceipt, (const domain::ReceiptEvent&), (override));
    MOCK_METHOD(std::vector<domain::StockPosition>, reorderCandidates, (), (override));
    MOCK_METHOD(std::vector<domain::StockPosition>, lowStock, (int64_t), (override));
    MOCK_METHOD(std::vector<domain::StockPosition>, expiringWithin, (int, const domain::Timestamp&), (override));
    MOCK_METHOD(std::vector<domain::StockPosition>, inventory, (), (override));
    MOCK_METHOD(std::optional<domain::StockPosition>, position, (const domain::BatchKey&), (override));
    MOCK_METHOD(std::optional<domain::SaleRecord>, findSale, (const std::string&), (override));
    MOCK_METHOD(std::optional<domain::SupplierInvoice>, findInvoice, (const std::string&), (override));
    MOCK_METHOD(domain::SupplierInvoice, updateInvoicePaymentStatus, (const std::string&, domain::PaymentStatus), (override));
};

} // namespace pharmacy::tests
