#pragma once

#include "ports/output/IDocumentRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>
#include <mutex>

namespace pharmacy::adapters::secondary {

class InMemoryDocumentRepository : public ports::output::IDocumentRepository {
public:
    bool saveSale(const domain::SaleRecord& sale) override {
        return sales_.insertIfAbsent(sale.receiptNumber, std::make_shared<domain::SaleRecord>(sale));
    }

    std::optional<domain::SaleRecord> findSale(const std::string& receiptNumber) override {
        auto sale = sales_.find(receiptNumber);
        return sale ? std::optional(*sale) : std::nullopt;
    }

    bool saveInvoice(const domain::SupplierInvoice& invoice) override {
        return invoices_.insertIfAbsent(invoice.invoiceNumber, std::make_shared<domain::SupplierInvoice>(invoice));
    }

    std::optional<domain::SupplierInvoice> findInvoice(const std::string& invoiceNumber) override {
        auto invoice = invoices_.find(invoiceNumber);
        return invoice ? std::optional(*invoice) : std::nullopt;
    }

    bool updateInvoicePaymentStatus(const std::string& invoiceNumber, domain::PaymentStatus status) override {
        // Копия с новым статусом: читатели не видят частично изменённый объект
        std::lock_guard<std::mutex> lock(statusMutex_);
        auto current = invoices_.find(invoiceNumber);
        if (!current) {
            return false;
        }
        auto updated = std::make_shared<domain::SupplierInvoice>(*current);
        updated->paymentStatus = status;
        invoices_.insert(invoiceNumber, updated);
        return true;
    }

    void eraseSale(const std::string& receiptNumber) {
        sales_.erase(receiptNumber);
    }

    void eraseInvoice(const std::string& invoiceNumber) {
        invoices_.erase(invoiceNumber);
    }

private:
    ThreadSafeMap<std::string, domain::SaleRecord> sales_;
    ThreadSafeMap<std::string, domain::SupplierInvoice> invoices_;
    std::mutex statusMutex_;
};

} // namespace pharmacy::adapters::secondary
