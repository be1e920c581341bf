#pragma once

#include "domain/SaleRecord.hpp"
#include "domain/SupplierInvoice.hpp"
#include "domain/enums/PaymentStatus.hpp"
#include <optional>
#include <string>

namespace pharmacy::ports::output {

/**
 * @brief Родительские записи событий: чеки и накладные
 */
class IDocumentRepository {
public:
    virtual ~IDocumentRepository() = default;

    /**
     * @return false если чек с таким номером уже сохранён
     */
    virtual bool saveSale(const domain::SaleRecord& sale) = 0;

    virtual std::optional<domain::SaleRecord> findSale(const std::string& receiptNumber) = 0;

    /**
     * @return false если накладная с таким номером уже сохранена
     */
    virtual bool saveInvoice(const domain::SupplierInvoice& invoice) = 0;

    virtual std::optional<domain::SupplierInvoice> findInvoice(const std::string& invoiceNumber) = 0;

    /**
     * @brief Единственное изменяемое поле накладной
     * @return false если накладная не найдена
     */
    virtual bool updateInvoicePaymentStatus(const std::string& invoiceNumber, domain::PaymentStatus status) = 0;
};

} // namespace pharmacy::ports::output
