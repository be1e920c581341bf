#pragma once

#include <string>
#include <stdexcept>

namespace pharmacy::domain {

/**
 * @brief Источник внешнего события
 */
enum class ReferenceType {
    POS,               ///< Чек кассы (pos_sales.receipt_number)
    SUPPLIER_INVOICE,  ///< Накладная поставщика (supplier_invoices.invoice_number)
    BANK_STATEMENT,    ///< Строка банковской выписки (tran_id)
    MANUAL             ///< Ручная операция, не дедуплицируется
};

inline std::string toString(ReferenceType type) {
    switch (type) {
        case ReferenceType::POS:              return "POS";
        case ReferenceType::SUPPLIER_INVOICE: return "SUPPLIER_INVOICE";
        case ReferenceType::BANK_STATEMENT:   return "BANK_STATEMENT";
        case ReferenceType::MANUAL:           return "MANUAL";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline ReferenceType referenceTypeFromString(const std::string& str) {
    if (str == "POS")              return ReferenceType::POS;
    if (str == "SUPPLIER_INVOICE") return ReferenceType::SUPPLIER_INVOICE;
    if (str == "BANK_STATEMENT")   return ReferenceType::BANK_STATEMENT;
    if (str == "MANUAL")           return ReferenceType::MANUAL;
    throw std::invalid_argument("Unknown ReferenceType: " + str);
}

} // namespace pharmacy::domain
