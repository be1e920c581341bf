#pragma once

#include <string>
#include <stdexcept>

namespace pharmacy::domain {

/**
 * @brief Предметная область записи журнала
 */
enum class LedgerDomain {
    STOCK,  ///< Движение количества по партии лекарства
    CASH    ///< Движение денег по банковскому счёту
};

inline std::string toString(LedgerDomain domain) {
    switch (domain) {
        case LedgerDomain::STOCK: return "STOCK";
        case LedgerDomain::CASH:  return "CASH";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline LedgerDomain ledgerDomainFromString(const std::string& str) {
    if (str == "STOCK") return LedgerDomain::STOCK;
    if (str == "CASH")  return LedgerDomain::CASH;
    throw std::invalid_argument("Unknown LedgerDomain: " + str);
}

} // namespace pharmacy::domain
