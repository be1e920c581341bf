#pragma once

#include <string>
#include <stdexcept>

namespace pharmacy::domain {

/**
 * @brief Статус строки банковской выписки
 *
 * IMPORTED → APPROVED (финальный)
 * IMPORTED → FLAGGED  (финальный, ждёт ручного разбора корректирующей записью)
 */
enum class EntryStatus {
    IMPORTED,   ///< Принята, ждёт проверки
    APPROVED,   ///< Проверена и заморожена
    FLAGGED     ///< Расхождение остатка, в журнал не попала
};

inline std::string toString(EntryStatus status) {
    switch (status) {
        case EntryStatus::IMPORTED: return "IMPORTED";
        case EntryStatus::APPROVED: return "APPROVED";
        case EntryStatus::FLAGGED:  return "FLAGGED";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline EntryStatus entryStatusFromString(const std::string& str) {
    if (str == "IMPORTED") return EntryStatus::IMPORTED;
    if (str == "APPROVED") return EntryStatus::APPROVED;
    if (str == "FLAGGED")  return EntryStatus::FLAGGED;
    throw std::invalid_argument("Unknown EntryStatus: " + str);
}

inline bool isFinalStatus(EntryStatus status) {
    return status == EntryStatus::APPROVED || status == EntryStatus::FLAGGED;
}

} // namespace pharmacy::domain
