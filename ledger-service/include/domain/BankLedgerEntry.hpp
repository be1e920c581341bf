#pragma once

#include "domain/Money.hpp"
#include "domain/Reference.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/EntryStatus.hpp"
#include "domain/enums/MovementKind.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace pharmacy::domain {

constexpr std::size_t MAX_DESCRIPTION_LENGTH = 250;

/**
 * @brief Строка банковской выписки
 *
 * Инвариант для принятых строк счёта в порядке журнала:
 * balance[i] = balance[i-1] + amount (CR) или - amount (DR),
 * balance[-1] = начальный остаток счёта.
 *
 * approvedBy / approvedAt устанавливаются ровно один раз.
 */
struct BankLedgerEntry {
    int64_t entryId = 0;
    std::string accountId;
    std::string tranId;                     ///< Уникален глобально
    Timestamp occurredAt;
    MovementKind direction = MovementKind::CR;
    Money amount;                           ///< Всегда > 0
    Money runningBalance;
    std::optional<Money> declaredBalance;   ///< Остаток, как он напечатан в выписке
    std::string description;
    Reference reference;
    EntryStatus status = EntryStatus::IMPORTED;
    std::optional<std::string> approvedBy;
    std::optional<Timestamp> approvedAt;
    std::optional<int64_t> ledgerEntryId;   ///< Запись журнала (нет у FLAGGED)
    std::optional<int64_t> correctsEntryId; ///< Исправляемая FLAGGED-строка
    Timestamp importedAt;

    int64_t signedAmount() const {
        return direction == MovementKind::CR ? amount.minor : -amount.minor;
    }

    bool isApproved() const { return approvedBy.has_value(); }
};

/**
 * @brief Обрезать описание до 250 символов с "..."
 */
inline std::string truncateDescription(const std::string& description) {
    if (description.size() <= MAX_DESCRIPTION_LENGTH) {
        return description;
    }
    return description.substr(0, MAX_DESCRIPTION_LENGTH - 3) + "...";
}

} // namespace pharmacy::domain
