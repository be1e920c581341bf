#pragma once

#include "domain/Reference.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/LedgerDomain.hpp"
#include "domain/enums/MovementKind.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace pharmacy::domain {

/**
 * @brief Неизменяемая запись журнала движений
 *
 * signedAmount - штуки для склада, пайсы для денег.
 * После записи не изменяется и не удаляется: исправления делаются
 * новыми компенсирующими записями.
 */
struct LedgerEntry {
    int64_t entryId = 0;                    ///< Глобальный порядковый номер вставки (назначает хранилище)
    LedgerDomain domain = LedgerDomain::STOCK;
    std::string entityKey;                  ///< "name#batch" или account id
    int64_t signedAmount = 0;
    MovementKind kind = MovementKind::ADJUST;
    Reference reference;
    Timestamp occurredAt;
    Timestamp recordedAt;                   ///< Назначает хранилище
    std::string remarks;
};

using EntryIds = std::vector<int64_t>;

/**
 * @brief Участвует ли запись в дедупликации по ссылке
 *
 * Корректировки повторяемы: ADJUST никогда не дедуплицируется,
 * даже если ссылается на чек или накладную.
 */
inline bool isDeduplicated(const LedgerEntry& entry) {
    return entry.kind != MovementKind::ADJUST && entry.reference.isDeduplicated();
}

/**
 * @brief Позиция в упорядоченном журнале сущности
 *
 * Порядок воспроизведения: (occurred_at, recorded_at, entry_id).
 */
struct LedgerCursor {
    Timestamp occurredAt;
    Timestamp recordedAt;
    int64_t entryId = 0;

    static LedgerCursor after(const LedgerEntry& entry) {
        return LedgerCursor{entry.occurredAt, entry.recordedAt, entry.entryId};
    }
};

inline bool ledgerOrderLess(const LedgerEntry& a, const LedgerEntry& b) {
    if (a.occurredAt != b.occurredAt) return a.occurredAt < b.occurredAt;
    if (a.recordedAt != b.recordedAt) return a.recordedAt < b.recordedAt;
    return a.entryId < b.entryId;
}

/**
 * @brief Запись лежит строго после курсора
 */
inline bool isAfter(const LedgerEntry& entry, const LedgerCursor& cursor) {
    if (entry.occurredAt != cursor.occurredAt) return entry.occurredAt > cursor.occurredAt;
    if (entry.recordedAt != cursor.recordedAt) return entry.recordedAt > cursor.recordedAt;
    return entry.entryId > cursor.entryId;
}

} // namespace pharmacy::domain
