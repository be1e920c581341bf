#pragma once

#include "domain/Money.hpp"
#include "domain/Reference.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/MovementKind.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace pharmacy::domain {

/**
 * @brief Строка банковской выписки на импорт
 */
struct StatementEntryRequest {
    std::string accountId;
    std::string tranId;
    Timestamp occurredAt;
    MovementKind direction = MovementKind::CR;
    Money amount;
    std::string description;
    Reference reference;                    ///< Внешний документ (например, накладная), только для отчёта
    std::optional<Money> declaredBalance;
};

/**
 * @brief Корректирующая строка для FLAGGED-записи
 *
 * Импортируется как новая строка с tran_id "<исходный>-R<n>".
 * Исходная FLAGGED-строка не изменяется.
 */
struct FlagResolution {
    MovementKind direction = MovementKind::CR;
    Money amount;
    std::optional<Timestamp> occurredAt;    ///< По умолчанию - дата исходной строки
    std::string description;
    std::optional<Money> declaredBalance;
};

/**
 * @brief Результат проверки непрерывности остатков счёта
 */
struct ContinuityReport {
    std::string accountId;
    bool continuous = true;
    std::size_t checkedEntries = 0;
    std::optional<int64_t> firstBrokenEntryId;
    Money replayedBalance;                  ///< opening + все принятые строки выписки
    Money projectedBalance;                 ///< по журналу
};

} // namespace pharmacy::domain
