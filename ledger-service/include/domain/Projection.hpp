#pragma once

#include <cstdint>
#include <string>

namespace pharmacy::domain {

/**
 * @brief Кэшированная свёртка журнала сущности
 *
 * Не является источником истины: всегда может быть пересчитана из журнала.
 * lastEntryId - максимальный entry_id, уже учтённый в value.
 */
struct Projection {
    std::string entityKey;
    int64_t value = 0;
    int64_t lastEntryId = 0;
};

} // namespace pharmacy::domain
