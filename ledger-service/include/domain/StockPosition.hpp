#pragma once

#include "domain/BatchKey.hpp"
#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace pharmacy::domain {

constexpr int64_t DEFAULT_REORDER_LEVEL = 50;

/**
 * @brief Метаданные партии (создаются при первом приходе)
 *
 * Количество здесь не хранится: оно всегда проецируется из журнала.
 */
struct StockBatch {
    BatchKey key;
    std::string manufacturer;
    std::optional<Timestamp> expiryDate;
    int64_t reorderLevel = DEFAULT_REORDER_LEVEL;
    Money costPrice;
    Money sellingPrice;
    std::string location;                   ///< Полка / стеллаж
    Timestamp createdAt;

    bool isExpired(const Timestamp& today) const {
        return expiryDate.has_value() && expiryDate->toDateString() < today.toDateString();
    }
};

/**
 * @brief Складская позиция: метаданные + проецированное количество
 */
struct StockPosition {
    StockBatch batch;
    int64_t currentQuantity = 0;

    bool needsReorder() const {
        return currentQuantity < batch.reorderLevel;
    }
};

} // namespace pharmacy::domain
