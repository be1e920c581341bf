#pragma once

#include "domain/BatchKey.hpp"
#include "domain/StockPosition.hpp"
#include <optional>
#include <vector>

namespace pharmacy::ports::output {

/**
 * @brief Репозиторий метаданных партий
 *
 * Партии не удаляются: просроченные остаются доступными для аудита.
 */
class IStockBatchRepository {
public:
    virtual ~IStockBatchRepository() = default;

    /**
     * @return false если партия уже существует (метаданные не меняются)
     */
    virtual bool insertIfAbsent(const domain::StockBatch& batch) = 0;

    virtual std::optional<domain::StockBatch> find(const domain::BatchKey& key) = 0;

    virtual std::vector<domain::StockBatch> findAll() = 0;
};

} // namespace pharmacy::ports::output
