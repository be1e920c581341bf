#pragma once

#include "domain/Projection.hpp"
#include <optional>
#include <string>

namespace pharmacy::ports::output {

/**
 * @brief Кэш проекций (только оптимизация, не источник истины)
 */
class IProjectionRepository {
public:
    virtual ~IProjectionRepository() = default;

    virtual std::optional<domain::Projection> find(const std::string& key) = 0;

    /**
     * @brief Сдвинуть кэш вперёд
     *
     * Запись с lastEntryId не больше сохранённого игнорируется.
     */
    virtual void advance(const domain::Projection& projection) = 0;

    /**
     * @brief Перезаписать кэш безусловно (rebuild)
     */
    virtual void overwrite(const domain::Projection& projection) = 0;
};

} // namespace pharmacy::ports::output
