#pragma once

#include <string>

namespace pharmacy::ports::output {

/**
 * @brief Хранилище заявок идемпотентности
 *
 * Ключ - "REFERENCE_TYPE:reference_id".
 */
class IIdempotencyRepository {
public:
    virtual ~IIdempotencyRepository() = default;

    /**
     * @brief Атомарно вставить ключ
     * @return false если ключ уже был
     */
    virtual bool insertIfAbsent(const std::string& key) = 0;

    virtual bool contains(const std::string& key) = 0;
};

} // namespace pharmacy::ports::output
