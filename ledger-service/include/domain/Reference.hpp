#pragma once

#include "domain/enums/ReferenceType.hpp"
#include <optional>
#include <string>

namespace pharmacy::domain {

/**
 * @brief Ссылка на внешнее событие-источник записи журнала
 *
 * Пара (type, id) - ключ идемпотентности. Ручные операции (MANUAL)
 * и ссылки без id не дедуплицируются.
 */
struct Reference {
    ReferenceType type = ReferenceType::MANUAL;
    std::optional<std::string> id;

    static Reference manual() {
        return Reference{};
    }

    static Reference of(ReferenceType type, const std::string& id) {
        return Reference{type, id};
    }

    bool isDeduplicated() const {
        return type != ReferenceType::MANUAL && id.has_value() && !id->empty();
    }

    /**
     * @brief Строковый ключ "POS:R-1001"
     */
    std::string key() const {
        return toString(type) + ":" + id.value_or("");
    }

    bool operator==(const Reference& other) const {
        return type == other.type && id == other.id;
    }
};

} // namespace pharmacy::domain
