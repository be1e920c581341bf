#pragma once

#include "domain/Timestamp.hpp"
#include "domain/enums/LedgerDomain.hpp"
#include "ports/output/LedgerSequence.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace pharmacy::ports::input {

/**
 * @brief Проекция журнала в текущее количество / остаток
 *
 * STOCK: сумма количеств со знаком.
 * CASH: начальный остаток счёта + CR − DR (в пайсах).
 */
class IBalanceProjector {
public:
    virtual ~IBalanceProjector() = default;

    virtual int64_t current(domain::LedgerDomain ledger, const std::string& entityKey) = 0;

    /**
     * @brief Значение на момент: только записи с occurred_at <= at
     */
    virtual int64_t asOf(domain::LedgerDomain ledger, const std::string& entityKey, const domain::Timestamp& at) = 0;

    virtual output::LedgerSequence read(const std::string& entityKey, const std::optional<domain::Timestamp>& asOf) = 0;

    /**
     * @brief Пересчитать из журнала, перезаписав кэш
     */
    virtual int64_t rebuild(domain::LedgerDomain ledger, const std::string& entityKey) = 0;

    /**
     * @brief Совпадает ли кэш с полным пересчётом
     */
    virtual bool verify(domain::LedgerDomain ledger, const std::string& entityKey) = 0;
};

} // namespace pharmacy::ports::input
