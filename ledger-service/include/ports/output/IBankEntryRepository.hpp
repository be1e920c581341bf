#pragma once

#include "domain/BankLedgerEntry.hpp"
#include "domain/Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pharmacy::ports::output {

/**
 * @brief Репозиторий строк банковской выписки
 *
 * tran_id уникален глобально. Кроме approve, строки не изменяются.
 */
class IBankEntryRepository {
public:
    virtual ~IBankEntryRepository() = default;

    /**
     * @brief Сохранить строку, назначив entryId
     * @return entryId или std::nullopt если tran_id уже есть
     */
    virtual std::optional<int64_t> insert(const domain::BankLedgerEntry& entry) = 0;

    virtual std::optional<domain::BankLedgerEntry> findById(int64_t entryId) = 0;

    virtual std::optional<domain::BankLedgerEntry> findByTranId(const std::string& tranId) = 0;

    /**
     * @brief Все строки счёта по возрастанию (occurred_at, entry_id)
     */
    virtual std::vector<domain::BankLedgerEntry> findByAccount(const std::string& accountId) = 0;

    /**
     * @brief IMPORTED и не утверждённые, по возрастанию occurred_at
     * @param accountId std::nullopt - по всем счетам
     */
    virtual std::vector<domain::BankLedgerEntry> findUnreconciled(const std::optional<std::string>& accountId) = 0;

    /**
     * @brief Корректирующие строки для FLAGGED-строки
     */
    virtual std::vector<domain::BankLedgerEntry> findCorrections(int64_t flaggedEntryId) = 0;

    /**
     * @brief Атомарно утвердить строку
     *
     * Срабатывает только если approved_by ещё пуст и статус IMPORTED.
     * @return true если именно этот вызов утвердил строку
     */
    virtual bool markApproved(int64_t entryId, const std::string& approver, const domain::Timestamp& at) = 0;
};

} // namespace pharmacy::ports::output
