#pragma once

#include "domain/LedgerEntry.hpp"
#include "domain/Reference.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/LedgerDomain.hpp"
#include "ports/output/ILedgerTransaction.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pharmacy::ports::output {

/**
 * @brief Ожидаемые головы журналов: entity_key → последний entry_id (0 - записей нет)
 */
using ExpectedHeads = std::map<std::string, int64_t>;

/**
 * @brief Append-only журнал движений склада и денег
 *
 * append - единственная операция изменения. Записи не редактируются
 * и не удаляются.
 *
 * @example
 * ```cpp
 * auto head = store->head("Paracetamol#PC101");
 * try {
 *     auto ids = store->append({entry}, {{"Paracetamol#PC101", head}});
 * } catch (const domain::ConcurrencyConflict&) {
 *     // журнал сдвинулся - перечитать и повторить
 * }
 * ```
 */
class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    /**
     * @brief Атомарно дописать записи (все или ни одной)
     *
     * Хранилище назначает entryId и recordedAt. work выполняется в той же
     * транзакции после вставки записей; исключение из work откатывает всё.
     * entries может быть пустым: тогда фиксируется только work
     * (с той же проверкой голов).
     *
     * @param expectedHeads Для каждого указанного ключа голова журнала должна совпасть
     * @throws domain::ConflictError если по (reference_type, reference_id) уже есть записи
     * @throws domain::ConcurrencyConflict если голова журнала не совпала
     */
    virtual domain::EntryIds append(const std::vector<domain::LedgerEntry>& entries,
                                    const ExpectedHeads& expectedHeads,
                                    const TransactionWork& work) = 0;

    domain::EntryIds append(const std::vector<domain::LedgerEntry>& entries,
                            const ExpectedHeads& expectedHeads) {
        return append(entries, expectedHeads, TransactionWork{});
    }

    /**
     * @brief Страница журнала сущности в порядке (occurred_at, recorded_at, entry_id)
     *
     * @param asOf Только записи с occurred_at <= asOf
     * @param after Keyset-курсор: строго после этой позиции
     */
    virtual std::vector<domain::LedgerEntry> readPage(
        const std::string& entityKey,
        const std::optional<domain::Timestamp>& asOf,
        const std::optional<domain::LedgerCursor>& after,
        std::size_t limit) = 0;

    /**
     * @brief Записи сущности с entry_id > afterEntryId, по возрастанию entry_id
     */
    virtual std::vector<domain::LedgerEntry> readSince(const std::string& entityKey, int64_t afterEntryId) = 0;

    virtual std::optional<domain::LedgerEntry> findById(int64_t entryId) = 0;

    virtual std::vector<domain::LedgerEntry> findByReference(const domain::Reference& reference) = 0;

    virtual bool hasReference(const domain::Reference& reference) = 0;

    /**
     * @brief Последний entry_id сущности, 0 если записей нет
     */
    virtual int64_t head(const std::string& entityKey) = 0;

    virtual std::vector<std::string> entityKeys(domain::LedgerDomain ledger) = 0;
};

} // namespace pharmacy::ports::output
