#pragma once

#include "domain/BankLedgerEntry.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/SaleRecord.hpp"
#include "domain/StockPosition.hpp"
#include "domain/SupplierInvoice.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace pharmacy::ports::output {

/**
 * @brief Записи, которые фиксируются в одной транзакции с движениями журнала
 *
 * Реализуется адаптером хранилища поверх его транзакции. Если работа,
 * переданная в ILedgerStore::append, бросает исключение, откатываются
 * и движения, и всё записанное через этот интерфейс.
 */
class ILedgerTransaction {
public:
    virtual ~ILedgerTransaction() = default;

    /**
     * @brief Заявка идемпотентности ("POS:R-1001")
     * @return false если заявка уже есть
     */
    virtual bool claimReference(const std::string& key) = 0;

    /**
     * @return false если партия уже есть (метаданные не меняются)
     */
    virtual bool insertBatchIfAbsent(const domain::StockBatch& batch) = 0;

    virtual bool saveSale(const domain::SaleRecord& sale) = 0;

    virtual bool saveInvoice(const domain::SupplierInvoice& invoice) = 0;

    /**
     * @return entry_id строки выписки или nullopt, если tran_id уже есть
     */
    virtual std::optional<int64_t> insertBankEntry(const domain::BankLedgerEntry& entry) = 0;
};

/**
 * @brief Работа внутри транзакции append
 *
 * Получает entry_id дописываемых записей (в порядке entries).
 */
using TransactionWork = std::function<void(const domain::EntryIds&, ILedgerTransaction&)>;

} // namespace pharmacy::ports::output
