#pragma once

#include "adapters/secondary/persistence/InMemoryBankEntryRepository.hpp"
#include "adapters/secondary/persistence/InMemoryDocumentRepository.hpp"
#include "adapters/secondary/persistence/InMemoryIdempotencyRepository.hpp"
#include "adapters/secondary/persistence/InMemoryStockBatchRepository.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include "ports/output/ILedgerStore.hpp"
#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <stdexcept>
#include <unordered_map>

namespace pharmacy::adapters::secondary {

/**
 * @brief In-memory журнал (тесты и встроенное использование)
 *
 * Все записи лежат в одном векторе по порядку вставки; entry_id = позиция + 1.
 * append берёт unique_lock, чтение - shared_lock, поэтому читатель
 * всегда видит согласованный префикс журнала.
 *
 * Работа append пишет в переданные in-memory репозитории и ведёт журнал
 * отмены: если работа бросила исключение, её записи удаляются в обратном
 * порядке, а движения в журнал не попадают.
 */
class InMemoryLedgerStore : public ports::output::ILedgerStore {
public:
    InMemoryLedgerStore() = default;

    InMemoryLedgerStore(std::shared_ptr<InMemoryIdempotencyRepository> claims,
                        std::shared_ptr<InMemoryStockBatchRepository> batches,
                        std::shared_ptr<InMemoryDocumentRepository> documents,
                        std::shared_ptr<InMemoryBankEntryRepository> bankEntries)
        : claims_(std::move(claims))
        , batches_(std::move(batches))
        , documents_(std::move(documents))
        , bankEntries_(std::move(bankEntries))
    {}

    using ports::output::ILedgerStore::append;

    domain::EntryIds append(const std::vector<domain::LedgerEntry>& entries,
                            const ports::output::ExpectedHeads& expectedHeads,
                            const ports::output::TransactionWork& work) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        for (const auto& [key, expected] : expectedHeads) {
            if (headLocked(key) != expected) {
                throw domain::ConcurrencyConflict(key);
            }
        }

        for (const auto& entry : entries) {
            if (domain::isDeduplicated(entry) && references_.count(entry.reference.key())) {
                throw domain::ConflictError(entry.reference.key());
            }
        }

        domain::EntryIds ids;
        for (std::size_t i = 0; i < entries.size(); ++i) {
            ids.push_back(static_cast<int64_t>(entries_.size() + i) + 1);
        }

        if (work) {
            InMemoryTransaction tx(*this);
            try {
                work(ids, tx);
            } catch (...) {
                tx.rollback();
                throw;
            }
        }

        auto now = domain::Timestamp::now();
        for (const auto& entry : entries) {
            domain::LedgerEntry stored = entry;
            stored.entryId = static_cast<int64_t>(entries_.size()) + 1;
            stored.recordedAt = now;
            entries_.push_back(stored);
            byEntity_[stored.entityKey].push_back(entries_.size() - 1);
            if (domain::isDeduplicated(stored)) {
                references_[stored.reference.key()].push_back(entries_.size() - 1);
            }
        }
        return ids;
    }

    std::vector<domain::LedgerEntry> readPage(const std::string& entityKey,
                                              const std::optional<domain::Timestamp>& asOf,
                                              const std::optional<domain::LedgerCursor>& after,
                                              std::size_t limit) override {
        std::vector<domain::LedgerEntry> ordered;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = byEntity_.find(entityKey);
            if (it == byEntity_.end()) {
                return {};
            }
            for (auto index : it->second) {
                const auto& entry = entries_[index];
                if (asOf && entry.occurredAt > *asOf) continue;
                if (after && !domain::isAfter(entry, *after)) continue;
                ordered.push_back(entry);
            }
        }

        std::sort(ordered.begin(), ordered.end(), domain::ledgerOrderLess);
        if (ordered.size() > limit) {
            ordered.resize(limit);
        }
        return ordered;
    }

    std::vector<domain::LedgerEntry> readSince(const std::string& entityKey, int64_t afterEntryId) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<domain::LedgerEntry> result;
        auto it = byEntity_.find(entityKey);
        if (it == byEntity_.end()) {
            return result;
        }
        for (auto index : it->second) {
            if (entries_[index].entryId > afterEntryId) {
                result.push_back(entries_[index]);
            }
        }
        return result;
    }

    std::optional<domain::LedgerEntry> findById(int64_t entryId) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (entryId <= 0 || entryId > static_cast<int64_t>(entries_.size())) {
            return std::nullopt;
        }
        return entries_[entryId - 1];
    }

    std::vector<domain::LedgerEntry> findByReference(const domain::Reference& reference) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<domain::LedgerEntry> result;
        for (const auto& entry : entries_) {
            if (entry.reference == reference) {
                result.push_back(entry);
            }
        }
        return result;
    }

    bool hasReference(const domain::Reference& reference) override {
        if (!reference.isDeduplicated()) {
            return false;
        }
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return references_.count(reference.key()) > 0;
    }

    int64_t head(const std::string& entityKey) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return headLocked(entityKey);
    }

    std::vector<std::string> entityKeys(domain::LedgerDomain ledger) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::set<std::string> keys;
        for (const auto& entry : entries_) {
            if (entry.domain == ledger) {
                keys.insert(entry.entityKey);
            }
        }
        return std::vector<std::string>(keys.begin(), keys.end());
    }

    std::size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.size();
    }

private:
    class InMemoryTransaction : public ports::output::ILedgerTransaction {
    public:
        explicit InMemoryTransaction(InMemoryLedgerStore& store) : store_(store) {}

        bool claimReference(const std::string& key) override {
            auto& claims = require(store_.claims_, "idempotency");
            if (!claims.insertIfAbsent(key)) {
                return false;
            }
            undo_.push_back([&claims, key] { claims.remove(key); });
            return true;
        }

        bool insertBatchIfAbsent(const domain::StockBatch& batch) override {
            auto& batches = require(store_.batches_, "stock batch");
            if (!batches.insertIfAbsent(batch)) {
                return false;
            }
            undo_.push_back([&batches, key = batch.key] { batches.erase(key); });
            return true;
        }

        bool saveSale(const domain::SaleRecord& sale) override {
            auto& documents = require(store_.documents_, "document");
            if (!documents.saveSale(sale)) {
                return false;
            }
            undo_.push_back([&documents, number = sale.receiptNumber] { documents.eraseSale(number); });
            return true;
        }

        bool saveInvoice(const domain::SupplierInvoice& invoice) override {
            auto& documents = require(store_.documents_, "document");
            if (!documents.saveInvoice(invoice)) {
                return false;
            }
            undo_.push_back([&documents, number = invoice.invoiceNumber] { documents.eraseInvoice(number); });
            return true;
        }

        std::optional<int64_t> insertBankEntry(const domain::BankLedgerEntry& entry) override {
            auto& bankEntries = require(store_.bankEntries_, "bank entry");
            auto entryId = bankEntries.insert(entry);
            if (entryId) {
                undo_.push_back([&bankEntries, id = *entryId] { bankEntries.erase(id); });
            }
            return entryId;
        }

        void rollback() {
            for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
                (*it)();
            }
            undo_.clear();
        }

    private:
        InMemoryLedgerStore& store_;
        std::vector<std::function<void()>> undo_;

        template<typename Repository>
        static Repository& require(const std::shared_ptr<Repository>& repository, const char* name) {
            if (!repository) {
                throw std::logic_error(std::string("InMemoryLedgerStore has no ") + name + " repository");
            }
            return *repository;
        }
    };

    std::shared_ptr<InMemoryIdempotencyRepository> claims_;
    std::shared_ptr<InMemoryStockBatchRepository> batches_;
    std::shared_ptr<InMemoryDocumentRepository> documents_;
    std::shared_ptr<InMemoryBankEntryRepository> bankEntries_;

    mutable std::shared_mutex mutex_;
    std::vector<domain::LedgerEntry> entries_;
    std::unordered_map<std::string, std::vector<std::size_t>> byEntity_;
    std::unordered_map<std::string, std::vector<std::size_t>> references_;

    int64_t headLocked(const std::string& entityKey) const {
        auto it = byEntity_.find(entityKey);
        if (it == byEntity_.end() || it->second.empty()) {
            return 0;
        }
        return entries_[it->second.back()].entryId;
    }
};

} // namespace pharmacy::adapters::secondary
