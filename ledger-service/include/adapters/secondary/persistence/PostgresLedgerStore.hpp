// include/adapters/secondary/persistence/PostgresLedgerStore.hpp
#pragma once

#include "adapters/secondary/persistence/PostgresBankEntryRepository.hpp"
#include "adapters/secondary/persistence/PostgresDocumentRepository.hpp"
#include "adapters/secondary/persistence/PostgresIdempotencyRepository.hpp"
#include "adapters/secondary/persistence/PostgresStockBatchRepository.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <set>

namespace pharmacy::adapters::secondary {

/**
 * @brief PostgreSQL журнал движений
 *
 * Таблица: ledger_entries (только INSERT)
 * - entry_id BIGSERIAL PRIMARY KEY        (порядок вставки)
 * - domain VARCHAR(8)                     (STOCK | CASH)
 * - entity_key VARCHAR(300)
 * - signed_amount BIGINT                  (штуки или пайсы)
 * - movement_kind VARCHAR(8)
 * - reference_type VARCHAR(20), reference_id VARCHAR(100) NULL
 * - occurred_at BIGINT, recorded_at BIGINT (Unix ms)
 * - remarks TEXT
 *
 * Таблица: ledger_references - UNIQUE (reference_type, reference_id),
 * одна строка на применённое событие.
 *
 * append сериализуется по ключам сущностей через pg_advisory_xact_lock,
 * поэтому entry_id внутри одной сущности растёт в порядке коммитов.
 * Заявка идемпотентности, партия, документ и строка выписки пишутся
 * работой append в ту же pqxx::work и фиксируются одним commit.
 */
class PostgresLedgerStore : public ports::output::ILedgerStore {
public:
    explicit PostgresLedgerStore(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    using ports::output::ILedgerStore::append;

    domain::EntryIds append(const std::vector<domain::LedgerEntry>& entries,
                            const ports::output::ExpectedHeads& expectedHeads,
                            const ports::output::TransactionWork& work) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            // Ключи блокируем в отсортированном порядке
            std::set<std::string> keys;
            for (const auto& entry : entries) {
                keys.insert(entry.entityKey);
            }
            for (const auto& [key, expected] : expectedHeads) {
                keys.insert(key);
            }
            for (const auto& key : keys) {
                txn.exec_params("SELECT pg_advisory_xact_lock(hashtext($1))", key);
            }

            for (const auto& [key, expected] : expectedHeads) {
                auto result = txn.exec_params(
                    "SELECT COALESCE(MAX(entry_id), 0) AS head FROM ledger_entries WHERE entity_key = $1",
                    key
                );
                if (result[0]["head"].as<int64_t>() != expected) {
                    throw domain::ConcurrencyConflict(key);
                }
            }

            std::set<std::string> claimed;
            for (const auto& entry : entries) {
                if (!domain::isDeduplicated(entry) || claimed.count(entry.reference.key())) {
                    continue;
                }
                auto result = txn.exec_params(
                    "INSERT INTO ledger_references (reference_type, reference_id) VALUES ($1, $2) "
                    "ON CONFLICT (reference_type, reference_id) DO NOTHING "
                    "RETURNING reference_id",
                    domain::toString(entry.reference.type),
                    *entry.reference.id
                );
                if (result.empty()) {
                    throw domain::ConflictError(entry.reference.key());
                }
                claimed.insert(entry.reference.key());
            }

            auto recordedAt = domain::Timestamp::now().toUnixMillis();
            domain::EntryIds ids;
            for (const auto& entry : entries) {
                auto result = txn.exec_params(
                    "INSERT INTO ledger_entries "
                    "(domain, entity_key, signed_amount, movement_kind, reference_type, reference_id, "
                    " occurred_at, recorded_at, remarks) "
                    "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9) "
                    "RETURNING entry_id",
                    domain::toString(entry.domain),
                    entry.entityKey,
                    entry.signedAmount,
                    domain::toString(entry.kind),
                    domain::toString(entry.reference.type),
                    entry.reference.id,
                    entry.occurredAt.toUnixMillis(),
                    recordedAt,
                    entry.remarks
                );
                ids.push_back(result[0]["entry_id"].as<int64_t>());
            }

            if (work) {
                PgLedgerTransaction tx(txn);
                work(ids, tx);
            }

            txn.commit();
            std::cout << "[PostgresLedgerStore] Appended " << ids.size() << " entries" << std::endl;
            return ids;

        } catch (const domain::LedgerException&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] append error: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::LedgerEntry> readPage(const std::string& entityKey,
                                              const std::optional<domain::Timestamp>& asOf,
                                              const std::optional<domain::LedgerCursor>& after,
                                              std::size_t limit) override {
        std::optional<int64_t> asOfMs;
        if (asOf) {
            asOfMs = asOf->toUnixMillis();
        }
        std::optional<int64_t> afterOccurred;
        std::optional<int64_t> afterRecorded;
        std::optional<int64_t> afterId;
        if (after) {
            afterOccurred = after->occurredAt.toUnixMillis();
            afterRecorded = after->recordedAt.toUnixMillis();
            afterId = after->entryId;
        }

        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + std::string(COLUMNS) + " FROM ledger_entries "
                "WHERE entity_key = $1 "
                "  AND ($2::BIGINT IS NULL OR occurred_at <= $2::BIGINT) "
                "  AND ($3::BIGINT IS NULL OR (occurred_at, recorded_at, entry_id) > ($3::BIGINT, $4::BIGINT, $5::BIGINT)) "
                "ORDER BY occurred_at, recorded_at, entry_id "
                "LIMIT $6",
                entityKey,
                asOfMs,
                afterOccurred,
                afterRecorded,
                afterId,
                static_cast<int64_t>(limit)
            );
            txn.commit();
            return toEntries(result);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] readPage error: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::LedgerEntry> readSince(const std::string& entityKey, int64_t afterEntryId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + std::string(COLUMNS) + " FROM ledger_entries "
                "WHERE entity_key = $1 AND entry_id > $2 "
                "ORDER BY entry_id",
                entityKey,
                afterEntryId
            );
            txn.commit();
            return toEntries(result);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] readSince error: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::LedgerEntry> findById(int64_t entryId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + std::string(COLUMNS) + " FROM ledger_entries WHERE entry_id = $1",
                entryId
            );
            txn.commit();

            if (result.empty()) {
                return std::nullopt;
            }
            return rowToEntry(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] findById error: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::LedgerEntry> findByReference(const domain::Reference& reference) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + std::string(COLUMNS) + " FROM ledger_entries "
                "WHERE reference_type = $1 AND reference_id IS NOT DISTINCT FROM $2 "
                "ORDER BY entry_id",
                domain::toString(reference.type),
                reference.id
            );
            txn.commit();
            return toEntries(result);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] findByReference error: " << e.what() << std::endl;
            throw;
        }
    }

    bool hasReference(const domain::Reference& reference) override {
        if (!reference.isDeduplicated()) {
            return false;
        }
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT 1 FROM ledger_references WHERE reference_type = $1 AND reference_id = $2",
                domain::toString(reference.type),
                *reference.id
            );
            txn.commit();
            return !result.empty();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] hasReference error: " << e.what() << std::endl;
            throw;
        }
    }

    int64_t head(const std::string& entityKey) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT COALESCE(MAX(entry_id), 0) AS head FROM ledger_entries WHERE entity_key = $1",
                entityKey
            );
            txn.commit();
            return result[0]["head"].as<int64_t>();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] head error: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<std::string> entityKeys(domain::LedgerDomain ledger) override {
        std::vector<std::string> keys;
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT DISTINCT entity_key FROM ledger_entries WHERE domain = $1 ORDER BY entity_key",
                domain::toString(ledger)
            );
            txn.commit();

            for (const auto& row : result) {
                keys.push_back(row["entity_key"].as<std::string>());
            }
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] entityKeys error: " << e.what() << std::endl;
            throw;
        }
        return keys;
    }

private:
    /**
     * @brief Записи репозиториев внутри транзакции append
     */
    class PgLedgerTransaction : public ports::output::ILedgerTransaction {
    public:
        explicit PgLedgerTransaction(pqxx::work& txn) : txn_(txn) {}

        bool claimReference(const std::string& key) override {
            return PostgresIdempotencyRepository::insertIn(txn_, key);
        }

        bool insertBatchIfAbsent(const domain::StockBatch& batch) override {
            return PostgresStockBatchRepository::insertIn(txn_, batch);
        }

        bool saveSale(const domain::SaleRecord& sale) override {
            return PostgresDocumentRepository::saveSaleIn(txn_, sale);
        }

        bool saveInvoice(const domain::SupplierInvoice& invoice) override {
            return PostgresDocumentRepository::saveInvoiceIn(txn_, invoice);
        }

        std::optional<int64_t> insertBankEntry(const domain::BankLedgerEntry& entry) override {
            return PostgresBankEntryRepository::insertIn(txn_, entry);
        }

    private:
        pqxx::work& txn_;
    };

    std::shared_ptr<settings::DbSettings> settings_;

    static constexpr const char* COLUMNS =
        "entry_id, domain, entity_key, signed_amount, movement_kind, "
        "reference_type, reference_id, occurred_at, recorded_at, remarks";

    static domain::LedgerEntry rowToEntry(const pqxx::row& row) {
        domain::LedgerEntry entry;
        entry.entryId = row["entry_id"].as<int64_t>();
        entry.domain = domain::ledgerDomainFromString(row["domain"].as<std::string>());
        entry.entityKey = row["entity_key"].as<std::string>();
        entry.signedAmount = row["signed_amount"].as<int64_t>();
        entry.kind = domain::movementKindFromString(row["movement_kind"].as<std::string>());
        entry.reference.type = domain::referenceTypeFromString(row["reference_type"].as<std::string>());
        if (!row["reference_id"].is_null()) {
            entry.reference.id = row["reference_id"].as<std::string>();
        }
        entry.occurredAt = domain::Timestamp::fromUnixMillis(row["occurred_at"].as<int64_t>());
        entry.recordedAt = domain::Timestamp::fromUnixMillis(row["recorded_at"].as<int64_t>());
        entry.remarks = row["remarks"].is_null() ? "" : row["remarks"].as<std::string>();
        return entry;
    }

    static std::vector<domain::LedgerEntry> toEntries(const pqxx::result& result) {
        std::vector<domain::LedgerEntry> entries;
        entries.reserve(result.size());
        for (const auto& row : result) {
            entries.push_back(rowToEntry(row));
        }
        return entries;
    }

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_entries (
                    entry_id BIGSERIAL PRIMARY KEY,
                    domain VARCHAR(8) NOT NULL CHECK (domain IN ('STOCK', 'CASH')),
                    entity_key VARCHAR(300) NOT NULL,
                    signed_amount BIGINT NOT NULL,
                    movement_kind VARCHAR(8) NOT NULL CHECK (movement_kind IN ('IN', 'OUT', 'ADJUST', 'CR', 'DR')),
                    reference_type VARCHAR(20) NOT NULL,
                    reference_id VARCHAR(100),
                    occurred_at BIGINT NOT NULL,
                    recorded_at BIGINT NOT NULL,
                    remarks TEXT
                )
            )");

            txn.exec(R"(
                CREATE INDEX IF NOT EXISTS idx_ledger_entries_entity_order
                    ON ledger_entries (entity_key, occurred_at, recorded_at, entry_id)
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_references (
                    reference_type VARCHAR(20) NOT NULL,
                    reference_id VARCHAR(100) NOT NULL,
                    created_at TIMESTAMP DEFAULT NOW(),
                    PRIMARY KEY (reference_type, reference_id)
                )
            )");

            txn.commit();
            std::cout << "[PostgresLedgerStore] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] initSchema error: " << e.what() << std::endl;
        }
    }
};

} // namespace pharmacy::adapters::secondary
