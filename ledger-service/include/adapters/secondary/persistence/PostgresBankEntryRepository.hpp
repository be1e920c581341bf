// include/adapters/secondary/persistence/PostgresBankEntryRepository.hpp
#pragma once

#include "ports/output/IBankEntryRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace pharmacy::adapters::secondary {

/**
 * @brief PostgreSQL строки банковской выписки
 *
 * Таблица: bank_ledger_entries
 * - entry_id BIGSERIAL PRIMARY KEY
 * - account_id VARCHAR(64) NOT NULL
 * - tran_id VARCHAR(80) UNIQUE NOT NULL
 * - occurred_at BIGINT                (Unix ms)
 * - direction VARCHAR(2)              (CR | DR)
 * - amount, running_balance BIGINT, declared_balance BIGINT NULL  (в пайсах)
 * - description VARCHAR(250)
 * - status VARCHAR(10)                (IMPORTED | APPROVED | FLAGGED)
 * - approved_by VARCHAR(100) NULL, approved_at BIGINT NULL
 * - ledger_entry_id BIGINT NULL, corrects_entry_id BIGINT NULL
 */
class PostgresBankEntryRepository : public ports::output::IBankEntryRepository {
public:
    explicit PostgresBankEntryRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    std::optional<int64_t> insert(const domain::BankLedgerEntry& entry) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            auto entryId = insertIn(txn, entry);
            txn.commit();
            return entryId;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresBankEntryRepository] insert error: " << e.what() << std::endl;
            throw;
        }
    }

    /**
     * @brief Вставка строки выписки в переданной транзакции, без commit
     * @return entry_id или nullopt, если tran_id уже занят
     */
    static std::optional<int64_t> insertIn(pqxx::work& txn, const domain::BankLedgerEntry& entry) {
        std::optional<int64_t> declared;
        if (entry.declaredBalance) {
            declared = entry.declaredBalance->minor;
        }

        auto result = txn.exec_params(
            "INSERT INTO bank_ledger_entries "
            "(account_id, tran_id, occurred_at, direction, amount, running_balance, declared_balance, "
            " currency, description, reference_type, reference_id, status, ledger_entry_id, "
            " corrects_entry_id, imported_at) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15) "
            "ON CONFLICT (tran_id) DO NOTHING "
            "RETURNING entry_id",
            entry.accountId,
            entry.tranId,
            entry.occurredAt.toUnixMillis(),
            domain::toString(entry.direction),
            entry.amount.minor,
            entry.runningBalance.minor,
            declared,
            entry.amount.currency,
            entry.description,
            domain::toString(entry.reference.type),
            entry.reference.id,
            domain::toString(entry.status),
            entry.ledgerEntryId,
            entry.correctsEntryId,
            entry.importedAt.toUnixMillis()
        );

        if (result.empty()) {
            return std::nullopt;
        }
        return result[0]["entry_id"].as<int64_t>();
    }

    std::optional<domain::BankLedgerEntry> findById(int64_t entryId) override {
        auto rows = query("WHERE entry_id = $1", entryId);
        if (rows.empty()) {
            return std::nullopt;
        }
        return rows.front();
    }

    std::optional<domain::BankLedgerEntry> findByTranId(const std::string& tranId) override {
        auto rows = query("WHERE tran_id = $1", tranId);
        if (rows.empty()) {
            return std::nullopt;
        }
        return rows.front();
    }

    std::vector<domain::BankLedgerEntry> findByAccount(const std::string& accountId) override {
        return query("WHERE account_id = $1 ORDER BY occurred_at, entry_id", accountId);
    }

    std::vector<domain::BankLedgerEntry> findUnreconciled(const std::optional<std::string>& accountId) override {
        return query(
            "WHERE status = 'IMPORTED' AND approved_by IS NULL "
            "  AND ($1::VARCHAR IS NULL OR account_id = $1::VARCHAR) "
            "ORDER BY occurred_at, entry_id",
            accountId);
    }

    std::vector<domain::BankLedgerEntry> findCorrections(int64_t flaggedEntryId) override {
        return query("WHERE corrects_entry_id = $1 ORDER BY entry_id", flaggedEntryId);
    }

    bool markApproved(int64_t entryId, const std::string& approver, const domain::Timestamp& at) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            // Атомарная проверка "ещё не утверждена" и запись
            auto result = txn.exec_params(
                "UPDATE bank_ledger_entries "
                "SET approved_by = $2, approved_at = $3, status = 'APPROVED' "
                "WHERE entry_id = $1 AND approved_by IS NULL AND status = 'IMPORTED' "
                "RETURNING entry_id",
                entryId,
                approver,
                at.toUnixMillis()
            );

            if (result.empty()) {
                return false;
            }

            txn.commit();
            std::cout << "[PostgresBankEntryRepository] Approved " << entryId << " by " << approver << std::endl;
            return true;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresBankEntryRepository] markApproved error: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    template <typename Param>
    std::vector<domain::BankLedgerEntry> query(const std::string& whereClause, const Param& param) {
        std::vector<domain::BankLedgerEntry> entries;
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT entry_id, account_id, tran_id, occurred_at, direction, amount, running_balance, "
                "       declared_balance, currency, description, reference_type, reference_id, status, "
                "       approved_by, approved_at, ledger_entry_id, corrects_entry_id, imported_at "
                "FROM bank_ledger_entries " + whereClause,
                param
            );
            txn.commit();

            for (const auto& row : result) {
                entries.push_back(rowToEntry(row));
            }
        } catch (const std::exception& e) {
            std::cerr << "[PostgresBankEntryRepository] query error: " << e.what() << std::endl;
            throw;
        }
        return entries;
    }

    static domain::BankLedgerEntry rowToEntry(const pqxx::row& row) {
        auto currency = row["currency"].as<std::string>();

        domain::BankLedgerEntry entry;
        entry.entryId = row["entry_id"].as<int64_t>();
        entry.accountId = row["account_id"].as<std::string>();
        entry.tranId = row["tran_id"].as<std::string>();
        entry.occurredAt = domain::Timestamp::fromUnixMillis(row["occurred_at"].as<int64_t>());
        entry.direction = domain::movementKindFromString(row["direction"].as<std::string>());
        entry.amount = domain::Money(row["amount"].as<int64_t>(), currency);
        entry.runningBalance = domain::Money(row["running_balance"].as<int64_t>(), currency);
        if (!row["declared_balance"].is_null()) {
            entry.declaredBalance = domain::Money(row["declared_balance"].as<int64_t>(), currency);
        }
        entry.description = row["description"].is_null() ? "" : row["description"].as<std::string>();
        entry.reference.type = domain::referenceTypeFromString(row["reference_type"].as<std::string>());
        if (!row["reference_id"].is_null()) {
            entry.reference.id = row["reference_id"].as<std::string>();
        }
        entry.status = domain::entryStatusFromString(row["status"].as<std::string>());
        if (!row["approved_by"].is_null()) {
            entry.approvedBy = row["approved_by"].as<std::string>();
            entry.approvedAt = domain::Timestamp::fromUnixMillis(row["approved_at"].as<int64_t>());
        }
        if (!row["ledger_entry_id"].is_null()) {
            entry.ledgerEntryId = row["ledger_entry_id"].as<int64_t>();
        }
        if (!row["corrects_entry_id"].is_null()) {
            entry.correctsEntryId = row["corrects_entry_id"].as<int64_t>();
        }
        entry.importedAt = domain::Timestamp::fromUnixMillis(row["imported_at"].as<int64_t>());
        return entry;
    }

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS bank_ledger_entries (
                    entry_id BIGSERIAL PRIMARY KEY,
                    account_id VARCHAR(64) NOT NULL,
                    tran_id VARCHAR(80) UNIQUE NOT NULL,
                    occurred_at BIGINT NOT NULL,
                    direction VARCHAR(2) NOT NULL CHECK (direction IN ('CR', 'DR')),
                    amount BIGINT NOT NULL CHECK (amount > 0),
                    running_balance BIGINT NOT NULL,
                    declared_balance BIGINT,
                    currency VARCHAR(3) NOT NULL DEFAULT 'INR',
                    description VARCHAR(250),
                    reference_type VARCHAR(20) NOT NULL DEFAULT 'MANUAL',
                    reference_id VARCHAR(100),
                    status VARCHAR(10) NOT NULL DEFAULT 'IMPORTED',
                    approved_by VARCHAR(100),
                    approved_at BIGINT,
                    ledger_entry_id BIGINT,
                    corrects_entry_id BIGINT REFERENCES bank_ledger_entries(entry_id),
                    imported_at BIGINT NOT NULL
                )
            )");

            txn.exec("CREATE INDEX IF NOT EXISTS idx_bank_entries_account ON bank_ledger_entries (account_id, occurred_at)");

            txn.commit();
            std::cout << "[PostgresBankEntryRepository] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresBankEntryRepository] initSchema error: " << e.what() << std::endl;
        }
    }
};

} // namespace pharmacy::adapters::secondary
