// include/adapters/secondary/persistence/PostgresBankAccountRepository.hpp
#pragma once

#include "ports/output/IBankAccountRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace pharmacy::adapters::secondary {

/**
 * @brief PostgreSQL банковские счета
 *
 * Таблица: bank_accounts
 * - account_id VARCHAR(64) PRIMARY KEY
 * - opening_balance BIGINT NOT NULL  (в пайсах)
 * - currency VARCHAR(3) NOT NULL DEFAULT 'INR'
 * - opened_at BIGINT NOT NULL        (Unix ms)
 */
class PostgresBankAccountRepository : public ports::output::IBankAccountRepository {
public:
    explicit PostgresBankAccountRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    bool insertIfAbsent(const domain::BankAccount& account) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "INSERT INTO bank_accounts (account_id, opening_balance, currency, opened_at) "
                "VALUES ($1, $2, $3, $4) "
                "ON CONFLICT (account_id) DO NOTHING "
                "RETURNING account_id",
                account.accountId,
                account.openingBalance.minor,
                account.currency,
                account.openedAt.toUnixMillis()
            );

            txn.commit();
            return !result.empty();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresBankAccountRepository] insertIfAbsent error: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::BankAccount> find(const std::string& accountId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT account_id, opening_balance, currency, opened_at "
                "FROM bank_accounts WHERE account_id = $1",
                accountId
            );

            if (result.empty()) {
                return std::nullopt;
            }
            return rowToAccount(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresBankAccountRepository] find error: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::BankAccount> findAll() override {
        std::vector<domain::BankAccount> accounts;
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec(
                "SELECT account_id, opening_balance, currency, opened_at "
                "FROM bank_accounts ORDER BY account_id"
            );

            for (const auto& row : result) {
                accounts.push_back(rowToAccount(row));
            }
        } catch (const std::exception& e) {
            std::cerr << "[PostgresBankAccountRepository] findAll error: " << e.what() << std::endl;
            throw;
        }
        return accounts;
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    static domain::BankAccount rowToAccount(const pqxx::row& row) {
        domain::BankAccount account;
        account.accountId = row["account_id"].as<std::string>();
        account.currency = row["currency"].as<std::string>();
        account.openingBalance = domain::Money(row["opening_balance"].as<int64_t>(), account.currency);
        account.openedAt = domain::Timestamp::fromUnixMillis(row["opened_at"].as<int64_t>());
        return account;
    }

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS bank_accounts (
                    account_id VARCHAR(64) PRIMARY KEY,
                    opening_balance BIGINT NOT NULL,
                    currency VARCHAR(3) NOT NULL DEFAULT 'INR',
                    opened_at BIGINT NOT NULL
                )
            )");

            txn.commit();
            std::cout << "[PostgresBankAccountRepository] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresBankAccountRepository] initSchema error: " << e.what() << std::endl;
        }
    }
};

} // namespace pharmacy::adapters::secondary
