// include/adapters/secondary/persistence/PostgresProjectionRepository.hpp
#pragma once

#include "ports/output/IProjectionRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace pharmacy::adapters::secondary {

/**
 * @brief PostgreSQL кэш проекций
 *
 * Таблица: ledger_projections
 * - projection_key VARCHAR(320) PRIMARY KEY   ("STOCK:name#batch", "CASH:acc")
 * - value BIGINT NOT NULL
 * - last_entry_id BIGINT NOT NULL
 * - updated_at TIMESTAMP DEFAULT NOW()
 *
 * Ошибки чтения не фатальны: без кэша проектор свернёт журнал целиком.
 */
class PostgresProjectionRepository : public ports::output::IProjectionRepository {
public:
    explicit PostgresProjectionRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    std::optional<domain::Projection> find(const std::string& key) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT projection_key, value, last_entry_id FROM ledger_projections WHERE projection_key = $1",
                key
            );

            if (result.empty()) {
                return std::nullopt;
            }

            domain::Projection projection;
            projection.entityKey = result[0]["projection_key"].as<std::string>();
            projection.value = result[0]["value"].as<int64_t>();
            projection.lastEntryId = result[0]["last_entry_id"].as<int64_t>();
            return projection;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresProjectionRepository] find error: " << e.what() << std::endl;
            return std::nullopt;
        }
    }

    void advance(const domain::Projection& projection) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            // Кэш только движется вперёд
            txn.exec_params(
                "INSERT INTO ledger_projections (projection_key, value, last_entry_id, updated_at) "
                "VALUES ($1, $2, $3, NOW()) "
                "ON CONFLICT (projection_key) DO UPDATE SET "
                "value = EXCLUDED.value, "
                "last_entry_id = EXCLUDED.last_entry_id, "
                "updated_at = NOW() "
                "WHERE ledger_projections.last_entry_id < EXCLUDED.last_entry_id",
                projection.entityKey,
                projection.value,
                projection.lastEntryId
            );

            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresProjectionRepository] advance error: " << e.what() << std::endl;
        }
    }

    void overwrite(const domain::Projection& projection) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                "INSERT INTO ledger_projections (projection_key, value, last_entry_id, updated_at) "
                "VALUES ($1, $2, $3, NOW()) "
                "ON CONFLICT (projection_key) DO UPDATE SET "
                "value = EXCLUDED.value, "
                "last_entry_id = EXCLUDED.last_entry_id, "
                "updated_at = NOW()",
                projection.entityKey,
                projection.value,
                projection.lastEntryId
            );

            txn.commit();
            std::cout << "[PostgresProjectionRepository] Overwrote " << projection.entityKey << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresProjectionRepository] overwrite error: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_projections (
                    projection_key VARCHAR(320) PRIMARY KEY,
                    value BIGINT NOT NULL,
                    last_entry_id BIGINT NOT NULL,
                    updated_at TIMESTAMP DEFAULT NOW()
                )
            )");

            txn.commit();
            std::cout << "[PostgresProjectionRepository] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresProjectionRepository] initSchema error: " << e.what() << std::endl;
        }
    }
};

} // namespace pharmacy::adapters::secondary
