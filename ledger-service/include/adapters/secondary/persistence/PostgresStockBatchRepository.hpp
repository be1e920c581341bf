// include/adapters/secondary/persistence/PostgresStockBatchRepository.hpp
#pragma once

#include "ports/output/IStockBatchRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace pharmacy::adapters::secondary {

/**
 * @brief PostgreSQL метаданные партий
 *
 * Таблица: stock_batches
 * - medicine_name VARCHAR(200), batch_number VARCHAR(50)  PRIMARY KEY (оба)
 * - manufacturer VARCHAR(200)
 * - expiry_date DATE NULL
 * - reorder_level INT NOT NULL DEFAULT 50
 * - cost_price BIGINT, selling_price BIGINT  (в пайсах)
 * - currency VARCHAR(3) NOT NULL DEFAULT 'INR'
 * - location VARCHAR(50)
 * - created_at BIGINT  (Unix ms)
 *
 * Количество здесь не хранится - только в журнале.
 */
class PostgresStockBatchRepository : public ports::output::IStockBatchRepository {
public:
    explicit PostgresStockBatchRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    bool insertIfAbsent(const domain::StockBatch& batch) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            bool inserted = insertIn(txn, batch);
            txn.commit();
            return inserted;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresStockBatchRepository] insertIfAbsent error: " << e.what() << std::endl;
            throw;
        }
    }

    /**
     * @brief INSERT ... ON CONFLICT DO NOTHING в переданной транзакции, без commit
     */
    static bool insertIn(pqxx::work& txn, const domain::StockBatch& batch) {
        std::optional<std::string> expiry;
        if (batch.expiryDate) {
            expiry = batch.expiryDate->toDateString();
        }

        auto result = txn.exec_params(
            "INSERT INTO stock_batches "
            "(medicine_name, batch_number, manufacturer, expiry_date, reorder_level, "
            " cost_price, selling_price, currency, location, created_at) "
            "VALUES ($1, $2, $3, $4::DATE, $5, $6, $7, $8, $9, $10) "
            "ON CONFLICT (medicine_name, batch_number) DO NOTHING "
            "RETURNING batch_number",
            batch.key.medicineName,
            batch.key.batchNumber,
            batch.manufacturer,
            expiry,
            batch.reorderLevel,
            batch.costPrice.minor,
            batch.sellingPrice.minor,
            batch.costPrice.currency,
            batch.location,
            batch.createdAt.toUnixMillis()
        );

        if (!result.empty()) {
            std::cout << "[PostgresStockBatchRepository] Created batch " << batch.key.entityKey() << std::endl;
        }
        return !result.empty();
    }

    std::optional<domain::StockBatch> find(const domain::BatchKey& key) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + std::string(COLUMNS) + " FROM stock_batches "
                "WHERE medicine_name = $1 AND batch_number = $2",
                key.medicineName,
                key.batchNumber
            );

            if (result.empty()) {
                return std::nullopt;
            }
            return rowToBatch(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresStockBatchRepository] find error: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::StockBatch> findAll() override {
        std::vector<domain::StockBatch> batches;
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec(
                "SELECT " + std::string(COLUMNS) + " FROM stock_batches ORDER BY medicine_name, batch_number"
            );

            for (const auto& row : result) {
                batches.push_back(rowToBatch(row));
            }
        } catch (const std::exception& e) {
            std::cerr << "[PostgresStockBatchRepository] findAll error: " << e.what() << std::endl;
            throw;
        }
        return batches;
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    static constexpr const char* COLUMNS =
        "medicine_name, batch_number, manufacturer, TO_CHAR(expiry_date, 'YYYY-MM-DD') AS expiry_date, "
        "reorder_level, cost_price, selling_price, currency, location, created_at";

    static domain::StockBatch rowToBatch(const pqxx::row& row) {
        domain::StockBatch batch;
        batch.key.medicineName = row["medicine_name"].as<std::string>();
        batch.key.batchNumber = row["batch_number"].as<std::string>();
        batch.manufacturer = row["manufacturer"].is_null() ? "" : row["manufacturer"].as<std::string>();
        if (!row["expiry_date"].is_null()) {
            batch.expiryDate = domain::Timestamp::fromString(row["expiry_date"].as<std::string>());
        }
        batch.reorderLevel = row["reorder_level"].as<int64_t>();
        auto currency = row["currency"].as<std::string>();
        batch.costPrice = domain::Money(row["cost_price"].as<int64_t>(), currency);
        batch.sellingPrice = domain::Money(row["selling_price"].as<int64_t>(), currency);
        batch.location = row["location"].is_null() ? "" : row["location"].as<std::string>();
        batch.createdAt = domain::Timestamp::fromUnixMillis(row["created_at"].as<int64_t>());
        return batch;
    }

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS stock_batches (
                    medicine_name VARCHAR(200) NOT NULL,
                    batch_number VARCHAR(50) NOT NULL,
                    manufacturer VARCHAR(200),
                    expiry_date DATE,
                    reorder_level INT NOT NULL DEFAULT 50,
                    cost_price BIGINT NOT NULL DEFAULT 0,
                    selling_price BIGINT NOT NULL DEFAULT 0,
                    currency VARCHAR(3) NOT NULL DEFAULT 'INR',
                    location VARCHAR(50),
                    created_at BIGINT NOT NULL,
                    PRIMARY KEY (medicine_name, batch_number)
                )
            )");

            txn.exec("CREATE INDEX IF NOT EXISTS idx_stock_batches_expiry ON stock_batches (expiry_date)");

            txn.commit();
            std::cout << "[PostgresStockBatchRepository] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresStockBatchRepository] initSchema error: " << e.what() << std::endl;
        }
    }
};

} // namespace pharmacy::adapters::secondary
