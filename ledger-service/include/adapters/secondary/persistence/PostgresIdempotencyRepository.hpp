#pragma once

#include "ports/output/IIdempotencyRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace pharmacy::adapters::secondary
{

    /**
     * @brief PostgreSQL заявки идемпотентности
     *
     * Таблица: idempotency_claims
     * - claim_key VARCHAR(130) PRIMARY KEY   ("POS:R-1001")
     * - claimed_at TIMESTAMP DEFAULT NOW()
     */
    class PostgresIdempotencyRepository : public pharmacy::ports::output::IIdempotencyRepository
    {
    public:
        explicit PostgresIdempotencyRepository(std::shared_ptr<pharmacy::settings::DbSettings> s) : settings_(std::move(s))
        {
            initSchema();
            std::cout << "[IdempotencyRepo] Connected to " << settings_->getName() << std::endl;
        }

        bool insertIfAbsent(const std::string &key) override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            bool inserted = insertIn(t, key);
            t.commit();
            return inserted;
        }

        /**
         * @brief Вставка в чужой транзакции (фиксируется вместе с журналом)
         */
        static bool insertIn(pqxx::work &t, const std::string &key)
        {
            auto r = t.exec_params(
                "INSERT INTO idempotency_claims (claim_key) VALUES ($1) "
                "ON CONFLICT (claim_key) DO NOTHING RETURNING claim_key",
                key);
            if (r.empty())
                return false;
            std::cout << "[IdempotencyRepo] Claimed key: " << key << std::endl;
            return true;
        }

        bool contains(const std::string &key) override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec_params("SELECT 1 FROM idempotency_claims WHERE claim_key=$1", key);
            return !r.empty();
        }

    private:
        std::shared_ptr<pharmacy::settings::DbSettings> settings_;

        void initSchema()
        {
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                pqxx::work t(c);
                t.exec(R"(
                    CREATE TABLE IF NOT EXISTS idempotency_claims (
                        claim_key VARCHAR(130) PRIMARY KEY,
                        claimed_at TIMESTAMP DEFAULT NOW()
                    )
                )");
                t.commit();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[IdempotencyRepo] initSchema error: " << e.what() << std::endl;
            }
        }
    };

} // namespace pharmacy::adapters::secondary
