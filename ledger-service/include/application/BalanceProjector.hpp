// include/application/BalanceProjector.hpp
#pragma once

#include "ports/input/IBalanceProjector.hpp"
#include "ports/output/IBankAccountRepository.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "ports/output/IProjectionRepository.hpp"
#include "ports/output/LedgerSequence.hpp"
#include "settings/LedgerSettings.hpp"
#include <iostream>
#include <memory>

namespace pharmacy::application {

/**
 * @brief Свёртка журнала в количество / остаток
 *
 * current() берёт кэш (value, lastEntryId) и досворачивает только записи
 * с entry_id > lastEntryId (онлайн-свёртка вместо пересчёта всей истории).
 * Сумма коммутативна, поэтому порядок досворачивания не влияет на результат.
 *
 * В кэше хранится только свёртка журнала; начальный остаток счёта
 * прибавляется при чтении.
 */
class BalanceProjector : public ports::input::IBalanceProjector {
public:
    BalanceProjector(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<ports::output::IProjectionRepository> projections,
        std::shared_ptr<ports::output::IBankAccountRepository> accounts,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : store_(std::move(store))
      , projections_(std::move(projections))
      , accounts_(std::move(accounts))
      , settings_(std::move(settings))
    {}

    int64_t current(domain::LedgerDomain ledger, const std::string& entityKey) override {
        auto cacheKey = projectionKey(ledger, entityKey);
        auto cached = projections_->find(cacheKey);

        domain::Projection projection{cacheKey, 0, 0};
        if (cached) {
            projection = *cached;
        }

        auto newer = store_->readSince(entityKey, projection.lastEntryId);
        if (!newer.empty()) {
            for (const auto& entry : newer) {
                projection.value += entry.signedAmount;
                if (entry.entryId > projection.lastEntryId) {
                    projection.lastEntryId = entry.entryId;
                }
            }
            projections_->advance(projection);
        }

        return opening(ledger, entityKey) + projection.value;
    }

    int64_t asOf(domain::LedgerDomain ledger, const std::string& entityKey, const domain::Timestamp& at) override {
        int64_t value = 0;
        for (const auto& entry : read(entityKey, at)) {
            value += entry.signedAmount;
        }
        return opening(ledger, entityKey) + value;
    }

    ports::output::LedgerSequence read(const std::string& entityKey,
                                       const std::optional<domain::Timestamp>& asOf) override {
        return ports::output::LedgerSequence(store_, entityKey, asOf, settings_->getPageSize());
    }

    int64_t rebuild(domain::LedgerDomain ledger, const std::string& entityKey) override {
        auto replayed = replay(ledger, entityKey);
        projections_->overwrite(replayed);
        std::cout << "[BalanceProjector] Rebuilt " << entityKey
                  << " value=" << replayed.value << " last=" << replayed.lastEntryId << std::endl;
        return opening(ledger, entityKey) + replayed.value;
    }

    bool verify(domain::LedgerDomain ledger, const std::string& entityKey) override {
        auto replayed = replay(ledger, entityKey);
        auto cached = projections_->find(replayed.entityKey);
        if (!cached) {
            // Кэша нет - сравнивать не с чем, расхождения тоже нет
            return true;
        }

        // Кэш может отставать от журнала, но не расходиться с ним:
        // досворачиваем хвост и сравниваем с полным пересчётом
        int64_t value = cached->value;
        int64_t lastEntryId = cached->lastEntryId;
        for (const auto& entry : store_->readSince(entityKey, cached->lastEntryId)) {
            value += entry.signedAmount;
            if (entry.entryId > lastEntryId) {
                lastEntryId = entry.entryId;
            }
        }

        bool ok = value == replayed.value && lastEntryId == replayed.lastEntryId;
        if (!ok) {
            std::cerr << "[BalanceProjector] Projection drift for " << entityKey
                      << ": cached=" << value << " replayed=" << replayed.value << std::endl;
        }
        return ok;
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<ports::output::IProjectionRepository> projections_;
    std::shared_ptr<ports::output::IBankAccountRepository> accounts_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    static std::string projectionKey(domain::LedgerDomain ledger, const std::string& entityKey) {
        return domain::toString(ledger) + ":" + entityKey;
    }

    int64_t opening(domain::LedgerDomain ledger, const std::string& entityKey) {
        if (ledger != domain::LedgerDomain::CASH) {
            return 0;
        }
        auto account = accounts_->find(entityKey);
        return account ? account->openingBalance.minor : 0;
    }

    domain::Projection replay(domain::LedgerDomain ledger, const std::string& entityKey) {
        domain::Projection projection{projectionKey(ledger, entityKey), 0, 0};
        for (const auto& entry : read(entityKey, std::nullopt)) {
            projection.value += entry.signedAmount;
            if (entry.entryId > projection.lastEntryId) {
                projection.lastEntryId = entry.entryId;
            }
        }
        return projection;
    }
};

} // namespace pharmacy::application
