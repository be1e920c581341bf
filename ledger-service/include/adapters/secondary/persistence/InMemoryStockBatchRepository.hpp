#pragma once

#include "ports/output/IStockBatchRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>

namespace pharmacy::adapters::secondary {

class InMemoryStockBatchRepository : public ports::output::IStockBatchRepository {
public:
    bool insertIfAbsent(const domain::StockBatch& batch) override {
        return batches_.insertIfAbsent(batch.key.entityKey(), std::make_shared<domain::StockBatch>(batch));
    }

    std::optional<domain::StockBatch> find(const domain::BatchKey& key) override {
        auto batch = batches_.find(key.entityKey());
        return batch ? std::optional(*batch) : std::nullopt;
    }

    std::vector<domain::StockBatch> findAll() override {
        std::vector<domain::StockBatch> result;
        for (const auto& batch : batches_.values()) {
            result.push_back(*batch);
        }
        return result;
    }

    void erase(const domain::BatchKey& key) {
        batches_.erase(key.entityKey());
    }

private:
    ThreadSafeMap<std::string, domain::StockBatch> batches_;
};

} // namespace pharmacy::adapters::secondary
