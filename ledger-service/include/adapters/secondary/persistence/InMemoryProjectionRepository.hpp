#pragma once

#include "ports/output/IProjectionRepository.hpp"
#include <mutex>
#include <unordered_map>

namespace pharmacy::adapters::secondary {

class InMemoryProjectionRepository : public ports::output::IProjectionRepository {
public:
    std::optional<domain::Projection> find(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = projections_.find(key);
        if (it == projections_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void advance(const domain::Projection& projection) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = projections_.find(projection.entityKey);
        if (it == projections_.end() || it->second.lastEntryId < projection.lastEntryId) {
            projections_[projection.entityKey] = projection;
        }
    }

    void overwrite(const domain::Projection& projection) override {
        std::lock_guard<std::mutex> lock(mutex_);
        projections_[projection.entityKey] = projection;
    }

private:
    std::mutex mutex_;
    std::unordered_map<std::string, domain::Projection> projections_;
};

} // namespace pharmacy::adapters::secondary
