#pragma once

#include "ports/output/IIdempotencyRepository.hpp"
#include "domain/Timestamp.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>

namespace pharmacy::adapters::secondary {

/**
 * @brief In-memory заявки идемпотентности на ThreadSafeMap
 */
class InMemoryIdempotencyRepository : public ports::output::IIdempotencyRepository {
public:
    bool insertIfAbsent(const std::string& key) override {
        return claims_.insertIfAbsent(key, std::make_shared<domain::Timestamp>(domain::Timestamp::now()));
    }

    bool contains(const std::string& key) override {
        return claims_.contains(key);
    }

    void remove(const std::string& key) {
        claims_.erase(key);
    }

private:
    ThreadSafeMap<std::string, domain::Timestamp> claims_;
};

} // namespace pharmacy::adapters::secondary
