/**
 * @file IdempotencyGuardTest.cpp
 * @brief Unit tests for IdempotencyGuard
 */

#include <gtest/gtest.h>
#include "application/IdempotencyGuard.hpp"
#include "adapters/secondary/persistence/InMemoryIdempotencyRepository.hpp"
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace pharmacy;
using namespace pharmacy::application;
using namespace pharmacy::adapters::secondary;

class IdempotencyGuardTest : public ::testing::Test {
protected:
    void SetUp() override {
        claims_ = std::make_shared<InMemoryIdempotencyRepository>();
        store_ = std::make_shared<InMemoryLedgerStore>(claims_, nullptr, nullptr, nullptr);
        guard_ = std::make_shared<IdempotencyGuard>(claims_);
    }

    // Заявка в отдельной транзакции append без движений
    bool claim(const domain::Reference& ref) {
        bool claimed = false;
        store_->append({}, {}, [&](const domain::EntryIds&, ports::output::ILedgerTransaction& tx) {
            claimed = guard_->claim(tx, ref);
        });
        return claimed;
    }

    std::shared_ptr<InMemoryIdempotencyRepository> claims_;
    std::shared_ptr<InMemoryLedgerStore> store_;
    std::shared_ptr<IdempotencyGuard> guard_;
};

TEST_F(IdempotencyGuardTest, Claim_FirstWinsSecondLoses) {
    auto ref = domain::Reference::of(domain::ReferenceType::POS, "R-1001");

    EXPECT_TRUE(claim(ref));
    EXPECT_FALSE(claim(ref));
    EXPECT_TRUE(guard_->isClaimed(ref));
}

TEST_F(IdempotencyGuardTest, Claim_SameIdDifferentType_Independent) {
    EXPECT_TRUE(claim(domain::Reference::of(domain::ReferenceType::POS, "1")));
    EXPECT_TRUE(claim(domain::Reference::of(domain::ReferenceType::SUPPLIER_INVOICE, "1")));
}

TEST_F(IdempotencyGuardTest, Claim_ManualAlwaysPasses) {
    EXPECT_TRUE(claim(domain::Reference::manual()));
    EXPECT_TRUE(claim(domain::Reference::manual()));
    EXPECT_FALSE(guard_->isClaimed(domain::Reference::manual()));
}

TEST_F(IdempotencyGuardTest, Claim_RolledBackWithFailedTransaction) {
    auto ref = domain::Reference::of(domain::ReferenceType::BANK_STATEMENT, "T-1");

    EXPECT_THROW(
        store_->append({}, {}, [&](const domain::EntryIds&, ports::output::ILedgerTransaction& tx) {
            ASSERT_TRUE(guard_->claim(tx, ref));
            throw std::runtime_error("bank row insert failed");
        }),
        std::runtime_error);

    EXPECT_FALSE(guard_->isClaimed(ref));
    EXPECT_TRUE(claim(ref));
}

TEST_F(IdempotencyGuardTest, Claim_ConcurrentClaims_ExactlyOneSucceeds) {
    auto ref = domain::Reference::of(domain::ReferenceType::POS, "R-race");
    std::atomic<int> wins{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([this, &ref, &wins]() {
            if (claim(ref)) {
                ++wins;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(wins.load(), 1);
}
