/**
 * @file InMemoryBankEntryRepositoryTest.cpp
 * @brief Unit tests for InMemoryBankEntryRepository
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryBankEntryRepository.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace pharmacy;
using namespace pharmacy::adapters::secondary;

namespace {

domain::BankLedgerEntry bankEntry(const std::string& tranId, const std::string& occurredAt) {
    domain::BankLedgerEntry entry;
    entry.accountId = "acc-001";
    entry.tranId = tranId;
    entry.occurredAt = domain::Timestamp::fromString(occurredAt);
    entry.direction = domain::MovementKind::CR;
    entry.amount = domain::Money::parse("100.00");
    return entry;
}

} // namespace

TEST(InMemoryBankEntryRepositoryTest, Insert_DuplicateTranId_ReturnsNullopt) {
    InMemoryBankEntryRepository repo;

    EXPECT_TRUE(repo.insert(bankEntry("T-1", "2024-01-10")).has_value());
    EXPECT_FALSE(repo.insert(bankEntry("T-1", "2024-01-11")).has_value());
}

TEST(InMemoryBankEntryRepositoryTest, FindByAccount_IsChronological) {
    InMemoryBankEntryRepository repo;
    repo.insert(bankEntry("T-2", "2024-01-12"));
    repo.insert(bankEntry("T-1", "2024-01-10"));

    auto entries = repo.findByAccount("acc-001");

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].tranId, "T-1");
    EXPECT_EQ(entries[1].tranId, "T-2");
}

TEST(InMemoryBankEntryRepositoryTest, MarkApproved_OnlyOnce) {
    InMemoryBankEntryRepository repo;
    auto id = repo.insert(bankEntry("T-1", "2024-01-10"));
    ASSERT_TRUE(id.has_value());

    EXPECT_TRUE(repo.markApproved(*id, "U1", domain::Timestamp::now()));
    EXPECT_FALSE(repo.markApproved(*id, "U2", domain::Timestamp::now()));

    auto stored = repo.findById(*id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->approvedBy.value_or(""), "U1");
    EXPECT_EQ(stored->status, domain::EntryStatus::APPROVED);
    EXPECT_TRUE(repo.findUnreconciled(std::nullopt).empty());
}

TEST(InMemoryBankEntryRepositoryTest, MarkApproved_ConcurrentCallers_ExactlyOneWins) {
    InMemoryBankEntryRepository repo;
    auto id = repo.insert(bankEntry("T-1", "2024-01-10"));
    ASSERT_TRUE(id.has_value());

    std::atomic<int> wins{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&repo, &wins, &id, i]() {
            if (repo.markApproved(*id, "U" + std::to_string(i), domain::Timestamp::now())) {
                ++wins;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(wins.load(), 1);
}

TEST(InMemoryBankEntryRepositoryTest, FindCorrections_ByFlaggedId) {
    InMemoryBankEntryRepository repo;
    auto flagged = bankEntry("T-1", "2024-01-10");
    flagged.status = domain::EntryStatus::FLAGGED;
    auto flaggedId = repo.insert(flagged);
    ASSERT_TRUE(flaggedId.has_value());

    auto correction = bankEntry("T-1-R1", "2024-01-10");
    correction.correctsEntryId = *flaggedId;
    repo.insert(correction);

    auto corrections = repo.findCorrections(*flaggedId);
    ASSERT_EQ(corrections.size(), 1u);
    EXPECT_EQ(corrections[0].tranId, "T-1-R1");
}
