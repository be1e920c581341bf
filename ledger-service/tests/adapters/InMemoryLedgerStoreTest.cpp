/**
 * @file InMemoryLedgerStoreTest.cpp
 * @brief Unit tests for InMemoryLedgerStore and LedgerSequence
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include "ports/output/LedgerSequence.hpp"
#include <memory>
#include <stdexcept>

using namespace pharmacy;
using namespace pharmacy::adapters::secondary;

namespace {

domain::LedgerEntry stockEntry(const std::string& key, int64_t amount, domain::MovementKind kind,
                               const domain::Reference& reference, const std::string& occurredAt) {
    domain::LedgerEntry entry;
    entry.domain = domain::LedgerDomain::STOCK;
    entry.entityKey = key;
    entry.signedAmount = amount;
    entry.kind = kind;
    entry.reference = reference;
    entry.occurredAt = domain::Timestamp::fromString(occurredAt);
    return entry;
}

const std::string PC101 = "Paracetamol 500mg#PC101";

} // namespace

class InMemoryLedgerStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryLedgerStore>();
    }

    std::shared_ptr<InMemoryLedgerStore> store_;
};

// ============================================================================
// APPEND
// ============================================================================

TEST_F(InMemoryLedgerStoreTest, Append_AssignsIncreasingIds) {
    auto ids = store_->append({
        stockEntry(PC101, 100, domain::MovementKind::IN, domain::Reference::of(domain::ReferenceType::SUPPLIER_INVOICE, "INV-1"), "2024-01-10"),
        stockEntry("Amoxicillin#AM7", 40, domain::MovementKind::IN, domain::Reference::of(domain::ReferenceType::SUPPLIER_INVOICE, "INV-1"), "2024-01-10")
    }, {});

    ASSERT_EQ(ids.size(), 2u);
    EXPECT_LT(ids[0], ids[1]);
    EXPECT_EQ(store_->head(PC101), ids[0]);
    EXPECT_EQ(store_->head("Amoxicillin#AM7"), ids[1]);
    EXPECT_EQ(store_->head("unknown#x"), 0);
}

TEST_F(InMemoryLedgerStoreTest, Append_StaleHead_ThrowsConcurrencyConflict) {
    store_->append({stockEntry(PC101, 100, domain::MovementKind::IN, domain::Reference::manual(), "2024-01-10")}, {});

    EXPECT_THROW(
        store_->append({stockEntry(PC101, -10, domain::MovementKind::OUT, domain::Reference::manual(), "2024-01-11")},
                       {{PC101, 0}}),
        domain::ConcurrencyConflict);
    EXPECT_EQ(store_->size(), 1u);
}

TEST_F(InMemoryLedgerStoreTest, Append_SameReferenceTwice_ThrowsConflictError) {
    auto ref = domain::Reference::of(domain::ReferenceType::POS, "R-1001");
    store_->append({stockEntry(PC101, -5, domain::MovementKind::OUT, ref, "2024-01-10")}, {});

    EXPECT_THROW(
        store_->append({stockEntry(PC101, -5, domain::MovementKind::OUT, ref, "2024-01-10")}, {}),
        domain::ConflictError);
    EXPECT_TRUE(store_->hasReference(ref));
}

TEST_F(InMemoryLedgerStoreTest, Append_IsAllOrNothing) {
    auto ref = domain::Reference::of(domain::ReferenceType::POS, "R-1");
    store_->append({stockEntry(PC101, -1, domain::MovementKind::OUT, ref, "2024-01-10")}, {});

    EXPECT_THROW(store_->append({
        stockEntry("Amoxicillin#AM7", -1, domain::MovementKind::OUT, domain::Reference::of(domain::ReferenceType::POS, "R-2"), "2024-01-10"),
        stockEntry(PC101, -1, domain::MovementKind::OUT, ref, "2024-01-10")
    }, {}), domain::ConflictError);

    EXPECT_EQ(store_->size(), 1u);
    EXPECT_EQ(store_->head("Amoxicillin#AM7"), 0);
}

TEST_F(InMemoryLedgerStoreTest, Append_WorkSeesAssignedIdsAndCommitsWithEntries) {
    auto claims = std::make_shared<InMemoryIdempotencyRepository>();
    auto bankEntries = std::make_shared<InMemoryBankEntryRepository>();
    InMemoryLedgerStore store(claims, nullptr, nullptr, bankEntries);

    domain::BankLedgerEntry row;
    row.accountId = "A1";
    row.tranId = "T-1";
    auto cash = stockEntry("A1", 100, domain::MovementKind::CR,
                           domain::Reference::of(domain::ReferenceType::BANK_STATEMENT, "T-1"), "2024-01-10");
    cash.domain = domain::LedgerDomain::CASH;

    auto ids = store.append({cash}, {{"A1", 0}},
        [&](const domain::EntryIds& assigned, ports::output::ILedgerTransaction& tx) {
            ASSERT_EQ(assigned.size(), 1u);
            EXPECT_TRUE(tx.claimReference("BANK_STATEMENT:T-1"));
            row.ledgerEntryId = assigned.front();
            EXPECT_TRUE(tx.insertBankEntry(row).has_value());
        });

    EXPECT_EQ(store.head("A1"), ids.front());
    EXPECT_TRUE(claims->contains("BANK_STATEMENT:T-1"));
    auto stored = bankEntries->findByTranId("T-1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->ledgerEntryId.value(), ids.front());
}

TEST_F(InMemoryLedgerStoreTest, Append_WorkThrows_RollsBackEverything) {
    auto claims = std::make_shared<InMemoryIdempotencyRepository>();
    auto batches = std::make_shared<InMemoryStockBatchRepository>();
    InMemoryLedgerStore store(claims, batches, nullptr, nullptr);

    domain::StockBatch batch;
    batch.key = domain::BatchKey{"Paracetamol 500mg", "PC101"};

    EXPECT_THROW(
        store.append({stockEntry(PC101, 100, domain::MovementKind::IN, domain::Reference::manual(), "2024-01-10")}, {},
            [&](const domain::EntryIds&, ports::output::ILedgerTransaction& tx) {
                tx.claimReference("SUPPLIER_INVOICE:INV-1");
                tx.insertBatchIfAbsent(batch);
                throw std::runtime_error("document insert failed");
            }),
        std::runtime_error);

    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(store.head(PC101), 0);
    EXPECT_FALSE(claims->contains("SUPPLIER_INVOICE:INV-1"));
    EXPECT_FALSE(batches->find(batch.key).has_value());
}

TEST_F(InMemoryLedgerStoreTest, Append_WorkWithoutRepository_ThrowsLogicError) {
    EXPECT_THROW(
        store_->append({}, {}, [](const domain::EntryIds&, ports::output::ILedgerTransaction& tx) {
            tx.claimReference("POS:R-1");
        }),
        std::logic_error);
}

TEST_F(InMemoryLedgerStoreTest, Append_AdjustmentsAreRepeatable) {
    auto ref = domain::Reference::of(domain::ReferenceType::POS, "R-1");

    store_->append({stockEntry(PC101, -2, domain::MovementKind::ADJUST, ref, "2024-01-10")}, {});
    store_->append({stockEntry(PC101, -2, domain::MovementKind::ADJUST, ref, "2024-01-10")}, {});

    EXPECT_EQ(store_->size(), 2u);
    EXPECT_FALSE(store_->hasReference(ref));
}

// ============================================================================
// READ
// ============================================================================

TEST_F(InMemoryLedgerStoreTest, ReadPage_OrdersByOccurredAt) {
    store_->append({stockEntry(PC101, 10, domain::MovementKind::IN, domain::Reference::manual(), "2024-01-12")}, {});
    store_->append({stockEntry(PC101, 20, domain::MovementKind::IN, domain::Reference::manual(), "2024-01-10")}, {});

    auto page = store_->readPage(PC101, std::nullopt, std::nullopt, 10);

    ASSERT_EQ(page.size(), 2u);
    EXPECT_EQ(page[0].signedAmount, 20);
    EXPECT_EQ(page[1].signedAmount, 10);
}

TEST_F(InMemoryLedgerStoreTest, ReadPage_AsOfExcludesLaterEntries) {
    store_->append({stockEntry(PC101, 10, domain::MovementKind::IN, domain::Reference::manual(), "2024-01-10")}, {});
    store_->append({stockEntry(PC101, 20, domain::MovementKind::IN, domain::Reference::manual(), "2024-01-20")}, {});

    auto page = store_->readPage(PC101, domain::Timestamp::fromString("2024-01-15"), std::nullopt, 10);

    ASSERT_EQ(page.size(), 1u);
    EXPECT_EQ(page[0].signedAmount, 10);
}

TEST_F(InMemoryLedgerStoreTest, ReadSince_ReturnsOnlyNewerEntries) {
    auto first = store_->append({stockEntry(PC101, 10, domain::MovementKind::IN, domain::Reference::manual(), "2024-01-10")}, {});
    store_->append({stockEntry(PC101, -3, domain::MovementKind::OUT, domain::Reference::manual(), "2024-01-11")}, {});

    auto newer = store_->readSince(PC101, first.front());

    ASSERT_EQ(newer.size(), 1u);
    EXPECT_EQ(newer[0].signedAmount, -3);
}

TEST_F(InMemoryLedgerStoreTest, EntityKeys_FilteredByDomain) {
    store_->append({stockEntry(PC101, 10, domain::MovementKind::IN, domain::Reference::manual(), "2024-01-10")}, {});

    domain::LedgerEntry cash;
    cash.domain = domain::LedgerDomain::CASH;
    cash.entityKey = "acc-001";
    cash.signedAmount = 500000;
    cash.kind = domain::MovementKind::CR;
    store_->append({cash}, {});

    EXPECT_EQ(store_->entityKeys(domain::LedgerDomain::STOCK), std::vector<std::string>{PC101});
    EXPECT_EQ(store_->entityKeys(domain::LedgerDomain::CASH), std::vector<std::string>{"acc-001"});
}

// ============================================================================
// LEDGER SEQUENCE
// ============================================================================

TEST_F(InMemoryLedgerStoreTest, Sequence_WalksAllPages) {
    for (int day = 1; day <= 7; ++day) {
        std::string date = "2024-01-0" + std::to_string(day);
        store_->append({stockEntry(PC101, day, domain::MovementKind::IN, domain::Reference::manual(), date)}, {});
    }

    ports::output::LedgerSequence sequence(store_, PC101, std::nullopt, 3);

    int64_t sum = 0;
    int64_t previous = 0;
    int count = 0;
    for (const auto& entry : sequence) {
        EXPECT_GT(entry.signedAmount, previous);
        previous = entry.signedAmount;
        sum += entry.signedAmount;
        ++count;
    }

    EXPECT_EQ(count, 7);
    EXPECT_EQ(sum, 28);
}

TEST_F(InMemoryLedgerStoreTest, Sequence_IsRestartable) {
    for (int day = 1; day <= 4; ++day) {
        std::string date = "2024-01-0" + std::to_string(day);
        store_->append({stockEntry(PC101, 1, domain::MovementKind::IN, domain::Reference::manual(), date)}, {});
    }

    ports::output::LedgerSequence sequence(store_, PC101, std::nullopt, 2);

    EXPECT_EQ(sequence.toVector().size(), 4u);
    EXPECT_EQ(sequence.toVector().size(), 4u);
}

TEST_F(InMemoryLedgerStoreTest, Sequence_EmptyEntity) {
    ports::output::LedgerSequence sequence(store_, "nobody#none", std::nullopt, 5);

    EXPECT_EQ(sequence.begin(), sequence.end());
}
