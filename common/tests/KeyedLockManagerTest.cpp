#include <gtest/gtest.h>
#include <KeyedLockManager.hpp>
#include <thread>
#include <vector>
#include <atomic>
#include <chrono>

using namespace std::chrono_literals;

class KeyedLockManagerTest : public ::testing::Test {
protected:
    KeyedLockManager locks;
};

TEST_F(KeyedLockManagerTest, AcquireFreeKey_Succeeds) {
    auto lease = locks.tryAcquire({"Paracetamol#PC101"}, 10ms);

    ASSERT_TRUE(lease.has_value());
    EXPECT_EQ(lease->size(), 1u);
}

TEST_F(KeyedLockManagerTest, DuplicateKeysLockedOnce) {
    auto lease = locks.tryAcquire({"k1", "k1", "k2"}, 10ms);

    ASSERT_TRUE(lease.has_value());
    EXPECT_EQ(lease->size(), 2u);
}

TEST_F(KeyedLockManagerTest, HeldKey_TimesOut) {
    auto held = locks.tryAcquire({"acc-001"}, 10ms);
    ASSERT_TRUE(held.has_value());

    std::optional<KeyedLockManager::Lease> contender;
    std::thread other([this, &contender]() {
        contender = locks.tryAcquire({"acc-001"}, 20ms);
    });
    other.join();

    EXPECT_FALSE(contender.has_value());
}

TEST_F(KeyedLockManagerTest, ReleasedOnDestruction) {
    {
        auto lease = locks.tryAcquire({"acc-001"}, 10ms);
        ASSERT_TRUE(lease.has_value());
    }

    std::optional<KeyedLockManager::Lease> next;
    std::thread other([this, &next]() {
        next = locks.tryAcquire({"acc-001"}, 10ms);
    });
    other.join();

    EXPECT_TRUE(next.has_value());
}

TEST_F(KeyedLockManagerTest, PartialFailure_ReleasesAcquiredKeys) {
    auto held = locks.tryAcquire({"b"}, 10ms);
    ASSERT_TRUE(held.has_value());

    std::optional<KeyedLockManager::Lease> attempt;
    std::thread other([this, &attempt]() {
        attempt = locks.tryAcquire({"a", "b"}, 10ms);
    });
    other.join();
    ASSERT_FALSE(attempt.has_value());

    // "a" должен быть свободен после неудачной попытки
    std::optional<KeyedLockManager::Lease> onlyA;
    std::thread third([this, &onlyA]() {
        onlyA = locks.tryAcquire({"a"}, 10ms);
    });
    third.join();
    EXPECT_TRUE(onlyA.has_value());
}

TEST_F(KeyedLockManagerTest, DifferentKeys_DoNotBlockEachOther) {
    auto first = locks.tryAcquire({"batch-A"}, 10ms);
    ASSERT_TRUE(first.has_value());

    std::optional<KeyedLockManager::Lease> second;
    std::thread other([this, &second]() {
        second = locks.tryAcquire({"batch-B"}, 10ms);
    });
    other.join();

    EXPECT_TRUE(second.has_value());
}

// Счётчик под блокировкой ключа не теряет инкременты
TEST_F(KeyedLockManagerTest, MutualExclusion_CounterIsConsistent) {
    int counter = 0;
    std::atomic<int> failures(0);
    std::vector<std::thread> threads;

    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, &counter, &failures]() {
            for (int i = 0; i < 200; ++i) {
                auto lease = locks.tryAcquire({"counter"}, 1000ms);
                if (!lease) {
                    failures++;
                    continue;
                }
                ++counter;
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(failures, 0);
    EXPECT_EQ(counter, 1600);
}

TEST_F(KeyedLockManagerTest, MovedLease_ReleasesOnce) {
    auto lease = locks.tryAcquire({"k"}, 10ms);
    ASSERT_TRUE(lease.has_value());

    KeyedLockManager::Lease moved = std::move(*lease);
    lease.reset();  // пустой Lease ничего не отпускает

    std::optional<KeyedLockManager::Lease> contender;
    std::thread other([this, &contender]() {
        contender = locks.tryAcquire({"k"}, 10ms);
    });
    other.join();
    EXPECT_FALSE(contender.has_value());
}
