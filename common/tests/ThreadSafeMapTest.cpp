#include <gtest/gtest.h>
#include <ThreadSafeMap.hpp>
#include <thread>
#include <vector>
#include <atomic>
#include <string>

struct BatchRecord {
    std::string batch;
    int quantity;

    BatchRecord(const std::string& b = "", int q = 0) : batch(b), quantity(q) {}
};

class ThreadSafeMapTest : public ::testing::Test {
protected:
    ThreadSafeMap<std::string, BatchRecord> map;
};

// Базовые тесты
TEST_F(ThreadSafeMapTest, InsertAndFind) {
    map.insert("PC101", std::make_shared<BatchRecord>("PC101", 100));

    auto found = map.find("PC101");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->batch, "PC101");
    EXPECT_EQ(found->quantity, 100);
}

TEST_F(ThreadSafeMapTest, FindNonExistent) {
    EXPECT_EQ(map.find("nonexistent"), nullptr);
    EXPECT_FALSE(map.contains("nonexistent"));
}

TEST_F(ThreadSafeMapTest, InsertIfAbsent_SecondInsertRejected) {
    EXPECT_TRUE(map.insertIfAbsent("AM200", std::make_shared<BatchRecord>("AM200", 1)));
    EXPECT_FALSE(map.insertIfAbsent("AM200", std::make_shared<BatchRecord>("AM200", 2)));

    // Первое значение не перезаписано
    EXPECT_EQ(map.find("AM200")->quantity, 1);
}

TEST_F(ThreadSafeMapTest, GetOrCreate_ReturnsSameObject) {
    auto first = map.getOrCreate("IB300", [] { return std::make_shared<BatchRecord>("IB300", 5); });
    auto second = map.getOrCreate("IB300", [] { return std::make_shared<BatchRecord>("IB300", 99); });

    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(second->quantity, 5);
}

TEST_F(ThreadSafeMapTest, Erase_RemovesKeyOnce) {
    map.insert("PC101", std::make_shared<BatchRecord>("PC101", 1));

    EXPECT_TRUE(map.erase("PC101"));
    EXPECT_FALSE(map.erase("PC101"));
    EXPECT_FALSE(map.contains("PC101"));

    // После удаления ключ снова свободен
    EXPECT_TRUE(map.insertIfAbsent("PC101", std::make_shared<BatchRecord>("PC101", 2)));
}

TEST_F(ThreadSafeMapTest, ValuesAndSize) {
    map.insert("a", std::make_shared<BatchRecord>("a", 1));
    map.insert("b", std::make_shared<BatchRecord>("b", 2));

    EXPECT_EQ(map.size(), 2u);
    EXPECT_EQ(map.values().size(), 2u);

    map.clear();
    EXPECT_EQ(map.size(), 0u);
}

// Конкурентная вставка одного ключа - ровно один победитель
TEST_F(ThreadSafeMapTest, ConcurrentInsertIfAbsent_ExactlyOneWinner) {
    const int NUM_THREADS = 16;
    std::atomic<int> winners(0);
    std::vector<std::thread> threads;

    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([this, t, &winners]() {
            if (map.insertIfAbsent("POS:1001", std::make_shared<BatchRecord>("POS:1001", t))) {
                winners++;
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(winners, 1);
    EXPECT_EQ(map.size(), 1u);
}

// getOrCreate из многих потоков создаёт объект один раз
TEST_F(ThreadSafeMapTest, ConcurrentGetOrCreate_SingleInstance) {
    std::atomic<int> created(0);
    std::vector<std::thread> threads;
    std::vector<BatchRecord*> seen(8, nullptr);

    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, t, &created, &seen]() {
            auto value = map.getOrCreate("shared", [&created] {
                created++;
                return std::make_shared<BatchRecord>("shared", 0);
            });
            seen[t] = value.get();
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(created, 1);
    for (auto* ptr : seen) {
        EXPECT_EQ(ptr, seen[0]);
    }
}

// Читатели всегда видят целый объект, пока писатели его заменяют
TEST_F(ThreadSafeMapTest, ConcurrentReadWrite_NoDataCorruption) {
    const std::string key = "shared_key";
    map.insert(key, std::make_shared<BatchRecord>("initial", 0));

    std::vector<std::thread> threads;
    std::atomic<int> read_count(0);

    for (int writer = 0; writer < 4; ++writer) {
        threads.emplace_back([this, &key, writer]() {
            for (int i = 0; i < 50; ++i) {
                map.insert(key, std::make_shared<BatchRecord>("w" + std::to_string(writer), i));
            }
        });
    }

    for (int reader = 0; reader < 4; ++reader) {
        threads.emplace_back([this, &key, &read_count]() {
            for (int i = 0; i < 100; ++i) {
                auto found = map.find(key);
                ASSERT_NE(found, nullptr);
                read_count++;
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(read_count, 400);
}
