#include <gtest/gtest.h>
#include <ThreadSafeMap.hpp>
#include <thread>
#include <vector>
#include <atomic>
#include <string>

struct SlotData {
    int value;
    std::string name;

    SlotData(int v = 0, const std::string& n = "") : value(v), name(n) {}
};

class ThreadSafeMapTest : public ::testing::Test {
protected:
    ThreadSafeMap<std::string, SlotData> map;
};

TEST_F(ThreadSafeMapTest, InsertAndFind) {
    map.insert("u1/USD", std::make_shared<SlotData>(42, "usd"));

    auto found = map.find("u1/USD");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->value, 42);
    EXPECT_EQ(found->name, "usd");
}

TEST_F(ThreadSafeMapTest, FindNonExistent) {
    EXPECT_EQ(map.find("u1/EUR"), nullptr);
    EXPECT_FALSE(map.contains("u1/EUR"));
}

TEST_F(ThreadSafeMapTest, Overwrite_ReplacesWholeValue) {
    map.insert("key", std::make_shared<SlotData>(1, "first"));
    map.insert("key", std::make_shared<SlotData>(2, "second"));

    auto found = map.find("key");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->value, 2);
    EXPECT_EQ(found->name, "second");
    EXPECT_EQ(map.size(), 1u);
}

TEST_F(ThreadSafeMapTest, GetOrCreate_ReturnsExisting) {
    auto existing = std::make_shared<SlotData>(7, "existing");
    map.insert("key", existing);

    int factoryCalls = 0;
    auto value = map.getOrCreate("key", [&factoryCalls]() {
        ++factoryCalls;
        return std::make_shared<SlotData>(0, "new");
    });

    EXPECT_EQ(value, existing);
    EXPECT_EQ(factoryCalls, 0);
}

TEST_F(ThreadSafeMapTest, RemoveAndClear) {
    map.insert("a", std::make_shared<SlotData>(1));
    map.insert("b", std::make_shared<SlotData>(2));

    EXPECT_TRUE(map.remove("a"));
    EXPECT_FALSE(map.remove("a"));
    EXPECT_EQ(map.size(), 1u);

    map.clear();
    EXPECT_EQ(map.size(), 0u);
    EXPECT_TRUE(map.values().empty());
}

// Параллельные getOrCreate с одним ключом не создают дубликатов
TEST_F(ThreadSafeMapTest, ConcurrentGetOrCreate_SingleInstance) {
    const int NUM_THREADS = 16;
    std::atomic<int> factoryCalls(0);
    std::vector<std::shared_ptr<SlotData>> results(NUM_THREADS);
    std::vector<std::thread> threads;

    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([this, i, &factoryCalls, &results]() {
            results[i] = map.getOrCreate("u1/NGN", [&factoryCalls]() {
                factoryCalls++;
                return std::make_shared<SlotData>(0, "zero");
            });
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(factoryCalls.load(), 1);
    for (const auto& r : results) {
        EXPECT_EQ(r, results[0]);
    }
    EXPECT_EQ(map.size(), 1u);
}

TEST_F(ThreadSafeMapTest, ConcurrentReadWrite_NoDataCorruption) {
    const std::string key = "shared_key";
    map.insert(key, std::make_shared<SlotData>(0, "initial"));

    std::vector<std::thread> threads;
    std::atomic<int> readCount(0);

    for (int writer = 0; writer < 5; ++writer) {
        threads.emplace_back([this, &key, writer]() {
            for (int i = 0; i < 50; ++i) {
                map.insert(key, std::make_shared<SlotData>(writer * 100 + i, "data"));
            }
        });
    }

    for (int reader = 0; reader < 5; ++reader) {
        threads.emplace_back([this, &key, &readCount]() {
            for (int i = 0; i < 100; ++i) {
                auto found = map.find(key);
                ASSERT_NE(found, nullptr);
                readCount++;
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(readCount, 500);
}
