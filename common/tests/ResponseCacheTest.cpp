#include <gtest/gtest.h>
#include <ResponseCache.hpp>

#include <chrono>
#include <string>

using walletgate::ResponseCache;
using namespace std::chrono_literals;

class ResponseCacheTest : public ::testing::Test {
protected:
    ResponseCache::Clock::time_point now{ResponseCache::Clock::now()};
    ResponseCache cache{ResponseCache::DEFAULT_CAPACITY, [this] { return now; }};
};

TEST_F(ResponseCacheTest, FreshEntryIsReturned) {
    cache.set("wallet_info", R"({"address":"0xabc"})");

    auto value = cache.get("wallet_info", 30s);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, R"({"address":"0xabc"})");
}

TEST_F(ResponseCacheTest, MissingKeyIsEmpty) {
    EXPECT_FALSE(cache.get("balance:native", 30s).has_value());
}

// Запись моложе TTL отдаётся, ровно на границе уже нет
TEST_F(ResponseCacheTest, EntryExpiresAtTtl) {
    cache.set("balance:native", "1.5");

    now += 29s;
    EXPECT_TRUE(cache.get("balance:native", 30s).has_value());

    now += 1s;
    EXPECT_FALSE(cache.get("balance:native", 30s).has_value());
}

TEST_F(ResponseCacheTest, TtlIsChosenPerRead) {
    cache.set("wallet_info", "{}");
    now += 10s;

    EXPECT_FALSE(cache.get("wallet_info", 5s).has_value());
    EXPECT_TRUE(cache.get("wallet_info", 60s).has_value());
}

TEST_F(ResponseCacheTest, SetRefreshesTimestamp) {
    cache.set("wallet_info", "old");
    now += 25s;
    cache.set("wallet_info", "new");
    now += 25s;

    auto value = cache.get("wallet_info", 30s);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "new");
}

TEST_F(ResponseCacheTest, ClearMatchingDropsOnlyPrefix) {
    cache.set("balance:native", "1");
    cache.set("balance:0xdead", "2");
    cache.set("wallet_info", "{}");

    EXPECT_EQ(cache.clearMatching("balance:"), 2u);
    EXPECT_FALSE(cache.get("balance:native", 30s).has_value());
    EXPECT_TRUE(cache.get("wallet_info", 30s).has_value());
}

TEST_F(ResponseCacheTest, ClearRemovesEverything) {
    cache.set("a", "1");
    cache.set("b", "2");

    cache.clear();

    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.remove("a"));
}

TEST_F(ResponseCacheTest, ExpiredEntryIsDroppedOnRead) {
    cache.set("balance:native", "1");
    now += 31s;

    EXPECT_FALSE(cache.get("balance:native", 30s).has_value());
    EXPECT_EQ(cache.size(), 0u);
}

// Поток разных контрактов не раздувает кэш сверх ёмкости
TEST(ResponseCacheCapacityTest, DistinctKeysAreCappedAtCapacity) {
    auto now = ResponseCache::Clock::now();
    ResponseCache cache{64, [&now] { return now; }};

    for (int i = 0; i < 10000; ++i) {
        cache.set("balance:con_" + std::to_string(i), "1");
        now += 31s;
    }

    EXPECT_LE(cache.size(), 64u);
    EXPECT_EQ(cache.capacity(), 64u);
    EXPECT_FALSE(cache.get("balance:con_0", 30s).has_value());
}

TEST(ResponseCacheCapacityTest, LeastRecentlyUsedIsEvicted) {
    ResponseCache cache{2};

    cache.set("a", "1");
    cache.set("b", "2");
    ASSERT_TRUE(cache.get("a", 30s).has_value());
    cache.set("c", "3");

    EXPECT_TRUE(cache.get("a", 30s).has_value());
    EXPECT_FALSE(cache.get("b", 30s).has_value());
    EXPECT_TRUE(cache.get("c", 30s).has_value());
}

TEST(ResponseCacheCapacityTest, ClearMatchingSkipsEvictedKeys) {
    ResponseCache cache{2};

    cache.set("balance:a", "1");
    cache.set("balance:b", "2");
    cache.set("wallet_info", "{}");

    EXPECT_EQ(cache.clearMatching("balance:"), 1u);
    EXPECT_TRUE(cache.get("wallet_info", 30s).has_value());
    EXPECT_EQ(cache.size(), 1u);
}
