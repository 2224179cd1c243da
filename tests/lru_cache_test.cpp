#include "cache/lru_cache.hpp"
#include "test_clock.hpp"

#include <gtest/gtest.h>

using namespace qcache::cache;
using qcache::test::ManualClock;
using namespace std::chrono_literals;

class LruCacheTest : public testing::Test {
protected:
    ManualClock clock_;
};

TEST_F(LruCacheTest, StoreAndLookup) {
    LruCache cache(LruCacheConfig{}, clock_.clock());
    cache.store("k", "value", 0s);

    EXPECT_EQ(cache.lookup("k"), "value");
    EXPECT_FALSE(cache.lookup("missing").has_value());

    auto stats = cache.get_stats();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.entries, 1u);
    EXPECT_EQ(stats.size_bytes, 6u);
    EXPECT_DOUBLE_EQ(stats.hit_rate(), 0.5);
}

TEST_F(LruCacheTest, FuturesAreReady) {
    LruCache cache(LruCacheConfig{}, clock_.clock());
    cache.set("k", "v", 10s).get();

    auto result = cache.get("k");
    EXPECT_EQ(result.wait_for(0s), std::future_status::ready);
    EXPECT_EQ(result.get(), "v");
}

TEST_F(LruCacheTest, EntryExpiresAfterTtl) {
    LruCache cache(LruCacheConfig{}, clock_.clock());
    cache.store("k", "v", 10s);

    clock_.advance(9s);
    EXPECT_TRUE(cache.lookup("k").has_value());

    clock_.advance(1s);
    EXPECT_FALSE(cache.lookup("k").has_value());

    auto stats = cache.get_stats();
    EXPECT_EQ(stats.expired, 1u);
    EXPECT_EQ(stats.entries, 0u);
    EXPECT_EQ(stats.size_bytes, 0u);
}

TEST_F(LruCacheTest, ZeroTtlNeverExpires) {
    LruCache cache(LruCacheConfig{}, clock_.clock());
    cache.store("k", "v", 0s);

    clock_.advance(std::chrono::hours(24 * 365));
    EXPECT_TRUE(cache.lookup("k").has_value());
}

TEST_F(LruCacheTest, EvictsLeastRecentlyUsed) {
    // Each entry is 1 + 9 = 10 bytes; three fit
    LruCache cache(LruCacheConfig{.max_size_bytes = 30, .enabled = true}, clock_.clock());
    cache.store("a", "123456789", 0s);
    cache.store("b", "123456789", 0s);
    cache.store("c", "123456789", 0s);

    ASSERT_TRUE(cache.lookup("a").has_value());
    cache.store("d", "123456789", 0s);

    EXPECT_TRUE(cache.lookup("a").has_value());
    EXPECT_FALSE(cache.lookup("b").has_value());
    EXPECT_TRUE(cache.lookup("c").has_value());
    EXPECT_TRUE(cache.lookup("d").has_value());
    EXPECT_EQ(cache.get_stats().evictions, 1u);
}

TEST_F(LruCacheTest, ReplacingEntryUpdatesSize) {
    LruCache cache(LruCacheConfig{}, clock_.clock());
    cache.store("k", "short", 0s);
    cache.store("k", "much longer value", 0s);

    auto stats = cache.get_stats();
    EXPECT_EQ(stats.entries, 1u);
    EXPECT_EQ(stats.size_bytes, 1u + 17u);
    EXPECT_EQ(cache.lookup("k"), "much longer value");
}

TEST_F(LruCacheTest, OversizedEntryIsNotStored) {
    LruCache cache(LruCacheConfig{.max_size_bytes = 8, .enabled = true}, clock_.clock());
    cache.store("key", "too large for budget", 0s);

    EXPECT_FALSE(cache.lookup("key").has_value());
    EXPECT_EQ(cache.get_stats().entries, 0u);
}

TEST_F(LruCacheTest, ShrinkingBudgetEvicts) {
    LruCache cache(LruCacheConfig{.max_size_bytes = 100, .enabled = true}, clock_.clock());
    cache.store("a", "123456789", 0s);
    cache.store("b", "123456789", 0s);

    cache.update_max_size(10);

    auto stats = cache.get_stats();
    EXPECT_EQ(stats.entries, 1u);
    EXPECT_EQ(stats.max_size_bytes, 10u);
    EXPECT_TRUE(cache.lookup("b").has_value());
}

TEST_F(LruCacheTest, RemoveAndClear) {
    LruCache cache(LruCacheConfig{}, clock_.clock());
    cache.store("a", "1", 0s);
    cache.store("b", "2", 0s);

    EXPECT_TRUE(cache.remove("a"));
    EXPECT_FALSE(cache.remove("a"));
    EXPECT_EQ(cache.get_stats().entries, 1u);

    cache.clear();
    EXPECT_EQ(cache.get_stats().entries, 0u);
    EXPECT_EQ(cache.get_stats().size_bytes, 0u);
}

TEST_F(LruCacheTest, DisabledCacheStoresNothing) {
    LruCache cache(LruCacheConfig{.max_size_bytes = 1024, .enabled = false}, clock_.clock());
    cache.store("k", "v", 0s);

    EXPECT_FALSE(cache.is_enabled());
    EXPECT_FALSE(cache.lookup("k").has_value());
}

TEST_F(LruCacheTest, ReclaimsExpiredEntriesBeforeLiveOnes) {
    LruCache cache(LruCacheConfig{.max_size_bytes = 30, .enabled = true}, clock_.clock());
    cache.store("a", "123456789", 0s);
    cache.store("b", "123456789", 5s);
    cache.store("c", "123456789", 0s);

    clock_.advance(6s);
    cache.store("d", "123456789", 0s);

    // "a" is the least recently used but "b" had already expired
    EXPECT_TRUE(cache.lookup("a").has_value());
    EXPECT_TRUE(cache.lookup("c").has_value());
    EXPECT_TRUE(cache.lookup("d").has_value());

    auto stats = cache.get_stats();
    EXPECT_EQ(stats.evictions, 0u);
    EXPECT_EQ(stats.expired, 1u);
    EXPECT_EQ(stats.entries, 3u);
}

TEST_F(LruCacheTest, PurgeExpired) {
    LruCache cache(LruCacheConfig{}, clock_.clock());
    cache.store("short", "v", 1s);
    cache.store("long", "v", 60s);
    cache.store("forever", "v", 0s);

    EXPECT_EQ(cache.purge_expired(), 0u);

    clock_.advance(2s);
    EXPECT_EQ(cache.purge_expired(), 1u);

    auto stats = cache.get_stats();
    EXPECT_EQ(stats.entries, 2u);
    EXPECT_EQ(stats.expired, 1u);
    EXPECT_EQ(stats.misses, 0u);
}
