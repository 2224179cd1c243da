#include "cache/async_store.hpp"
#include "cache/lru_cache.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>

using namespace qcache::cache;
using namespace std::chrono_literals;

namespace {

class ThrowingStore : public KeyValueStore {
public:
    std::future<std::optional<std::string>> get(const std::string&) override {
        throw std::runtime_error("connection refused");
    }

    std::future<void> set(const std::string&, std::string, std::chrono::seconds) override {
        throw std::runtime_error("connection refused");
    }
};

} // namespace

class AsyncStoreTest : public testing::Test {
protected:
    std::shared_ptr<LruCache> inner_ = std::make_shared<LruCache>(LruCacheConfig{});
};

TEST_F(AsyncStoreTest, RoundTripThroughPool) {
    AsyncStore store(inner_, 2);

    store.set("k", "v", 0s).get();
    EXPECT_EQ(store.get("k").get(), "v");
    EXPECT_FALSE(store.get("missing").get().has_value());
    EXPECT_EQ(inner_->get_stats().entries, 1u);
}

TEST_F(AsyncStoreTest, ManyConcurrentWrites) {
    AsyncStore store(inner_, 4);

    std::vector<std::future<void>> writes;
    for (int i = 0; i < 100; ++i) {
        writes.push_back(store.set("key-" + std::to_string(i), "value", 0s));
    }
    for (auto& write : writes) {
        write.get();
    }

    EXPECT_EQ(inner_->get_stats().entries, 100u);
}

TEST_F(AsyncStoreTest, InnerFailureSurfacesThroughFuture) {
    AsyncStore store(std::make_shared<ThrowingStore>(), 1);

    auto read = store.get("k");
    EXPECT_THROW(read.get(), std::runtime_error);

    auto write = store.set("k", "v", 0s);
    EXPECT_THROW(write.get(), std::runtime_error);
}

TEST_F(AsyncStoreTest, ZeroThreadsStillRuns) {
    AsyncStore store(inner_, 0);
    store.set("k", "v", 0s).get();
    EXPECT_EQ(store.get("k").get(), "v");
}

TEST_F(AsyncStoreTest, ShutdownCompletesQueuedWork) {
    AsyncStore store(inner_, 1);

    std::vector<std::future<void>> writes;
    for (int i = 0; i < 20; ++i) {
        writes.push_back(store.set("key-" + std::to_string(i), "value", 0s));
    }
    store.shutdown();

    for (auto& write : writes) {
        EXPECT_EQ(write.wait_for(0s), std::future_status::ready);
        EXPECT_NO_THROW(write.get());
    }
    EXPECT_EQ(inner_->get_stats().entries, 20u);
}

TEST_F(AsyncStoreTest, RejectsWorkAfterShutdown) {
    AsyncStore store(inner_, 1);
    store.shutdown();

    auto read = store.get("k");
    ASSERT_EQ(read.wait_for(1s), std::future_status::ready);
    EXPECT_THROW(read.get(), std::runtime_error);

    auto write = store.set("k", "v", 0s);
    ASSERT_EQ(write.wait_for(1s), std::future_status::ready);
    EXPECT_THROW(write.get(), std::runtime_error);
    EXPECT_EQ(inner_->get_stats().entries, 0u);

    // A second shutdown is a no-op
    store.shutdown();
}
