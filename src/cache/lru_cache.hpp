/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * LRU Cache - Default in-process response store
 *
 * Entries are charged key size plus value size against a byte budget.
 * When the budget is exceeded, expired entries are reclaimed first and
 * then the least recently used live entries.
 */

#ifndef QCACHE_CACHE_LRU_CACHE_HPP
#define QCACHE_CACHE_LRU_CACHE_HPP

#include "cache/cache_key.hpp"
#include "cache/key_value_store.hpp"
#include "util/clock.hpp"

#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace qcache::cache {

/**
 * Store counters and occupancy for /cache/stats
 */
struct CacheStats {
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t evictions{0};   // Live entries pushed out by the budget
    std::uint64_t expired{0};     // Entries dropped after their TTL

    std::size_t entries{0};
    std::size_t size_bytes{0};
    std::size_t max_size_bytes{0};

    double hit_rate() const {
        auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / total : 0.0;
    }
};

struct LruCacheConfig {
    std::size_t max_size_bytes{64 * 1024 * 1024};
    bool enabled{true};
};

/**
 * Bounded, thread-safe KeyValueStore
 *
 * get()/set() complete synchronously; the returned futures are ready.
 * Expiry is judged against the injected clock when an entry is looked up
 * or when space is needed.
 */
class LruCache : public KeyValueStore {
public:
    explicit LruCache(const LruCacheConfig& config, util::Clock clock = util::system_clock());

    LruCache(const LruCache&) = delete;
    LruCache& operator=(const LruCache&) = delete;

    std::future<std::optional<std::string>> get(const std::string& key) override;
    std::future<void> set(const std::string& key, std::string value, std::chrono::seconds ttl) override;

    std::optional<std::string> lookup(const std::string& key);

    /**
     * Insert or replace; a value larger than the whole budget is dropped
     */
    void store(const std::string& key, std::string value, std::chrono::seconds ttl);

    bool remove(const std::string& key);

    void clear();

    /**
     * Drop every expired entry now
     *
     * @return number of entries dropped
     */
    std::size_t purge_expired();

    CacheStats get_stats() const;

    bool is_enabled() const { return enabled_; }

    /**
     * Change the byte budget; a smaller budget takes effect immediately
     */
    void update_max_size(std::size_t max_size_bytes);

private:
    struct Slot {
        std::string key;
        std::string value;
        std::size_t charge{0};
        std::optional<util::TimePoint> expires_at;  // Unset = no expiry
    };

    using SlotList = std::list<Slot>;
    using Index = std::unordered_map<std::string, SlotList::iterator, StoreKeyHash>;

    // All private helpers expect mutex_ to be held
    bool expired(const Slot& slot, util::TimePoint now) const;
    void drop(Index::iterator it);
    std::size_t drop_expired(util::TimePoint now);
    void fit_budget(util::TimePoint now);

    const bool enabled_;
    util::Clock clock_;

    mutable std::mutex mutex_;
    std::size_t budget_;
    std::size_t used_{0};
    SlotList slots_;  // Most recently used first
    Index index_;

    std::uint64_t hits_{0};
    std::uint64_t misses_{0};
    std::uint64_t evictions_{0};
    std::uint64_t expired_{0};
};

} // namespace qcache::cache

#endif // QCACHE_CACHE_LRU_CACHE_HPP
