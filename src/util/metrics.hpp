/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Metrics - Process-wide counters for the cache engine and gateway
 */

#ifndef QCACHE_UTIL_METRICS_HPP
#define QCACHE_UTIL_METRICS_HPP

#include "cache/errors.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace qcache::util {

enum class Counter : std::size_t {
    RequestsTotal,
    RequestsSuccess,
    RequestsError,
    CacheLookups,
    CacheHits,
    CacheMisses,
    CacheWrites,
    CacheWritesSkipped,
    KeyDerivationErrors,
    StoreErrors,
    PolicyPredicateErrors,
    UpstreamRequests,
    UpstreamLatencyMs,  // Sum, divided by UpstreamRequests for the average
    Count_
};

inline constexpr std::size_t kCounterCount = static_cast<std::size_t>(Counter::Count_);

/**
 * Point-in-time copy of all counters
 */
struct MetricsSnapshot {
    std::array<std::uint64_t, kCounterCount> counters{};
    std::uint64_t requests_active{0};
    std::uint64_t store_bytes{0};
    std::uint64_t uptime_seconds{0};

    std::uint64_t operator[](Counter counter) const {
        return counters[static_cast<std::size_t>(counter)];
    }

    double cache_hit_rate() const;
    double upstream_latency_avg_ms() const;

    /**
     * Nested JSON document, grouped by area
     */
    std::string to_json() const;

    /**
     * Prometheus text exposition format
     */
    std::string to_prometheus() const;
};

/**
 * Metrics registry - lock-free, relaxed atomics only
 */
class Metrics {
public:
    static Metrics& instance();

    void add(Counter counter, std::uint64_t amount = 1);

    void request_started();
    void request_completed(bool success);

    void cache_lookup() { add(Counter::CacheLookups); }
    void cache_hit() { add(Counter::CacheHits); }
    void cache_miss() { add(Counter::CacheMisses); }
    void cache_write() { add(Counter::CacheWrites); }
    void cache_write_skipped() { add(Counter::CacheWritesSkipped); }
    void cache_error(cache::ErrorKind kind);

    void upstream_request(std::chrono::milliseconds latency);

    void set_store_bytes(std::uint64_t bytes);

    MetricsSnapshot snapshot() const;

    /**
     * Zero all counters; uptime keeps running
     */
    void reset();

    Metrics(const Metrics&) = delete;
    Metrics& operator=(const Metrics&) = delete;

private:
    Metrics();

    std::array<std::atomic<std::uint64_t>, kCounterCount> counters_{};
    std::atomic<std::uint64_t> requests_active_{0};
    std::atomic<std::uint64_t> store_bytes_{0};
    const std::chrono::steady_clock::time_point started_;
};

} // namespace qcache::util

#endif // QCACHE_UTIL_METRICS_HPP
