/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Metrics Implementation
 */

#include "util/metrics.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace qcache::util {

namespace {

struct CounterInfo {
    std::string_view group;
    std::string_view field;
    std::string_view prometheus_name;
    std::string_view help;
};

// Indexed by Counter
constexpr std::array<CounterInfo, kCounterCount> kCounterInfo{{
    {"requests", "total", "qcache_requests_total", "GraphQL requests received"},
    {"requests", "success", "qcache_requests_success_total", "GraphQL requests answered below 400"},
    {"requests", "error", "qcache_requests_error_total", "GraphQL requests answered with 400 or above"},
    {"cache", "lookups", "qcache_cache_lookups_total", "Store reads attempted"},
    {"cache", "hits", "qcache_cache_hits_total", "Responses served from the store"},
    {"cache", "misses", "qcache_cache_misses_total", "Cacheable requests that were executed"},
    {"cache", "writes", "qcache_cache_writes_total", "Responses written to the store"},
    {"cache", "writes_skipped", "qcache_cache_writes_skipped_total", "Executed responses not written"},
    {"errors", "key_derivation", "qcache_key_derivation_errors_total", "Cache key or hook failures"},
    {"errors", "store", "qcache_store_errors_total", "Store get/set failures"},
    {"errors", "policy_predicate", "qcache_policy_predicate_errors_total", "Read/write predicate failures"},
    {"upstream", "requests", "qcache_upstream_requests_total", "Requests forwarded upstream"},
    {"upstream", "latency_ms_sum", "qcache_upstream_latency_ms_sum", "Total upstream latency in milliseconds"},
}};

} // namespace

Metrics::Metrics()
    : started_(std::chrono::steady_clock::now())
{
}

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

void Metrics::add(Counter counter, std::uint64_t amount) {
    counters_[static_cast<std::size_t>(counter)].fetch_add(amount, std::memory_order_relaxed);
}

void Metrics::request_started() {
    add(Counter::RequestsTotal);
    requests_active_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::request_completed(bool success) {
    requests_active_.fetch_sub(1, std::memory_order_relaxed);
    add(success ? Counter::RequestsSuccess : Counter::RequestsError);
}

void Metrics::cache_error(cache::ErrorKind kind) {
    switch (kind) {
        case cache::ErrorKind::KeyDerivation:   add(Counter::KeyDerivationErrors); break;
        case cache::ErrorKind::StorePermanent:  add(Counter::StoreErrors); break;
        case cache::ErrorKind::PolicyPredicate: add(Counter::PolicyPredicateErrors); break;
    }
}

void Metrics::upstream_request(std::chrono::milliseconds latency) {
    add(Counter::UpstreamRequests);
    add(Counter::UpstreamLatencyMs, static_cast<std::uint64_t>(latency.count()));
}

void Metrics::set_store_bytes(std::uint64_t bytes) {
    store_bytes_.store(bytes, std::memory_order_relaxed);
}

MetricsSnapshot Metrics::snapshot() const {
    MetricsSnapshot snap;
    for (std::size_t i = 0; i < kCounterCount; ++i) {
        snap.counters[i] = counters_[i].load(std::memory_order_relaxed);
    }
    snap.requests_active = requests_active_.load(std::memory_order_relaxed);
    snap.store_bytes = store_bytes_.load(std::memory_order_relaxed);
    snap.uptime_seconds = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started_).count());
    return snap;
}

void Metrics::reset() {
    for (auto& counter : counters_) {
        counter.store(0, std::memory_order_relaxed);
    }
    requests_active_.store(0, std::memory_order_relaxed);
    store_bytes_.store(0, std::memory_order_relaxed);
}

double MetricsSnapshot::cache_hit_rate() const {
    auto hits = (*this)[Counter::CacheHits];
    auto total = hits + (*this)[Counter::CacheMisses];
    return total > 0 ? static_cast<double>(hits) / total : 0.0;
}

double MetricsSnapshot::upstream_latency_avg_ms() const {
    auto requests = (*this)[Counter::UpstreamRequests];
    return requests > 0 ? static_cast<double>((*this)[Counter::UpstreamLatencyMs]) / requests : 0.0;
}

std::string MetricsSnapshot::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    for (std::size_t i = 0; i < kCounterCount; ++i) {
        const auto& info = kCounterInfo[i];
        j[std::string(info.group)][std::string(info.field)] = counters[i];
    }
    j["requests"]["active"] = requests_active;
    j["cache"]["hit_rate"] = cache_hit_rate();
    j["upstream"]["latency_avg_ms"] = upstream_latency_avg_ms();
    j["system"] = {
        {"uptime_seconds", uptime_seconds},
        {"store_bytes", store_bytes}
    };
    return j.dump(2);
}

std::string MetricsSnapshot::to_prometheus() const {
    std::string out;
    auto emit = [&out](std::string_view name, std::string_view type, std::string_view help, auto value) {
        out += fmt::format("# HELP {} {}\n# TYPE {} {}\n{} {}\n", name, help, name, type, name, value);
    };

    for (std::size_t i = 0; i < kCounterCount; ++i) {
        const auto& info = kCounterInfo[i];
        emit(info.prometheus_name, "counter", info.help, counters[i]);
    }
    emit("qcache_requests_active", "gauge", "GraphQL requests in flight", requests_active);
    emit("qcache_store_bytes", "gauge", "Bytes held by the in-process store", store_bytes);
    emit("qcache_uptime_seconds", "gauge", "Seconds since start", uptime_seconds);
    return out;
}

} // namespace qcache::util
