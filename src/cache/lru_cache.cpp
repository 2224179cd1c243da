/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * LRU Cache Implementation
 */

#include "cache/lru_cache.hpp"
#include "util/future.hpp"
#include "util/logger.hpp"

namespace qcache::cache {

using util::log_component::Store;

LruCache::LruCache(const LruCacheConfig& config, util::Clock clock)
    : enabled_(config.enabled)
    , clock_(std::move(clock))
    , budget_(config.max_size_bytes)
{
    QCACHE_LOG_DEBUG(Store, "In-process store ready: budget={} bytes, enabled={}", budget_, enabled_);
}

std::future<std::optional<std::string>> LruCache::get(const std::string& key) {
    return util::make_ready_future(lookup(key));
}

std::future<void> LruCache::set(const std::string& key, std::string value, std::chrono::seconds ttl) {
    store(key, std::move(value), ttl);
    return util::make_ready_future();
}

std::optional<std::string> LruCache::lookup(const std::string& key) {
    if (!enabled_) {
        return std::nullopt;
    }

    auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(key);
    if (it == index_.end()) {
        ++misses_;
        return std::nullopt;
    }
    if (expired(*it->second, now)) {
        drop(it);
        ++expired_;
        ++misses_;
        return std::nullopt;
    }

    slots_.splice(slots_.begin(), slots_, it->second);
    ++hits_;
    return it->second->value;
}

void LruCache::store(const std::string& key, std::string value, std::chrono::seconds ttl) {
    if (!enabled_) {
        return;
    }

    auto now = clock_();
    auto charge = key.size() + value.size();
    std::optional<util::TimePoint> expires_at;
    if (ttl.count() > 0) {
        expires_at = now + ttl;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (charge > budget_) {
        QCACHE_LOG_DEBUG(Store, "Not storing {}: {} bytes exceeds the {} byte budget", key, charge, budget_);
        return;
    }

    if (auto it = index_.find(key); it != index_.end()) {
        auto& slot = *it->second;
        used_ = used_ - slot.charge + charge;
        slot.value = std::move(value);
        slot.charge = charge;
        slot.expires_at = expires_at;
        slots_.splice(slots_.begin(), slots_, it->second);
    } else {
        slots_.push_front(Slot{key, std::move(value), charge, expires_at});
        index_.emplace(key, slots_.begin());
        used_ += charge;
    }

    QCACHE_LOG_TRACE(Store, "Stored {} ({} bytes, ttl={}s), {} of {} bytes used",
                     key, charge, ttl.count(), used_, budget_);

    fit_budget(now);
}

bool LruCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(key);
    if (it == index_.end()) {
        return false;
    }
    drop(it);
    return true;
}

void LruCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    QCACHE_LOG_INFO(Store, "Clearing {} entries", index_.size());
    index_.clear();
    slots_.clear();
    used_ = 0;
}

std::size_t LruCache::purge_expired() {
    auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    return drop_expired(now);
}

CacheStats LruCache::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    return CacheStats{
        .hits = hits_,
        .misses = misses_,
        .evictions = evictions_,
        .expired = expired_,
        .entries = index_.size(),
        .size_bytes = used_,
        .max_size_bytes = budget_
    };
}

void LruCache::update_max_size(std::size_t max_size_bytes) {
    auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);

    QCACHE_LOG_INFO(Store, "Budget changed from {} to {} bytes", budget_, max_size_bytes);
    budget_ = max_size_bytes;
    fit_budget(now);
}

bool LruCache::expired(const Slot& slot, util::TimePoint now) const {
    return slot.expires_at && now >= *slot.expires_at;
}

void LruCache::drop(Index::iterator it) {
    used_ -= it->second->charge;
    slots_.erase(it->second);
    index_.erase(it);
}

std::size_t LruCache::drop_expired(util::TimePoint now) {
    std::size_t dropped = 0;
    for (auto it = slots_.begin(); it != slots_.end();) {
        auto slot = it++;
        if (expired(*slot, now)) {
            drop(index_.find(slot->key));
            ++dropped;
        }
    }
    expired_ += dropped;
    return dropped;
}

void LruCache::fit_budget(util::TimePoint now) {
    if (used_ <= budget_) {
        return;
    }

    if (auto dropped = drop_expired(now); dropped > 0) {
        QCACHE_LOG_DEBUG(Store, "Reclaimed {} expired entries", dropped);
    }

    while (used_ > budget_ && !slots_.empty()) {
        const auto& victim = slots_.back();
        QCACHE_LOG_DEBUG(Store, "Evicting {} ({} bytes)", victim.key, victim.charge);
        drop(index_.find(victim.key));
        ++evictions_;
    }
}

} // namespace qcache::cache
