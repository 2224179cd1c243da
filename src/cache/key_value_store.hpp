/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Key-Value Store - Contract of the pluggable response store
 */

#ifndef QCACHE_CACHE_KEY_VALUE_STORE_HPP
#define QCACHE_CACHE_KEY_VALUE_STORE_HPP

#include <chrono>
#include <future>
#include <optional>
#include <string>

namespace qcache::cache {

/**
 * Pluggable get/set-with-expiry store
 *
 * Both operations may complete asynchronously and may fail; failures are
 * delivered through the returned future. Implementations guarantee atomic
 * per-key get/set and isolation between keys; nothing more is assumed.
 */
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    /**
     * Fetch a value
     * @return future holding the value, or nullopt if absent or expired
     */
    virtual std::future<std::optional<std::string>> get(const std::string& key) = 0;

    /**
     * Store a value that expires after ttl (0 = no expiry)
     */
    virtual std::future<void> set(const std::string& key, std::string value, std::chrono::seconds ttl) = 0;
};

} // namespace qcache::cache

#endif // QCACHE_CACHE_KEY_VALUE_STORE_HPP
