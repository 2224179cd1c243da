/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Store Entry - Serialized form of a cached response
 */

#ifndef QCACHE_CACHE_STORE_ENTRY_HPP
#define QCACHE_CACHE_STORE_ENTRY_HPP

#include "cache/cache_hint.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace qcache::cache {

/**
 * Immutable snapshot of one cacheable response
 */
struct StoreEntry {
    std::string payload;
    AggregatedPolicy policy;
    std::int64_t stored_at_ms{0};  // Epoch milliseconds
};

/**
 * Encode as {"data": ..., "cachePolicy": {...}, "cacheTime": ...}
 */
std::string serialize_entry(const StoreEntry& entry);

/**
 * Decode a stored value
 * @return nullopt if the value is not a well-formed entry
 */
std::optional<StoreEntry> deserialize_entry(std::string_view value);

void to_json(nlohmann::json& j, const AggregatedPolicy& p);
void from_json(const nlohmann::json& j, AggregatedPolicy& p);

} // namespace qcache::cache

#endif // QCACHE_CACHE_STORE_ENTRY_HPP
