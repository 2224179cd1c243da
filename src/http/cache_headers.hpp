/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * HTTP Cache Headers - Cache-Control and Age for outgoing responses
 */

#ifndef QCACHE_HTTP_CACHE_HEADERS_HPP
#define QCACHE_HTTP_CACHE_HEADERS_HPP

#include "cache/cache_hint.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace qcache::http {

/**
 * Whether the response came from the cache, and how old the entry was
 */
struct HitInfo {
    bool hit{false};
    std::int64_t age_seconds{0};
};

struct HttpCacheHeaders {
    std::optional<std::string> cache_control;
    std::optional<std::int64_t> age;

    /**
     * Header name/value pairs, in emission order
     */
    std::vector<std::pair<std::string, std::string>> to_header_list() const;
};

/**
 * "max-age=<n>, public" or "max-age=<n>, private"
 */
std::string format_cache_control(const cache::AggregatedPolicy& policy);

/**
 * Translate a response policy into HTTP cache headers
 *
 * No headers at all for an absent or uncacheable policy. Cache-Control
 * always reflects the computed policy, whether or not the engine stored
 * the response. Age is only set on an actual cache hit.
 */
HttpCacheHeaders compute_headers(const std::optional<cache::AggregatedPolicy>& policy, const HitInfo& hit);

} // namespace qcache::http

#endif // QCACHE_HTTP_CACHE_HEADERS_HPP
