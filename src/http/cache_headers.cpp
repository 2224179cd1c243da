/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * HTTP Cache Headers Implementation
 */

#include "http/cache_headers.hpp"

#include <fmt/format.h>

namespace qcache::http {

std::vector<std::pair<std::string, std::string>> HttpCacheHeaders::to_header_list() const {
    std::vector<std::pair<std::string, std::string>> headers;
    if (cache_control) {
        headers.emplace_back("Cache-Control", *cache_control);
    }
    if (age) {
        headers.emplace_back("Age", std::to_string(*age));
    }
    return headers;
}

std::string format_cache_control(const cache::AggregatedPolicy& policy) {
    return fmt::format("max-age={}, {}", policy.max_age,
                       policy.scope == cache::CacheScope::Private ? "private" : "public");
}

HttpCacheHeaders compute_headers(const std::optional<cache::AggregatedPolicy>& policy, const HitInfo& hit) {
    HttpCacheHeaders headers;
    if (!policy || !policy->cacheable()) {
        return headers;
    }

    headers.cache_control = format_cache_control(*policy);
    if (hit.hit) {
        headers.age = hit.age_seconds;
    }
    return headers;
}

} // namespace qcache::http
