/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Gateway - HTTP routing in front of the response cache
 *
 * Routes:
 * - POST <graphql_path>: GraphQL request through the response cache
 * - GET /health, /metrics, /cache/stats
 */

#ifndef QCACHE_PROXY_GATEWAY_HPP
#define QCACHE_PROXY_GATEWAY_HPP

#include "cache/lru_cache.hpp"
#include "cache/response_cache.hpp"
#include "config/config.hpp"
#include "server/connection.hpp"
#include "util/logger.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <variant>

namespace qcache::proxy {

/**
 * Request header names used by the cache hooks, swappable at runtime
 */
class HeaderMapping {
public:
    explicit HeaderMapping(config::HeaderSettings settings);

    config::HeaderSettings get() const;
    void set(config::HeaderSettings settings);

private:
    mutable std::shared_mutex mutex_;
    config::HeaderSettings settings_;
};

/**
 * Engine options derived from configuration
 *
 * Hooks read the current header names from the mapping on every request:
 * - session_id: value of the session header (hook unset if no header is configured)
 * - extra_cache_key_data: value of the extra-key header
 * - should_read/should_write: denied while the no-read/no-write header is present
 */
cache::ResponseCacheOptions make_cache_options(const config::Config& config,
                                               std::shared_ptr<HeaderMapping> headers);

/**
 * Parse a GraphQL-over-HTTP POST body
 *
 * @return The request, or an error message for the client
 */
std::variant<cache::GraphQLRequest, std::string> parse_graphql_body(const std::string& body);

class Gateway {
public:
    Gateway(std::string graphql_path,
            std::shared_ptr<cache::ResponseCache> cache,
            std::shared_ptr<cache::OperationExecutor> executor,
            std::shared_ptr<cache::LruCache> store);

    server::HttpResponse handle(const server::HttpRequest& request);

private:
    server::HttpResponse handle_graphql(const server::HttpRequest& request, util::AccessLogEntry& entry);
    server::HttpResponse cache_stats() const;
    // Prometheus text unless the query string asks for format=json
    server::HttpResponse metrics(bool as_json) const;

    std::string graphql_path_;
    std::shared_ptr<cache::ResponseCache> cache_;
    std::shared_ptr<cache::OperationExecutor> executor_;
    std::shared_ptr<cache::LruCache> store_;
};

} // namespace qcache::proxy

#endif // QCACHE_PROXY_GATEWAY_HPP
