/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Request Context - Per-request input and caching state
 */

#ifndef QCACHE_CACHE_REQUEST_CONTEXT_HPP
#define QCACHE_CACHE_REQUEST_CONTEXT_HPP

#include "cache/cache_hint.hpp"
#include "cache/cache_key.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace qcache::cache {

enum class OperationType {
    Query,
    Mutation,
    Subscription
};

std::string_view to_string(OperationType type);

/**
 * Lifecycle of one request through the response cache
 *
 * START -> CHECKING_READ_POLICY -> KEY_COMPUTED -> LOOKUP -> HIT
 *                                                       \-> MISS_EXECUTING -> AGGREGATING
 *       -> CHECKING_WRITE_POLICY -> WRITING | SKIPPED -> RESPONDING -> END
 */
enum class RequestState {
    Start,
    CheckingReadPolicy,
    KeyComputed,
    Lookup,
    Hit,
    MissExecuting,
    Aggregating,
    CheckingWritePolicy,
    Writing,
    Skipped,
    Responding,
    End
};

std::string_view to_string(RequestState state);

/**
 * GraphQL request as received from the transport
 */
struct GraphQLRequest {
    std::string query;
    std::optional<std::string> operation_name;
    nlohmann::json variables = nlohmann::json::object();

    // Header names are stored lowercase
    std::map<std::string, std::string> headers;

    /**
     * Header value by name (case-insensitive)
     */
    std::optional<std::string> header(std::string_view name) const;
};

/**
 * Everything the cache knows about one request
 *
 * Filled in by the planner (operation) and by the engine as the request
 * moves through its states. One context per request; never shared.
 */
struct RequestContext {
    GraphQLRequest request;
    OperationType operation{OperationType::Query};
    std::string request_id;

    RequestState state{RequestState::Start};
    std::optional<CacheKeyComponents> key_components;  // Unset when the key could not be derived
    bool cache_hit{false};
    std::optional<SessionMode> matched_bucket;
    std::optional<AggregatedPolicy> policy;
    std::optional<std::int64_t> age_seconds;           // Only on a hit
};

} // namespace qcache::cache

#endif // QCACHE_CACHE_REQUEST_CONTEXT_HPP
