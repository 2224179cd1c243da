/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Response Cache - Request lifecycle around GraphQL execution
 *
 * Two hooks bracket execution:
 * - response_for_operation(): before resolution; may answer from the store
 * - will_send_response(): after assembly; aggregates hints, writes the
 *   store and derives the outgoing HTTP cache headers
 *
 * No failure of the caching layer fails the request: key, store and
 * predicate errors are reported and the request proceeds uncached.
 */

#ifndef QCACHE_CACHE_RESPONSE_CACHE_HPP
#define QCACHE_CACHE_RESPONSE_CACHE_HPP

#include "cache/cache_hint.hpp"
#include "cache/cache_key.hpp"
#include "cache/errors.hpp"
#include "cache/key_value_store.hpp"
#include "cache/policy_gate.hpp"
#include "cache/request_context.hpp"
#include "http/cache_headers.hpp"
#include "util/clock.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace qcache::cache {

using SessionIdHook = std::function<std::optional<std::string>(const RequestContext&)>;
using ExtraKeyDataHook = std::function<std::optional<std::string>(const RequestContext&)>;

/**
 * Replaces the SHA-256 digest of the key document; the result is prefixed
 */
using GenerateCacheKeyHook = std::function<std::string(const RequestContext&, const nlohmann::json& key_document)>;

struct ResponseCacheOptions {
    SessionIdHook session_id;                 // Unset: every caller is anonymous
    ExtraKeyDataHook extra_cache_key_data;
    Predicate should_read_from_cache;         // Unset: always read
    Predicate should_write_to_cache;          // Unset: always write
    GenerateCacheKeyHook generate_cache_key;

    std::uint32_t default_max_age{0};
    std::string key_prefix{"fqc:"};
    bool authenticated_public_bucket{true};   // Off: public data for sessions shares the anonymous bucket

    ErrorListener on_error;
};

/**
 * Output of one execution, as seen by the cache
 */
struct ExecutionResult {
    std::string payload;      // Serialized response body
    HintTree hints;
    bool has_errors{false};
};

/**
 * Entry found by the pre-execution lookup
 */
struct CachedResponse {
    std::string payload;
    AggregatedPolicy policy;
    std::int64_t age_seconds{0};
    SessionMode bucket{SessionMode::NoSession};
};

/**
 * What goes back to the transport
 */
struct ServedResponse {
    std::string payload;
    http::HttpCacheHeaders headers;
    bool cache_hit{false};
};

/**
 * Executes an operation on a miss
 */
class OperationExecutor {
public:
    virtual ~OperationExecutor() = default;

    /**
     * @throws std::exception if the operation could not be executed at all
     */
    virtual ExecutionResult execute(const RequestContext& ctx) = 0;
};

class ResponseCache {
public:
    ResponseCache(std::shared_ptr<KeyValueStore> store,
                  ResponseCacheOptions options,
                  util::Clock clock = util::system_clock());

    ResponseCache(const ResponseCache&) = delete;
    ResponseCache& operator=(const ResponseCache&) = delete;

    /**
     * Pre-execution hook
     *
     * Derives the key components (also when reading is denied, so the
     * response can still be written) and looks the request up bucket by
     * bucket.
     *
     * @return The cached response on a hit; nullopt means execute
     */
    std::optional<CachedResponse> response_for_operation(RequestContext& ctx);

    /**
     * Post-execution hook
     *
     * On a hit pass the cached payload with no hints; it is never written back.
     */
    ServedResponse will_send_response(RequestContext& ctx, const ExecutionResult& result);

    /**
     * Full lifecycle: lookup, execute on a miss, write, respond
     *
     * @throws whatever the executor throws
     */
    ServedResponse handle(RequestContext& ctx, OperationExecutor& executor);

    const ResponseCacheOptions& options() const { return options_; }

private:
    void report(const CacheError& error) const;

    void derive_key_components(RequestContext& ctx) const;

    /**
     * @throws KeyDerivationError
     */
    std::string store_key(const RequestContext& ctx, SessionMode bucket) const;

    std::optional<CachedResponse> lookup(RequestContext& ctx);

    std::optional<SessionMode> write_bucket(const RequestContext& ctx, const AggregatedPolicy& policy) const;

    bool write(const RequestContext& ctx, SessionMode bucket, const ExecutionResult& result,
               const AggregatedPolicy& policy);

    std::shared_ptr<KeyValueStore> store_;
    ResponseCacheOptions options_;
    util::Clock clock_;

    HintAggregator aggregator_;
    CacheKeyBuilder key_builder_;
    PolicyGate gate_;

    mutable std::once_flag private_without_session_hook_warned_;
};

} // namespace qcache::cache

#endif // QCACHE_CACHE_RESPONSE_CACHE_HPP
