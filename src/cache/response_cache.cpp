/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Response Cache Implementation
 */

#include "cache/response_cache.hpp"
#include "cache/store_entry.hpp"
#include "util/logger.hpp"
#include "util/metrics.hpp"

#include <fmt/format.h>

#include <cmath>
#include <vector>

namespace qcache::cache {

using util::log_component::Cache;
using util::log_component::Key;
using util::log_component::Store;

ResponseCache::ResponseCache(std::shared_ptr<KeyValueStore> store,
                             ResponseCacheOptions options,
                             util::Clock clock)
    : store_(std::move(store))
    , options_(std::move(options))
    , clock_(std::move(clock))
    , aggregator_(AggregatorConfig{.default_max_age = options_.default_max_age})
    , key_builder_(options_.key_prefix)
    , gate_(options_.should_read_from_cache, options_.should_write_to_cache,
            [this](const CacheError& error) { report(error); })
{
    if (!store_) {
        throw std::invalid_argument("ResponseCache requires a store");
    }
}

std::optional<CachedResponse> ResponseCache::response_for_operation(RequestContext& ctx) {
    ctx.state = RequestState::Start;
    ctx.cache_hit = false;

    if (ctx.operation != OperationType::Query) {
        QCACHE_LOG_DEBUG(Cache, "[{}] {} bypasses the cache", ctx.request_id, to_string(ctx.operation));
        ctx.state = RequestState::MissExecuting;
        return std::nullopt;
    }

    ctx.state = RequestState::CheckingReadPolicy;
    bool may_read = gate_.may_read(ctx);

    derive_key_components(ctx);
    ctx.state = RequestState::KeyComputed;

    if (!may_read || !ctx.key_components) {
        util::Metrics::instance().cache_miss();
        ctx.state = RequestState::MissExecuting;
        return std::nullopt;
    }

    ctx.state = RequestState::Lookup;
    util::Metrics::instance().cache_lookup();

    auto cached = lookup(ctx);
    if (!cached) {
        util::Metrics::instance().cache_miss();
        ctx.state = RequestState::MissExecuting;
        return std::nullopt;
    }

    util::Metrics::instance().cache_hit();
    ctx.state = RequestState::Hit;
    ctx.cache_hit = true;
    ctx.matched_bucket = cached->bucket;
    ctx.policy = cached->policy;
    ctx.age_seconds = cached->age_seconds;

    QCACHE_LOG_DEBUG(Cache, "[{}] HIT bucket={} age={}s max_age={}s",
                     ctx.request_id, to_string(cached->bucket), cached->age_seconds, cached->policy.max_age);
    return cached;
}

ServedResponse ResponseCache::will_send_response(RequestContext& ctx, const ExecutionResult& result) {
    if (ctx.cache_hit) {
        ctx.state = RequestState::Responding;
        ServedResponse served{
            .payload = result.payload,
            .headers = http::compute_headers(ctx.policy, http::HitInfo{.hit = true, .age_seconds = ctx.age_seconds.value_or(0)}),
            .cache_hit = true
        };
        ctx.state = RequestState::End;
        return served;
    }

    ctx.state = RequestState::Aggregating;
    auto policy = aggregator_.aggregate(result.hints);
    ctx.policy = policy;

    ctx.state = RequestState::CheckingWritePolicy;
    bool attempted = false;

    bool eligible = ctx.operation == OperationType::Query
        && ctx.key_components.has_value()
        && !result.has_errors
        && policy.cacheable();

    if (eligible && gate_.may_write(ctx)) {
        if (auto bucket = write_bucket(ctx, policy)) {
            ctx.state = RequestState::Writing;
            attempted = true;
            if (write(ctx, *bucket, result, policy)) {
                util::Metrics::instance().cache_write();
            }
        }
    }

    if (!attempted) {
        ctx.state = RequestState::Skipped;
        util::Metrics::instance().cache_write_skipped();
        QCACHE_LOG_TRACE(Cache, "[{}] write skipped (max_age={}s, errors={})",
                         ctx.request_id, policy.max_age, result.has_errors);
    }

    ctx.state = RequestState::Responding;
    std::optional<AggregatedPolicy> header_policy;
    if (!result.has_errors) {
        header_policy = policy;
    }
    ServedResponse served{
        .payload = result.payload,
        .headers = http::compute_headers(header_policy, http::HitInfo{}),
        .cache_hit = false
    };
    ctx.state = RequestState::End;
    return served;
}

ServedResponse ResponseCache::handle(RequestContext& ctx, OperationExecutor& executor) {
    if (auto cached = response_for_operation(ctx)) {
        return will_send_response(ctx, ExecutionResult{.payload = std::move(cached->payload)});
    }

    auto result = executor.execute(ctx);
    return will_send_response(ctx, result);
}

void ResponseCache::report(const CacheError& error) const {
    QCACHE_LOG_WARN(Cache, "{} error: {}", to_string(error.kind()), error.what());
    util::Metrics::instance().cache_error(error.kind());

    if (options_.on_error) {
        try {
            options_.on_error(error);
        } catch (const std::exception& e) {
            QCACHE_LOG_ERROR(Cache, "Error listener threw: {}", e.what());
        }
    }
}

void ResponseCache::derive_key_components(RequestContext& ctx) const {
    ctx.key_components.reset();

    CacheKeyComponents components;
    components.document = ctx.request.query;
    components.operation_name = ctx.request.operation_name;
    components.variables = ctx.request.variables;

    try {
        // An empty session id or extra value counts as absent
        if (options_.session_id) {
            components.session_id = options_.session_id(ctx);
            if (components.session_id && components.session_id->empty()) {
                components.session_id.reset();
            }
        }
        if (options_.extra_cache_key_data) {
            components.extra = options_.extra_cache_key_data(ctx);
            if (components.extra && components.extra->empty()) {
                components.extra.reset();
            }
        }
    } catch (const CacheError& e) {
        report(e);
        return;
    } catch (const std::exception& e) {
        report(KeyDerivationError(fmt::format("Key hook failed: {}", e.what())));
        return;
    }

    try {
        canonicalize_variables(components.variables);
    } catch (const KeyDerivationError& e) {
        report(e);
        return;
    }

    QCACHE_LOG_TRACE(Key, "[{}] key components: operation={}, session={}, extra={}",
                     ctx.request_id,
                     components.operation_name.value_or("(anonymous)"),
                     components.session_id.has_value(),
                     components.extra.has_value());
    ctx.key_components = std::move(components);
}

std::string ResponseCache::store_key(const RequestContext& ctx, SessionMode bucket) const {
    const auto& components = *ctx.key_components;

    if (!options_.generate_cache_key) {
        return key_builder_.build_key(components, bucket);
    }

    auto document = key_document(components, bucket);
    try {
        return key_builder_.prefixed(options_.generate_cache_key(ctx, document));
    } catch (const CacheError&) {
        throw;
    } catch (const std::exception& e) {
        throw KeyDerivationError(fmt::format("generate_cache_key failed: {}", e.what()));
    }
}

std::optional<CachedResponse> ResponseCache::lookup(RequestContext& ctx) {
    std::vector<SessionMode> buckets;
    if (ctx.key_components->session_id) {
        buckets.push_back(SessionMode::Private);
        buckets.push_back(options_.authenticated_public_bucket
                              ? SessionMode::AuthenticatedPublic
                              : SessionMode::NoSession);
    } else {
        buckets.push_back(SessionMode::NoSession);
    }

    for (auto bucket : buckets) {
        std::string key;
        std::optional<std::string> value;
        try {
            key = store_key(ctx, bucket);
        } catch (const KeyDerivationError& e) {
            report(e);
            return std::nullopt;
        }

        try {
            value = store_->get(key).get();
        } catch (const std::exception& e) {
            report(StorePermanentError(fmt::format("get {} failed: {}", key, e.what())));
            return std::nullopt;
        }

        if (!value) {
            QCACHE_LOG_TRACE(Store, "[{}] no entry in {} bucket", ctx.request_id, to_string(bucket));
            continue;
        }

        auto entry = deserialize_entry(*value);
        if (!entry) {
            QCACHE_LOG_WARN(Store, "[{}] unreadable entry at {}, treating as miss", ctx.request_id, key);
            continue;
        }

        auto elapsed_ms = util::epoch_millis(clock_()) - entry->stored_at_ms;
        if (elapsed_ms < 0) {
            elapsed_ms = 0;
        }
        if (elapsed_ms >= static_cast<std::int64_t>(entry->policy.max_age) * 1000) {
            QCACHE_LOG_TRACE(Store, "[{}] expired entry in {} bucket", ctx.request_id, to_string(bucket));
            continue;
        }

        return CachedResponse{
            .payload = std::move(entry->payload),
            .policy = entry->policy,
            .age_seconds = static_cast<std::int64_t>(std::llround(static_cast<double>(elapsed_ms) / 1000.0)),
            .bucket = bucket
        };
    }

    return std::nullopt;
}

std::optional<SessionMode> ResponseCache::write_bucket(const RequestContext& ctx, const AggregatedPolicy& policy) const {
    bool has_session = ctx.key_components->session_id.has_value();

    if (policy.scope == CacheScope::Private) {
        if (!options_.session_id) {
            std::call_once(private_without_session_hook_warned_, [] {
                QCACHE_LOG_WARN(Cache, "PRIVATE response not cached: no session_id hook is configured");
            });
            return std::nullopt;
        }
        if (!has_session) {
            return std::nullopt;
        }
        return SessionMode::Private;
    }

    if (has_session && options_.authenticated_public_bucket) {
        return SessionMode::AuthenticatedPublic;
    }
    return SessionMode::NoSession;
}

bool ResponseCache::write(const RequestContext& ctx, SessionMode bucket, const ExecutionResult& result,
                          const AggregatedPolicy& policy) {
    std::string key;
    try {
        key = store_key(ctx, bucket);
    } catch (const KeyDerivationError& e) {
        report(e);
        return false;
    }

    StoreEntry entry{
        .payload = result.payload,
        .policy = policy,
        .stored_at_ms = util::epoch_millis(clock_())
    };

    try {
        store_->set(key, serialize_entry(entry), std::chrono::seconds(policy.max_age)).get();
    } catch (const std::exception& e) {
        report(StorePermanentError(fmt::format("set {} failed: {}", key, e.what())));
        return false;
    }

    QCACHE_LOG_DEBUG(Cache, "[{}] stored in {} bucket, max_age={}s scope={}",
                     ctx.request_id, to_string(bucket), policy.max_age, to_string(policy.scope));
    return true;
}

} // namespace qcache::cache
