/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Cache Hints - Per-field hints and response-wide policy aggregation
 *
 * Execution attaches one hint to every resolved field. The aggregator
 * reduces them to a single policy for the whole response:
 * - max age is the minimum over all fields
 * - scope is PRIVATE as soon as one field is PRIVATE
 * - a field without a max age contributes the default (0 unless configured),
 *   so one uncached field makes the whole response uncacheable
 */

#ifndef QCACHE_CACHE_CACHE_HINT_HPP
#define QCACHE_CACHE_CACHE_HINT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qcache::cache {

enum class CacheScope {
    Public,
    Private
};

/**
 * "PUBLIC" or "PRIVATE"
 */
std::string_view to_string(CacheScope scope);

/**
 * Parse a scope name (case-insensitive)
 */
std::optional<CacheScope> parse_scope(std::string_view name);

/**
 * Cache hint attached to a single field or type
 */
struct CacheHint {
    std::optional<std::uint32_t> max_age;
    std::optional<CacheScope> scope;

    bool operator==(const CacheHint&) const = default;
};

/**
 * Hint for one resolved field, identified by its response path
 * (list indices appear as decimal path segments)
 */
struct FieldHint {
    std::vector<std::string> path;
    CacheHint hint;

    bool is_root() const { return path.size() == 1; }
};

/**
 * All hints visited while executing one request
 */
using HintTree = std::vector<FieldHint>;

/**
 * Response-wide cache policy
 */
struct AggregatedPolicy {
    std::uint32_t max_age{0};  // 0 = do not cache
    CacheScope scope{CacheScope::Public};
    bool possible_root_fields_cacheable{false};

    bool cacheable() const { return max_age > 0; }

    bool operator==(const AggregatedPolicy&) const = default;
};

struct AggregatorConfig {
    std::uint32_t default_max_age{0};  // Applied to hints without a max age
};

class HintAggregator {
public:
    explicit HintAggregator(AggregatorConfig config = {});

    /**
     * Reduce a hint tree to one policy
     *
     * An empty tree (nothing was resolved) yields an uncacheable policy.
     */
    AggregatedPolicy aggregate(const HintTree& hints) const;

    /**
     * Max age a single hint contributes to the reduction
     */
    std::uint32_t effective_max_age(const CacheHint& hint) const;

    const AggregatorConfig& config() const { return config_; }

private:
    AggregatorConfig config_;
};

} // namespace qcache::cache

#endif // QCACHE_CACHE_CACHE_HINT_HPP
