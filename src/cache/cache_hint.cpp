/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Cache Hint Aggregation Implementation
 */

#include "cache/cache_hint.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace qcache::cache {

std::string_view to_string(CacheScope scope) {
    switch (scope) {
        case CacheScope::Public:  return "PUBLIC";
        case CacheScope::Private: return "PRIVATE";
        default:                  return "PUBLIC";
    }
}

std::optional<CacheScope> parse_scope(std::string_view name) {
    std::string upper;
    upper.reserve(name.size());
    for (char c : name) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    if (upper == "PUBLIC") return CacheScope::Public;
    if (upper == "PRIVATE") return CacheScope::Private;
    return std::nullopt;
}

HintAggregator::HintAggregator(AggregatorConfig config)
    : config_(config) {}

std::uint32_t HintAggregator::effective_max_age(const CacheHint& hint) const {
    return hint.max_age.value_or(config_.default_max_age);
}

AggregatedPolicy HintAggregator::aggregate(const HintTree& hints) const {
    AggregatedPolicy policy;
    if (hints.empty()) {
        return policy;
    }

    // Start unconstrained and narrow down field by field
    auto max_age = std::numeric_limits<std::uint32_t>::max();

    for (const auto& field : hints) {
        auto field_max_age = effective_max_age(field.hint);
        max_age = std::min(max_age, field_max_age);

        if (field.hint.scope == CacheScope::Private) {
            policy.scope = CacheScope::Private;
        }
        if (field.is_root() && field_max_age > 0) {
            policy.possible_root_fields_cacheable = true;
        }
    }

    policy.max_age = max_age;
    return policy;
}

} // namespace qcache::cache
