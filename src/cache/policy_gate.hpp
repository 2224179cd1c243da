/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Policy Gate - Caller-controlled read/write eligibility
 */

#ifndef QCACHE_CACHE_POLICY_GATE_HPP
#define QCACHE_CACHE_POLICY_GATE_HPP

#include "cache/errors.hpp"
#include "cache/request_context.hpp"

#include <functional>
#include <future>
#include <string_view>

namespace qcache::cache {

/**
 * Eligibility predicate; may resolve asynchronously
 */
using Predicate = std::function<std::future<bool>(const RequestContext&)>;

/**
 * Wrap a synchronous predicate
 */
Predicate make_predicate(std::function<bool(const RequestContext&)> fn);

/**
 * Evaluates the read and write predicates of a response cache
 *
 * Missing predicates allow everything. The gate waits for each predicate's
 * future before answering. A predicate that throws, or whose future is
 * invalid or broken, counts as a denial and is reported as a
 * PolicyPredicateError.
 */
class PolicyGate {
public:
    PolicyGate(Predicate should_read, Predicate should_write, ErrorListener reporter);

    bool may_read(const RequestContext& ctx) const;
    bool may_write(const RequestContext& ctx) const;

private:
    bool evaluate(const Predicate& predicate, const RequestContext& ctx, std::string_view name) const;

    Predicate should_read_;
    Predicate should_write_;
    ErrorListener reporter_;
};

} // namespace qcache::cache

#endif // QCACHE_CACHE_POLICY_GATE_HPP
