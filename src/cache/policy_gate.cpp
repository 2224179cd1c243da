/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Policy Gate Implementation
 */

#include "cache/policy_gate.hpp"
#include "util/future.hpp"
#include "util/logger.hpp"

#include <fmt/format.h>

namespace qcache::cache {

using util::log_component::Policy;

Predicate make_predicate(std::function<bool(const RequestContext&)> fn) {
    return [fn = std::move(fn)](const RequestContext& ctx) {
        return util::make_ready_future(fn(ctx));
    };
}

PolicyGate::PolicyGate(Predicate should_read, Predicate should_write, ErrorListener reporter)
    : should_read_(std::move(should_read))
    , should_write_(std::move(should_write))
    , reporter_(std::move(reporter)) {}

bool PolicyGate::may_read(const RequestContext& ctx) const {
    return evaluate(should_read_, ctx, "shouldReadFromCache");
}

bool PolicyGate::may_write(const RequestContext& ctx) const {
    return evaluate(should_write_, ctx, "shouldWriteToCache");
}

bool PolicyGate::evaluate(const Predicate& predicate, const RequestContext& ctx, std::string_view name) const {
    if (!predicate) {
        return true;
    }

    std::string failure;
    try {
        auto decision = predicate(ctx);
        if (!decision.valid()) {
            failure = "returned an empty future";
        } else {
            bool allowed = decision.get();
            QCACHE_LOG_TRACE(Policy, "{} -> {}", name, allowed);
            return allowed;
        }
    } catch (const std::exception& e) {
        failure = e.what();
    } catch (...) {
        failure = "threw a non-standard exception";
    }

    if (reporter_) {
        reporter_(PolicyPredicateError(fmt::format("{} failed: {}", name, failure)));
    }
    return false;
}

} // namespace qcache::cache
