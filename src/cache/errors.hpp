/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Cache Errors - Failure taxonomy of the caching layer
 *
 * None of these errors ever fails the request being served: the engine
 * reports them and continues without the cache.
 */

#ifndef QCACHE_CACHE_ERRORS_HPP
#define QCACHE_CACHE_ERRORS_HPP

#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace qcache::cache {

enum class ErrorKind {
    KeyDerivation,    // A key component could not be canonicalized
    StorePermanent,   // The backing store failed a get or set
    PolicyPredicate   // A read/write predicate threw or never resolved
};

inline std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::KeyDerivation:   return "key_derivation";
        case ErrorKind::StorePermanent:  return "store";
        case ErrorKind::PolicyPredicate: return "policy_predicate";
        default:                         return "unknown";
    }
}

class CacheError : public std::runtime_error {
public:
    CacheError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class KeyDerivationError : public CacheError {
public:
    explicit KeyDerivationError(const std::string& message)
        : CacheError(ErrorKind::KeyDerivation, message) {}
};

class StorePermanentError : public CacheError {
public:
    explicit StorePermanentError(const std::string& message)
        : CacheError(ErrorKind::StorePermanent, message) {}
};

class PolicyPredicateError : public CacheError {
public:
    explicit PolicyPredicateError(const std::string& message)
        : CacheError(ErrorKind::PolicyPredicate, message) {}
};

/**
 * Observability hook invoked for every reported cache error
 */
using ErrorListener = std::function<void(const CacheError&)>;

} // namespace qcache::cache

#endif // QCACHE_CACHE_ERRORS_HPP
