/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Cache Key - Deterministic store keys for full responses
 *
 * A store key is derived from:
 * - The raw operation text (not normalized: whitespace matters)
 * - The operation name
 * - The variables, canonicalized (sorted keys, stable JSON encoding)
 * - Caller-supplied extra key data
 * - The session bucket, and for private responses the session id
 */

#ifndef QCACHE_CACHE_CACHE_KEY_HPP
#define QCACHE_CACHE_CACHE_KEY_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace qcache::cache {

/**
 * Key space a cache entry belongs to
 *
 * The same request maps to three disjoint keys:
 * - NoSession: anonymous callers, public data
 * - AuthenticatedPublic: shared by all callers with a session, public data
 * - Private: one key per session id
 */
enum class SessionMode {
    NoSession = 0,
    Private = 1,
    AuthenticatedPublic = 2
};

std::string_view to_string(SessionMode mode);

/**
 * Everything a request contributes to its cache key
 */
struct CacheKeyComponents {
    std::string document;
    std::optional<std::string> operation_name;
    nlohmann::json variables = nlohmann::json::object();
    std::optional<std::string> extra;
    std::optional<std::string> session_id;
};

/**
 * Encode variables canonically
 *
 * @throws KeyDerivationError if the variables are not an object or hold a
 *         value without a stable encoding (invalid UTF-8, NaN/Inf, binary)
 */
std::string canonicalize_variables(const nlohmann::json& variables);

/**
 * Build the JSON document that identifies one (request, bucket) pair
 *
 * The session id is only part of the document in Private mode; the
 * AuthenticatedPublic bucket depends on session presence alone.
 *
 * @throws KeyDerivationError on unserializable variables
 */
nlohmann::json key_document(const CacheKeyComponents& components, SessionMode mode);

/**
 * Lowercase hex SHA-256 of the input
 *
 * @throws KeyDerivationError if the digest cannot be computed
 */
std::string sha256_hex(std::string_view data);

/**
 * Derives prefixed store keys from key components
 */
class CacheKeyBuilder {
public:
    explicit CacheKeyBuilder(std::string prefix = "fqc:");

    /**
     * Store key for a request in the given bucket
     *
     * @return prefix + SHA-256 of the canonical key document
     * @throws KeyDerivationError on unserializable components
     */
    std::string build_key(const CacheKeyComponents& components, SessionMode mode) const;

    /**
     * Apply the configured prefix to an externally generated digest
     */
    std::string prefixed(std::string_view digest) const;

    const std::string& prefix() const { return prefix_; }

private:
    std::string prefix_;
};

/**
 * XXH3-based hash functor for store keys in std::unordered_map
 */
struct StoreKeyHash {
    std::size_t operator()(const std::string& key) const noexcept;
};

} // namespace qcache::cache

#endif // QCACHE_CACHE_CACHE_KEY_HPP
