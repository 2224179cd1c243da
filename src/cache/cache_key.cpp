/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Cache Key Implementation
 */

#include "cache/cache_key.hpp"
#include "cache/errors.hpp"

#include <openssl/evp.h>
#include <xxhash.h>

#include <array>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace qcache::cache {

namespace {

void ensure_serializable(const nlohmann::json& value, const std::string& path) {
    switch (value.type()) {
        case nlohmann::json::value_t::object:
            for (auto it = value.begin(); it != value.end(); ++it) {
                ensure_serializable(it.value(), path + "." + it.key());
            }
            break;
        case nlohmann::json::value_t::array:
            for (std::size_t i = 0; i < value.size(); ++i) {
                ensure_serializable(value[i], path + "[" + std::to_string(i) + "]");
            }
            break;
        case nlohmann::json::value_t::number_float:
            // nlohmann encodes NaN and Inf as null, which would collide with a real null
            if (!std::isfinite(value.get<double>())) {
                throw KeyDerivationError("Non-finite number in variables at " + path);
            }
            break;
        case nlohmann::json::value_t::binary:
            throw KeyDerivationError("Binary value in variables at " + path);
        case nlohmann::json::value_t::discarded:
            throw KeyDerivationError("Discarded value in variables at " + path);
        default:
            break;
    }
}

std::string dump_strict(const nlohmann::json& document, std::string_view what) {
    try {
        return document.dump();
    } catch (const nlohmann::json::exception& e) {
        throw KeyDerivationError(std::string(what) + " is not serializable: " + e.what());
    }
}

} // namespace

std::string_view to_string(SessionMode mode) {
    switch (mode) {
        case SessionMode::NoSession:           return "no-session";
        case SessionMode::Private:             return "private";
        case SessionMode::AuthenticatedPublic: return "authenticated-public";
        default:                               return "unknown";
    }
}

std::string canonicalize_variables(const nlohmann::json& variables) {
    if (variables.is_null()) {
        return "{}";
    }
    if (!variables.is_object()) {
        throw KeyDerivationError(std::string("Variables must be an object, got ") + variables.type_name());
    }

    ensure_serializable(variables, "$");

    // nlohmann::json stores object members in a std::map, so dump() is key-ordered
    return dump_strict(variables, "Variables");
}

nlohmann::json key_document(const CacheKeyComponents& components, SessionMode mode) {
    nlohmann::json variables = nlohmann::json::object();
    if (!components.variables.is_null()) {
        canonicalize_variables(components.variables);
        variables = components.variables;
    }

    nlohmann::json document = {
        {"source", components.document},
        {"operationName", components.operation_name ? nlohmann::json(*components.operation_name) : nlohmann::json()},
        {"variables", std::move(variables)},
        {"extra", components.extra ? nlohmann::json(*components.extra) : nlohmann::json()},
        {"sessionMode", static_cast<int>(mode)}
    };

    if (mode == SessionMode::Private) {
        document["sessionId"] = components.session_id.value_or("");
    }

    return document;
}

std::string sha256_hex(std::string_view data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;

    if (EVP_Digest(data.data(), data.size(), digest.data(), &length, EVP_sha256(), nullptr) != 1) {
        throw KeyDerivationError("SHA-256 digest failed");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(digest[i]);
    }
    return oss.str();
}

CacheKeyBuilder::CacheKeyBuilder(std::string prefix)
    : prefix_(std::move(prefix)) {}

std::string CacheKeyBuilder::build_key(const CacheKeyComponents& components, SessionMode mode) const {
    auto document = key_document(components, mode);
    return prefixed(sha256_hex(dump_strict(document, "Cache key document")));
}

std::string CacheKeyBuilder::prefixed(std::string_view digest) const {
    std::string key;
    key.reserve(prefix_.size() + digest.size());
    key.append(prefix_);
    key.append(digest);
    return key;
}

std::size_t StoreKeyHash::operator()(const std::string& key) const noexcept {
    return static_cast<std::size_t>(XXH3_64bits(key.data(), key.size()));
}

} // namespace qcache::cache
