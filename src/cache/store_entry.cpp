/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Store Entry Implementation
 */

#include "cache/store_entry.hpp"

#include <stdexcept>

namespace qcache::cache {

void to_json(nlohmann::json& j, const AggregatedPolicy& p) {
    j = nlohmann::json{
        {"maxAge", p.max_age},
        {"scope", std::string(to_string(p.scope))},
        {"possibleRootFieldsCacheable", p.possible_root_fields_cacheable}
    };
}

void from_json(const nlohmann::json& j, AggregatedPolicy& p) {
    j.at("maxAge").get_to(p.max_age);

    auto scope = parse_scope(j.at("scope").get<std::string>());
    if (!scope) {
        throw std::invalid_argument("unknown cache scope");
    }
    p.scope = *scope;

    if (j.contains("possibleRootFieldsCacheable")) {
        j.at("possibleRootFieldsCacheable").get_to(p.possible_root_fields_cacheable);
    }
}

std::string serialize_entry(const StoreEntry& entry) {
    nlohmann::json j = {
        {"data", entry.payload},
        {"cachePolicy", entry.policy},
        {"cacheTime", entry.stored_at_ms}
    };
    return j.dump();
}

std::optional<StoreEntry> deserialize_entry(std::string_view value) {
    auto j = nlohmann::json::parse(value, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    try {
        StoreEntry entry;
        j.at("data").get_to(entry.payload);
        j.at("cachePolicy").get_to(entry.policy);
        j.at("cacheTime").get_to(entry.stored_at_ms);
        return entry;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

} // namespace qcache::cache
