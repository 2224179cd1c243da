/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Request Context Implementation
 */

#include "cache/request_context.hpp"

#include <algorithm>
#include <cctype>

namespace qcache::cache {

std::string_view to_string(OperationType type) {
    switch (type) {
        case OperationType::Query:        return "query";
        case OperationType::Mutation:     return "mutation";
        case OperationType::Subscription: return "subscription";
        default:                          return "unknown";
    }
}

std::string_view to_string(RequestState state) {
    switch (state) {
        case RequestState::Start:               return "START";
        case RequestState::CheckingReadPolicy:  return "CHECKING_READ_POLICY";
        case RequestState::KeyComputed:         return "KEY_COMPUTED";
        case RequestState::Lookup:              return "LOOKUP";
        case RequestState::Hit:                 return "HIT";
        case RequestState::MissExecuting:       return "MISS_EXECUTING";
        case RequestState::Aggregating:         return "AGGREGATING";
        case RequestState::CheckingWritePolicy: return "CHECKING_WRITE_POLICY";
        case RequestState::Writing:             return "WRITING";
        case RequestState::Skipped:             return "SKIPPED";
        case RequestState::Responding:          return "RESPONDING";
        case RequestState::End:                 return "END";
        default:                                return "UNKNOWN";
    }
}

std::optional<std::string> GraphQLRequest::header(std::string_view name) const {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = headers.find(lower);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace qcache::cache
