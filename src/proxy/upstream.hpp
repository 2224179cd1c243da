/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Upstream - Executes cache misses against the origin GraphQL server
 *
 * The origin reports per-field cache hints in the response extension
 * extensions.cacheControl.hints ({path, maxAge, scope}). They are turned
 * into the hint tree the response cache aggregates, and stripped from the
 * payload that is returned and stored.
 */

#ifndef QCACHE_PROXY_UPSTREAM_HPP
#define QCACHE_PROXY_UPSTREAM_HPP

#include "cache/response_cache.hpp"

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace qcache::proxy {

namespace beast = boost::beast;
namespace http = beast::http;

struct UpstreamConfig {
    std::string host{"127.0.0.1"};
    std::uint16_t port{4000};
    std::string target{"/graphql"};
    std::chrono::seconds timeout{30};
};

/**
 * The origin could not produce a GraphQL response
 *
 * Carries the status and body to relay to the client.
 */
class UpstreamError : public std::runtime_error {
public:
    UpstreamError(http::status status, const std::string& message, std::string body = {})
        : std::runtime_error(message)
        , status_(status)
        , body_(std::move(body)) {}

    http::status status() const noexcept { return status_; }
    const std::string& body() const noexcept { return body_; }

private:
    http::status status_;
    std::string body_;
};

/**
 * Hint tree of an origin response
 *
 * Every hint of the cacheControl extension is kept. Root fields and
 * object-valued fields that carry no hint are added with an empty hint,
 * so they hold the response at the default max age. Scalar fields without
 * a hint inherit from their parent and are not listed. List indices
 * become decimal path segments.
 */
cache::HintTree extract_hints(const nlohmann::json& response);

/**
 * Turn an origin response body into an execution result
 *
 * @throws UpstreamError (502) if the body is not a JSON object
 */
cache::ExecutionResult interpret_response(std::string_view body);

/**
 * Forwards GraphQL requests to the origin over HTTP/1.1
 *
 * One connection per request, with connect/read/write bounded by the
 * configured timeout. Safe to call from several threads at once.
 */
class UpstreamExecutor : public cache::OperationExecutor {
public:
    explicit UpstreamExecutor(UpstreamConfig config);

    /**
     * @throws UpstreamError on transport failure or a non-2xx origin status
     */
    cache::ExecutionResult execute(const cache::RequestContext& ctx) override;

    const UpstreamConfig& config() const { return config_; }

    /**
     * JSON body sent to the origin
     */
    static std::string build_body(const cache::GraphQLRequest& request);

private:
    http::request<http::string_body> build_request(const cache::RequestContext& ctx) const;

    UpstreamConfig config_;
};

} // namespace qcache::proxy

#endif // QCACHE_PROXY_UPSTREAM_HPP
