/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Upstream Implementation
 */

#include "proxy/upstream.hpp"
#include "util/logger.hpp"
#include "util/metrics.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <limits>
#include <optional>
#include <set>
#include <vector>

namespace qcache::proxy {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using util::log_component::Upstream;

namespace {

std::string join_path(const std::vector<std::string>& path) {
    std::string joined;
    for (const auto& segment : path) {
        joined += segment;
        joined += '\x1f';
    }
    return joined;
}

std::optional<cache::FieldHint> parse_hint(const nlohmann::json& raw) {
    if (!raw.is_object()) {
        return std::nullopt;
    }
    auto path_it = raw.find("path");
    if (path_it == raw.end() || !path_it->is_array() || path_it->empty()) {
        return std::nullopt;
    }

    cache::FieldHint field;
    for (const auto& segment : *path_it) {
        if (segment.is_string()) {
            field.path.push_back(segment.get<std::string>());
        } else if (segment.is_number_integer()) {
            field.path.push_back(std::to_string(segment.get<std::int64_t>()));
        } else {
            return std::nullopt;
        }
    }

    if (auto it = raw.find("maxAge"); it != raw.end() && it->is_number()) {
        auto value = it->get<double>();
        value = std::min(value, static_cast<double>(std::numeric_limits<std::uint32_t>::max()));
        field.hint.max_age = value <= 0 ? 0u : static_cast<std::uint32_t>(value);
    }
    if (auto it = raw.find("scope"); it != raw.end() && it->is_string()) {
        field.hint.scope = cache::parse_scope(it->get<std::string>());
    }
    return field;
}

bool is_composite(const nlohmann::json& value) {
    if (value.is_object()) {
        return true;
    }
    if (value.is_array()) {
        for (const auto& item : value) {
            if (is_composite(item)) {
                return true;
            }
        }
    }
    return false;
}

class HintWalker {
public:
    HintWalker(const std::set<std::string>& hinted, cache::HintTree& out)
        : hinted_(hinted), out_(out) {}

    void walk_field(std::vector<std::string>& path, const nlohmann::json& value) {
        bool root = path.size() == 1;
        if (!hinted_.contains(join_path(path)) && (root || is_composite(value))) {
            out_.push_back(cache::FieldHint{.path = path, .hint = {}});
        }
        walk_value(path, value);
    }

    void walk_value(std::vector<std::string>& path, const nlohmann::json& value) {
        if (value.is_object()) {
            for (auto it = value.begin(); it != value.end(); ++it) {
                path.push_back(it.key());
                walk_field(path, it.value());
                path.pop_back();
            }
        } else if (value.is_array()) {
            for (std::size_t i = 0; i < value.size(); ++i) {
                path.push_back(std::to_string(i));
                walk_value(path, value[i]);
                path.pop_back();
            }
        }
    }

private:
    const std::set<std::string>& hinted_;
    cache::HintTree& out_;
};

// Not forwarded to the origin
const std::set<std::string>& skipped_request_headers() {
    static const std::set<std::string> headers = {
        "connection", "keep-alive", "proxy-authenticate", "proxy-authorization",
        "te", "trailer", "transfer-encoding", "upgrade",
        "host", "content-length", "content-type", "accept", "accept-encoding", "x-request-id"
    };
    return headers;
}

} // namespace

cache::HintTree extract_hints(const nlohmann::json& response) {
    cache::HintTree hints;
    std::set<std::string> hinted;

    if (auto ext = response.find("extensions"); ext != response.end() && ext->is_object()) {
        if (auto cc = ext->find("cacheControl"); cc != ext->end() && cc->is_object()) {
            if (auto list = cc->find("hints"); list != cc->end() && list->is_array()) {
                for (const auto& raw : *list) {
                    if (auto field = parse_hint(raw)) {
                        hinted.insert(join_path(field->path));
                        hints.push_back(std::move(*field));
                    } else {
                        QCACHE_LOG_DEBUG(Upstream, "Ignoring malformed cache hint: {}", raw.dump());
                    }
                }
            }
        }
    }

    if (auto data = response.find("data"); data != response.end() && data->is_object()) {
        std::vector<std::string> path;
        HintWalker(hinted, hints).walk_value(path, *data);
    }

    return hints;
}

cache::ExecutionResult interpret_response(std::string_view body) {
    auto response = nlohmann::json::parse(body, nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        throw UpstreamError(http::status::bad_gateway, "Origin returned a non-JSON response");
    }

    cache::ExecutionResult result;
    result.hints = extract_hints(response);

    auto errors = response.find("errors");
    result.has_errors = errors != response.end() && !errors->is_null()
        && !(errors->is_array() && errors->empty());

    if (auto ext = response.find("extensions"); ext != response.end() && ext->is_object()) {
        ext->erase("cacheControl");
        if (ext->empty()) {
            response.erase(ext);
        }
    }

    result.payload = response.dump();
    return result;
}

UpstreamExecutor::UpstreamExecutor(UpstreamConfig config)
    : config_(std::move(config))
{
    QCACHE_LOG_DEBUG(Upstream, "Upstream executor: {}:{}{} timeout={}s",
                     config_.host, config_.port, config_.target, config_.timeout.count());
}

std::string UpstreamExecutor::build_body(const cache::GraphQLRequest& request) {
    nlohmann::json body = {{"query", request.query}};
    if (request.operation_name) {
        body["operationName"] = *request.operation_name;
    }
    if (!request.variables.is_null()) {
        body["variables"] = request.variables;
    }
    return body.dump();
}

http::request<http::string_body> UpstreamExecutor::build_request(const cache::RequestContext& ctx) const {
    http::request<http::string_body> request{http::verb::post, config_.target, 11};

    request.set(http::field::host, config_.host + ":" + std::to_string(config_.port));
    request.set(http::field::content_type, "application/json");
    request.set(http::field::accept, "application/json");

    const auto& skipped = skipped_request_headers();
    for (const auto& [name, value] : ctx.request.headers) {
        if (skipped.contains(name)) {
            continue;
        }
        request.set(name, value);
    }

    if (!ctx.request_id.empty()) {
        request.set("X-Request-ID", ctx.request_id);
    }

    request.body() = build_body(ctx.request);
    request.prepare_payload();
    return request;
}

cache::ExecutionResult UpstreamExecutor::execute(const cache::RequestContext& ctx) {
    auto start_time = std::chrono::steady_clock::now();
    auto request = build_request(ctx);

    http::response<http::string_body> response;
    try {
        asio::io_context io_context;
        tcp::resolver resolver(io_context);
        beast::tcp_stream stream(io_context);

        auto endpoints = resolver.resolve(config_.host, std::to_string(config_.port));

        stream.expires_after(config_.timeout);
        stream.connect(endpoints);

        stream.expires_after(config_.timeout);
        http::write(stream, request);

        beast::flat_buffer buffer;
        http::read(stream, buffer, response);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != beast::errc::not_connected) {
            QCACHE_LOG_TRACE(Upstream, "Socket shutdown: {}", ec.message());
        }
    } catch (const beast::system_error& e) {
        auto status = e.code() == beast::error::timeout
            ? http::status::gateway_timeout
            : http::status::bad_gateway;
        QCACHE_LOG_WARN(Upstream, "[{}] {}:{} failed: {}", ctx.request_id, config_.host, config_.port, e.code().message());
        throw UpstreamError(status, fmt::format("Origin request failed: {}", e.code().message()));
    }

    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    util::Metrics::instance().upstream_request(latency);

    auto status = static_cast<unsigned>(response.result());
    QCACHE_LOG_DEBUG(Upstream, "[{}] origin answered {} in {}ms ({} bytes)",
                     ctx.request_id, status, latency.count(), response.body().size());

    if (status < 200 || status >= 300) {
        throw UpstreamError(response.result(), fmt::format("Origin returned status {}", status),
                            std::move(response.body()));
    }

    return interpret_response(response.body());
}

} // namespace qcache::proxy
