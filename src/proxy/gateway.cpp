/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Gateway Implementation
 */

#include "proxy/gateway.hpp"
#include "proxy/operation.hpp"
#include "proxy/upstream.hpp"
#include "util/logger.hpp"
#include "util/metrics.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <mutex>

namespace qcache::proxy {

using util::log_component::Server;
using util::log_component::Upstream;

namespace {

constexpr const char* kJson = "application/json";

std::string graphql_error_body(const std::string& message) {
    return nlohmann::json{{"errors", nlohmann::json::array({{{"message", message}}})}}.dump();
}

server::HttpResponse graphql_error(http::status status, const std::string& message) {
    return server::HttpResponse{
        .status = status,
        .content_type = kJson,
        .body = graphql_error_body(message)
    };
}

std::optional<std::string> header_value(const cache::RequestContext& ctx, const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }
    auto value = ctx.request.header(name);
    if (value && value->empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

HeaderMapping::HeaderMapping(config::HeaderSettings settings)
    : settings_(std::move(settings)) {}

config::HeaderSettings HeaderMapping::get() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return settings_;
}

void HeaderMapping::set(config::HeaderSettings settings) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    settings_ = std::move(settings);
}

cache::ResponseCacheOptions make_cache_options(const config::Config& config,
                                               std::shared_ptr<HeaderMapping> headers) {
    cache::ResponseCacheOptions options;
    options.default_max_age = config.cache.default_max_age;
    options.key_prefix = config.cache.key_prefix;
    options.authenticated_public_bucket = config.cache.authenticated_public_bucket;

    if (!config.headers.session_id.empty()) {
        options.session_id = [headers](const cache::RequestContext& ctx) {
            return header_value(ctx, headers->get().session_id);
        };
    }

    options.extra_cache_key_data = [headers](const cache::RequestContext& ctx) {
        return header_value(ctx, headers->get().extra_cache_key_data);
    };

    options.should_read_from_cache = cache::make_predicate([headers](const cache::RequestContext& ctx) {
        return !header_value(ctx, headers->get().no_read_from_cache).has_value();
    });

    options.should_write_to_cache = cache::make_predicate([headers](const cache::RequestContext& ctx) {
        return !header_value(ctx, headers->get().no_write_to_cache).has_value();
    });

    return options;
}

std::variant<cache::GraphQLRequest, std::string> parse_graphql_body(const std::string& body) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded()) {
        return std::string("Request body is not valid JSON");
    }
    if (!json.is_object()) {
        return std::string("Request body must be a JSON object");
    }

    cache::GraphQLRequest request;

    auto query = json.find("query");
    if (query == json.end() || !query->is_string()) {
        return std::string("Request body must contain a \"query\" string");
    }
    request.query = query->get<std::string>();

    if (auto name = json.find("operationName"); name != json.end() && !name->is_null()) {
        if (!name->is_string()) {
            return std::string("\"operationName\" must be a string");
        }
        request.operation_name = name->get<std::string>();
    }

    // Non-object variables are passed on; the cache declines to key them
    if (auto variables = json.find("variables"); variables != json.end() && !variables->is_null()) {
        request.variables = *variables;
    }

    return request;
}

Gateway::Gateway(std::string graphql_path,
                 std::shared_ptr<cache::ResponseCache> cache,
                 std::shared_ptr<cache::OperationExecutor> executor,
                 std::shared_ptr<cache::LruCache> store)
    : graphql_path_(std::move(graphql_path))
    , cache_(std::move(cache))
    , executor_(std::move(executor))
    , store_(std::move(store))
{
}

server::HttpResponse Gateway::handle(const server::HttpRequest& request) {
    auto start_time = std::chrono::steady_clock::now();
    util::TraceContext trace(request.header("x-request-id").value_or(""));

    util::AccessLogEntry entry;
    entry.request_id = trace.id();
    entry.client_ip = request.client_ip;
    entry.method = std::string(http::to_string(request.method));
    entry.path = request.target;

    server::HttpResponse response;
    auto path = request.path();

    if (path == graphql_path_) {
        if (request.method != http::verb::post) {
            response = graphql_error(http::status::method_not_allowed, "Only POST is supported");
            response.headers.emplace_back("Allow", "POST");
        } else {
            util::Metrics::instance().request_started();
            response = handle_graphql(request, entry);
            util::Metrics::instance().request_completed(static_cast<unsigned>(response.status) < 400);
        }
    } else if (path == "/health" && request.method == http::verb::get) {
        response = server::HttpResponse{
            .status = http::status::ok,
            .content_type = kJson,
            .body = R"({"status": "healthy"})"
        };
    } else if (path == "/metrics" && request.method == http::verb::get) {
        response = metrics(request.target.find("format=json") != std::string::npos);
    } else if (path == "/cache/stats" && request.method == http::verb::get) {
        response = cache_stats();
    } else {
        response = server::HttpResponse{
            .status = http::status::not_found,
            .content_type = kJson,
            .body = R"({"error": "Not found"})"
        };
    }

    response.headers.emplace_back("X-Request-ID", entry.request_id);

    entry.status_code = static_cast<int>(response.status);
    entry.response_size = response.body.size();
    entry.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    util::Logger::instance().access(entry);

    return response;
}

server::HttpResponse Gateway::handle_graphql(const server::HttpRequest& request, util::AccessLogEntry& entry) {
    if (auto content_type = request.header("content-type");
        !content_type || content_type->find("application/json") == std::string::npos) {
        return graphql_error(http::status::unsupported_media_type, "Content-Type must be application/json");
    }

    auto parsed = parse_graphql_body(request.body);
    if (auto* error = std::get_if<std::string>(&parsed)) {
        return graphql_error(http::status::bad_request, *error);
    }

    cache::RequestContext ctx;
    ctx.request = std::move(std::get<cache::GraphQLRequest>(parsed));
    ctx.request.headers = request.headers;
    ctx.request_id = entry.request_id;
    entry.operation_name = ctx.request.operation_name.value_or("");

    auto operation = detect_operation_type(ctx.request.query, ctx.request.operation_name);

    try {
        if (!operation) {
            // The origin reports the document error; never cached
            QCACHE_LOG_DEBUG(Server, "[{}] operation type unknown, bypassing cache", ctx.request_id);
            auto result = executor_->execute(ctx);
            return server::HttpResponse{.status = http::status::ok, .content_type = kJson, .body = result.payload};
        }

        ctx.operation = *operation;
        auto served = cache_->handle(ctx, *executor_);

        server::HttpResponse response{
            .status = http::status::ok,
            .content_type = kJson,
            .body = std::move(served.payload),
            .headers = served.headers.to_header_list()
        };
        response.headers.emplace_back("X-Cache", served.cache_hit ? "HIT" : "MISS");

        entry.cache_hit = served.cache_hit;
        entry.cache_control = served.headers.cache_control.value_or("");
        return response;

    } catch (const UpstreamError& e) {
        QCACHE_LOG_WARN(Upstream, "[{}] {}", ctx.request_id, e.what());
        return server::HttpResponse{
            .status = e.status(),
            .content_type = kJson,
            .body = e.body().empty() ? graphql_error_body(e.what()) : e.body()
        };
    } catch (const std::exception& e) {
        QCACHE_LOG_ERROR(Server, "[{}] execution failed: {}", ctx.request_id, e.what());
        return graphql_error(http::status::bad_gateway, "Execution failed");
    }
}

server::HttpResponse Gateway::cache_stats() const {
    auto stats = store_->get_stats();
    nlohmann::json j = {
        {"enabled", store_->is_enabled()},
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"hit_rate", stats.hit_rate()},
        {"evictions", stats.evictions},
        {"expired", stats.expired},
        {"entries", stats.entries},
        {"size_bytes", stats.size_bytes},
        {"max_size_bytes", stats.max_size_bytes}
    };
    return server::HttpResponse{
        .status = http::status::ok,
        .content_type = kJson,
        .body = j.dump(2)
    };
}

server::HttpResponse Gateway::metrics(bool as_json) const {
    auto& metrics = util::Metrics::instance();
    metrics.set_store_bytes(store_->get_stats().size_bytes);
    auto snapshot = metrics.snapshot();

    if (as_json) {
        return server::HttpResponse{
            .status = http::status::ok,
            .content_type = kJson,
            .body = snapshot.to_json()
        };
    }
    return server::HttpResponse{
        .status = http::status::ok,
        .content_type = "text/plain; version=0.0.4",
        .body = snapshot.to_prometheus()
    };
}

} // namespace qcache::proxy
