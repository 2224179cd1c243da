/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 *
 * HTTP front for a GraphQL origin: whole responses are cached according to
 * the per-field cache hints the origin reports.
 */

#include "cache/async_store.hpp"
#include "cache/lru_cache.hpp"
#include "cache/response_cache.hpp"
#include "config/config.hpp"
#include "proxy/gateway.hpp"
#include "proxy/upstream.hpp"
#include "server/server.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <thread>

namespace {

qcache::util::LogConfig make_log_config(const qcache::config::LogSettings& settings) {
    using qcache::util::Logger;

    qcache::util::LogConfig log_config;
    log_config.level = Logger::parse_level(settings.level).value_or(qcache::util::LogLevel::Info);
    for (const auto& [component, level] : settings.components) {
        if (auto parsed = Logger::parse_level(level)) {
            log_config.component_levels.emplace(component, *parsed);
        }
    }
    log_config.file_path = settings.file;
    log_config.max_file_size_mb = settings.max_file_size_mb;
    log_config.max_files = settings.max_files;
    log_config.enable_console = settings.enable_console;
    log_config.enable_colors = settings.enable_colors;
    log_config.enable_access_log = settings.access_log;
    log_config.access_file_path = settings.access_file;
    log_config.access_format = Logger::parse_access_format(settings.access_format)
        .value_or(qcache::util::AccessLogFormat::Text);
    return log_config;
}

/**
 * Levels are the only logging settings applied without a restart
 */
void apply_log_levels(const qcache::config::LogSettings& previous, const qcache::config::LogSettings& current) {
    using qcache::util::Logger;

    auto& logger = Logger::instance();
    if (auto level = Logger::parse_level(current.level)) {
        logger.set_level(*level);
    }
    for (const auto& [component, level] : previous.components) {
        if (!current.components.contains(component)) {
            logger.set_component_level(component, std::nullopt);
        }
    }
    for (const auto& [component, level] : current.components) {
        logger.set_component_level(component, Logger::parse_level(level));
    }
}

} // namespace

int main(int argc, char* argv[]) {
    using qcache::util::log_component::Server;

    try {
        qcache::config::ConfigManager config_manager;
        if (!config_manager.load(argc, argv)) {
            // --help was requested
            return 0;
        }

        auto config = config_manager.get_config();

        qcache::util::Logger::init(make_log_config(config.logging));
        QCACHE_LOG_INFO(Server, "QCACHE v0.1.0 - full-response cache for GraphQL");

        qcache::server::ServerConfig server_config;
        server_config.port = config.server.port;
        server_config.thread_count = config.server.threads > 0
            ? config.server.threads
            : std::max(1u, std::thread::hardware_concurrency());
        server_config.bind_address = config.server.bind_address;
        server_config.limits.max_body_bytes = config.server.max_body_bytes;
        server_config.drain_timeout = std::chrono::seconds(config.server.drain_timeout_seconds);

        QCACHE_LOG_INFO(Server, "Configuration: port={}, threads={}, bind={}, graphql_path={}",
                        server_config.port, server_config.thread_count,
                        server_config.bind_address, config.server.graphql_path);

        // In-process store, optionally driven from its own thread pool
        qcache::cache::LruCacheConfig store_config;
        store_config.max_size_bytes = config.cache.max_size_mb * 1024 * 1024;
        store_config.enabled = config.cache.enabled;
        auto lru_store = std::make_shared<qcache::cache::LruCache>(store_config);

        std::shared_ptr<qcache::cache::KeyValueStore> store = lru_store;
        std::shared_ptr<qcache::cache::AsyncStore> async_store;
        if (config.cache.store_threads > 0) {
            async_store = std::make_shared<qcache::cache::AsyncStore>(lru_store, config.cache.store_threads);
            store = async_store;
        }

        if (config.cache.enabled) {
            QCACHE_LOG_INFO(Server, "Cache: enabled, max_size={}MB, default_max_age={}s, prefix='{}', store_threads={}",
                            config.cache.max_size_mb, config.cache.default_max_age,
                            config.cache.key_prefix, config.cache.store_threads);
        } else {
            QCACHE_LOG_INFO(Server, "Cache: disabled");
        }

        auto header_mapping = std::make_shared<qcache::proxy::HeaderMapping>(config.headers);
        auto response_cache = std::make_shared<qcache::cache::ResponseCache>(
            store, qcache::proxy::make_cache_options(config, header_mapping));

        qcache::proxy::UpstreamConfig upstream_config;
        upstream_config.host = config.upstream.host;
        upstream_config.port = config.upstream.port;
        upstream_config.target = config.upstream.target;
        upstream_config.timeout = std::chrono::seconds(config.upstream.timeout_seconds);
        auto executor = std::make_shared<qcache::proxy::UpstreamExecutor>(upstream_config);

        QCACHE_LOG_INFO(Server, "Upstream: {}:{}{}", upstream_config.host, upstream_config.port, upstream_config.target);

        auto gateway = std::make_shared<qcache::proxy::Gateway>(
            config.server.graphql_path, response_cache, executor, lru_store);

        // SIGHUP: header mapping, log levels and cache budget
        auto applied_logging = std::make_shared<qcache::config::LogSettings>(config.logging);
        config_manager.on_reload([header_mapping, lru_store, applied_logging](const qcache::config::Config& reloaded) {
            header_mapping->set(reloaded.headers);
            apply_log_levels(*applied_logging, reloaded.logging);
            *applied_logging = reloaded.logging;
            lru_store->update_max_size(reloaded.cache.max_size_mb * 1024 * 1024);
            QCACHE_LOG_INFO(Server, "Reload applied: log_level={}, session_header='{}', max_size={}MB",
                            reloaded.logging.level, reloaded.headers.session_id, reloaded.cache.max_size_mb);
        });

        qcache::server::Server server(server_config, [gateway](const qcache::server::HttpRequest& request) {
            return gateway->handle(request);
        });
        server.on_reload([&config_manager]() {
            config_manager.reload();
        });
        server.start();

        QCACHE_LOG_INFO(Server, "Server started successfully, press Ctrl+C to stop");

        // Blocks until SIGINT/SIGTERM
        server.wait();

        if (async_store) {
            async_store->shutdown();
        }

        QCACHE_LOG_INFO(Server, "Server stopped gracefully");
        qcache::util::Logger::instance().shutdown();
        return 0;

    } catch (const std::exception& e) {
        QCACHE_LOG_CRITICAL(Server, "Fatal error: {}", e.what());
        return 1;
    }
}
