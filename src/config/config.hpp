/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Configuration System - Supports JSON file, environment variables, and CLI args
 *
 * Configuration hierarchy (highest precedence first):
 * 1. Command-line arguments
 * 2. Environment variables (QCACHE_*)
 * 3. Configuration file (JSON)
 * 4. Default values
 */

#ifndef QCACHE_CONFIG_CONFIG_HPP
#define QCACHE_CONFIG_CONFIG_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace qcache::config {

/**
 * HTTP listener configuration
 */
struct ServerSettings {
    std::uint16_t port{8080};
    std::size_t threads{0};  // 0 = hardware_concurrency
    std::string bind_address{"0.0.0.0"};
    std::string graphql_path{"/graphql"};
    std::size_t max_body_bytes{1024 * 1024};
    std::uint32_t drain_timeout_seconds{5};
};

/**
 * Origin GraphQL server whose responses are cached
 */
struct UpstreamSettings {
    std::string host{"127.0.0.1"};
    std::uint16_t port{4000};
    std::string target{"/graphql"};
    std::uint32_t timeout_seconds{30};
};

/**
 * Response cache configuration
 */
struct CacheSettings {
    bool enabled{true};
    std::size_t max_size_mb{64};
    std::uint32_t default_max_age{0};
    std::string key_prefix{"fqc:"};
    bool authenticated_public_bucket{true};
    std::size_t store_threads{0};  // 0 = store calls complete on the request thread
};

/**
 * Request headers wired into the cache hooks; empty disables a hook
 */
struct HeaderSettings {
    std::string session_id{"x-session-id"};
    std::string extra_cache_key_data;
    std::string no_read_from_cache{"x-cache-no-read"};
    std::string no_write_to_cache{"x-cache-no-write"};

    bool operator==(const HeaderSettings&) const = default;
};

/**
 * Logging configuration
 */
struct LogSettings {
    std::string level{"info"};
    std::map<std::string, std::string> components;  // Component name -> level override
    std::string file;
    std::size_t max_file_size_mb{100};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};
    bool access_log{true};
    std::string access_file;                        // Empty: access lines go to the main log
    std::string access_format{"text"};              // text or json
};

/**
 * Complete application configuration
 */
struct Config {
    ServerSettings server;
    UpstreamSettings upstream;
    CacheSettings cache;
    HeaderSettings headers;
    LogSettings logging;

    /**
     * Validate configuration and throw if invalid
     */
    void validate() const;
};

/**
 * Configuration reload callback type
 */
using ConfigReloadCallback = std::function<void(const Config&)>;

/**
 * Configuration manager - handles loading, parsing, and hot-reload
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // Non-copyable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * Parse command-line arguments and load configuration
     *
     * @return true if configuration loaded successfully, false if --help was requested
     * @throws std::runtime_error on configuration errors
     */
    bool load(int argc, char* argv[]);

    /**
     * Get the current configuration (thread-safe)
     */
    Config get_config() const;

    /**
     * Reload configuration from file (called on SIGHUP)
     *
     * Header mapping, logging level and the cache budget take effect
     * immediately; other settings require restart. On error the previous
     * configuration is kept.
     */
    void reload();

    /**
     * Register callback for configuration reload events
     */
    void on_reload(ConfigReloadCallback callback);

    std::filesystem::path get_config_path() const;

    static void print_help(const char* program_name);

private:
    void load_from_file(const std::filesystem::path& path);

    void apply_environment_overrides();

    void apply_cli_overrides(int argc, char* argv[]);

    /**
     * Re-apply stored CLI values after a reload
     */
    void reapply_cli_overrides();

    static std::optional<std::string> get_env(const std::string& name);

    mutable std::mutex config_mutex_;
    Config config_;
    std::filesystem::path config_path_;
    std::vector<ConfigReloadCallback> reload_callbacks_;

    // CLI overrides (stored to preserve precedence on reload)
    std::optional<std::uint16_t> cli_port_;
    std::optional<std::size_t> cli_threads_;
    std::optional<std::string> cli_bind_address_;
    std::optional<std::string> cli_upstream_host_;
    std::optional<std::uint16_t> cli_upstream_port_;
    std::optional<std::string> cli_log_level_;
};

// JSON serialization support
void to_json(nlohmann::json& j, const ServerSettings& s);
void from_json(const nlohmann::json& j, ServerSettings& s);
void to_json(nlohmann::json& j, const UpstreamSettings& u);
void from_json(const nlohmann::json& j, UpstreamSettings& u);
void to_json(nlohmann::json& j, const CacheSettings& c);
void from_json(const nlohmann::json& j, CacheSettings& c);
void to_json(nlohmann::json& j, const HeaderSettings& h);
void from_json(const nlohmann::json& j, HeaderSettings& h);
void to_json(nlohmann::json& j, const LogSettings& l);
void from_json(const nlohmann::json& j, LogSettings& l);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace qcache::config

#endif // QCACHE_CONFIG_CONFIG_HPP
