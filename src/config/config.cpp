/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Configuration System Implementation
 */

#include "config/config.hpp"
#include "util/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <utility>

namespace qcache::config {

namespace lc = util::log_component;

namespace {

template<typename T>
T parse_number(const std::string& value, const std::string& what) {
    unsigned long long parsed = 0;
    std::size_t consumed = 0;
    try {
        parsed = std::stoull(value, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid " + what + " value: " + value);
    }
    if (consumed != value.size() || value.starts_with('-') ||
        parsed > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
        throw std::runtime_error("Invalid " + what + " value: " + value);
    }
    return static_cast<T>(parsed);
}

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

std::pair<std::string, std::uint16_t> parse_host_port(const std::string& value, const std::string& what) {
    auto colon_pos = value.rfind(':');
    if (colon_pos == std::string::npos || colon_pos == 0) {
        throw std::runtime_error("Invalid " + what + " format (expected host:port): " + value);
    }
    return {value.substr(0, colon_pos), parse_number<std::uint16_t>(value.substr(colon_pos + 1), what + " port")};
}

/**
 * Value of "--name VALUE" or "--name=VALUE"; advances i past a separate value
 */
std::optional<std::string> option_value(const std::string& arg, int& i, int argc, char* argv[],
                                        std::string_view long_name, std::string_view short_name = {}) {
    if ((arg == long_name || (!short_name.empty() && arg == short_name)) && i + 1 < argc) {
        return std::string(argv[++i]);
    }
    std::string prefix = std::string(long_name) + "=";
    if (arg.starts_with(prefix)) {
        return arg.substr(prefix.size());
    }
    return std::nullopt;
}

} // namespace

// JSON serialization implementations
void to_json(nlohmann::json& j, const ServerSettings& s) {
    j = nlohmann::json{
        {"port", s.port},
        {"threads", s.threads},
        {"bind_address", s.bind_address},
        {"graphql_path", s.graphql_path},
        {"max_body_bytes", s.max_body_bytes},
        {"drain_timeout_seconds", s.drain_timeout_seconds}
    };
}

void from_json(const nlohmann::json& j, ServerSettings& s) {
    if (j.contains("port")) j.at("port").get_to(s.port);
    if (j.contains("threads")) j.at("threads").get_to(s.threads);
    if (j.contains("bind_address")) j.at("bind_address").get_to(s.bind_address);
    if (j.contains("graphql_path")) j.at("graphql_path").get_to(s.graphql_path);
    if (j.contains("max_body_bytes")) j.at("max_body_bytes").get_to(s.max_body_bytes);
    if (j.contains("drain_timeout_seconds")) j.at("drain_timeout_seconds").get_to(s.drain_timeout_seconds);
}

void to_json(nlohmann::json& j, const UpstreamSettings& u) {
    j = nlohmann::json{
        {"host", u.host},
        {"port", u.port},
        {"target", u.target},
        {"timeout_seconds", u.timeout_seconds}
    };
}

void from_json(const nlohmann::json& j, UpstreamSettings& u) {
    if (j.contains("host")) j.at("host").get_to(u.host);
    if (j.contains("port")) j.at("port").get_to(u.port);
    if (j.contains("target")) j.at("target").get_to(u.target);
    if (j.contains("timeout_seconds")) j.at("timeout_seconds").get_to(u.timeout_seconds);
}

void to_json(nlohmann::json& j, const CacheSettings& c) {
    j = nlohmann::json{
        {"enabled", c.enabled},
        {"max_size_mb", c.max_size_mb},
        {"default_max_age", c.default_max_age},
        {"key_prefix", c.key_prefix},
        {"authenticated_public_bucket", c.authenticated_public_bucket},
        {"store_threads", c.store_threads}
    };
}

void from_json(const nlohmann::json& j, CacheSettings& c) {
    if (j.contains("enabled")) j.at("enabled").get_to(c.enabled);
    if (j.contains("max_size_mb")) j.at("max_size_mb").get_to(c.max_size_mb);
    if (j.contains("default_max_age")) j.at("default_max_age").get_to(c.default_max_age);
    if (j.contains("key_prefix")) j.at("key_prefix").get_to(c.key_prefix);
    if (j.contains("authenticated_public_bucket")) j.at("authenticated_public_bucket").get_to(c.authenticated_public_bucket);
    if (j.contains("store_threads")) j.at("store_threads").get_to(c.store_threads);
}

void to_json(nlohmann::json& j, const HeaderSettings& h) {
    j = nlohmann::json{
        {"session_id", h.session_id},
        {"extra_cache_key_data", h.extra_cache_key_data},
        {"no_read_from_cache", h.no_read_from_cache},
        {"no_write_to_cache", h.no_write_to_cache}
    };
}

void from_json(const nlohmann::json& j, HeaderSettings& h) {
    if (j.contains("session_id")) j.at("session_id").get_to(h.session_id);
    if (j.contains("extra_cache_key_data")) j.at("extra_cache_key_data").get_to(h.extra_cache_key_data);
    if (j.contains("no_read_from_cache")) j.at("no_read_from_cache").get_to(h.no_read_from_cache);
    if (j.contains("no_write_to_cache")) j.at("no_write_to_cache").get_to(h.no_write_to_cache);
}

void to_json(nlohmann::json& j, const LogSettings& l) {
    j = nlohmann::json{
        {"level", l.level},
        {"components", l.components},
        {"file", l.file},
        {"max_file_size_mb", l.max_file_size_mb},
        {"max_files", l.max_files},
        {"enable_console", l.enable_console},
        {"enable_colors", l.enable_colors},
        {"access_log", l.access_log},
        {"access_file", l.access_file},
        {"access_format", l.access_format}
    };
}

void from_json(const nlohmann::json& j, LogSettings& l) {
    if (j.contains("level")) j.at("level").get_to(l.level);
    if (j.contains("components")) j.at("components").get_to(l.components);
    if (j.contains("file")) j.at("file").get_to(l.file);
    if (j.contains("max_file_size_mb")) j.at("max_file_size_mb").get_to(l.max_file_size_mb);
    if (j.contains("max_files")) j.at("max_files").get_to(l.max_files);
    if (j.contains("enable_console")) j.at("enable_console").get_to(l.enable_console);
    if (j.contains("enable_colors")) j.at("enable_colors").get_to(l.enable_colors);
    if (j.contains("access_log")) j.at("access_log").get_to(l.access_log);
    if (j.contains("access_file")) j.at("access_file").get_to(l.access_file);
    if (j.contains("access_format")) j.at("access_format").get_to(l.access_format);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"server", c.server},
        {"upstream", c.upstream},
        {"cache", c.cache},
        {"headers", c.headers},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("server")) j.at("server").get_to(c.server);
    if (j.contains("upstream")) j.at("upstream").get_to(c.upstream);
    if (j.contains("cache")) j.at("cache").get_to(c.cache);
    if (j.contains("headers")) j.at("headers").get_to(c.headers);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

// Config validation
void Config::validate() const {
    // Validate server settings
    if (server.port == 0) {
        throw std::runtime_error("Configuration error: server.port must be non-zero");
    }
    if (server.bind_address.empty()) {
        throw std::runtime_error("Configuration error: server.bind_address cannot be empty");
    }
    if (!server.graphql_path.starts_with('/')) {
        throw std::runtime_error("Configuration error: server.graphql_path must start with '/'");
    }
    if (server.max_body_bytes == 0) {
        throw std::runtime_error("Configuration error: server.max_body_bytes must be non-zero");
    }

    // Validate upstream
    if (upstream.host.empty()) {
        throw std::runtime_error("Configuration error: upstream.host cannot be empty");
    }
    if (upstream.port == 0) {
        throw std::runtime_error("Configuration error: upstream.port must be non-zero");
    }
    if (!upstream.target.starts_with('/')) {
        throw std::runtime_error("Configuration error: upstream.target must start with '/'");
    }
    if (upstream.timeout_seconds == 0) {
        throw std::runtime_error("Configuration error: upstream.timeout_seconds must be non-zero");
    }

    // Validate cache settings
    if (cache.enabled && cache.max_size_mb == 0) {
        throw std::runtime_error("Configuration error: cache.max_size_mb must be non-zero when cache is enabled");
    }

    if (!util::Logger::parse_level(logging.level)) {
        throw std::runtime_error("Configuration error: unknown logging.level '" + logging.level + "'");
    }
    for (const auto& [component, level] : logging.components) {
        if (!util::Logger::parse_level(level)) {
            throw std::runtime_error("Configuration error: unknown level '" + level +
                                     "' for logging.components." + component);
        }
    }
    if (!util::Logger::parse_access_format(logging.access_format)) {
        throw std::runtime_error("Configuration error: logging.access_format must be 'text' or 'json'");
    }

    QCACHE_LOG_DEBUG(lc::Config, "Configuration validated successfully");
}

// ConfigManager implementation
ConfigManager::ConfigManager() = default;
ConfigManager::~ConfigManager() = default;

bool ConfigManager::load(int argc, char* argv[]) {
    std::lock_guard<std::mutex> lock(config_mutex_);

    // Start with defaults
    config_ = Config{};

    // First pass: look for --help or --config
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h") {
            print_help(argv[0]);
            return false;
        }

        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path_ = argv[++i];
        } else if (arg.starts_with("--config=")) {
            config_path_ = arg.substr(9);
        }
    }

    if (!config_path_.empty()) {
        load_from_file(config_path_);
    }

    apply_environment_overrides();

    // Highest precedence
    apply_cli_overrides(argc, argv);

    config_.validate();

    QCACHE_LOG_INFO(lc::Config, "Configuration loaded successfully");
    return true;
}

Config ConfigManager::get_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void ConfigManager::reload() {
    std::vector<ConfigReloadCallback> callbacks;
    Config reloaded;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);

        if (config_path_.empty()) {
            QCACHE_LOG_WARN(lc::Config, "No configuration file specified, reload skipped");
            return;
        }

        QCACHE_LOG_INFO(lc::Config, "Reloading configuration from {}", config_path_.string());

        auto previous = config_;
        try {
            load_from_file(config_path_);
            apply_environment_overrides();
            reapply_cli_overrides();
            config_.validate();
        } catch (const std::exception& e) {
            QCACHE_LOG_ERROR(lc::Config, "Configuration reload failed: {}", e.what());
            config_ = std::move(previous);
            return;
        }

        reloaded = config_;
        callbacks = reload_callbacks_;
    }

    QCACHE_LOG_INFO(lc::Config, "Configuration reloaded, notifying {} listeners", callbacks.size());
    for (const auto& callback : callbacks) {
        callback(reloaded);
    }
}

void ConfigManager::on_reload(ConfigReloadCallback callback) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    reload_callbacks_.push_back(std::move(callback));
}

std::filesystem::path ConfigManager::get_config_path() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_path_;
}

void ConfigManager::print_help(const char* program_name) {
    std::cout << "QCACHE - Full-Response Cache for GraphQL Servers\n"
              << "\n"
              << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help              Show this help message and exit\n"
              << "  -c, --config FILE       Path to JSON configuration file\n"
              << "  -p, --port PORT         Server HTTP port (default: 8080)\n"
              << "  -t, --threads NUM       Number of I/O threads (default: CPU cores)\n"
              << "  -b, --bind ADDRESS      Bind address (default: 0.0.0.0)\n"
              << "  -u, --upstream HOST:PORT\n"
              << "                          Origin GraphQL server (default: 127.0.0.1:4000)\n"
              << "  --log-level LEVEL       Log level (trace/debug/info/warn/error/critical/off)\n"
              << "\n"
              << "Environment Variables:\n"
              << "  QCACHE_CONFIG                 Path to configuration file\n"
              << "  QCACHE_PORT                   Server HTTP port\n"
              << "  QCACHE_THREADS                Number of I/O threads\n"
              << "  QCACHE_BIND                   Bind address\n"
              << "  QCACHE_GRAPHQL_PATH           Path GraphQL requests are accepted on\n"
              << "  QCACHE_UPSTREAM               Origin server (host:port)\n"
              << "  QCACHE_UPSTREAM_TARGET        Origin GraphQL path\n"
              << "  QCACHE_UPSTREAM_TIMEOUT       Origin timeout in seconds\n"
              << "  QCACHE_CACHE_ENABLED          Enable/disable cache (true/false)\n"
              << "  QCACHE_CACHE_SIZE_MB          Cache size in MB\n"
              << "  QCACHE_CACHE_DEFAULT_MAX_AGE  Max age for fields without a hint\n"
              << "  QCACHE_CACHE_KEY_PREFIX       Prefix of every store key\n"
              << "  QCACHE_CACHE_STORE_THREADS    Store worker threads (0 = inline)\n"
              << "  QCACHE_SESSION_HEADER         Header carrying the session id\n"
              << "  QCACHE_LOG_LEVEL              Log level\n"
              << "  QCACHE_LOG_FILE               Log file path (stdout if not set)\n"
              << "  QCACHE_ACCESS_LOG_FILE        Separate access log file\n"
              << "  QCACHE_ACCESS_LOG_FORMAT      Access log format (text/json)\n"
              << "\n"
              << "Configuration Precedence (highest to lowest):\n"
              << "  1. Command-line arguments\n"
              << "  2. Environment variables\n"
              << "  3. Configuration file\n"
              << "  4. Default values\n"
              << "\n"
              << "Configuration File Format (JSON):\n"
              << "  {\n"
              << "    \"server\": {\"port\": 8080, \"threads\": 4, \"graphql_path\": \"/graphql\"},\n"
              << "    \"upstream\": {\"host\": \"127.0.0.1\", \"port\": 4000, \"target\": \"/graphql\"},\n"
              << "    \"cache\": {\n"
              << "      \"enabled\": true,\n"
              << "      \"max_size_mb\": 64,\n"
              << "      \"default_max_age\": 0,\n"
              << "      \"key_prefix\": \"fqc:\",\n"
              << "      \"authenticated_public_bucket\": true,\n"
              << "      \"store_threads\": 0\n"
              << "    },\n"
              << "    \"headers\": {\n"
              << "      \"session_id\": \"x-session-id\",\n"
              << "      \"extra_cache_key_data\": \"\",\n"
              << "      \"no_read_from_cache\": \"x-cache-no-read\",\n"
              << "      \"no_write_to_cache\": \"x-cache-no-write\"\n"
              << "    },\n"
              << "    \"logging\": {\n"
              << "      \"level\": \"info\",\n"
              << "      \"components\": {\"cache\": \"debug\"},\n"
              << "      \"file\": \"\",\n"
              << "      \"access_file\": \"\",\n"
              << "      \"access_format\": \"text\"\n"
              << "    }\n"
              << "  }\n"
              << "\n"
              << "Send SIGHUP to reload header mapping, log levels and cache size without restart.\n";
}

void ConfigManager::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config_ = j.get<Config>();
        QCACHE_LOG_DEBUG(lc::Config, "Loaded configuration from {}", path.string());
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
    }
}

void ConfigManager::apply_environment_overrides() {
    if (config_path_.empty()) {
        if (auto env = get_env("QCACHE_CONFIG")) {
            config_path_ = *env;
            if (!config_path_.empty()) {
                load_from_file(config_path_);
            }
        }
    }

    // Server settings
    if (auto env = get_env("QCACHE_PORT")) {
        config_.server.port = parse_number<std::uint16_t>(*env, "QCACHE_PORT");
    }
    if (auto env = get_env("QCACHE_THREADS")) {
        config_.server.threads = parse_number<std::size_t>(*env, "QCACHE_THREADS");
    }
    if (auto env = get_env("QCACHE_BIND")) {
        config_.server.bind_address = *env;
    }
    if (auto env = get_env("QCACHE_GRAPHQL_PATH")) {
        config_.server.graphql_path = *env;
    }

    // Upstream
    if (auto env = get_env("QCACHE_UPSTREAM")) {
        auto [host, port] = parse_host_port(*env, "QCACHE_UPSTREAM");
        config_.upstream.host = host;
        config_.upstream.port = port;
    }
    if (auto env = get_env("QCACHE_UPSTREAM_TARGET")) {
        config_.upstream.target = *env;
    }
    if (auto env = get_env("QCACHE_UPSTREAM_TIMEOUT")) {
        config_.upstream.timeout_seconds = parse_number<std::uint32_t>(*env, "QCACHE_UPSTREAM_TIMEOUT");
    }

    // Cache settings
    if (auto env = get_env("QCACHE_CACHE_ENABLED")) {
        config_.cache.enabled = parse_bool(*env);
    }
    if (auto env = get_env("QCACHE_CACHE_SIZE_MB")) {
        config_.cache.max_size_mb = parse_number<std::size_t>(*env, "QCACHE_CACHE_SIZE_MB");
    }
    if (auto env = get_env("QCACHE_CACHE_DEFAULT_MAX_AGE")) {
        config_.cache.default_max_age = parse_number<std::uint32_t>(*env, "QCACHE_CACHE_DEFAULT_MAX_AGE");
    }
    if (auto env = get_env("QCACHE_CACHE_KEY_PREFIX")) {
        config_.cache.key_prefix = *env;
    }
    if (auto env = get_env("QCACHE_CACHE_STORE_THREADS")) {
        config_.cache.store_threads = parse_number<std::size_t>(*env, "QCACHE_CACHE_STORE_THREADS");
    }

    // Header mapping
    if (auto env = get_env("QCACHE_SESSION_HEADER")) {
        config_.headers.session_id = *env;
    }

    // Logging settings
    if (auto env = get_env("QCACHE_LOG_LEVEL")) {
        config_.logging.level = *env;
    }
    if (auto env = get_env("QCACHE_LOG_FILE")) {
        config_.logging.file = *env;
    }
    if (auto env = get_env("QCACHE_ACCESS_LOG_FILE")) {
        config_.logging.access_file = *env;
    }
    if (auto env = get_env("QCACHE_ACCESS_LOG_FORMAT")) {
        config_.logging.access_format = *env;
    }
}

void ConfigManager::apply_cli_overrides(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        // Skip already processed args
        if (arg == "--help" || arg == "-h") continue;
        if (arg == "--config" || arg == "-c") { ++i; continue; }
        if (arg.starts_with("--config=")) continue;

        if (auto value = option_value(arg, i, argc, argv, "--port", "-p")) {
            cli_port_ = parse_number<std::uint16_t>(*value, "--port");
        } else if (auto value = option_value(arg, i, argc, argv, "--threads", "-t")) {
            cli_threads_ = parse_number<std::size_t>(*value, "--threads");
        } else if (auto value = option_value(arg, i, argc, argv, "--bind", "-b")) {
            cli_bind_address_ = *value;
        } else if (auto value = option_value(arg, i, argc, argv, "--upstream", "-u")) {
            auto [host, port] = parse_host_port(*value, "--upstream");
            cli_upstream_host_ = host;
            cli_upstream_port_ = port;
        } else if (auto value = option_value(arg, i, argc, argv, "--log-level")) {
            cli_log_level_ = *value;
        } else {
            QCACHE_LOG_WARN(lc::Config, "Ignoring unknown argument: {}", arg);
        }
    }

    reapply_cli_overrides();
}

void ConfigManager::reapply_cli_overrides() {
    if (cli_port_) config_.server.port = *cli_port_;
    if (cli_threads_) config_.server.threads = *cli_threads_;
    if (cli_bind_address_) config_.server.bind_address = *cli_bind_address_;
    if (cli_upstream_host_) config_.upstream.host = *cli_upstream_host_;
    if (cli_upstream_port_) config_.upstream.port = *cli_upstream_port_;
    if (cli_log_level_) config_.logging.level = *cli_log_level_;
}

std::optional<std::string> ConfigManager::get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace qcache::config
