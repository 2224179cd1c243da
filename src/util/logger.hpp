/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Logger - Component-tagged logging with spdlog
 *
 * Provides:
 * - Leveled logging tagged with the emitting component ("cache", "store", ...)
 * - Per-component level overrides on top of the global level
 * - Access log of GraphQL requests (text or JSON lines), optionally to its own file
 * - Request tracing with X-Request-ID propagation
 */

#ifndef QCACHE_UTIL_LOGGER_HPP
#define QCACHE_UTIL_LOGGER_HPP

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace qcache::util {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

enum class AccessLogFormat {
    Text,
    Json
};

struct LogConfig {
    LogLevel level{LogLevel::Info};
    std::map<std::string, LogLevel, std::less<>> component_levels;  // Override level per component

    std::string file_path;             // Empty for console only
    std::size_t max_file_size_mb{100};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};

    bool enable_access_log{true};
    std::string access_file_path;      // Empty: access lines go to the main sinks
    AccessLogFormat access_format{AccessLogFormat::Text};
};

/**
 * One served GraphQL HTTP request
 */
struct AccessLogEntry {
    std::string request_id;
    std::string client_ip;
    std::string method;
    std::string path;
    std::string operation_name;
    int status_code{0};
    std::size_t response_size{0};
    std::chrono::milliseconds latency{0};
    bool cache_hit{false};
    std::string cache_control;
};

/**
 * Process-wide logger
 *
 * instance() creates a console logger on first use; init() replaces its
 * sinks with the configured ones and may be called again later.
 */
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    ~Logger();

    void set_level(LogLevel level);
    LogLevel get_level() const;

    /**
     * Override the level of one component; nullopt restores the global level
     */
    void set_component_level(std::string_view component, std::optional<LogLevel> level);

    /**
     * Effective level of a component
     */
    LogLevel level_for(std::string_view component) const;

    bool should_log(LogLevel level, std::string_view component) const;

    /**
     * Case-insensitive: trace, debug, info, warn, error, critical, off
     */
    static std::optional<LogLevel> parse_level(std::string_view name);
    static std::string_view level_to_string(LogLevel level);

    static std::optional<AccessLogFormat> parse_access_format(std::string_view name);

    template<typename... Args>
    void log(LogLevel level, std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (!should_log(level, component)) {
            return;
        }
        write(level, component, fmt::format(fmt, std::forward<Args>(args)...));
    }

    void access(const AccessLogEntry& entry);

    /**
     * Flush and release all sinks
     */
    void shutdown();

private:
    Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void configure(const LogConfig& config);
    void write(LogLevel level, std::string_view component, const std::string& message);

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);
    static std::string format_access_text(const AccessLogEntry& entry);
    static std::string format_access_json(const AccessLogEntry& entry);

    mutable std::shared_mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::logger> access_logger_;
    AccessLogFormat access_format_{AccessLogFormat::Text};
    std::map<std::string, LogLevel, std::less<>> component_levels_;
    std::atomic<LogLevel> level_{LogLevel::Info};

    static std::unique_ptr<Logger> instance_;
    static std::once_flag init_flag_;
};

/**
 * Binds a request id to the current thread for the lifetime of the scope
 *
 * Scopes nest: the enclosing id is restored on destruction.
 */
class TraceContext {
public:
    /**
     * @param request_id Incoming X-Request-ID; a fresh id is generated if empty
     */
    explicit TraceContext(std::string request_id = "");
    ~TraceContext();

    TraceContext(const TraceContext&) = delete;
    TraceContext& operator=(const TraceContext&) = delete;

    const std::string& id() const { return request_id_; }

    /**
     * Request id bound to this thread (empty outside any scope)
     */
    static std::string current_id();

    /**
     * 16 lowercase hex characters
     */
    static std::string generate_id();

private:
    std::string request_id_;
    std::string previous_id_;
};

#define QCACHE_LOG_TRACE(component, ...) \
    ::qcache::util::Logger::instance().log(::qcache::util::LogLevel::Trace, component, __VA_ARGS__)
#define QCACHE_LOG_DEBUG(component, ...) \
    ::qcache::util::Logger::instance().log(::qcache::util::LogLevel::Debug, component, __VA_ARGS__)
#define QCACHE_LOG_INFO(component, ...) \
    ::qcache::util::Logger::instance().log(::qcache::util::LogLevel::Info, component, __VA_ARGS__)
#define QCACHE_LOG_WARN(component, ...) \
    ::qcache::util::Logger::instance().log(::qcache::util::LogLevel::Warn, component, __VA_ARGS__)
#define QCACHE_LOG_ERROR(component, ...) \
    ::qcache::util::Logger::instance().log(::qcache::util::LogLevel::Error, component, __VA_ARGS__)
#define QCACHE_LOG_CRITICAL(component, ...) \
    ::qcache::util::Logger::instance().log(::qcache::util::LogLevel::Critical, component, __VA_ARGS__)

namespace log_component {
    constexpr std::string_view Server = "server";
    constexpr std::string_view Config = "config";
    constexpr std::string_view Cache = "cache";
    constexpr std::string_view Key = "key";
    constexpr std::string_view Policy = "policy";
    constexpr std::string_view Store = "store";
    constexpr std::string_view Upstream = "upstream";
}

} // namespace qcache::util

#endif // QCACHE_UTIL_LOGGER_HPP
