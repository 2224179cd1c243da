/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Logger Implementation
 */

#include "util/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <array>
#include <cctype>
#include <random>
#include <utility>
#include <vector>

namespace qcache::util {

std::unique_ptr<Logger> Logger::instance_;
std::once_flag Logger::init_flag_;

namespace {

thread_local std::string tl_request_id;

constexpr std::array<std::pair<std::string_view, LogLevel>, 11> kLevelNames{{
    {"trace", LogLevel::Trace},
    {"debug", LogLevel::Debug},
    {"info", LogLevel::Info},
    {"warn", LogLevel::Warn},
    {"warning", LogLevel::Warn},
    {"error", LogLevel::Error},
    {"err", LogLevel::Error},
    {"critical", LogLevel::Critical},
    {"fatal", LogLevel::Critical},
    {"off", LogLevel::Off},
    {"none", LogLevel::Off},
}};

std::string lowercase(std::string_view value) {
    std::string lower;
    lower.reserve(value.size());
    for (char c : value) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return lower;
}

std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> make_file_sink(const std::string& path, const LogConfig& config) {
    return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        path, config.max_file_size_mb * 1024 * 1024, config.max_files);
}

} // namespace

void Logger::init(const LogConfig& config) {
    bool created = false;
    std::call_once(init_flag_, [&config, &created]() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        instance_->configure(config);
        created = true;
    });
    if (!created) {
        instance_->configure(config);
    }
}

Logger& Logger::instance() {
    std::call_once(init_flag_, []() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        instance_->configure(LogConfig{});
    });
    return *instance_;
}

Logger::~Logger() {
    shutdown();
}

void Logger::configure(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        if (!config.enable_colors) {
            console->set_color_mode(spdlog::color_mode::never);
        }
        console->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(std::move(console));
    }
    if (!config.file_path.empty()) {
        auto file = make_file_sink(config.file_path, config);
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        sinks.push_back(std::move(file));
    }

    auto logger = std::make_shared<spdlog::logger>("qcache", sinks.begin(), sinks.end());
    // Filtering happens in should_log(); the spdlog level only gates the sinks
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::warn);

    std::shared_ptr<spdlog::logger> access_logger;
    if (config.enable_access_log) {
        if (config.access_file_path.empty()) {
            access_logger = std::make_shared<spdlog::logger>("access", sinks.begin(), sinks.end());
        } else {
            auto file = make_file_sink(config.access_file_path, config);
            file->set_pattern(config.access_format == AccessLogFormat::Json ? "%v" : "[%Y-%m-%d %H:%M:%S.%e] %v");
            access_logger = std::make_shared<spdlog::logger>("access", std::move(file));
        }
        access_logger->set_level(spdlog::level::info);
        access_logger->flush_on(spdlog::level::info);
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        logger_ = logger;
        access_logger_ = access_logger;
        access_format_ = config.access_format;
        component_levels_ = config.component_levels;
        level_.store(config.level, std::memory_order_relaxed);
    }

    spdlog::drop("qcache");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
}

void Logger::set_level(LogLevel level) {
    level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::get_level() const {
    return level_.load(std::memory_order_relaxed);
}

void Logger::set_component_level(std::string_view component, std::optional<LogLevel> level) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (level) {
        component_levels_.insert_or_assign(std::string(component), *level);
    } else if (auto it = component_levels_.find(component); it != component_levels_.end()) {
        component_levels_.erase(it);
    }
}

LogLevel Logger::level_for(std::string_view component) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (auto it = component_levels_.find(component); it != component_levels_.end()) {
        return it->second;
    }
    return level_.load(std::memory_order_relaxed);
}

bool Logger::should_log(LogLevel level, std::string_view component) const {
    auto threshold = level_for(component);
    return level != LogLevel::Off && threshold != LogLevel::Off && level >= threshold;
}

std::optional<LogLevel> Logger::parse_level(std::string_view name) {
    auto lower = lowercase(name);
    for (const auto& [level_name, level] : kLevelNames) {
        if (lower == level_name) {
            return level;
        }
    }
    return std::nullopt;
}

std::string_view Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "trace";
        case LogLevel::Debug:    return "debug";
        case LogLevel::Info:     return "info";
        case LogLevel::Warn:     return "warn";
        case LogLevel::Error:    return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off:      return "off";
        default:                 return "unknown";
    }
}

std::optional<AccessLogFormat> Logger::parse_access_format(std::string_view name) {
    auto lower = lowercase(name);
    if (lower == "text") return AccessLogFormat::Text;
    if (lower == "json") return AccessLogFormat::Json;
    return std::nullopt;
}

void Logger::write(LogLevel level, std::string_view component, const std::string& message) {
    std::shared_ptr<spdlog::logger> logger;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        logger = logger_;
    }
    if (logger) {
        logger->log(to_spdlog_level(level), "[{}] {}", component, message);
    }
}

void Logger::access(const AccessLogEntry& entry) {
    std::shared_ptr<spdlog::logger> logger;
    AccessLogFormat format;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        logger = access_logger_;
        format = access_format_;
    }
    if (!logger) {
        return;
    }

    logger->info(format == AccessLogFormat::Json ? format_access_json(entry) : format_access_text(entry));
}

std::string Logger::format_access_text(const AccessLogEntry& entry) {
    // 5f0c9a31d2e4b870 10.0.0.7 "POST /graphql" GetUser 200 312 4ms HIT "max-age=10, public"
    auto or_dash = [](const std::string& value) -> std::string_view {
        return value.empty() ? std::string_view("-") : std::string_view(value);
    };
    return fmt::format(R"({} {} "{} {}" {} {} {} {}ms {} "{}")",
                       or_dash(entry.request_id), or_dash(entry.client_ip),
                       entry.method, entry.path, or_dash(entry.operation_name),
                       entry.status_code, entry.response_size, entry.latency.count(),
                       entry.cache_hit ? "HIT" : "MISS", or_dash(entry.cache_control));
}

std::string Logger::format_access_json(const AccessLogEntry& entry) {
    nlohmann::json line = {
        {"request_id", entry.request_id},
        {"client_ip", entry.client_ip},
        {"method", entry.method},
        {"path", entry.path},
        {"operation", entry.operation_name.empty() ? nlohmann::json() : nlohmann::json(entry.operation_name)},
        {"status", entry.status_code},
        {"bytes", entry.response_size},
        {"latency_ms", entry.latency.count()},
        {"cache", entry.cache_hit ? "HIT" : "MISS"},
        {"cache_control", entry.cache_control.empty() ? nlohmann::json() : nlohmann::json(entry.cache_control)}
    };
    return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void Logger::shutdown() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (logger_) {
        logger_->flush();
    }
    if (access_logger_) {
        access_logger_->flush();
    }
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warn:     return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
        default:                 return spdlog::level::info;
    }
}

TraceContext::TraceContext(std::string request_id)
    : request_id_(request_id.empty() ? generate_id() : std::move(request_id))
    , previous_id_(std::exchange(tl_request_id, request_id_))
{
}

TraceContext::~TraceContext() {
    tl_request_id = std::move(previous_id_);
}

std::string TraceContext::current_id() {
    return tl_request_id;
}

std::string TraceContext::generate_id() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    return fmt::format("{:016x}", rng());
}

} // namespace qcache::util
