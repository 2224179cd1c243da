#include "config/config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <string>
#include <vector>

using namespace qcache::config;

namespace {

constexpr const char* kEnvironment[] = {
    "QCACHE_CONFIG", "QCACHE_PORT", "QCACHE_THREADS", "QCACHE_BIND", "QCACHE_GRAPHQL_PATH",
    "QCACHE_UPSTREAM", "QCACHE_UPSTREAM_TARGET", "QCACHE_UPSTREAM_TIMEOUT",
    "QCACHE_CACHE_ENABLED", "QCACHE_CACHE_SIZE_MB", "QCACHE_CACHE_DEFAULT_MAX_AGE",
    "QCACHE_CACHE_KEY_PREFIX", "QCACHE_CACHE_STORE_THREADS", "QCACHE_SESSION_HEADER",
    "QCACHE_LOG_LEVEL", "QCACHE_LOG_FILE", "QCACHE_ACCESS_LOG_FILE", "QCACHE_ACCESS_LOG_FORMAT",
};

/**
 * argv-compatible copy of a list of arguments
 */
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "qcache");
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

} // namespace

class ConfigTest : public testing::Test {
protected:
    void SetUp() override {
        for (const char* name : kEnvironment) {
            unsetenv(name);
        }
        file_ = std::filesystem::temp_directory_path() /
                ("qcache_config_test_" + std::to_string(::getpid()) + ".json");
    }

    void TearDown() override {
        for (const char* name : kEnvironment) {
            unsetenv(name);
        }
        std::filesystem::remove(file_);
    }

    void write_file(const std::string& content) {
        std::ofstream out(file_);
        out << content;
    }

    std::filesystem::path file_;
};

TEST_F(ConfigTest, Defaults) {
    Config config;

    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.server.graphql_path, "/graphql");
    EXPECT_EQ(config.server.max_body_bytes, 1024u * 1024u);
    EXPECT_EQ(config.server.drain_timeout_seconds, 5u);
    EXPECT_EQ(config.upstream.port, 4000);
    EXPECT_EQ(config.upstream.timeout_seconds, 30u);
    EXPECT_TRUE(config.cache.enabled);
    EXPECT_EQ(config.cache.default_max_age, 0u);
    EXPECT_EQ(config.cache.key_prefix, "fqc:");
    EXPECT_TRUE(config.cache.authenticated_public_bucket);
    EXPECT_EQ(config.headers.session_id, "x-session-id");
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, ValidateRejectsBadValues) {
    Config bad_path;
    bad_path.server.graphql_path = "graphql";
    EXPECT_THROW(bad_path.validate(), std::runtime_error);

    Config bad_target;
    bad_target.upstream.target = "";
    EXPECT_THROW(bad_target.validate(), std::runtime_error);

    Config bad_timeout;
    bad_timeout.upstream.timeout_seconds = 0;
    EXPECT_THROW(bad_timeout.validate(), std::runtime_error);

    Config bad_level;
    bad_level.logging.level = "verbose";
    EXPECT_THROW(bad_level.validate(), std::runtime_error);

    Config bad_component;
    bad_component.logging.components["cache"] = "loud";
    EXPECT_THROW(bad_component.validate(), std::runtime_error);

    Config bad_format;
    bad_format.logging.access_format = "xml";
    EXPECT_THROW(bad_format.validate(), std::runtime_error);

    Config bad_body;
    bad_body.server.max_body_bytes = 0;
    EXPECT_THROW(bad_body.validate(), std::runtime_error);

    Config bad_size;
    bad_size.cache.max_size_mb = 0;
    EXPECT_THROW(bad_size.validate(), std::runtime_error);
}

TEST_F(ConfigTest, LoadsFile) {
    write_file(R"({
        "server": {"port": 9090, "graphql_path": "/api", "max_body_bytes": 4096},
        "upstream": {"host": "origin.local", "port": 4001},
        "cache": {"default_max_age": 15, "key_prefix": "t:", "authenticated_public_bucket": false},
        "headers": {"session_id": "authorization", "extra_cache_key_data": "accept-language"},
        "logging": {"components": {"store": "trace"}, "access_format": "json"}
    })");

    Args args{"--config", file_.string()};
    ConfigManager manager;
    ASSERT_TRUE(manager.load(args.argc(), args.argv()));

    auto config = manager.get_config();
    EXPECT_EQ(config.server.port, 9090);
    EXPECT_EQ(config.server.graphql_path, "/api");
    EXPECT_EQ(config.server.max_body_bytes, 4096u);
    EXPECT_EQ(config.upstream.host, "origin.local");
    EXPECT_EQ(config.upstream.port, 4001);
    EXPECT_EQ(config.upstream.target, "/graphql");
    EXPECT_EQ(config.cache.default_max_age, 15u);
    EXPECT_EQ(config.cache.key_prefix, "t:");
    EXPECT_FALSE(config.cache.authenticated_public_bucket);
    EXPECT_EQ(config.headers.session_id, "authorization");
    EXPECT_EQ(config.headers.extra_cache_key_data, "accept-language");
    EXPECT_EQ(config.logging.components.at("store"), "trace");
    EXPECT_EQ(config.logging.access_format, "json");
    EXPECT_EQ(manager.get_config_path().string(), file_.string());
}

TEST_F(ConfigTest, PrecedenceCliOverEnvOverFile) {
    write_file(R"({"server": {"port": 9090, "threads": 2}, "logging": {"level": "warn"}})");
    setenv("QCACHE_PORT", "9191", 1);
    setenv("QCACHE_THREADS", "3", 1);
    setenv("QCACHE_UPSTREAM", "env-origin:5000", 1);
    setenv("QCACHE_CACHE_ENABLED", "false", 1);

    Args args{"--config=" + file_.string(), "-p", "9292", "--log-level=debug"};
    ConfigManager manager;
    ASSERT_TRUE(manager.load(args.argc(), args.argv()));

    auto config = manager.get_config();
    EXPECT_EQ(config.server.port, 9292);
    EXPECT_EQ(config.server.threads, 3u);
    EXPECT_EQ(config.upstream.host, "env-origin");
    EXPECT_EQ(config.upstream.port, 5000);
    EXPECT_FALSE(config.cache.enabled);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigTest, ConfigPathFromEnvironment) {
    write_file(R"({"cache": {"default_max_age": 42}})");
    setenv("QCACHE_CONFIG", file_.c_str(), 1);

    Args args{};
    ConfigManager manager;
    ASSERT_TRUE(manager.load(args.argc(), args.argv()));
    EXPECT_EQ(manager.get_config().cache.default_max_age, 42u);
}

TEST_F(ConfigTest, InvalidInputsFailLoad) {
    {
        Args args{"--port", "70000"};
        ConfigManager manager;
        EXPECT_THROW(manager.load(args.argc(), args.argv()), std::runtime_error);
    }
    {
        Args args{"--upstream", "no-port"};
        ConfigManager manager;
        EXPECT_THROW(manager.load(args.argc(), args.argv()), std::runtime_error);
    }
    {
        setenv("QCACHE_THREADS", "-1", 1);
        Args args{};
        ConfigManager manager;
        EXPECT_THROW(manager.load(args.argc(), args.argv()), std::runtime_error);
        unsetenv("QCACHE_THREADS");
    }
    {
        write_file("{ not json");
        Args args{"-c", file_.string()};
        ConfigManager manager;
        EXPECT_THROW(manager.load(args.argc(), args.argv()), std::runtime_error);
    }
    {
        Args args{"-c", "/nonexistent/qcache.json"};
        ConfigManager manager;
        EXPECT_THROW(manager.load(args.argc(), args.argv()), std::runtime_error);
    }
}

TEST_F(ConfigTest, HelpStopsLoading) {
    Args args{"--help"};
    ConfigManager manager;
    EXPECT_FALSE(manager.load(args.argc(), args.argv()));
}

TEST_F(ConfigTest, ReloadNotifiesListenersAndKeepsCliOverrides) {
    write_file(R"({"headers": {"session_id": "x-session"}, "logging": {"level": "info"}})");

    Args args{"-c", file_.string(), "-p", "9300"};
    ConfigManager manager;
    ASSERT_TRUE(manager.load(args.argc(), args.argv()));

    std::vector<Config> seen;
    manager.on_reload([&seen](const Config& config) { seen.push_back(config); });

    write_file(R"({"server": {"port": 1111}, "headers": {"session_id": "x-user"}, "logging": {"level": "debug"}})");
    manager.reload();

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].headers.session_id, "x-user");
    EXPECT_EQ(seen[0].logging.level, "debug");
    EXPECT_EQ(seen[0].server.port, 9300);
    EXPECT_EQ(manager.get_config().headers.session_id, "x-user");
}

TEST_F(ConfigTest, FailedReloadKeepsPreviousConfig) {
    write_file(R"({"headers": {"session_id": "x-session"}})");

    Args args{"-c", file_.string()};
    ConfigManager manager;
    ASSERT_TRUE(manager.load(args.argc(), args.argv()));

    int notified = 0;
    manager.on_reload([&notified](const Config&) { ++notified; });

    write_file(R"({"logging": {"level": "chatty"}})");
    manager.reload();

    EXPECT_EQ(notified, 0);
    EXPECT_EQ(manager.get_config().headers.session_id, "x-session");
    EXPECT_EQ(manager.get_config().logging.level, "info");
}

TEST_F(ConfigTest, JsonRoundTrip) {
    Config config;
    config.cache.default_max_age = 7;
    config.headers.no_read_from_cache = "x-skip";

    nlohmann::json j = config;
    auto restored = j.get<Config>();
    EXPECT_EQ(restored.cache.default_max_age, 7u);
    EXPECT_EQ(restored.headers, config.headers);
}
