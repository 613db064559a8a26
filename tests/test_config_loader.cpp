// =============================================================================
// Unit tests for config_loader.hpp
// Tests: defaults, file loading, wrong types, malformed JSON, environment
// =============================================================================
#include <gtest/gtest.h>
#include <fstream>
#include <cstdio>
#include <cstdlib>
#include "config_loader.hpp"

using namespace snapadb::config;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static void writeTmpJson(const char* path, const char* content) {
    std::ofstream f(path);
    f << content;
}

TEST(ConfigLoaderTest, DefaultValues) {
    AdbConfig cfg;
    EXPECT_EQ(cfg.daemon.host,                 "127.0.0.1");
    EXPECT_EQ(cfg.daemon.port,                 5037);
    EXPECT_TRUE(cfg.adb_path.empty());
    EXPECT_EQ(cfg.retry.max_attempts,          3);
    EXPECT_EQ(cfg.retry.backoff_initial_ms,    100);
    EXPECT_EQ(cfg.retry.backoff_max_ms,        1000);
    EXPECT_EQ(cfg.server.start_grace_ms,       100);
    EXPECT_EQ(cfg.tracker.reconnect_delay_ms,  300);
    EXPECT_EQ(cfg.log.level,                   "info");
    EXPECT_TRUE(cfg.log.log_path.empty());
}

TEST(ConfigLoaderTest, LoadConfigMissingFileReturnsDefaults) {
    AdbConfig cfg = loadConfig("__nonexistent_snapadb_config.json", true);
    EXPECT_EQ(cfg.daemon.port, 5037);
    EXPECT_EQ(cfg.retry.max_attempts, 3);
}

TEST(ConfigLoaderTest, LoadConfigFromFile) {
    const char* tmp = "__test_snapadb_config.json";
    writeTmpJson(tmp, R"({
        "daemon":  { "host": "127.0.0.2", "port": 5038 },
        "adb":     { "path": "/opt/sdk/platform-tools/adb" },
        "retry":   { "max_attempts": 5, "backoff_initial_ms": 50 },
        "log":     { "level": "debug", "path": "snapadb.log" }
    })");

    AdbConfig cfg = loadConfig(tmp, true);
    std::remove(tmp);

    EXPECT_EQ(cfg.daemon.host,              "127.0.0.2");
    EXPECT_EQ(cfg.daemon.port,              5038);
    EXPECT_EQ(cfg.adb_path,                 "/opt/sdk/platform-tools/adb");
    EXPECT_EQ(cfg.retry.max_attempts,       5);
    EXPECT_EQ(cfg.retry.backoff_initial_ms, 50);
    EXPECT_EQ(cfg.log.level,                "debug");
    EXPECT_EQ(cfg.log.log_path,             "snapadb.log");
    // Unspecified fields retain defaults
    EXPECT_EQ(cfg.retry.backoff_max_ms,     1000);
    EXPECT_EQ(cfg.tracker.reconnect_delay_ms, 300);
}

TEST(ConfigLoaderTest, WrongTypeKeepsDefault) {
    const char* tmp = "__test_snapadb_config_types.json";
    writeTmpJson(tmp, R"({ "daemon": { "port": "not-a-number" }, "retry": { "max_attempts": 0 } })");

    AdbConfig cfg = loadConfig(tmp, true);
    std::remove(tmp);

    EXPECT_EQ(cfg.daemon.port, 5037);
    EXPECT_EQ(cfg.retry.max_attempts, 1);  // clamped
}

TEST(ConfigLoaderTest, OutOfRangePortKeepsDefault) {
    const char* tmp = "__test_snapadb_config_port.json";
    writeTmpJson(tmp, R"({ "daemon": { "port": 70000 } })");

    AdbConfig cfg = loadConfig(tmp, true);
    std::remove(tmp);

    EXPECT_EQ(cfg.daemon.port, 5037);
}

TEST(ConfigLoaderTest, MalformedJsonReturnsDefaults) {
    const char* tmp = "__test_snapadb_config_bad.json";
    writeTmpJson(tmp, R"({ "daemon": { "port": 5038, )");

    AdbConfig cfg = loadConfig(tmp, true);
    std::remove(tmp);

    EXPECT_EQ(cfg.daemon.port, 5037);
}

TEST(ConfigLoaderTest, EnvironmentOverridesAdbPath) {
    AdbConfig cfg;
    cfg.adb_path = "/from/config/adb";
    setenv("SNAPADB_ADB_PATH", "/from/env/adb", 1);
    applyEnvironment(cfg);
    unsetenv("SNAPADB_ADB_PATH");

    EXPECT_EQ(cfg.adb_path, "/from/env/adb");
}
