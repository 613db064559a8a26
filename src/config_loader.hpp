#pragma once
// =============================================================================
// SnapADB Config Loader
// =============================================================================
// Loads client settings from a JSON file with nlohmann/json.
// Every key is optional; missing or wrong-typed keys keep their defaults.
// =============================================================================

#include <cstdint>
#include <cstdlib>
#include <string>
#include <fstream>
#include <nlohmann/json.hpp>
#include "snapadb_log.hpp"

namespace snapadb {
namespace config {

struct DaemonConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 5037;
};

struct RetryConfig {
    int max_attempts = 3;
    int backoff_initial_ms = 100;
    int backoff_max_ms = 1000;
};

struct ServerConfig {
    int start_grace_ms = 100;   // daemon needs a moment before accepting connections
};

struct TrackerConfig {
    int reconnect_delay_ms = 300;
};

struct LogConfig {
    std::string level = "info";
    std::string log_path;       // empty: stderr only
};

struct AdbConfig {
    DaemonConfig daemon;
    std::string adb_path;       // empty: resolve automatically
    RetryConfig retry;
    ServerConfig server;
    TrackerConfig tracker;
    LogConfig log;
};

// Safe JSON accessor with section/key and default value
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    try {
        if (j.contains(section) && j[section].is_object() && j[section].contains(key)) {
            return j[section][key].get<T>();
        }
    } catch (const nlohmann::json::exception& e) {
        SLOG_WARN("config", "%s.%s has the wrong type (%s), using default",
                  section.c_str(), key.c_str(), e.what());
    }
    return def;
}

// Environment overrides (SNAPADB_ADB_PATH).
inline void applyEnvironment(AdbConfig& config) {
    if (const char* p = std::getenv("SNAPADB_ADB_PATH")) {
        if (*p) config.adb_path = p;
    }
}

// @param configPath  Path to config file
// @param strict      If true, only try the exact path (no fallback search)
inline AdbConfig loadConfig(const std::string& configPath = "snapadb.json",
                            bool strict = false) {
    AdbConfig config;

    std::ifstream file(configPath);
    if (!file.is_open() && !strict) {
        if (const char* home = std::getenv("HOME")) {
            file.open(std::string(home) + "/.config/snapadb/snapadb.json");
        }
    }
    if (!file.is_open()) {
        SLOG_WARN("config", "%s not found, using defaults", configPath.c_str());
        return config;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        const AdbConfig def;

        config.daemon.host = jsonGet<std::string>(j, "daemon", "host", def.daemon.host);
        int port = jsonGet<int>(j, "daemon", "port", def.daemon.port);
        if (port > 0 && port <= 65535) {
            config.daemon.port = static_cast<uint16_t>(port);
        } else {
            SLOG_WARN("config", "daemon.port %d out of range, using %u", port, (unsigned)def.daemon.port);
        }

        config.adb_path = jsonGet<std::string>(j, "adb", "path", def.adb_path);

        config.retry.max_attempts = jsonGet<int>(j, "retry", "max_attempts", def.retry.max_attempts);
        if (config.retry.max_attempts < 1) config.retry.max_attempts = 1;
        config.retry.backoff_initial_ms = jsonGet<int>(j, "retry", "backoff_initial_ms", def.retry.backoff_initial_ms);
        config.retry.backoff_max_ms = jsonGet<int>(j, "retry", "backoff_max_ms", def.retry.backoff_max_ms);

        config.server.start_grace_ms = jsonGet<int>(j, "server", "start_grace_ms", def.server.start_grace_ms);
        config.tracker.reconnect_delay_ms = jsonGet<int>(j, "tracker", "reconnect_delay_ms", def.tracker.reconnect_delay_ms);

        config.log.level = jsonGet<std::string>(j, "log", "level", def.log.level);
        config.log.log_path = jsonGet<std::string>(j, "log", "path", def.log.log_path);
    } catch (const nlohmann::json::exception& e) {
        SLOG_ERROR("config", "JSON parse error: %s", e.what());
        return AdbConfig{};
    }

    SLOG_INFO("config", "Loaded %s (daemon %s:%u, attempts=%d)", configPath.c_str(),
              config.daemon.host.c_str(), (unsigned)config.daemon.port, config.retry.max_attempts);
    return config;
}

} // namespace config
} // namespace snapadb
