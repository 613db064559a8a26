#include "adb_path.hpp"
#include "snapadb_log.hpp"

#include <sys/stat.h>
#include <unistd.h>
#include <cstdlib>
#include <sstream>

namespace snapadb {

namespace {

std::string envOrEmpty(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

} // anonymous namespace

bool isExecutableFile(const std::string& path) {
    if (path.empty()) return false;
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

std::vector<std::string> adbPathCandidates(const config::AdbConfig& config) {
    std::vector<std::string> out;
    if (!config.adb_path.empty()) out.push_back(config.adb_path);

    for (const char* var : {"ANDROID_HOME", "ANDROID_SDK_ROOT"}) {
        std::string sdk = envOrEmpty(var);
        if (!sdk.empty()) out.push_back(sdk + "/platform-tools/adb");
    }

    std::string home = envOrEmpty("HOME");
    if (!home.empty()) {
        out.push_back(home + "/Library/Android/sdk/platform-tools/adb");
        out.push_back(home + "/Android/Sdk/platform-tools/adb");
    }

    std::stringstream path_var(envOrEmpty("PATH"));
    std::string dir;
    while (std::getline(path_var, dir, ':')) {
        if (dir.empty()) continue;
        out.push_back(dir + "/adb");
    }
    return out;
}

AdbResult<std::string> resolveAdbPath(const config::AdbConfig& config) {
    if (!config.adb_path.empty() && !isExecutableFile(config.adb_path)) {
        SLOG_WARN("adb-server", "configured adb path %s is not executable, searching", config.adb_path.c_str());
    }
    for (const auto& candidate : adbPathCandidates(config)) {
        if (isExecutableFile(candidate)) {
            SLOG_DEBUG("adb-server", "using adb at %s", candidate.c_str());
            return candidate;
        }
    }
    return AdbError::adbNotFound();
}

} // namespace snapadb
