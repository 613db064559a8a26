#pragma once
// =============================================================================
// SnapADB - adb Binary Lookup
// =============================================================================
// The adb CLI is only needed to (re)start the local server. Search order:
//   1. configured path (adb.path / SNAPADB_ADB_PATH)
//   2. $ANDROID_HOME, $ANDROID_SDK_ROOT
//   3. ~/Library/Android/sdk, ~/Android/Sdk
//   4. $PATH
// =============================================================================

#include <string>
#include <vector>
#include "config_loader.hpp"
#include "result.hpp"

namespace snapadb {

// Candidate locations in search order (not filtered for existence).
std::vector<std::string> adbPathCandidates(const config::AdbConfig& config);

AdbResult<std::string> resolveAdbPath(const config::AdbConfig& config);

bool isExecutableFile(const std::string& path);

} // namespace snapadb
