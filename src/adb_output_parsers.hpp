// =============================================================================
// SnapADB - Device Output Parsers
// =============================================================================
// Pure functions over text produced on the device or by the server:
// getprop dumps, display probes, device-list rows, /proc/net/unix and the
// recording exit trailer. No I/O here so every parser is unit-testable.
// =============================================================================
#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "result.hpp"

namespace snapadb {
namespace parse {

using PropertyMap = std::map<std::string, std::string>;

// Marker printed by the outer shell after screenrecord exits.
constexpr const char* kExitTrailer = "__SNAPADB_EXIT__:";

// "[ro.product.model]: [Pixel 7]" -> {"ro.product.model", "Pixel 7"}
std::optional<std::pair<std::string, std::string>> parsePropertyLine(std::string_view line);

// Every property line of a `getprop` dump, optionally limited to keys
// starting with `prefix`.
PropertyMap parseProperties(const std::string& output, const std::string& prefix = {});

// "cur=1080x2400" in `dumpsys window displays`.
std::optional<std::string> parseCurrentDisplaySize(const std::string& output);

// `wm size`: Override size wins over Physical size.
std::optional<std::string> parseWmSize(const std::string& output);

// `wm density` ("Physical density: 420") or a bare number (getprop value).
std::optional<int> parseDensity(const std::string& output);

struct DeviceRow {
    std::string serial;
    std::string state;                          // "device", "emulator", ...
    std::map<std::string, std::string> fields;  // product:, model:, device:, transport_id:
};

// One `devices -l` row. nullopt for blanks, the header, daemon chatter and
// rows in an unusable state (offline / unauthorized / recovery / authorizing).
std::optional<DeviceRow> parseDeviceRow(std::string_view line);

// All usable rows of a normalized snapshot, in order, without duplicates.
std::vector<DeviceRow> parseDeviceList(const std::string& snapshot);

// Abstract unix socket names from /proc/net/unix starting with `prefix`,
// '@' stripped, sorted and unique.
std::vector<std::string> parseAbstractSockets(const std::string& proc_net_unix, const std::string& prefix);

// First line written by `echo $$`.
std::optional<int> parsePid(const std::string& line);

// Status from the last exit trailer in `output`, if any.
std::optional<int> parseExitTrailer(const std::string& output);

// Screenrecord stop: 0 and 130 (SIGINT) succeed; no trailer counts as a
// completed stop; any other status is NonZeroExit.
AdbResult<void> classifyRecordingExit(std::optional<int> status, const std::string& output);

// `settings get system show_touches`
bool parseShowTouches(const std::string& output);

std::string trim(std::string_view s);

// Strict UTF-8: no overlongs, surrogates or code points past U+10FFFF.
bool isValidUtf8(std::string_view s);

} // namespace parse
} // namespace snapadb
