#include "adb_output_parsers.hpp"
#include "adb_protocol.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>
#include <set>
#include <sstream>

namespace snapadb {
namespace parse {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> splitWhitespace(std::string_view s) {
    std::vector<std::string> parts;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
        size_t start = i;
        while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) ++i;
        if (i > start) parts.emplace_back(s.substr(start, i - start));
    }
    return parts;
}

std::optional<int> toInt(const std::string& digits) {
    if (digits.empty() || digits.size() > 9) return std::nullopt;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    return std::atoi(digits.c_str());
}

} // anonymous namespace

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return std::string(s.substr(b, e - b));
}

bool isValidUtf8(std::string_view s) {
    size_t i = 0;
    const size_t n = s.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }
        size_t extra;
        unsigned char lo = 0x80, hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            extra = 1;
        } else if (c >= 0xE0 && c <= 0xEF) {
            extra = 2;
            if (c == 0xE0) lo = 0xA0;       // overlong
            if (c == 0xED) hi = 0x9F;       // surrogates
        } else if (c >= 0xF0 && c <= 0xF4) {
            extra = 3;
            if (c == 0xF0) lo = 0x90;       // overlong
            if (c == 0xF4) hi = 0x8F;       // > U+10FFFF
        } else {
            return false;
        }
        if (n - i <= extra) return false;
        unsigned char c1 = static_cast<unsigned char>(s[i + 1]);
        if (c1 < lo || c1 > hi) return false;
        for (size_t k = 2; k <= extra; ++k) {
            unsigned char ck = static_cast<unsigned char>(s[i + k]);
            if (ck < 0x80 || ck > 0xBF) return false;
        }
        i += extra + 1;
    }
    return true;
}

// =============================================================================
// getprop
// =============================================================================

std::optional<std::pair<std::string, std::string>> parsePropertyLine(std::string_view line) {
    size_t key_start = line.find('[');
    if (key_start == std::string_view::npos) return std::nullopt;
    size_t key_end = line.find(']', key_start + 1);
    if (key_end == std::string_view::npos) return std::nullopt;
    size_t value_start = line.find('[', key_end + 1);
    if (value_start == std::string_view::npos) return std::nullopt;
    size_t value_end = line.find(']', value_start + 1);
    if (value_end == std::string_view::npos) return std::nullopt;

    return std::make_pair(std::string(line.substr(key_start + 1, key_end - key_start - 1)),
                          std::string(line.substr(value_start + 1, value_end - value_start - 1)));
}

PropertyMap parseProperties(const std::string& output, const std::string& prefix) {
    PropertyMap props;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        auto kv = parsePropertyLine(line);
        if (!kv) continue;
        if (!prefix.empty() && kv->first.compare(0, prefix.size(), prefix) != 0) continue;
        props[kv->first] = kv->second;
    }
    return props;
}

// =============================================================================
// Display probes
// =============================================================================

std::optional<std::string> parseCurrentDisplaySize(const std::string& output) {
    static const std::regex cur_re(R"(cur=(\d+x\d+))");
    std::smatch m;
    if (std::regex_search(output, m, cur_re)) return m[1].str();
    return std::nullopt;
}

std::optional<std::string> parseWmSize(const std::string& output) {
    static const std::regex override_re(R"(Override size:\s*(\d+x\d+))");
    static const std::regex physical_re(R"(Physical size:\s*(\d+x\d+))");
    std::smatch m;
    if (std::regex_search(output, m, override_re)) return m[1].str();
    if (std::regex_search(output, m, physical_re)) return m[1].str();
    return std::nullopt;
}

std::optional<int> parseDensity(const std::string& output) {
    static const std::regex physical_re(R"(Physical density:\s*(\d+))");
    std::smatch m;
    if (std::regex_search(output, m, physical_re)) {
        auto v = toInt(m[1].str());
        if (v && *v > 0) return v;
    }
    auto v = toInt(trim(output));
    if (v && *v > 0) return v;
    return std::nullopt;
}

// =============================================================================
// Device list
// =============================================================================

std::optional<DeviceRow> parseDeviceRow(std::string_view line) {
    std::string trimmed = trim(line);
    if (trimmed.empty()) return std::nullopt;
    if (trimmed == protocol::kSnapshotHeader) return std::nullopt;
    if (trimmed[0] == '*') return std::nullopt;  // "* daemon started successfully"

    auto parts = splitWhitespace(trimmed);
    if (parts.empty()) return std::nullopt;

    DeviceRow row;
    row.serial = parts[0];
    if (parts.size() >= 2) {
        row.state = parts[1];
        std::string state = lower(parts[1]);
        for (const char* bad : {"offline", "unauthorized", "recovery", "authorizing"}) {
            if (state.find(bad) != std::string::npos) return std::nullopt;
        }
    }

    for (size_t i = 1; i < parts.size(); ++i) {
        size_t colon = parts[i].find(':');
        if (colon == std::string::npos) continue;
        row.fields[parts[i].substr(0, colon)] = parts[i].substr(colon + 1);
    }
    return row;
}

std::vector<DeviceRow> parseDeviceList(const std::string& snapshot) {
    std::vector<DeviceRow> rows;
    std::set<std::string> seen;
    std::istringstream stream(snapshot);
    std::string line;
    while (std::getline(stream, line)) {
        auto row = parseDeviceRow(line);
        if (!row) continue;
        if (!seen.insert(row->serial).second) continue;
        rows.push_back(std::move(*row));
    }
    return rows;
}

// =============================================================================
// /proc/net/unix
// =============================================================================

std::vector<std::string> parseAbstractSockets(const std::string& proc_net_unix, const std::string& prefix) {
    std::set<std::string> names;
    const std::string wanted = "@" + prefix;
    std::istringstream stream(proc_net_unix);
    std::string line;
    while (std::getline(stream, line)) {
        auto cols = splitWhitespace(line);
        if (cols.size() < 8) continue;  // header row and unnamed sockets
        const std::string& path = cols.back();
        if (path.compare(0, wanted.size(), wanted) != 0) continue;
        names.insert(path.substr(1));
    }
    return std::vector<std::string>(names.begin(), names.end());
}

// =============================================================================
// Recording
// =============================================================================

std::optional<int> parsePid(const std::string& line) {
    auto pid = toInt(trim(line));
    if (!pid || *pid <= 0) return std::nullopt;
    return pid;
}

std::optional<int> parseExitTrailer(const std::string& output) {
    const std::string marker(kExitTrailer);
    size_t pos = output.rfind(marker);
    if (pos == std::string::npos) return std::nullopt;
    size_t start = pos + marker.size();
    size_t end = start;
    while (end < output.size() && std::isdigit(static_cast<unsigned char>(output[end]))) ++end;
    return toInt(output.substr(start, end - start));
}

AdbResult<void> classifyRecordingExit(std::optional<int> status, const std::string& output) {
    if (!status) return {};
    if (*status == 0 || *status == 130) return {};

    std::string detail = output;
    size_t marker = detail.rfind(kExitTrailer);
    if (marker != std::string::npos) detail.erase(marker);
    return AdbError::nonZeroExit(*status, trim(detail));
}

bool parseShowTouches(const std::string& output) {
    return trim(output) == "1";
}

} // namespace parse
} // namespace snapadb
