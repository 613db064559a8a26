#pragma once
// =============================================================================
// adb_security.hpp
//
// Validation of caller-supplied values that end up inside ADB requests or
// device shell command lines. The command layer rejects anything that fails
// these checks before a connection is opened.
// =============================================================================

#include <string>
#include <cstring>
#include <cctype>

namespace snapadb {
namespace security {

// Dangerous shell metacharacters that could enable command injection
constexpr const char* SHELL_METACHARACTERS = "|;&$`\\\"'<>(){}[]!#*?~\n\r";

/**
 * Validate a device serial before it is put into a host request.
 * Valid formats:
 *   - USB serial: alphanumeric, may include '.', '-', '_'
 *   - IP:port / emulator-5554
 *   - mDNS: adb-SERIAL-hash._adb-tls-connect._tcp
 */
inline bool isValidSerial(const std::string& serial) {
    if (serial.empty() || serial.length() > 128) {
        return false;
    }
    for (char c : serial) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != ':' && c != '.' && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

/**
 * Abstract unix socket names used with forward() (e.g. "snapo_server_1234").
 * No '@' prefix; the request adds "localabstract:".
 */
inline bool isValidSocketName(const std::string& name) {
    if (name.empty() || name.length() > 107) {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '.' && c != '-' && c != '_' && c != ':') {
            return false;
        }
    }
    return true;
}

/**
 * Key codes for "input keyevent": a KEYCODE_* name or a decimal number.
 */
inline bool isValidKeyCode(const std::string& key) {
    if (key.empty() || key.length() > 64) {
        return false;
    }
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

/**
 * Validate a remote file path that is interpolated into a shell command
 * (screenrecord output, rm -f). Only /data/local/tmp/ and /sdcard/.
 */
inline bool isAllowedRemotePath(const std::string& remote_path) {
    if (remote_path.empty()) {
        return false;
    }

    if (remote_path.find("/data/local/tmp/") != 0 &&
        remote_path.find("/sdcard/") != 0) {
        return false;
    }

    if (remote_path.find("..") != std::string::npos) {
        return false;
    }

    for (char c : remote_path) {
        if (std::strchr(SHELL_METACHARACTERS, c) != nullptr || c == ' ') {
            return false;
        }
    }

    return true;
}

/**
 * Display size argument for screenrecord --size: "<w>x<h>".
 */
inline bool isValidSizeSpec(const std::string& size) {
    size_t x = size.find('x');
    if (x == std::string::npos || x == 0 || x + 1 >= size.size()) {
        return false;
    }
    for (size_t i = 0; i < size.size(); ++i) {
        if (i == x) continue;
        if (!std::isdigit(static_cast<unsigned char>(size[i]))) return false;
    }
    return size.size() <= 11;
}

} // namespace security
} // namespace snapadb
