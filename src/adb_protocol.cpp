#include "adb_protocol.hpp"
#include <cctype>
#include <cstdio>

namespace snapadb {
namespace protocol {

std::string formatHexLength(size_t length) {
    char buf[8];
    snprintf(buf, sizeof(buf), "%04X", static_cast<unsigned>(length & 0xFFFF));
    return std::string(buf, 4);
}

std::optional<size_t> parseHexLength(std::string_view digits) {
    if (digits.size() != 4) return std::nullopt;
    size_t value = 0;
    for (char c : digits) {
        int v;
        if (c >= '0' && c <= '9') v = c - '0';
        else if (c >= 'a' && c <= 'f') v = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') v = c - 'A' + 10;
        else return std::nullopt;
        value = (value << 4) | static_cast<size_t>(v);
    }
    return value;
}

AdbResult<std::string> encodeRequest(const std::string& request) {
    if (request.size() > kMaxRequestBytes) {
        return AdbError::protocolFailure("request too long: " + std::to_string(request.size()) + " bytes");
    }
    std::string out = formatHexLength(request.size());
    out += request;
    return out;
}

AdbResult<std::string> encodeSyncRequest(const std::string& id, const std::string& path) {
    if (id.size() != 4) return AdbError::protocolFailure("invalid sync id: " + id);

    std::string out;
    out.reserve(8 + path.size() + 1);
    out += id;
    uint8_t len[4];
    writeLE32(static_cast<uint32_t>(path.size()), len);
    out.append(reinterpret_cast<const char*>(len), 4);
    out += path;
    if (path.empty() || path.back() != '\0') out.push_back('\0');
    return out;
}

uint32_t readLE32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

void writeLE32(uint32_t value, uint8_t* out) {
    out[0] = static_cast<uint8_t>(value & 0xFF);
    out[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    out[2] = static_cast<uint8_t>((value >> 16) & 0xFF);
    out[3] = static_cast<uint8_t>((value >> 24) & 0xFF);
}

std::string normalizeSnapshot(std::string_view payload) {
    std::string out(kSnapshotHeader);
    out += '\n';
    out.append(payload.data(), payload.size());
    out += '\n';
    return out;
}

namespace request {

std::string trackDevices() { return "host:track-devices-l"; }
std::string devicesList() { return "host:devices-l"; }
std::string transport(const std::string& serial) { return "host:transport:" + serial; }
std::string shell(const std::string& command) { return "shell:" + command; }
std::string exec(const std::string& command) { return "exec:" + command; }
std::string sync() { return "sync:"; }

std::string forward(const std::string& serial, uint16_t local_port, const std::string& remote) {
    return "host-serial:" + serial + ":forward:tcp:" + std::to_string(local_port) + ";" + remote;
}

std::string killForward(const std::string& serial, uint16_t local_port) {
    return "host-serial:" + serial + ":killforward:tcp:" + std::to_string(local_port);
}

} // namespace request

// =============================================================================
// TrackDevicesFramer
// =============================================================================

void TrackDevicesFramer::feed(const char* data, size_t len) {
    buffer_.append(data, len);
}

AdbResult<std::optional<std::string>> TrackDevicesFramer::next() {
    if (mode_ == Mode::Undecided) {
        if (buffer_.size() < 4) return std::optional<std::string>{};
        mode_ = parseHexLength(std::string_view(buffer_).substr(0, 4))
                    ? Mode::LengthPrefixed
                    : Mode::LineDelimited;
    }
    if (mode_ == Mode::LengthPrefixed) return nextLengthPrefixed();
    return nextLineDelimited();
}

AdbResult<std::optional<std::string>> TrackDevicesFramer::nextLengthPrefixed() {
    if (buffer_.size() < 4) return std::optional<std::string>{};
    auto length = parseHexLength(std::string_view(buffer_).substr(0, 4));
    if (!length) {
        return AdbError::protocolFailure("invalid length header: " + buffer_.substr(0, 4));
    }
    if (*length > kMaxPayloadBytes) {
        return AdbError::protocolFailure("track-devices payload too large: " +
                                         std::to_string(*length) + " bytes");
    }
    if (buffer_.size() < 4 + *length) return std::optional<std::string>{};

    std::string snapshot = buffer_.substr(4, *length);
    buffer_.erase(0, 4 + *length);
    return std::optional<std::string>(std::move(snapshot));
}

std::optional<std::string> TrackDevicesFramer::nextLineDelimited() {
    // Extra blank lines between snapshots are not snapshots of their own.
    size_t start = buffer_.find_first_not_of("\r\n");
    buffer_.erase(0, start == std::string::npos ? buffer_.size() : start);

    size_t lf = buffer_.find("\n\n");
    size_t crlf = buffer_.find("\r\n\r\n");
    size_t pos;
    size_t sep_len;
    if (crlf != std::string::npos && (lf == std::string::npos || crlf < lf)) {
        pos = crlf;
        sep_len = 4;
    } else if (lf != std::string::npos) {
        pos = lf;
        sep_len = 2;
    } else {
        if (buffer_.size() > kMaxPayloadBytes) {
            // No separator in sight; keep memory bounded.
            buffer_.erase(0, buffer_.size() - kMaxPayloadBytes);
        }
        return std::nullopt;
    }

    std::string snapshot = buffer_.substr(0, pos);
    while (!snapshot.empty() && snapshot.back() == '\r') snapshot.pop_back();
    buffer_.erase(0, pos + sep_len);
    return snapshot;
}

AdbResult<std::optional<std::string>> TrackDevicesFramer::finish() {
    if (buffer_.empty()) return std::optional<std::string>{};

    if (mode_ == Mode::LengthPrefixed) {
        size_t partial = buffer_.size();
        buffer_.clear();
        return AdbError::protocolFailure("unexpected EOF inside track-devices frame (" +
                                         std::to_string(partial) + " bytes buffered)");
    }

    std::string rest;
    rest.swap(buffer_);
    while (!rest.empty() && (rest.back() == '\n' || rest.back() == '\r')) rest.pop_back();
    if (rest.empty()) return std::optional<std::string>{};
    return std::optional<std::string>(std::move(rest));
}

} // namespace protocol
} // namespace snapadb
