// =============================================================================
// SnapADB - ADB Host Protocol Codec
// =============================================================================
// Byte-level pieces of the ADB server ("smart socket") protocol that do not
// touch a socket: request framing, hex / little-endian length fields, the
// request strings themselves, and the track-devices stream framer.
//
//   request  = [4 uppercase hex digits: byte length][UTF-8 request]
//   status   = "OKAY" | "FAIL" [4 hex length][UTF-8 message]
//   sync     = [4 ASCII tag][uint32 LE length][payload]
// =============================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include "result.hpp"

namespace snapadb {
namespace protocol {

// Largest length-prefixed payload accepted from the server. Anything bigger
// is treated as a framing error rather than allocated.
constexpr size_t kMaxPayloadBytes = 1 * 1024 * 1024;

// A request length must fit the 4 hex digit header.
constexpr size_t kMaxRequestBytes = 0xFFFF;

// First line of every normalized device-list snapshot.
constexpr const char* kSnapshotHeader = "List of devices attached";

constexpr const char* kStatusOkay = "OKAY";
constexpr const char* kStatusFail = "FAIL";

constexpr const char* kSyncRecv = "RECV";
constexpr const char* kSyncData = "DATA";
constexpr const char* kSyncDone = "DONE";
constexpr const char* kSyncFail = "FAIL";

// "%04X" of `length`. Caller guarantees length <= kMaxRequestBytes.
std::string formatHexLength(size_t length);

// Parses exactly four ASCII hex digits (either case).
std::optional<size_t> parseHexLength(std::string_view digits);

// Header + request bytes, ready to write.
AdbResult<std::string> encodeRequest(const std::string& request);

// Sync request: 4-byte id, LE32 path length, path bytes, NUL if missing.
AdbResult<std::string> encodeSyncRequest(const std::string& id, const std::string& path);

uint32_t readLE32(const uint8_t* p);
void writeLE32(uint32_t value, uint8_t* out);

// Wraps a raw device-list payload so downstream parsing does not depend on
// which framing produced it: header line, payload, trailing newline.
std::string normalizeSnapshot(std::string_view payload);

// Request strings, one per supported shape.
namespace request {
std::string trackDevices();
std::string devicesList();
std::string transport(const std::string& serial);
std::string shell(const std::string& command);
std::string exec(const std::string& command);
std::string sync();
std::string forward(const std::string& serial, uint16_t local_port, const std::string& remote);
std::string killForward(const std::string& serial, uint16_t local_port);
} // namespace request

// =============================================================================
// TrackDevicesFramer
// =============================================================================
// Splits a track-devices byte stream into snapshots. The framing is decided
// once, from the first four bytes:
//   - four hex digits  -> length-prefixed payloads ("0005abcde0004wxyz")
//   - anything else    -> text blocks separated by a blank line
//                         ("\n\n" or "\r\n\r\n")
// Snapshots come out raw; callers normalize them.
// =============================================================================
class TrackDevicesFramer {
public:
    enum class Mode { Undecided, LengthPrefixed, LineDelimited };

    void feed(const char* data, size_t len);
    void feed(std::string_view data) { feed(data.data(), data.size()); }

    // Next complete snapshot, nullopt if more bytes are needed.
    AdbResult<std::optional<std::string>> next();

    // Called at end of stream. Returns a trailing unterminated text block in
    // line mode; a partial length-prefixed frame is a ProtocolFailure.
    AdbResult<std::optional<std::string>> finish();

    Mode mode() const { return mode_; }
    size_t buffered() const { return buffer_.size(); }

private:
    AdbResult<std::optional<std::string>> nextLengthPrefixed();
    std::optional<std::string> nextLineDelimited();

    Mode mode_ = Mode::Undecided;
    std::string buffer_;
};

} // namespace protocol
} // namespace snapadb
