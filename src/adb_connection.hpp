// =============================================================================
// SnapADB - ADB Server Connection
// =============================================================================
// One TCP socket to the local ADB server. Speaks the request/response
// framing, the sync (file transfer) sub-protocol and the length-prefixed
// payloads used by host services.
//
// States: Connecting -> Open -> Closed. A closed connection is never
// reopened; open a fresh one. Exchanges on one connection are strictly
// sequential: at most one reader and one writer at a time. close() may be
// called from any thread and unblocks a reader stuck in recv().
// =============================================================================
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "cancellation.hpp"
#include "result.hpp"

namespace snapadb {

class Connection {
public:
    enum class State { Connecting, Open, Closed };

    using SyncChunkHandler = std::function<AdbResult<void>(const uint8_t* data, size_t len)>;

    static constexpr size_t kBufferSize = 64 * 1024;

    // Connects to host:port. Any OS-level failure is ServerUnavailable.
    static AdbResult<std::unique_ptr<Connection>> open(const std::string& host, uint16_t port,
                                                       CancellationToken token = CancellationToken::none());

    // Wraps an already-connected stream socket (takes ownership of fd).
    static std::unique_ptr<Connection> adopt(int fd, CancellationToken token = CancellationToken::none());

    ~Connection();
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Writes the framed request, then reads and validates the status.
    AdbResult<void> send(const std::string& request);

    // Reads one OKAY / FAIL status. Host forward requests answer twice.
    AdbResult<void> readStatus();

    // Everything until the peer closes its write side.
    AdbResult<std::vector<uint8_t>> readToEnd();

    // Reads and discards until EOF.
    AdbResult<void> drainToEnd();

    // One read of up to max_length bytes; nullopt on clean EOF.
    AdbResult<std::optional<std::vector<uint8_t>>> readChunk(size_t max_length);

    // Reads through the next '\n' (or EOF) and trims trailing CR/LF and
    // whitespace. nullopt if EOF arrives before any byte.
    AdbResult<std::optional<std::string>> readLine();

    // Sync sub-protocol header for one transfer (e.g. "RECV", path).
    AdbResult<void> sendSync(const std::string& id, const std::string& path);

    // DATA chunks go to on_chunk in order until DONE. FAIL and unknown tags
    // are ProtocolFailure.
    AdbResult<void> readSyncData(const SyncChunkHandler& on_chunk);

    // [4 hex length][payload]; nullopt on clean EOF before the header.
    AdbResult<std::optional<std::string>> readLengthPrefixedPayload();

    // Idempotent; shuts the socket down. The descriptor is released on
    // destruction so a concurrent reader never sees a reused fd.
    void close();

    bool isClosed() const { return closed_.load(std::memory_order_acquire); }
    State state() const { return isClosed() ? State::Closed : State::Open; }

    const CancellationToken& cancellationToken() const { return token_; }

private:
    Connection(int fd, CancellationToken token);

    // Bytes read into buf; 0 on EOF.
    AdbResult<size_t> readOnce(uint8_t* buf, size_t len);
    AdbResult<std::string> readExact(size_t count);
    AdbResult<std::optional<std::string>> readOptionalExact(size_t count);
    AdbResult<void> writeFully(const void* data, size_t len);
    AdbResult<size_t> readHexLength();
    AdbResult<uint32_t> readLittleEndianLength();
    AdbResult<void> checkUsable() const;
    AdbError interruptedError(const char* context) const;

    int fd_ = -1;
    std::atomic<bool> closed_{false};
    CancellationToken token_;
    CancellationRegistration cancel_registration_;
    std::string pending_;   // bytes read past a line boundary by readLine()
};

} // namespace snapadb
