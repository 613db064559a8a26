// =============================================================================
// SnapADB - ADB Server Connection
// =============================================================================

#include "adb_connection.hpp"
#include "adb_protocol.hpp"
#include "snapadb_log.hpp"

#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

#ifdef MSG_NOSIGNAL
#define SNAPADB_SEND_FLAGS MSG_NOSIGNAL
#else
#define SNAPADB_SEND_FLAGS 0
#endif

namespace snapadb {

namespace {

AdbError socketError(int code, const char* context) {
    return AdbError::serverUnavailable(std::string(context) + " failed: " + std::strerror(code));
}

AdbError unexpectedEof() {
    return AdbError::protocolFailure("unexpected EOF while reading from adb server");
}

} // anonymous namespace

// =============================================================================
// Lifecycle
// =============================================================================

AdbResult<std::unique_ptr<Connection>> Connection::open(const std::string& host, uint16_t port,
                                                        CancellationToken token) {
    if (token.isCancelled()) return AdbError::cancelled();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    struct addrinfo* addrs = nullptr;
    std::string port_str = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &addrs);
    if (gai != 0 || !addrs) {
        return AdbError::serverUnavailable("resolve " + host + " failed: " + gai_strerror(gai));
    }
    std::unique_ptr<struct addrinfo, void (*)(struct addrinfo*)> addr_guard(addrs, freeaddrinfo);

    int fd = ::socket(addrs->ai_family, addrs->ai_socktype, addrs->ai_protocol);
    if (fd < 0) return socketError(errno, "socket");

    int one = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
#ifdef SO_NOSIGPIPE
    setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#endif

    int rc;
    do {
        rc = ::connect(fd, addrs->ai_addr, addrs->ai_addrlen);
    } while (rc != 0 && errno == EINTR);
    if (rc != 0) {
        int err = errno;
        ::close(fd);
        SLOG_DEBUG("adb-conn", "connect %s:%u failed: %s", host.c_str(), (unsigned)port, std::strerror(err));
        return socketError(err, "connect");
    }

    return std::unique_ptr<Connection>(new Connection(fd, std::move(token)));
}

std::unique_ptr<Connection> Connection::adopt(int fd, CancellationToken token) {
    return std::unique_ptr<Connection>(new Connection(fd, std::move(token)));
}

Connection::Connection(int fd, CancellationToken token)
    : fd_(fd), token_(std::move(token)) {
    cancel_registration_ = token_.onCancel([this]() { close(); });
}

Connection::~Connection() {
    cancel_registration_.reset();
    close();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void Connection::close() {
    if (closed_.exchange(true)) return;
    if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
}

AdbResult<void> Connection::checkUsable() const {
    if (token_.isCancelled()) return AdbError::cancelled();
    if (isClosed()) return AdbError::serverUnavailable("connection closed");
    return {};
}

AdbError Connection::interruptedError(const char* context) const {
    if (token_.isCancelled()) return AdbError::cancelled();
    return AdbError::serverUnavailable(std::string(context) + " on closed connection");
}

// =============================================================================
// Raw I/O
// =============================================================================

AdbResult<size_t> Connection::readOnce(uint8_t* buf, size_t len) {
    if (!pending_.empty()) {
        size_t n = std::min(len, pending_.size());
        std::memcpy(buf, pending_.data(), n);
        pending_.erase(0, n);
        return n;
    }

    while (true) {
        SNAPADB_TRY_VOID(checkUsable());
        ssize_t n = ::recv(fd_, buf, len, 0);
        if (n > 0) return static_cast<size_t>(n);
        if (n == 0) {
            // shutdown() from close()/cancel() looks like EOF to a blocked reader
            if (token_.isCancelled()) return AdbError::cancelled();
            return static_cast<size_t>(0);
        }
        int err = errno;
        if (err == EINTR) continue;
        if (isClosed()) return interruptedError("recv");
        return socketError(err, "recv");
    }
}

AdbResult<void> Connection::writeFully(const void* data, size_t len) {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    size_t remaining = len;
    while (remaining > 0) {
        SNAPADB_TRY_VOID(checkUsable());
        ssize_t written = ::send(fd_, p, remaining, SNAPADB_SEND_FLAGS);
        if (written > 0) {
            p += written;
            remaining -= static_cast<size_t>(written);
            continue;
        }
        if (written == 0) return AdbError::serverUnavailable("socket closed during write");
        int err = errno;
        if (err == EINTR) continue;
        if (isClosed()) return interruptedError("send");
        return socketError(err, "send");
    }
    return {};
}

AdbResult<std::string> Connection::readExact(size_t count) {
    auto r = readOptionalExact(count);
    if (r.is_err()) return r.error();
    if (!r.value()) return unexpectedEof();
    return std::move(*r.value());
}

// nullopt only when EOF arrives before the first byte
AdbResult<std::optional<std::string>> Connection::readOptionalExact(size_t count) {
    std::string out;
    out.resize(count);
    size_t got = 0;
    while (got < count) {
        size_t n = SNAPADB_TRY(readOnce(reinterpret_cast<uint8_t*>(&out[got]), count - got));
        if (n == 0) {
            if (got == 0) return std::optional<std::string>{};
            return unexpectedEof();
        }
        got += n;
    }
    return std::optional<std::string>(std::move(out));
}

AdbResult<size_t> Connection::readHexLength() {
    std::string header = SNAPADB_TRY(readExact(4));
    auto length = protocol::parseHexLength(header);
    if (!length) return AdbError::protocolFailure("invalid length header");
    return *length;
}

AdbResult<uint32_t> Connection::readLittleEndianLength() {
    std::string raw = SNAPADB_TRY(readExact(4));
    return protocol::readLE32(reinterpret_cast<const uint8_t*>(raw.data()));
}

// =============================================================================
// Request / response
// =============================================================================

AdbResult<void> Connection::send(const std::string& request) {
    std::string framed = SNAPADB_TRY(protocol::encodeRequest(request));
    SLOG_TRACE("adb-conn", "-> %s", request.c_str());
    SNAPADB_TRY_VOID(writeFully(framed.data(), framed.size()));
    return readStatus();
}

AdbResult<void> Connection::readStatus() {
    std::string status = SNAPADB_TRY(readExact(4));
    if (status == protocol::kStatusOkay) return {};
    if (status == protocol::kStatusFail) {
        size_t len = SNAPADB_TRY(readHexLength());
        std::string message = SNAPADB_TRY(readExact(len));
        SLOG_DEBUG("adb-conn", "server replied FAIL: %s", message.c_str());
        return AdbError::protocolFailure(message);
    }
    return AdbError::protocolFailure("unexpected status: " + status);
}

AdbResult<std::vector<uint8_t>> Connection::readToEnd() {
    std::vector<uint8_t> out;
    std::vector<uint8_t> buffer(kBufferSize);
    while (true) {
        size_t n = SNAPADB_TRY(readOnce(buffer.data(), buffer.size()));
        if (n == 0) break;
        out.insert(out.end(), buffer.begin(), buffer.begin() + n);
    }
    return out;
}

AdbResult<void> Connection::drainToEnd() {
    std::vector<uint8_t> scratch(kBufferSize);
    while (true) {
        size_t n = SNAPADB_TRY(readOnce(scratch.data(), scratch.size()));
        if (n == 0) return {};
    }
}

AdbResult<std::optional<std::vector<uint8_t>>> Connection::readChunk(size_t max_length) {
    if (max_length == 0) max_length = kBufferSize;
    std::vector<uint8_t> buffer(max_length);
    size_t n = SNAPADB_TRY(readOnce(buffer.data(), buffer.size()));
    if (n == 0) return std::optional<std::vector<uint8_t>>{};
    buffer.resize(n);
    return std::optional<std::vector<uint8_t>>(std::move(buffer));
}

AdbResult<std::optional<std::string>> Connection::readLine() {
    std::string collected;
    uint8_t buffer[256];
    bool saw_any = false;

    while (true) {
        size_t n = SNAPADB_TRY(readOnce(buffer, sizeof(buffer)));
        if (n == 0) break;
        saw_any = true;
        const uint8_t* nl = static_cast<const uint8_t*>(std::memchr(buffer, '\n', n));
        if (nl) {
            size_t line_len = static_cast<size_t>(nl - buffer);
            collected.append(reinterpret_cast<const char*>(buffer), line_len);
            // keep whatever followed the newline for the next read
            pending_.insert(0, reinterpret_cast<const char*>(nl + 1), n - line_len - 1);
            break;
        }
        collected.append(reinterpret_cast<const char*>(buffer), n);
    }

    if (!saw_any) return std::optional<std::string>{};
    while (!collected.empty() &&
           (collected.back() == '\r' || collected.back() == '\n' ||
            collected.back() == ' ' || collected.back() == '\t')) {
        collected.pop_back();
    }
    size_t start = collected.find_first_not_of(" \t");
    if (start == std::string::npos) collected.clear();
    else if (start > 0) collected.erase(0, start);
    return std::optional<std::string>(std::move(collected));
}

// =============================================================================
// Sync sub-protocol
// =============================================================================

AdbResult<void> Connection::sendSync(const std::string& id, const std::string& path) {
    std::string header = SNAPADB_TRY(protocol::encodeSyncRequest(id, path));
    SLOG_TRACE("adb-conn", "-> sync %s %s", id.c_str(), path.c_str());
    return writeFully(header.data(), header.size());
}

AdbResult<void> Connection::readSyncData(const SyncChunkHandler& on_chunk) {
    while (true) {
        std::string id = SNAPADB_TRY(readExact(4));

        if (id == protocol::kSyncData) {
            uint32_t expected = SNAPADB_TRY(readLittleEndianLength());
            if (expected > protocol::kMaxPayloadBytes) {
                return AdbError::protocolFailure("sync DATA chunk too large: " + std::to_string(expected));
            }
            std::string payload = SNAPADB_TRY(readExact(expected));
            SNAPADB_TRY_VOID(on_chunk(reinterpret_cast<const uint8_t*>(payload.data()), payload.size()));
        } else if (id == protocol::kSyncDone) {
            SNAPADB_TRY(readExact(4));  // mtime, unused
            return {};
        } else if (id == protocol::kSyncFail) {
            uint32_t length = SNAPADB_TRY(readLittleEndianLength());
            if (length > protocol::kMaxPayloadBytes) {
                return AdbError::protocolFailure("sync FAIL message too large");
            }
            std::string message = SNAPADB_TRY(readExact(length));
            return AdbError::protocolFailure(message.empty() ? "unknown sync failure" : message);
        } else {
            return AdbError::protocolFailure("unexpected sync id: " + id);
        }
    }
}

// =============================================================================
// Length-prefixed payloads
// =============================================================================

AdbResult<std::optional<std::string>> Connection::readLengthPrefixedPayload() {
    auto header = SNAPADB_TRY(readOptionalExact(4));
    if (!header) return std::optional<std::string>{};

    auto length = protocol::parseHexLength(*header);
    if (!length) return AdbError::protocolFailure("invalid length header");
    if (*length > protocol::kMaxPayloadBytes) {
        return AdbError::protocolFailure("adb payload too large: " + std::to_string(*length) + " bytes");
    }
    if (*length == 0) return std::optional<std::string>(std::string());
    std::string payload = SNAPADB_TRY(readExact(*length));
    return std::optional<std::string>(std::move(payload));
}

} // namespace snapadb
