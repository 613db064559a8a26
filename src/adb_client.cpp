#include "adb_client.hpp"
#include "adb_path.hpp"
#include "adb_protocol.hpp"
#include "adb_security.hpp"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cerrno>
#include <condition_variable>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>

namespace snapadb {

namespace {

constexpr const char* kRecordingDir = "/data/local/tmp/";

// Random RFC 4122 version 4 identifier for remote temp files.
std::string makeUuid() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi = rng();
    uint64_t lo = rng();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
    char buf[40];
    snprintf(buf, sizeof(buf), "%08X-%04X-%04X-%04X-%012llX",
             (unsigned)(hi >> 32), (unsigned)((hi >> 16) & 0xFFFF), (unsigned)(hi & 0xFFFF),
             (unsigned)(lo >> 48), (unsigned long long)(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

// Binds 127.0.0.1:0 to let the kernel pick a free port, then releases it.
AdbResult<uint16_t> allocateLoopbackPort() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return AdbError::serverUnavailable(std::string("socket failed: ") + std::strerror(errno));

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;

    if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        int err = errno;
        ::close(fd);
        return AdbError::serverUnavailable(std::string("bind failed: ") + std::strerror(err));
    }
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
        int err = errno;
        ::close(fd);
        return AdbError::serverUnavailable(std::string("getsockname failed: ") + std::strerror(err));
    }
    ::close(fd);
    return static_cast<uint16_t>(ntohs(addr.sin_port));
}

AdbResult<std::string> utf8Text(const std::vector<uint8_t>& bytes) {
    std::string text(bytes.begin(), bytes.end());
    if (!parse::isValidUtf8(text)) return AdbError::parseFailure("non-utf8 output from adb");
    return text;
}

// Probe failures worth falling back from; transport-level ones are not.
bool isProbeFailure(const AdbError& e) {
    return e.is(AdbError::Kind::ProtocolFailure) || e.is(AdbError::Kind::ParseFailure);
}

std::string screenrecordArgs(int bit_rate_mbps, int time_limit_seconds,
                             const std::optional<std::string>& size, const char* extra_flag) {
    std::string cmd = "screenrecord";
    if (extra_flag) {
        cmd += ' ';
        cmd += extra_flag;
    }
    cmd += " --bit-rate " + std::to_string(static_cast<long long>(bit_rate_mbps) * 1000000LL);
    cmd += " --time-limit " + std::to_string(time_limit_seconds);
    if (size && !size->empty()) cmd += " --size " + *size;
    return cmd;
}

} // anonymous namespace

AdbClient::AdbClient(config::AdbConfig config, ServerRestartCoordinator& coordinator)
    : config_(std::move(config)), coordinator_(coordinator) {}

// =============================================================================
// Retry support
// =============================================================================

std::chrono::milliseconds AdbClient::backoffFor(int attempt) const {
    long long delay = config_.retry.backoff_initial_ms > 0 ? config_.retry.backoff_initial_ms : 0;
    const long long cap = config_.retry.backoff_max_ms > 0 ? config_.retry.backoff_max_ms : 0;
    for (int i = 1; i < attempt && delay < cap; ++i) delay *= 2;
    if (delay > cap) delay = cap;
    return std::chrono::milliseconds(delay);
}

void AdbClient::sleepBackoff(int attempt, const CancellationToken& token) const {
    auto delay = backoffFor(attempt);
    if (delay.count() <= 0) return;

    struct Waiter {
        std::mutex m;
        std::condition_variable cv;
    };
    // shared: a cancel() racing with our return may still touch it
    auto waiter = std::make_shared<Waiter>();
    CancellationToken watched = token;
    auto registration = watched.onCancel([waiter]() {
        std::lock_guard<std::mutex> lock(waiter->m);
        waiter->cv.notify_all();
    });
    std::unique_lock<std::mutex> lock(waiter->m);
    waiter->cv.wait_for(lock, delay, [&]() { return watched.isCancelled(); });
}

AdbResult<void> AdbClient::ensureServer() {
    std::string path = SNAPADB_TRY(resolveAdbPath(config_));
    return coordinator_.startServer(path);
}

AdbResult<void> AdbClient::validateSerial(const std::string& device_id) const {
    if (!security::isValidSerial(device_id)) {
        return AdbError::protocolFailure("invalid device serial: '" + device_id + "'");
    }
    return {};
}

AdbResult<std::unique_ptr<Connection>> AdbClient::openConnection(const CancellationToken& token) {
    return runWithRetry("connect", token, [](ConnectionPtr& conn) -> AdbResult<ConnectionPtr> {
        return std::move(conn);
    });
}

// =============================================================================
// One-shot commands
// =============================================================================

AdbResult<std::string> AdbClient::shell(const std::string& device_id, const std::string& command,
                                        const CancellationToken& token) {
    SNAPADB_TRY_VOID(validateSerial(device_id));
    SLOG_DEBUG("adb", "[%s] shell: %s", device_id.c_str(), command.c_str());
    return runWithRetry("shell", token, [&](ConnectionPtr& conn) -> AdbResult<std::string> {
        SNAPADB_TRY_VOID(conn->send(protocol::request::transport(device_id)));
        SNAPADB_TRY_VOID(conn->send(protocol::request::shell(command)));
        auto bytes = SNAPADB_TRY(conn->readToEnd());
        return utf8Text(bytes);
    });
}

AdbResult<std::vector<uint8_t>> AdbClient::exec(const std::string& device_id, const std::string& command,
                                                const CancellationToken& token) {
    SNAPADB_TRY_VOID(validateSerial(device_id));
    SLOG_DEBUG("adb", "[%s] exec: %s", device_id.c_str(), command.c_str());
    return runWithRetry("exec", token, [&](ConnectionPtr& conn) -> AdbResult<std::vector<uint8_t>> {
        SNAPADB_TRY_VOID(conn->send(protocol::request::transport(device_id)));
        SNAPADB_TRY_VOID(conn->send(protocol::request::exec(command)));
        return conn->readToEnd();
    });
}

AdbResult<void> AdbClient::pull(const std::string& device_id, const std::string& remote_path,
                                const std::string& local_path, const CancellationToken& token) {
    namespace fs = std::filesystem;
    SNAPADB_TRY_VOID(validateSerial(device_id));
    if (remote_path.empty()) return AdbError::protocolFailure("empty remote path");

    fs::path local(local_path);
    if (local.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(local.parent_path(), ec);
        if (ec) {
            return AdbError::localIo("cannot create " + local.parent_path().string() + ": " + ec.message());
        }
    }

    SLOG_INFO("adb", "[%s] pull %s -> %s", device_id.c_str(), remote_path.c_str(), local_path.c_str());
    auto result = runWithRetry("pull", token, [&](ConnectionPtr& conn) -> AdbResult<void> {
        std::ofstream out(local_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) return AdbError::localIo("cannot open " + local_path + " for writing");

        SNAPADB_TRY_VOID(conn->send(protocol::request::transport(device_id)));
        SNAPADB_TRY_VOID(conn->send(protocol::request::sync()));
        SNAPADB_TRY_VOID(conn->sendSync(protocol::kSyncRecv, remote_path));

        uint64_t total = 0;
        SNAPADB_TRY_VOID(conn->readSyncData([&](const uint8_t* data, size_t len) -> AdbResult<void> {
            out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
            if (!out) return AdbError::localIo("write to " + local_path + " failed");
            total += len;
            return {};
        }));
        out.flush();
        if (!out) return AdbError::localIo("flush of " + local_path + " failed");
        SLOG_DEBUG("adb", "[%s] pulled %llu bytes", device_id.c_str(), (unsigned long long)total);
        return {};
    });

    if (result.is_err()) {
        std::error_code ec;
        fs::remove(local, ec);
    }
    return result;
}

AdbResult<ForwardHandle> AdbClient::forward(const std::string& device_id, const std::string& socket_name) {
    SNAPADB_TRY_VOID(validateSerial(device_id));
    if (!security::isValidSocketName(socket_name)) {
        return AdbError::protocolFailure("invalid socket name: '" + socket_name + "'");
    }

    return runWithRetry("forward", CancellationToken::none(), [&](ConnectionPtr& conn) -> AdbResult<ForwardHandle> {
        uint16_t port = SNAPADB_TRY(allocateLoopbackPort());
        ForwardHandle handle;
        handle.device_id = device_id;
        handle.local_port = port;
        handle.remote = "localabstract:" + socket_name;

        SNAPADB_TRY_VOID(conn->send(protocol::request::forward(device_id, port, handle.remote)));
        SNAPADB_TRY_VOID(conn->readStatus());
        SLOG_INFO("adb", "[%s] forward tcp:%u -> %s", device_id.c_str(), (unsigned)port, handle.remote.c_str());
        return handle;
    });
}

AdbResult<void> AdbClient::removeForward(const ForwardHandle& handle) {
    SNAPADB_TRY_VOID(validateSerial(handle.device_id));
    return runWithRetry("killforward", CancellationToken::none(), [&](ConnectionPtr& conn) -> AdbResult<void> {
        SNAPADB_TRY_VOID(conn->send(protocol::request::killForward(handle.device_id, handle.local_port)));
        SLOG_INFO("adb", "[%s] removed forward tcp:%u", handle.device_id.c_str(), (unsigned)handle.local_port);
        return {};
    });
}

AdbResult<parse::PropertyMap> AdbClient::getProperties(const std::string& device_id, const std::string& prefix) {
    std::string output = SNAPADB_TRY(shell(device_id, "getprop"));
    return parse::parseProperties(output, prefix);
}

AdbResult<std::unique_ptr<TrackDevicesSubscription>> AdbClient::trackDevices(const CancellationToken& token) {
    return runWithRetry("track-devices", token,
                        [&](ConnectionPtr& conn) -> AdbResult<std::unique_ptr<TrackDevicesSubscription>> {
        SNAPADB_TRY_VOID(conn->send(protocol::request::trackDevices()));
        return std::make_unique<TrackDevicesSubscription>(std::move(conn));
    });
}

AdbResult<std::string> AdbClient::devicesList() {
    return runWithRetry("devices", CancellationToken::none(), [&](ConnectionPtr& conn) -> AdbResult<std::string> {
        SNAPADB_TRY_VOID(conn->send(protocol::request::devicesList()));
        auto payload = SNAPADB_TRY(conn->readLengthPrefixedPayload());
        if (payload && !parse::isValidUtf8(*payload)) {
            return AdbError::parseFailure("non-utf8 device list from adb");
        }
        return protocol::normalizeSnapshot(payload ? *payload : std::string());
    });
}

// =============================================================================
// Display probes and small device commands
// =============================================================================

AdbResult<std::string> AdbClient::displaySize(const std::string& device_id) {
    auto dumpsys = shell(device_id, "dumpsys window displays");
    if (dumpsys.is_ok()) {
        if (auto size = parse::parseCurrentDisplaySize(dumpsys.value())) return *size;
    } else if (!isProbeFailure(dumpsys.error())) {
        return dumpsys.error();
    }

    auto wm = shell(device_id, "wm size");
    if (wm.is_ok()) {
        if (auto size = parse::parseWmSize(wm.value())) return *size;
    } else if (!isProbeFailure(wm.error())) {
        return wm.error();
    }
    return AdbError::parseFailure("unable to determine display size");
}

AdbResult<int> AdbClient::displayDensity(const std::string& device_id) {
    auto wm = shell(device_id, "wm density");
    if (wm.is_ok()) {
        if (auto dpi = parse::parseDensity(wm.value())) return *dpi;
    } else if (!isProbeFailure(wm.error())) {
        return wm.error();
    }

    auto prop = shell(device_id, "getprop ro.sf.lcd_density");
    if (prop.is_ok()) {
        if (auto dpi = parse::parseDensity(prop.value())) return *dpi;
    } else if (!isProbeFailure(prop.error())) {
        return prop.error();
    }
    return AdbError::parseFailure("unable to determine device density");
}

AdbResult<double> AdbClient::displayDensityScale(const std::string& device_id) {
    int dpi = SNAPADB_TRY(displayDensity(device_id));
    return static_cast<double>(dpi) / 160.0;
}

AdbResult<std::vector<uint8_t>> AdbClient::screencapPNG(const std::string& device_id) {
    static const uint8_t kPngSignature[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
    auto png = SNAPADB_TRY(exec(device_id, "screencap -p 2>/dev/null"));
    if (png.size() < sizeof(kPngSignature) ||
        std::memcmp(png.data(), kPngSignature, sizeof(kPngSignature)) != 0) {
        return AdbError::parseFailure("screencap did not return a PNG (" + std::to_string(png.size()) + " bytes)");
    }
    return png;
}

AdbResult<std::string> AdbClient::keyEvent(const std::string& device_id, const std::string& key_code) {
    if (!security::isValidKeyCode(key_code)) {
        return AdbError::protocolFailure("invalid key code: '" + key_code + "'");
    }
    return shell(device_id, "input keyevent " + key_code);
}

AdbResult<void> AdbClient::setShowTouches(const std::string& device_id, bool enabled) {
    SNAPADB_TRY(shell(device_id, std::string("settings put system show_touches ") + (enabled ? "1" : "0")));
    return {};
}

AdbResult<bool> AdbClient::getShowTouches(const std::string& device_id) {
    std::string out = SNAPADB_TRY(shell(device_id, "settings get system show_touches"));
    return parse::parseShowTouches(out);
}

AdbResult<std::string> AdbClient::listUnixSockets(const std::string& device_id) {
    return shell(device_id, "cat /proc/net/unix");
}

AdbResult<std::vector<std::string>> AdbClient::findAbstractSockets(const std::string& device_id,
                                                                  const std::string& prefix) {
    std::string table = SNAPADB_TRY(listUnixSockets(device_id));
    return parse::parseAbstractSockets(table, prefix);
}

// =============================================================================
// Sessions
// =============================================================================

AdbResult<std::optional<std::string>> AdbClient::resolveRecordSize(const std::string& device_id,
                                                                   const std::string& requested) {
    std::string size = parse::trim(requested);
    if (!size.empty()) {
        if (!security::isValidSizeSpec(size)) return AdbError::parseFailure("invalid size: '" + size + "'");
        return std::optional<std::string>(size);
    }
    auto probed = displaySize(device_id);
    if (probed.is_ok()) return std::optional<std::string>(probed.value());
    if (probed.error().is(AdbError::Kind::Cancelled) || probed.error().is(AdbError::Kind::AdbNotFound)) {
        return probed.error();
    }
    SLOG_DEBUG("adb", "[%s] display size unavailable, recording at native size: %s",
               device_id.c_str(), probed.error().message.c_str());
    return std::optional<std::string>{};
}

AdbResult<std::unique_ptr<RecordingSession>> AdbClient::startScreenRecord(const std::string& device_id,
                                                                          const RecordingOptions& options) {
    SNAPADB_TRY_VOID(validateSerial(device_id));
    auto size = SNAPADB_TRY(resolveRecordSize(device_id, options.size));

    std::string remote = std::string(kRecordingDir) + "snapadb_recording_" + makeUuid() + ".mp4";
    std::string inner = screenrecordArgs(options.bit_rate_mbps, options.time_limit_seconds, size, nullptr) +
                        " " + remote;
    // The inner shell prints its pid and becomes screenrecord; the outer one
    // reports how screenrecord ended.
    std::string command = "sh -c 'echo $$; exec " + inner + "'; echo " + parse::kExitTrailer + "$?";

    auto session = runWithRetry("screenrecord", CancellationToken::none(),
                                [&](ConnectionPtr& conn) -> AdbResult<std::unique_ptr<RecordingSession>> {
        SNAPADB_TRY_VOID(conn->send(protocol::request::transport(device_id)));
        SNAPADB_TRY_VOID(conn->send(protocol::request::shell(command)));
        // screenrecord may already be writing the file from here on.
        auto line = conn->readLine();
        std::optional<int> pid;
        if (line.is_ok() && line.value()) pid = parse::parsePid(*line.value());
        if (!pid) {
            conn->close();
            removeRemoteRecording(device_id, remote);
            if (line.is_err()) return line.error();
            return AdbError::parseFailure("unable to determine screenrecord pid" +
                                          (line.value() ? ": '" + *line.value() + "'" : std::string()));
        }
        return std::make_unique<RecordingSession>(device_id, remote, *pid, std::move(conn));
    });
    if (session.is_ok()) {
        session.value()->setCleanup([this, device_id, remote]() { removeRemoteRecording(device_id, remote); });
        SLOG_INFO("recording", "[%s] recording to %s (pid %d)", device_id.c_str(), remote.c_str(),
                  session.value()->pid());
    }
    return session;
}

void AdbClient::removeRemoteRecording(const std::string& device_id, const std::string& remote_path) {
    if (!security::isAllowedRemotePath(remote_path)) return;
    auto removed = shell(device_id, "rm -f " + remote_path);
    if (removed.is_err()) {
        SLOG_WARN("recording", "[%s] could not remove %s: %s", device_id.c_str(),
                  remote_path.c_str(), removed.error().message.c_str());
    }
}

AdbResult<void> AdbClient::stopScreenRecord(RecordingSession& session, const std::string& local_path) {
    const std::string device_id = session.deviceId();
    session.markStopping();

    auto killed = shell(device_id, "kill -INT " + std::to_string(session.pid()) + " >/dev/null 2>&1 || true");
    if (killed.is_err()) {
        SLOG_WARN("recording", "[%s] SIGINT to pid %d failed: %s", device_id.c_str(), session.pid(),
                  killed.error().message.c_str());
    }

    AdbResult<void> outcome = session.waitUntilStopped();
    if (outcome.is_ok()) {
        outcome = pull(device_id, session.remotePath(), local_path);
    } else {
        SLOG_ERROR("recording", "[%s] screenrecord failed [%s]: %s", device_id.c_str(),
                   kindName(outcome.error().kind), outcome.error().message.c_str());
    }

    session.close();    // removes the remote file

    if (outcome.is_ok()) {
        SLOG_INFO("recording", "[%s] saved %s", device_id.c_str(), local_path.c_str());
    }
    return outcome;
}

AdbResult<std::unique_ptr<ScreenStreamSession>> AdbClient::startScreenStream(const std::string& device_id,
                                                                             const StreamOptions& options) {
    SNAPADB_TRY_VOID(validateSerial(device_id));
    auto size = SNAPADB_TRY(resolveRecordSize(device_id, options.size));
    std::string command = screenrecordArgs(options.bit_rate_mbps, 0, size, "--output-format=h264") + " -";

    auto session = runWithRetry("screen stream", CancellationToken::none(),
                                [&](ConnectionPtr& conn) -> AdbResult<std::unique_ptr<ScreenStreamSession>> {
        SNAPADB_TRY_VOID(conn->send(protocol::request::transport(device_id)));
        SNAPADB_TRY_VOID(conn->send(protocol::request::shell(command)));
        return std::make_unique<ScreenStreamSession>(device_id, std::move(conn));
    });
    if (session.is_err()) return session;

    auto woke = keyEvent(device_id, "KEYCODE_WAKEUP");
    if (woke.is_err()) {
        SLOG_DEBUG("stream", "[%s] wake key failed: %s", device_id.c_str(), woke.error().message.c_str());
    }
    SLOG_INFO("stream", "[%s] streaming H.264 (%d Mbps)", device_id.c_str(), options.bit_rate_mbps);
    return session;
}

} // namespace snapadb
