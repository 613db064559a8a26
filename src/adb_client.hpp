// =============================================================================
// SnapADB - ADB Command Client
// =============================================================================
// Typed device operations over the ADB server wire protocol. Each operation
// opens its own Connection inside a bounded retry loop:
//
//   for attempt in 1..max_attempts:
//       wait for any in-flight server restart
//       open connection, run the operation
//       ServerUnavailable -> (first time only) start-server, back off, retry
//       anything else     -> return immediately
//
// Backoff doubles from retry.backoff_initial_ms up to retry.backoff_max_ms.
// All operations are safe to call concurrently; they never share a socket.
// =============================================================================
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>
#include "adb_connection.hpp"
#include "adb_output_parsers.hpp"
#include "cancellation.hpp"
#include "config_loader.hpp"
#include "result.hpp"
#include "screen_sessions.hpp"
#include "server_restart_coordinator.hpp"
#include "snapadb_log.hpp"
#include "track_devices.hpp"

namespace snapadb {

struct ForwardHandle {
    std::string device_id;
    uint16_t local_port = 0;
    std::string remote;          // "localabstract:<name>"
};

class AdbClient {
public:
    explicit AdbClient(config::AdbConfig config,
                       ServerRestartCoordinator& coordinator = ServerRestartCoordinator::instance());

    const config::AdbConfig& config() const { return config_; }

    // --- one-shot commands ---------------------------------------------------

    // `shell:<cmd>` output as text (PTY-less shell v1).
    AdbResult<std::string> shell(const std::string& device_id, const std::string& command,
                                 const CancellationToken& token = CancellationToken::none());

    // `exec:<cmd>` raw bytes, no line-ending translation.
    AdbResult<std::vector<uint8_t>> exec(const std::string& device_id, const std::string& command,
                                         const CancellationToken& token = CancellationToken::none());

    // Sync RECV of `remote_path` into a freshly created `local_path`.
    AdbResult<void> pull(const std::string& device_id, const std::string& remote_path,
                         const std::string& local_path,
                         const CancellationToken& token = CancellationToken::none());

    // Forwards an ephemeral loopback port to localabstract:<socket_name>.
    AdbResult<ForwardHandle> forward(const std::string& device_id, const std::string& socket_name);
    AdbResult<void> removeForward(const ForwardHandle& handle);

    AdbResult<parse::PropertyMap> getProperties(const std::string& device_id, const std::string& prefix = {});

    // Held-open host:track-devices-l stream.
    AdbResult<std::unique_ptr<TrackDevicesSubscription>> trackDevices(
        const CancellationToken& token = CancellationToken::none());

    // One host:devices-l listing, normalized like a track-devices snapshot.
    AdbResult<std::string> devicesList();

    // --- derived conveniences ------------------------------------------------

    // "<w>x<h>" from dumpsys, falling back to wm size.
    AdbResult<std::string> displaySize(const std::string& device_id);

    // dpi from wm density, falling back to ro.sf.lcd_density.
    AdbResult<int> displayDensity(const std::string& device_id);
    AdbResult<double> displayDensityScale(const std::string& device_id);

    AdbResult<std::vector<uint8_t>> screencapPNG(const std::string& device_id);
    AdbResult<std::string> keyEvent(const std::string& device_id, const std::string& key_code);
    AdbResult<void> setShowTouches(const std::string& device_id, bool enabled);
    AdbResult<bool> getShowTouches(const std::string& device_id);

    // Raw /proc/net/unix, and the abstract socket names in it with `prefix`.
    AdbResult<std::string> listUnixSockets(const std::string& device_id);
    AdbResult<std::vector<std::string>> findAbstractSockets(const std::string& device_id,
                                                           const std::string& prefix);

    // --- sessions ------------------------------------------------------------

    AdbResult<std::unique_ptr<RecordingSession>> startScreenRecord(const std::string& device_id,
                                                                   const RecordingOptions& options = {});

    // SIGINT, wait for exit, pull to local_path, remove the remote file,
    // close. Cleanup runs on every path, and also when a session is dropped
    // without being stopped.
    AdbResult<void> stopScreenRecord(RecordingSession& session, const std::string& local_path);

    AdbResult<std::unique_ptr<ScreenStreamSession>> startScreenStream(const std::string& device_id,
                                                                      const StreamOptions& options = {});

    // Retry-wrapped connect, for callers that drive the protocol themselves.
    AdbResult<std::unique_ptr<Connection>> openConnection(
        const CancellationToken& token = CancellationToken::none());

    // Delay before attempt `attempt + 1` (attempt is 1-based).
    std::chrono::milliseconds backoffFor(int attempt) const;

private:
    using ConnectionPtr = std::unique_ptr<Connection>;

    AdbResult<void> ensureServer();
    AdbResult<void> validateSerial(const std::string& device_id) const;
    AdbResult<std::optional<std::string>> resolveRecordSize(const std::string& device_id,
                                                            const std::string& requested);
    void sleepBackoff(int attempt, const CancellationToken& token) const;
    void removeRemoteRecording(const std::string& device_id, const std::string& remote_path);

    // Runs body(conn) with the retry policy above. `body` receives the
    // connection by reference to the owning pointer so held-open operations
    // can take it.
    template<typename Body>
    auto runWithRetry(const char* what, const CancellationToken& token, Body&& body)
        -> decltype(body(std::declval<ConnectionPtr&>()));

    config::AdbConfig config_;
    ServerRestartCoordinator& coordinator_;
};

// =============================================================================
// Retry loop
// =============================================================================

template<typename Body>
auto AdbClient::runWithRetry(const char* what, const CancellationToken& token, Body&& body)
    -> decltype(body(std::declval<ConnectionPtr&>())) {
    const int max_attempts = config_.retry.max_attempts < 1 ? 1 : config_.retry.max_attempts;
    bool restart_requested = false;
    AdbError last_error = AdbError::serverUnavailable("adb server unavailable");

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        if (token.isCancelled()) return AdbError::cancelled();
        SNAPADB_TRY_VOID(coordinator_.waitForOngoingRestart(token));

        auto opened = Connection::open(config_.daemon.host, config_.daemon.port, token);
        if (opened.is_ok()) {
            ConnectionPtr conn = std::move(opened).value();
            auto result = body(conn);
            if (result.is_ok()) return result;
            last_error = result.error();
        } else {
            last_error = opened.error();
        }

        if (!last_error.isRetryable()) return last_error;

        SLOG_WARN("adb", "%s: attempt %d/%d failed: %s", what, attempt, max_attempts,
                  last_error.message.c_str());

        if (!restart_requested) {
            restart_requested = true;
            auto started = ensureServer();
            if (started.is_err()) {
                const AdbError& err = started.error();
                if (err.is(AdbError::Kind::AdbNotFound) || err.is(AdbError::Kind::NonZeroExit)) {
                    return err;
                }
            }
        }

        if (attempt < max_attempts) sleepBackoff(attempt, token);
    }

    SLOG_ERROR("adb", "%s: giving up after %d attempts: %s", what, max_attempts,
               last_error.message.c_str());
    return last_error;
}

} // namespace snapadb
