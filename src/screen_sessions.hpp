// =============================================================================
// SnapADB - Screen Recording / Streaming Sessions
// =============================================================================
// Long-lived sessions that own a held-open shell connection.
//
// RecordingSession: screenrecord writes an mp4 on the device. A drain thread
// reads the shell output until the remote command ends and keeps the tail,
// which carries the exit status trailer. Lifecycle:
//   Recording -> Stopping (SIGINT sent) -> Stopped (output drained)
//             -> Closed (file pulled, remote file removed, connection closed)
// A session dropped without being stopped still removes its remote file
// through the cleanup hook, so it must not outlive the client that made it.
//
// ScreenStreamSession: screenrecord writes raw H.264 to stdout; the caller
// pulls chunks with readChunk() until it closes the session.
// =============================================================================
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "adb_connection.hpp"
#include "result.hpp"

namespace snapadb {

struct RecordingOptions {
    int bit_rate_mbps = 8;
    int time_limit_seconds = 60 * 60 * 3;
    std::string size;            // "<w>x<h>"; empty: probe the display
};

struct StreamOptions {
    int bit_rate_mbps = 8;
    std::string size;
};

class RecordingSession {
public:
    enum class State { Recording, Stopping, Stopped, Closed };

    RecordingSession(std::string device_id, std::string remote_path, int pid,
                     std::unique_ptr<Connection> conn);
    ~RecordingSession();

    RecordingSession(const RecordingSession&) = delete;
    RecordingSession& operator=(const RecordingSession&) = delete;

    const std::string& deviceId() const { return device_id_; }
    const std::string& remotePath() const { return remote_path_; }
    int pid() const { return pid_; }
    std::chrono::steady_clock::time_point startedAt() const { return started_at_; }

    State state() const { return state_.load(); }
    void markStopping();

    // Blocks until the remote command has ended, then classifies its exit.
    AdbResult<void> waitUntilStopped();

    // Runs once from close(), after the connection is gone.
    void setCleanup(std::function<void()> cleanup) { cleanup_ = std::move(cleanup); }

    // Idempotent. Closes the connection, joins the drain thread, then runs
    // the cleanup hook.
    void close();

private:
    void drainLoop();

    std::string device_id_;
    std::string remote_path_;
    int pid_;
    std::chrono::steady_clock::time_point started_at_;
    std::unique_ptr<Connection> conn_;

    std::atomic<State> state_{State::Recording};
    std::mutex mutex_;
    std::condition_variable done_cv_;
    bool drained_ = false;
    std::optional<AdbError> drain_error_;
    std::string output_tail_;
    std::thread drain_thread_;
    std::function<void()> cleanup_;
};

class ScreenStreamSession {
public:
    ScreenStreamSession(std::string device_id, std::unique_ptr<Connection> conn);
    ~ScreenStreamSession();

    ScreenStreamSession(const ScreenStreamSession&) = delete;
    ScreenStreamSession& operator=(const ScreenStreamSession&) = delete;

    const std::string& deviceId() const { return device_id_; }
    std::chrono::steady_clock::time_point startedAt() const { return started_at_; }

    // Next chunk of H.264 elementary stream; nullopt when the stream ends.
    AdbResult<std::optional<std::vector<uint8_t>>> readChunk(size_t max_length = Connection::kBufferSize);

    uint64_t bytesReceived() const { return bytes_received_.load(); }

    // Unblocks readChunk() from any thread.
    void close();
    bool isClosed() const { return conn_->isClosed(); }

private:
    std::string device_id_;
    std::chrono::steady_clock::time_point started_at_;
    std::unique_ptr<Connection> conn_;
    std::atomic<uint64_t> bytes_received_{0};
};

} // namespace snapadb
