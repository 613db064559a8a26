#include "screen_sessions.hpp"
#include "adb_output_parsers.hpp"
#include "snapadb_log.hpp"

namespace snapadb {

namespace {
// Enough to hold screenrecord's error text and the exit trailer.
constexpr size_t kMaxOutputTail = 8 * 1024;
}

// =============================================================================
// RecordingSession
// =============================================================================

RecordingSession::RecordingSession(std::string device_id, std::string remote_path, int pid,
                                   std::unique_ptr<Connection> conn)
    : device_id_(std::move(device_id)),
      remote_path_(std::move(remote_path)),
      pid_(pid),
      started_at_(std::chrono::steady_clock::now()),
      conn_(std::move(conn)) {
    drain_thread_ = std::thread(&RecordingSession::drainLoop, this);
}

RecordingSession::~RecordingSession() {
    close();
}

void RecordingSession::drainLoop() {
    std::string tail;
    std::optional<AdbError> error;
    while (true) {
        auto chunk = conn_->readChunk(4096);
        if (chunk.is_err()) {
            error = chunk.error();
            break;
        }
        if (!chunk.value()) break;
        const auto& bytes = *chunk.value();
        tail.append(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        if (tail.size() > kMaxOutputTail) tail.erase(0, tail.size() - kMaxOutputTail);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        output_tail_ = std::move(tail);
        drain_error_ = std::move(error);
        drained_ = true;
    }
    State expected = State::Recording;
    if (!state_.compare_exchange_strong(expected, State::Stopped)) {
        expected = State::Stopping;
        state_.compare_exchange_strong(expected, State::Stopped);
    }
    done_cv_.notify_all();
    SLOG_DEBUG("recording", "[%s] remote screenrecord (pid %d) ended", device_id_.c_str(), pid_);
}

void RecordingSession::markStopping() {
    State expected = State::Recording;
    state_.compare_exchange_strong(expected, State::Stopping);
}

AdbResult<void> RecordingSession::waitUntilStopped() {
    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait(lock, [this] { return drained_; });

    if (drain_error_) {
        // closed locally before the remote side finished
        if (drain_error_->is(AdbError::Kind::Cancelled)) return *drain_error_;
        SLOG_WARN("recording", "[%s] output drain failed: %s", device_id_.c_str(),
                  drain_error_->message.c_str());
        return *drain_error_;
    }

    auto status = parse::parseExitTrailer(output_tail_);
    if (!status) {
        SLOG_DEBUG("recording", "[%s] no exit status reported, treating as stopped", device_id_.c_str());
    }
    return parse::classifyRecordingExit(status, output_tail_);
}

void RecordingSession::close() {
    if (state_.exchange(State::Closed) == State::Closed) return;
    conn_->close();
    if (drain_thread_.joinable()) drain_thread_.join();
    auto cleanup = std::move(cleanup_);
    cleanup_ = nullptr;
    if (cleanup) cleanup();
}

// =============================================================================
// ScreenStreamSession
// =============================================================================

ScreenStreamSession::ScreenStreamSession(std::string device_id, std::unique_ptr<Connection> conn)
    : device_id_(std::move(device_id)),
      started_at_(std::chrono::steady_clock::now()),
      conn_(std::move(conn)) {}

ScreenStreamSession::~ScreenStreamSession() {
    close();
}

AdbResult<std::optional<std::vector<uint8_t>>> ScreenStreamSession::readChunk(size_t max_length) {
    auto chunk = SNAPADB_TRY(conn_->readChunk(max_length));
    if (chunk) bytes_received_.fetch_add(chunk->size());
    return std::move(chunk);
}

void ScreenStreamSession::close() {
    if (conn_->isClosed()) return;
    SLOG_DEBUG("stream", "[%s] closing stream after %llu bytes", device_id_.c_str(),
               (unsigned long long)bytes_received_.load());
    conn_->close();
}

} // namespace snapadb
