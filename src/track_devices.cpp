#include "track_devices.hpp"
#include "adb_output_parsers.hpp"
#include "snapadb_log.hpp"

namespace snapadb {

namespace {

AdbResult<std::optional<std::string>> snapshotText(const std::string& raw) {
    if (!parse::isValidUtf8(raw)) return AdbError::parseFailure("non-utf8 track-devices snapshot");
    return std::optional<std::string>(protocol::normalizeSnapshot(raw));
}

} // anonymous namespace

TrackDevicesSubscription::TrackDevicesSubscription(std::unique_ptr<Connection> conn)
    : conn_(std::move(conn)) {}

TrackDevicesSubscription::~TrackDevicesSubscription() {
    cancel();
}

void TrackDevicesSubscription::cancel() {
    if (conn_) conn_->close();
}

AdbResult<std::optional<std::string>> TrackDevicesSubscription::next() {
    if (finished_) return std::optional<std::string>{};

    while (true) {
        auto ready = SNAPADB_TRY(framer_.next());
        if (ready) return snapshotText(*ready);

        auto chunk = SNAPADB_TRY(conn_->readChunk(Connection::kBufferSize));
        if (!chunk) {
            finished_ = true;
            auto tail = SNAPADB_TRY(framer_.finish());
            SLOG_DEBUG("adb-conn", "track-devices stream closed by server");
            if (tail) return snapshotText(*tail);
            return std::optional<std::string>{};
        }
        framer_.feed(reinterpret_cast<const char*>(chunk->data()), chunk->size());
    }
}

} // namespace snapadb
