// =============================================================================
// SnapADB - Track-Devices Subscription
// =============================================================================
// Holds one connection open on host:track-devices-l and turns its byte
// stream into normalized device-list snapshots. Framing is detected from the
// first four bytes and fixed for the connection's lifetime.
// =============================================================================
#pragma once

#include <memory>
#include <optional>
#include <string>
#include "adb_connection.hpp"
#include "adb_protocol.hpp"
#include "result.hpp"

namespace snapadb {

class TrackDevicesSubscription {
public:
    // `conn` must already have sent the track-devices request.
    explicit TrackDevicesSubscription(std::unique_ptr<Connection> conn);
    ~TrackDevicesSubscription();

    TrackDevicesSubscription(const TrackDevicesSubscription&) = delete;
    TrackDevicesSubscription& operator=(const TrackDevicesSubscription&) = delete;

    // Blocks for the next snapshot ("List of devices attached\n...\n").
    // nullopt when the server closes the stream.
    AdbResult<std::optional<std::string>> next();

    // Unblocks a pending next() from any thread.
    void cancel();

    protocol::TrackDevicesFramer::Mode mode() const { return framer_.mode(); }

private:
    std::unique_ptr<Connection> conn_;
    protocol::TrackDevicesFramer framer_;
    bool finished_ = false;
};

} // namespace snapadb
