// =============================================================================
// SnapADB - Server Restart Coordinator
// =============================================================================
// Serializes `adb start-server` launches across the process. The first caller
// to need a restart publishes a shared future and runs the launch; everyone
// else who arrives meanwhile waits on that same future. The slot is cleared
// once the attempt resolves, so a later failure can start a fresh attempt.
// =============================================================================
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include "cancellation.hpp"
#include "result.hpp"

namespace snapadb {

class ServerRestartCoordinator {
public:
    // Runs `<path> start-server` and waits for it to exit.
    using Launcher = std::function<AdbResult<void>(const std::string& path)>;

    // Process-wide instance using the real adb launcher.
    static ServerRestartCoordinator& instance();

    explicit ServerRestartCoordinator(Launcher launcher = {},
                                      std::chrono::milliseconds grace = std::chrono::milliseconds(100));

    ServerRestartCoordinator(const ServerRestartCoordinator&) = delete;
    ServerRestartCoordinator& operator=(const ServerRestartCoordinator&) = delete;

    // Joins an in-flight attempt or starts one. Launch failures reach every
    // waiter of that attempt.
    AdbResult<void> startServer(const std::string& adb_path);

    // Returns at once when idle; otherwise blocks until the in-flight attempt
    // resolves, whatever its outcome. Cancelled if `token` fires first.
    AdbResult<void> waitForOngoingRestart(const CancellationToken& token = CancellationToken::none());

    bool restartInFlight() const;

    // Number of launches actually performed.
    uint64_t launchCount() const { return launches_.load(); }

    void setGracePeriod(std::chrono::milliseconds grace);

    // `<path> start-server` through runProcess. Non-zero exit -> NonZeroExit.
    static AdbResult<void> launchAdbServer(const std::string& adb_path);

private:
    using Attempt = std::shared_future<AdbResult<void>>;

    mutable std::mutex mutex_;
    std::optional<Attempt> in_flight_;
    Launcher launcher_;
    std::chrono::milliseconds grace_;
    std::atomic<uint64_t> launches_{0};
};

} // namespace snapadb
