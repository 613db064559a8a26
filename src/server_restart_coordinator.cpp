#include "server_restart_coordinator.hpp"
#include "process_runner.hpp"
#include "snapadb_log.hpp"

#include <sys/stat.h>
#include <thread>

namespace snapadb {

ServerRestartCoordinator& ServerRestartCoordinator::instance() {
    static ServerRestartCoordinator coordinator;
    return coordinator;
}

ServerRestartCoordinator::ServerRestartCoordinator(Launcher launcher, std::chrono::milliseconds grace)
    : launcher_(launcher ? std::move(launcher) : Launcher(&ServerRestartCoordinator::launchAdbServer)),
      grace_(grace) {}

void ServerRestartCoordinator::setGracePeriod(std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> lock(mutex_);
    grace_ = grace;
}

bool ServerRestartCoordinator::restartInFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.has_value();
}

namespace {
constexpr auto kWaitPollInterval = std::chrono::milliseconds(20);
}

AdbResult<void> ServerRestartCoordinator::waitForOngoingRestart(const CancellationToken& token) {
    std::optional<Attempt> attempt;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        attempt = in_flight_;
    }
    if (!attempt) return {};
    while (attempt->wait_for(kWaitPollInterval) != std::future_status::ready) {
        if (token.isCancelled()) return AdbError::cancelled();
    }
    return {};
}

AdbResult<void> ServerRestartCoordinator::startServer(const std::string& adb_path) {
    std::promise<AdbResult<void>> promise;
    std::chrono::milliseconds grace;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (in_flight_) {
            Attempt attempt = *in_flight_;
            lock.unlock();
            SLOG_DEBUG("adb-server", "restart already in flight, waiting");
            return attempt.get();
        }
        in_flight_ = promise.get_future().share();
        grace = grace_;
    }

    AdbResult<void> result;
    struct stat st;
    if (adb_path.empty() || ::stat(adb_path.c_str(), &st) != 0) {
        result = AdbError::adbNotFound("adb binary not found at '" + adb_path + "'");
    } else {
        launches_.fetch_add(1);
        SLOG_INFO("adb-server", "starting adb server: %s start-server", adb_path.c_str());
        result = launcher_(adb_path);
        if (result.is_ok()) {
            if (grace.count() > 0) std::this_thread::sleep_for(grace);
            SLOG_INFO("adb-server", "adb server started");
        } else {
            SLOG_ERROR("adb-server", "start-server failed [%s]: %s",
                       kindName(result.error().kind), result.error().message.c_str());
        }
    }

    // Result first, then reopen the slot.
    promise.set_value(result);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_.reset();
    }
    return result;
}

AdbResult<void> ServerRestartCoordinator::launchAdbServer(const std::string& adb_path) {
    ProcessResult proc = SNAPADB_TRY(runProcess(adb_path, {"start-server"}));
    if (!proc.succeeded()) {
        return AdbError::nonZeroExit(proc.exit_code, proc.stderr_text);
    }
    return {};
}

} // namespace snapadb
