// =============================================================================
// SnapADB - Device Tracker
// =============================================================================
// Turns the raw track-devices stream into an enriched device list that any
// number of subscribers can follow.
//
//   Idle -> Connecting -> Streaming -> (stream ends / fails) -> Idle
//                                      wait reconnect_delay, loop again
//
// The loop runs on its own thread while at least one subscriber exists.
// Each newly seen serial gets one concurrent getprop lookup; the result is
// memoized for the lifetime of the tracker (failed lookups included).
// Subscribers receive the latest list immediately, then every change.
//
// Usage:
//   DeviceTracker tracker(DeviceTracker::Backend::fromClient(client));
//   auto sub = tracker.subscribe();
//   while (auto devices = sub.next()) { ... }
// =============================================================================
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "adb_output_parsers.hpp"
#include "cancellation.hpp"
#include "result.hpp"
#include "track_devices.hpp"

namespace snapadb {

class AdbClient;

// Enrichment fields are individually absent when the device did not report them.
struct DeviceInfo {
    std::optional<std::string> model;
    std::optional<std::string> android_version;
    std::optional<std::string> vendor_model;
    std::optional<std::string> manufacturer;
    std::optional<std::string> avd_name;

    bool operator==(const DeviceInfo& o) const {
        return model == o.model && android_version == o.android_version &&
               vendor_model == o.vendor_model && manufacturer == o.manufacturer &&
               avd_name == o.avd_name;
    }
};

struct Device {
    std::string id;          // serial
    std::string state;       // "device", "emulator", ...
    DeviceInfo info;

    // AVD name, vendor model, model, then "Unknown Model".
    std::string displayTitle() const;

    bool operator==(const Device& o) const { return id == o.id && state == o.state && info == o.info; }
    bool operator!=(const Device& o) const { return !(*this == o); }
};

using DeviceList = std::vector<Device>;

// Resolves enrichment from a `getprop` dump (keys under "ro.").
// `model_hint` comes from the device-list row and wins over ro.product.model.
DeviceInfo resolveDeviceInfo(const parse::PropertyMap& props, const std::optional<std::string>& model_hint);

class DeviceTracker {
public:
    enum class State { Idle, Connecting, Streaming };

    // Everything the tracker needs from the ADB layer.
    struct Backend {
        std::function<AdbResult<std::unique_ptr<TrackDevicesSubscription>>(const CancellationToken&)> track;
        std::function<AdbResult<parse::PropertyMap>(const std::string& serial)> properties;

        static Backend fromClient(AdbClient& client);
    };

    struct Queue;

    // RAII subscription. Dropping it unsubscribes; the last one to go stops
    // the tracking loop. Must not outlive its tracker.
    class Subscription {
    public:
        Subscription() = default;
        ~Subscription() { unsubscribe(); }

        Subscription(Subscription&& o) noexcept;
        Subscription& operator=(Subscription&& o) noexcept;
        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        // Blocks until the next list. nullopt once unsubscribed or the
        // tracker is destroyed.
        std::optional<DeviceList> next();

        // Like next() but gives up after `timeout`.
        std::optional<DeviceList> nextFor(std::chrono::milliseconds timeout);

        void unsubscribe();
        bool active() const { return static_cast<bool>(queue_); }

    private:
        friend class DeviceTracker;
        Subscription(std::shared_ptr<Queue> queue, std::function<void()> unsub)
            : queue_(std::move(queue)), unsub_(std::move(unsub)) {}

        std::shared_ptr<Queue> queue_;
        std::function<void()> unsub_;
    };

    explicit DeviceTracker(Backend backend,
                           std::chrono::milliseconds reconnect_delay = std::chrono::milliseconds(300));
    ~DeviceTracker();

    DeviceTracker(const DeviceTracker&) = delete;
    DeviceTracker& operator=(const DeviceTracker&) = delete;

    Subscription subscribe();

    std::optional<DeviceList> latest() const;
    State state() const { return state_.load(); }
    size_t subscriberCount() const;
    bool isRunning() const;

private:
    void removeSubscriber(uint64_t id);
    void startLoopLocked();
    std::thread stopLoopLocked();

    void trackLoop(uint64_t generation, CancellationToken token);
    DeviceList buildDevices(const std::string& snapshot, const CancellationToken& token);
    void broadcast(uint64_t generation, DeviceList devices);
    void setState(uint64_t generation, State s);
    bool waitReconnectDelay(const CancellationToken& token);

    Backend backend_;
    std::chrono::milliseconds reconnect_delay_;

    mutable std::mutex mutex_;
    std::map<uint64_t, std::shared_ptr<Queue>> subscribers_;
    uint64_t next_subscriber_id_ = 1;
    std::optional<DeviceList> latest_;
    uint64_t generation_ = 0;
    std::optional<CancellationToken> loop_token_;
    std::thread loop_thread_;
    std::atomic<State> state_{State::Idle};

    // Enrichment memo, written only by the tracking loop.
    std::mutex cache_mutex_;
    std::map<std::string, DeviceInfo> info_cache_;
};

} // namespace snapadb
