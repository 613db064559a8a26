#include "device_tracker.hpp"
#include "adb_client.hpp"
#include "snapadb_log.hpp"

#include <algorithm>
#include <future>

namespace snapadb {

namespace {

constexpr size_t kMaxQueuedLists = 64;

std::optional<std::string> cleanProp(const parse::PropertyMap& props, const char* key) {
    auto it = props.find(key);
    if (it == props.end()) return std::nullopt;
    std::string value = parse::trim(it->second);
    if (value.empty()) return std::nullopt;
    return value;
}

std::string underscoresToSpaces(std::string s) {
    std::replace(s.begin(), s.end(), '_', ' ');
    return s;
}

std::optional<std::string> modelHint(const parse::DeviceRow& row) {
    auto it = row.fields.find("model");
    if (it == row.fields.end()) return std::nullopt;
    std::string hint = parse::trim(underscoresToSpaces(it->second));
    if (hint.empty()) return std::nullopt;
    return hint;
}

} // anonymous namespace

// =============================================================================
// Device
// =============================================================================

std::string Device::displayTitle() const {
    if (info.avd_name) return *info.avd_name;
    if (info.vendor_model) return *info.vendor_model;
    if (info.model) return *info.model;
    return "Unknown Model";
}

DeviceInfo resolveDeviceInfo(const parse::PropertyMap& props, const std::optional<std::string>& model_hint) {
    DeviceInfo info;
    info.model = model_hint ? model_hint : cleanProp(props, "ro.product.model");
    info.android_version = cleanProp(props, "ro.build.version.release");
    info.vendor_model = cleanProp(props, "ro.product.vendor.model");
    info.manufacturer = cleanProp(props, "ro.product.vendor.manufacturer");
    if (!info.manufacturer) info.manufacturer = cleanProp(props, "ro.product.manufacturer");
    if (auto avd = cleanProp(props, "ro.boot.qemu.avd_name")) {
        info.avd_name = underscoresToSpaces(*avd);
    }
    return info;
}

DeviceTracker::Backend DeviceTracker::Backend::fromClient(AdbClient& client) {
    Backend backend;
    backend.track = [&client](const CancellationToken& token) { return client.trackDevices(token); };
    backend.properties = [&client](const std::string& serial) { return client.getProperties(serial, "ro."); };
    return backend;
}

// =============================================================================
// Subscriber queue
// =============================================================================

struct DeviceTracker::Queue {
    std::mutex m;
    std::condition_variable cv;
    std::deque<DeviceList> items;
    bool closed = false;

    void push(const DeviceList& devices) {
        {
            std::lock_guard<std::mutex> lock(m);
            if (closed) return;
            if (items.size() >= kMaxQueuedLists) items.pop_front();  // slow reader: keep newest
            items.push_back(devices);
        }
        cv.notify_one();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(m);
            closed = true;
        }
        cv.notify_all();
    }
};

DeviceTracker::Subscription::Subscription(Subscription&& o) noexcept
    : queue_(std::move(o.queue_)), unsub_(std::move(o.unsub_)) {
    o.queue_.reset();
    o.unsub_ = nullptr;
}

DeviceTracker::Subscription& DeviceTracker::Subscription::operator=(Subscription&& o) noexcept {
    if (this != &o) {
        unsubscribe();
        queue_ = std::move(o.queue_);
        unsub_ = std::move(o.unsub_);
        o.queue_.reset();
        o.unsub_ = nullptr;
    }
    return *this;
}

std::optional<DeviceList> DeviceTracker::Subscription::next() {
    if (!queue_) return std::nullopt;
    std::unique_lock<std::mutex> lock(queue_->m);
    queue_->cv.wait(lock, [this] { return queue_->closed || !queue_->items.empty(); });
    if (queue_->items.empty()) return std::nullopt;
    DeviceList devices = std::move(queue_->items.front());
    queue_->items.pop_front();
    return devices;
}

std::optional<DeviceList> DeviceTracker::Subscription::nextFor(std::chrono::milliseconds timeout) {
    if (!queue_) return std::nullopt;
    std::unique_lock<std::mutex> lock(queue_->m);
    queue_->cv.wait_for(lock, timeout, [this] { return queue_->closed || !queue_->items.empty(); });
    if (queue_->items.empty()) return std::nullopt;
    DeviceList devices = std::move(queue_->items.front());
    queue_->items.pop_front();
    return devices;
}

void DeviceTracker::Subscription::unsubscribe() {
    if (!queue_) return;
    auto queue = std::move(queue_);
    auto unsub = std::move(unsub_);
    queue_.reset();
    unsub_ = nullptr;
    queue->close();
    if (unsub) unsub();
}

// =============================================================================
// DeviceTracker
// =============================================================================

DeviceTracker::DeviceTracker(Backend backend, std::chrono::milliseconds reconnect_delay)
    : backend_(std::move(backend)), reconnect_delay_(reconnect_delay) {}

DeviceTracker::~DeviceTracker() {
    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& kv : subscribers_) kv.second->close();
        subscribers_.clear();
        finished = stopLoopLocked();
    }
    if (finished.joinable()) finished.join();
}

DeviceTracker::Subscription DeviceTracker::subscribe() {
    auto queue = std::make_shared<Queue>();
    uint64_t id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_subscriber_id_++;
        if (latest_) queue->push(*latest_);
        subscribers_[id] = queue;
        SLOG_DEBUG("tracker", "subscriber %llu added (%zu total)", (unsigned long long)id, subscribers_.size());
        if (subscribers_.size() == 1) startLoopLocked();
    }
    return Subscription(queue, [this, id]() { removeSubscriber(id); });
}

void DeviceTracker::removeSubscriber(uint64_t id) {
    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (subscribers_.erase(id) == 0) return;
        SLOG_DEBUG("tracker", "subscriber %llu removed (%zu left)", (unsigned long long)id, subscribers_.size());
        if (subscribers_.empty()) finished = stopLoopLocked();
    }
    if (finished.joinable()) finished.join();
}

std::optional<DeviceList> DeviceTracker::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
}

size_t DeviceTracker::subscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

bool DeviceTracker::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loop_token_.has_value();
}

void DeviceTracker::startLoopLocked() {
    ++generation_;
    CancellationToken token;
    loop_token_ = token;
    SLOG_INFO("tracker", "tracking started");
    loop_thread_ = std::thread(&DeviceTracker::trackLoop, this, generation_, token);
}

std::thread DeviceTracker::stopLoopLocked() {
    if (!loop_token_) return std::thread();
    ++generation_;
    loop_token_->cancel();
    loop_token_.reset();
    state_ = State::Idle;
    SLOG_INFO("tracker", "tracking stopped");
    return std::move(loop_thread_);
}

void DeviceTracker::setState(uint64_t generation, State s) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation == generation_) state_ = s;
}

bool DeviceTracker::waitReconnectDelay(const CancellationToken& token) {
    struct Waiter {
        std::mutex m;
        std::condition_variable cv;
    };
    auto waiter = std::make_shared<Waiter>();
    CancellationToken watched = token;
    auto registration = watched.onCancel([waiter]() {
        std::lock_guard<std::mutex> lock(waiter->m);
        waiter->cv.notify_all();
    });
    std::unique_lock<std::mutex> lock(waiter->m);
    waiter->cv.wait_for(lock, reconnect_delay_, [&]() { return watched.isCancelled(); });
    return !watched.isCancelled();
}

// =============================================================================
// Tracking loop
// =============================================================================

void DeviceTracker::trackLoop(uint64_t generation, CancellationToken token) {
    while (!token.isCancelled()) {
        setState(generation, State::Connecting);
        auto opened = backend_.track(token);
        if (opened.is_ok()) {
            std::unique_ptr<TrackDevicesSubscription> stream = std::move(opened).value();
            setState(generation, State::Streaming);

            while (!token.isCancelled()) {
                auto snapshot = stream->next();
                if (snapshot.is_err()) {
                    if (!snapshot.error().is(AdbError::Kind::Cancelled)) {
                        SLOG_WARN("tracker", "track-devices stream failed [%s]: %s",
                                  kindName(snapshot.error().kind), snapshot.error().message.c_str());
                    }
                    break;
                }
                if (!snapshot.value()) {
                    SLOG_INFO("tracker", "track-devices stream closed");
                    break;
                }
                DeviceList devices = buildDevices(*snapshot.value(), token);
                if (token.isCancelled()) break;
                broadcast(generation, std::move(devices));
            }
        } else if (!opened.error().is(AdbError::Kind::Cancelled)) {
            SLOG_WARN("tracker", "cannot start track-devices [%s]: %s",
                      kindName(opened.error().kind), opened.error().message.c_str());
        }

        if (token.isCancelled()) break;

        // Devices can't be vouched for while disconnected.
        bool had_devices = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            had_devices = latest_.has_value() && !latest_->empty();
        }
        if (had_devices) broadcast(generation, DeviceList{});

        setState(generation, State::Idle);
        if (!waitReconnectDelay(token)) break;
    }
}

DeviceList DeviceTracker::buildDevices(const std::string& snapshot, const CancellationToken& token) {
    auto rows = parse::parseDeviceList(snapshot);

    std::map<std::string, DeviceInfo> known;
    std::vector<std::string> missing;
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        for (const auto& row : rows) {
            auto it = info_cache_.find(row.serial);
            if (it != info_cache_.end()) known[row.serial] = it->second;
            else missing.push_back(row.serial);
        }
    }

    if (!missing.empty() && !token.isCancelled()) {
        std::vector<std::pair<std::string, std::future<DeviceInfo>>> lookups;
        lookups.reserve(missing.size());
        for (const auto& serial : missing) {
            lookups.emplace_back(serial, std::async(std::launch::async, [this, serial]() {
                auto props = backend_.properties(serial);
                if (props.is_err()) {
                    SLOG_WARN("tracker", "[%s] property lookup failed: %s", serial.c_str(),
                              props.error().message.c_str());
                    return resolveDeviceInfo({}, std::nullopt);
                }
                return resolveDeviceInfo(props.value(), std::nullopt);
            }));
        }

        std::lock_guard<std::mutex> lock(cache_mutex_);
        for (auto& lookup : lookups) {
            DeviceInfo info = lookup.second.get();
            info_cache_[lookup.first] = info;
            known[lookup.first] = std::move(info);
            SLOG_DEBUG("tracker", "[%s] enriched", lookup.first.c_str());
        }
    }

    DeviceList devices;
    devices.reserve(rows.size());
    for (const auto& row : rows) {
        Device device;
        device.id = row.serial;
        device.state = row.state;
        auto it = known.find(row.serial);
        if (it != known.end()) device.info = it->second;
        if (auto hint = modelHint(row)) device.info.model = hint;
        devices.push_back(std::move(device));
    }
    return devices;
}

void DeviceTracker::broadcast(uint64_t generation, DeviceList devices) {
    std::vector<std::shared_ptr<Queue>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) return;
        if (latest_ && *latest_ == devices) return;
        latest_ = devices;
        for (auto& kv : subscribers_) targets.push_back(kv.second);
    }
    SLOG_DEBUG("tracker", "%zu device(s) -> %zu subscriber(s)", devices.size(), targets.size());
    for (auto& q : targets) q->push(devices);
}

} // namespace snapadb
