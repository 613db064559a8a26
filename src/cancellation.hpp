// =============================================================================
// SnapADB - Cancellation Token
// =============================================================================
// Caller-driven cancellation threaded through every blocking ADB call.
// Copies share state. Blocking loops poll isCancelled() between chunks;
// onCancel() callbacks tear down the resource a thread is blocked on
// (typically a socket shutdown so recv() returns).
// =============================================================================
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace snapadb {

class CancellationToken;

// RAII handle for an onCancel() callback; destroying it deregisters.
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    explicit CancellationRegistration(std::function<void()> unregister)
        : unregister_(std::move(unregister)) {}
    ~CancellationRegistration() { reset(); }

    CancellationRegistration(CancellationRegistration&& o) noexcept
        : unregister_(std::move(o.unregister_)) { o.unregister_ = nullptr; }
    CancellationRegistration& operator=(CancellationRegistration&& o) noexcept {
        if (this != &o) {
            reset();
            unregister_ = std::move(o.unregister_);
            o.unregister_ = nullptr;
        }
        return *this;
    }
    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

    void reset() {
        if (unregister_) {
            auto fn = std::move(unregister_);
            unregister_ = nullptr;
            fn();
        }
    }

private:
    std::function<void()> unregister_;
};

class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    // A token that is never cancelled by anyone else.
    static CancellationToken none() { return CancellationToken(); }

    bool isCancelled() const { return state_->cancelled.load(std::memory_order_acquire); }

    // Idempotent. Runs registered callbacks once, on the cancelling thread.
    // Callbacks run one at a time; deregistering a running callback from
    // another thread waits for it to return.
    void cancel() {
        std::unique_lock<std::mutex> lock(state_->mutex);
        if (state_->cancelled.exchange(true)) return;
        while (!state_->callbacks.empty()) {
            auto it = state_->callbacks.begin();
            uint64_t id = it->first;
            std::function<void()> cb = std::move(it->second);
            state_->callbacks.erase(it);
            state_->executing = id;
            state_->executing_thread = std::this_thread::get_id();
            lock.unlock();
            cb();
            lock.lock();
            state_->executing = 0;
            state_->executing_thread = std::thread::id();
            state_->callback_done.notify_all();
        }
    }

    // Runs `cb` immediately if already cancelled.
    CancellationRegistration onCancel(std::function<void()> cb) {
        uint64_t id = 0;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->cancelled.load()) {
                id = state_->next_id++;
                state_->callbacks.emplace(id, std::move(cb));
            }
        }
        if (id == 0) {
            cb();
            return CancellationRegistration();
        }
        std::weak_ptr<State> weak = state_;
        return CancellationRegistration([weak, id]() {
            if (auto s = weak.lock()) {
                std::unique_lock<std::mutex> lock(s->mutex);
                if (s->callbacks.erase(id) != 0) return;
                // Running from inside its own callback: waiting would deadlock.
                if (s->executing_thread == std::this_thread::get_id()) return;
                s->callback_done.wait(lock, [&]() { return s->executing != id; });
            }
        });
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::map<uint64_t, std::function<void()>> callbacks;
        uint64_t next_id = 1;
        uint64_t executing = 0;
        std::thread::id executing_thread;
        std::condition_variable callback_done;
    };
    std::shared_ptr<State> state_;
};

} // namespace snapadb
