#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace chartagent {
namespace core {

/**
 * ITimer - one periodic timer driving the agent loop
 */
class ITimer {
public:
    using Callback = std::function<void()>;

    virtual ~ITimer() = default;

    // Replaces any previous arming
    virtual void arm(uint32_t interval_ms, Callback callback) = 0;

    // Never blocks on an in-flight callback; safe to call from inside one
    virtual void cancel() = 0;

    virtual bool is_armed() const = 0;

    // Block until the callback thread (if any) has exited. Call after
    // cancel(). From inside the callback it returns without blocking.
    virtual void wait() {}
};

/**
 * ThreadTimer - fires the callback on a dedicated thread every interval
 *
 * The callback runs with no lock held. A callback that outlasts the
 * interval delays the next fire; ticks are never queued.
 */
class ThreadTimer : public ITimer {
public:
    ThreadTimer() = default;

    ~ThreadTimer() override {
        cancel();
        join_worker();
    }

    ThreadTimer(const ThreadTimer&) = delete;
    ThreadTimer& operator=(const ThreadTimer&) = delete;

    void arm(uint32_t interval_ms, Callback callback) override {
        cancel();
        join_worker();

        uint64_t generation;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            armed_ = true;
            generation = ++generation_;
        }
        worker_ = std::thread(
            [this, interval_ms, generation, cb = std::move(callback)]() { run(interval_ms, generation, cb); });
    }

    void cancel() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            armed_ = false;
        }
        cv_.notify_all();
    }

    bool is_armed() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return armed_;
    }

    void wait() override { join_worker(); }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool armed_ = false;
    uint64_t generation_ = 0; // A worker exits once re-arming bumps this
    std::thread worker_;

    void run(uint32_t interval_ms, uint64_t generation, const Callback& callback) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto stale = [this, generation] { return !armed_ || generation_ != generation; };
        while (!stale()) {
            if (cv_.wait_for(lock, std::chrono::milliseconds(interval_ms), stale)) {
                break;
            }
            lock.unlock();
            callback();
            lock.lock();
        }
    }

    void join_worker() {
        if (!worker_.joinable()) return;
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach(); // Cancelled from its own callback
        } else {
            worker_.join();
        }
    }
};

/**
 * ManualTimer - fires only when told to; for tests and single-shot runs
 */
class ManualTimer : public ITimer {
public:
    void arm(uint32_t interval_ms, Callback callback) override {
        interval_ms_ = interval_ms;
        callback_ = std::move(callback);
        armed_ = true;
        ++arm_count_;
    }

    void cancel() override { armed_ = false; }

    bool is_armed() const override { return armed_; }

    // Simulate one interval elapsing; no-op when not armed
    bool fire() {
        if (!armed_ || !callback_) return false;
        auto cb = callback_;
        cb();
        return true;
    }

    uint32_t interval_ms() const { return interval_ms_; }
    int arm_count() const { return arm_count_; }

private:
    Callback callback_;
    uint32_t interval_ms_ = 0;
    bool armed_ = false;
    int arm_count_ = 0;
};

} // namespace core
} // namespace chartagent
