#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace migrator {
namespace core {

/**
 * @brief Cooperative cancellation flag shared between a controller and
 * the threads it may interrupt.
 *
 * Every suspension point (backoff, rate limiter, validation windows,
 * polling loops) sleeps through waitFor() so that cancel() wakes it.
 */
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(false);
    }

    bool isCancelled() const { return cancelled_.load(); }

    // Sleeps up to `timeout`. Returns true if cancelled.
    template<typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace core
} // namespace migrator
