#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

#include "migrator/core/cancellation.h"

namespace migrator {
namespace transfer {

/**
 * @brief Token bucket shared by all transfer workers.
 *
 * Capacity equals the configured rate (one second of burst) and the
 * bucket starts full. A request larger than the capacity is granted in
 * capacity-sized slices. A rate of 0 disables limiting.
 */
class RateLimiter {
public:
    explicit RateLimiter(uint64_t bytes_per_second);

    // Blocks until `bytes` tokens were taken. Returns false if the token
    // was cancelled first; tokens already taken for earlier slices are not
    // returned.
    bool acquire(uint64_t bytes, core::CancellationToken* cancel = nullptr);

    uint64_t rate() const { return rate_; }
    uint64_t capacity() const { return rate_; }
    uint64_t totalAcquired() const;

private:
    using Clock = std::chrono::steady_clock;

    // Caller holds mutex_.
    void refill(Clock::time_point now);

    const uint64_t rate_;
    mutable std::mutex mutex_;
    double tokens_;
    Clock::time_point last_refill_;
    uint64_t total_acquired_ = 0;
};

} // namespace transfer
} // namespace migrator
