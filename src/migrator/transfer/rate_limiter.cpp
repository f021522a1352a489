#include "migrator/transfer/rate_limiter.h"

#include <algorithm>
#include <thread>

namespace migrator {
namespace transfer {

RateLimiter::RateLimiter(uint64_t bytes_per_second)
    : rate_(bytes_per_second),
      tokens_(static_cast<double>(bytes_per_second)),
      last_refill_(Clock::now()) {}

void RateLimiter::refill(Clock::time_point now) {
    double elapsed = std::chrono::duration<double>(now - last_refill_).count();
    if (elapsed > 0) {
        tokens_ = std::min(static_cast<double>(rate_), tokens_ + elapsed * static_cast<double>(rate_));
        last_refill_ = now;
    }
}

bool RateLimiter::acquire(uint64_t bytes, core::CancellationToken* cancel) {
    if (rate_ == 0 || bytes == 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        total_acquired_ += bytes;
        return true;
    }

    uint64_t remaining = bytes;
    while (remaining > 0) {
        if (cancel && cancel->isCancelled()) {
            return false;
        }

        const uint64_t slice = std::min(remaining, rate_);
        std::chrono::microseconds wait{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            refill(Clock::now());
            if (tokens_ >= static_cast<double>(slice)) {
                tokens_ -= static_cast<double>(slice);
                total_acquired_ += slice;
                remaining -= slice;
                continue;
            }
            double deficit = static_cast<double>(slice) - tokens_;
            wait = std::chrono::microseconds(
                static_cast<int64_t>(deficit * 1e6 / static_cast<double>(rate_)) + 1);
        }

        if (cancel) {
            if (cancel->waitFor(wait)) {
                return false;
            }
        } else {
            std::this_thread::sleep_for(wait);
        }
    }
    return true;
}

uint64_t RateLimiter::totalAcquired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_acquired_;
}

} // namespace transfer
} // namespace migrator
