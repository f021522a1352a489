#include "migrator/transfer/retry_policy.h"

#include <algorithm>
#include <cmath>

namespace migrator {
namespace transfer {

std::chrono::milliseconds RetryPolicy::delayFor(uint32_t retry_index) const {
    double delay = static_cast<double>(config_.base_delay.count()) *
                   std::pow(config_.multiplier, static_cast<double>(retry_index));
    double cap = static_cast<double>(config_.max_delay.count());
    return std::chrono::milliseconds(static_cast<int64_t>(std::min(delay, cap)));
}

bool RetryPolicy::shouldRetry(const FileTask& task, core::ErrorKind kind) const {
    if (!core::IsRetryable(kind)) {
        return false;
    }
    // A ceiling of 0 still allows the first attempt and nothing more.
    return task.attempt_count < std::max<uint32_t>(task.max_retries, 1);
}

} // namespace transfer
} // namespace migrator
