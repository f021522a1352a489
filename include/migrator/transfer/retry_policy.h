#pragma once

#include <chrono>
#include <cstdint>

#include "migrator/core/config.h"
#include "migrator/core/error.h"
#include "migrator/transfer/file_task.h"

namespace migrator {
namespace transfer {

/**
 * @brief Exponential backoff with a cap, gated by the error taxonomy.
 */
class RetryPolicy {
public:
    explicit RetryPolicy(const core::RetryConfig& config) : config_(config) {}

    // Delay before retry number `retry_index` (0 for the first retry).
    std::chrono::milliseconds delayFor(uint32_t retry_index) const;

    // True if a task whose latest attempt failed with `kind` may run again.
    bool shouldRetry(const FileTask& task, core::ErrorKind kind) const;

    uint32_t maxAttempts() const { return config_.max_retries > 0 ? config_.max_retries : 1; }

private:
    core::RetryConfig config_;
};

} // namespace transfer
} // namespace migrator
