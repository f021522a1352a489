#ifndef MIGRATOR_TRANSFER_FILE_TASK_H_
#define MIGRATOR_TRANSFER_FILE_TASK_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "migrator/core/error.h"
#include "migrator/core/types.h"

namespace migrator {
namespace transfer {

enum class TaskPriority {
    LOW = 1,
    NORMAL = 2,
    HIGH = 3,
    CRITICAL = 4
};

/**
 * @brief One failed attempt of a file transfer.
 */
struct AttemptError {
    uint32_t attempt = 0;
    core::ErrorKind kind = core::ErrorKind::UNKNOWN;
    core::Error::Code code = core::Error::Code::UNKNOWN;
    std::string message;
    core::Timestamp timestamp = 0;
};

/**
 * @brief Unit of transfer work for a single file.
 *
 * Owned by exactly one worker while it is being processed. max_retries
 * is the ceiling on attempts; attempt_count never exceeds it.
 */
struct FileTask {
    std::string id;
    std::string source_path;
    std::string target_key;
    uint64_t size = 0;
    TaskPriority priority = TaskPriority::NORMAL;
    std::string checksum;  // Expected content fingerprint, empty if unknown
    core::Metadata metadata;

    core::TaskStatus status = core::TaskStatus::PENDING;
    uint32_t attempt_count = 0;
    uint32_t max_retries = 3;
    std::vector<AttemptError> error_history;

    core::Timestamp created_at = 0;
    core::Timestamp started_at = 0;
    core::Timestamp completed_at = 0;
    uint64_t sequence = 0;  // Assigned on enqueue

    void recordFailure(core::Error::Code code, const std::string& message);
    std::optional<core::ErrorKind> lastErrorKind() const;
    std::string lastErrorMessage() const;
};

} // namespace transfer
} // namespace migrator

#endif // MIGRATOR_TRANSFER_FILE_TASK_H_
