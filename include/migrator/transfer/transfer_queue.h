#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <queue>
#include <unordered_set>
#include <vector>

#include "migrator/core/result.h"
#include "migrator/transfer/file_task.h"

namespace migrator {
namespace transfer {

/**
 * @brief Thread-safe work queue: higher priority first, FIFO among equals.
 *
 * A task id can be queued at most once; pushing a duplicate id is an
 * ALREADY_EXISTS error and leaves the queued task untouched.
 */
class TransferQueue {
public:
    explicit TransferQueue(size_t max_size = 100000) : max_size_(max_size) {}

    core::Result<void> push(std::unique_ptr<FileTask> task);
    // Puts a task back after cancellation; ignores the size limit.
    void requeue(std::unique_ptr<FileTask> task);
    // Returns nullptr when empty.
    std::unique_ptr<FileTask> tryPop();
    std::vector<std::unique_ptr<FileTask>> drain();

    size_t size() const;
    bool empty() const;

private:
    struct TaskComparator {
        bool operator()(const std::unique_ptr<FileTask>& a, const std::unique_ptr<FileTask>& b) const {
            if (a->priority != b->priority) {
                return static_cast<int>(a->priority) < static_cast<int>(b->priority);
            }
            return a->sequence > b->sequence;
        }
    };

    void pushLocked(std::unique_ptr<FileTask> task, bool keep_sequence);

    const size_t max_size_;
    mutable std::mutex mutex_;
    std::priority_queue<std::unique_ptr<FileTask>, std::vector<std::unique_ptr<FileTask>>, TaskComparator> queue_;
    std::unordered_set<std::string> queued_ids_;
    uint64_t next_sequence_ = 0;
};

} // namespace transfer
} // namespace migrator
