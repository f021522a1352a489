#include "migrator/transfer/transfer_queue.h"

namespace migrator {
namespace transfer {

core::Result<void> TransferQueue::push(std::unique_ptr<FileTask> task) {
    if (!task) {
        return core::Result<void>::error("Cannot queue a null task", core::Error::Code::INVALID_ARGUMENT);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (queued_ids_.count(task->id) > 0) {
        return core::Result<void>::error("Task already queued: " + task->id, core::Error::Code::ALREADY_EXISTS);
    }
    if (queue_.size() >= max_size_) {
        return core::Result<void>::error("Transfer queue is full", core::Error::Code::RESOURCE_EXHAUSTED);
    }
    pushLocked(std::move(task), false);
    return core::Result<void>();
}

void TransferQueue::requeue(std::unique_ptr<FileTask> task) {
    if (!task) return;
    std::lock_guard<std::mutex> lock(mutex_);
    if (queued_ids_.count(task->id) > 0) return;
    pushLocked(std::move(task), true);
}

void TransferQueue::pushLocked(std::unique_ptr<FileTask> task, bool keep_sequence) {
    if (!keep_sequence) {
        task->sequence = next_sequence_++;
    }
    task->status = core::TaskStatus::QUEUED;
    queued_ids_.insert(task->id);
    queue_.push(std::move(task));
}

std::unique_ptr<FileTask> TransferQueue::tryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return nullptr;
    }
    // priority_queue::top() is const; the element is moved out right before pop().
    auto task = std::move(const_cast<std::unique_ptr<FileTask>&>(queue_.top()));
    queue_.pop();
    queued_ids_.erase(task->id);
    return task;
}

std::vector<std::unique_ptr<FileTask>> TransferQueue::drain() {
    std::vector<std::unique_ptr<FileTask>> tasks;
    while (auto task = tryPop()) {
        tasks.push_back(std::move(task));
    }
    return tasks;
}

size_t TransferQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool TransferQueue::empty() const {
    return size() == 0;
}

} // namespace transfer
} // namespace migrator
