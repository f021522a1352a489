#ifndef MIGRATOR_TRANSFER_BATCH_TRANSFER_ENGINE_H_
#define MIGRATOR_TRANSFER_BATCH_TRANSFER_ENGINE_H_

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "migrator/core/cancellation.h"
#include "migrator/core/config.h"
#include "migrator/core/interfaces.h"
#include "migrator/state/state_store.h"
#include "migrator/transfer/batch_stats.h"
#include "migrator/transfer/file_task.h"
#include "migrator/transfer/rate_limiter.h"
#include "migrator/transfer/retry_policy.h"
#include "migrator/transfer/transfer_queue.h"

namespace migrator {
namespace transfer {

/**
 * @brief Where the results of a batch are persisted. An empty session id
 * disables persistence.
 */
struct BatchContext {
    std::string session_id;
    std::string batch_id;
    uint64_t batch_number = 0;
    std::optional<core::Phase> phase;
};

struct BatchResult {
    std::string batch_id;
    BatchStats::Snapshot stats;
    std::vector<FileTask> finished;  // Tasks that reached a terminal state
    size_t pending = 0;              // Tasks left queued for a later call
    bool cancelled = false;
};

struct WorkerStats {
    uint32_t worker_id = 0;
    uint64_t files_processed = 0;
    uint64_t bytes_transferred = 0;
    uint64_t errors = 0;
    std::string current_task;
};

/**
 * @brief Moves files from the source to the destination with a bounded
 * pool of workers sharing one priority queue and one token bucket.
 *
 * processBatch() blocks until every queued task is terminal or cancel()
 * is called. On cancellation each worker finishes its in-flight attempt
 * and exits; tasks not yet started (or waiting in retry backoff) stay
 * in the queue and are picked up by the next processBatch() call.
 */
class BatchTransferEngine {
public:
    using TaskCallback = std::function<void(const FileTask&)>;

    BatchTransferEngine(const core::TransferConfig& config,
                        const core::RetryConfig& retry,
                        std::shared_ptr<core::SourceStorage> source,
                        std::shared_ptr<core::DestinationStorage> destination,
                        std::shared_ptr<state::StateStore> store = nullptr,
                        std::shared_ptr<core::IntegrityVerifier> verifier = nullptr);
    ~BatchTransferEngine();

    BatchTransferEngine(const BatchTransferEngine&) = delete;
    BatchTransferEngine& operator=(const BatchTransferEngine&) = delete;

    BatchResult processBatch(const BatchContext& context, std::vector<FileTask> tasks);

    // Safe to call from any thread.
    void cancel();
    bool isCancelled() const { return cancel_.isCancelled(); }
    bool isRunning() const { return running_.load(); }

    size_t pendingTasks() const { return queue_.size(); }
    std::vector<FileTask> takePending();

    // Invoked on the worker thread after every terminal transition.
    void setTaskCallback(TaskCallback callback);

    BatchStats::Snapshot currentStats() const { return stats_.snapshot(); }
    std::vector<WorkerStats> workerStats() const;
    const RateLimiter& rateLimiter() const { return limiter_; }

    static std::string FormatReport(const BatchResult& result);

private:
    struct Run;

    void workerLoop(uint32_t worker_id, const BatchContext& context, Run& run);
    // Bytes transferred once the task is terminal, nullopt if it must go back in the queue.
    std::optional<uint64_t> processTask(FileTask& task);
    // Sets `interrupted` when cancellation stopped the attempt before upload.
    core::Result<uint64_t> attemptTransfer(FileTask& task, bool& skipped, bool& interrupted);
    core::Result<void> verifyUpload(const FileTask& task, uint64_t size, const std::string& fingerprint);
    void finishTask(uint32_t worker_id, const BatchContext& context, Run& run,
                    std::unique_ptr<FileTask> task, uint64_t bytes);
    void persistTask(const BatchContext& context, const FileTask& task);

    core::TransferConfig config_;
    RetryPolicy retry_;
    std::shared_ptr<core::SourceStorage> source_;
    std::shared_ptr<core::DestinationStorage> destination_;
    std::shared_ptr<state::StateStore> store_;
    std::shared_ptr<core::IntegrityVerifier> verifier_;

    TransferQueue queue_;
    RateLimiter limiter_;
    BatchStats stats_;
    core::CancellationToken cancel_;
    std::atomic<bool> running_{false};

    mutable std::mutex workers_mutex_;
    std::vector<WorkerStats> workers_;
    TaskCallback callback_;
};

} // namespace transfer
} // namespace migrator

#endif // MIGRATOR_TRANSFER_BATCH_TRANSFER_ENGINE_H_
