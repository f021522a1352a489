#include "migrator/transfer/batch_transfer_engine.h"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <thread>

#include "migrator/common/logger.h"
#include "migrator/core/fingerprint.h"

namespace migrator {
namespace transfer {

struct BatchTransferEngine::Run {
    std::mutex mutex;
    std::vector<FileTask> finished;
};

namespace {

using SteadyClock = std::chrono::steady_clock;

std::chrono::milliseconds ElapsedSince(SteadyClock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start);
}

core::ErrorSeverity SeverityFor(core::ErrorKind kind) {
    switch (kind) {
        case core::ErrorKind::INTEGRITY:
        case core::ErrorKind::PERMISSION:
            return core::ErrorSeverity::HIGH;
        case core::ErrorKind::FILE_NOT_FOUND:
            return core::ErrorSeverity::LOW;
        default:
            return core::ErrorSeverity::MEDIUM;
    }
}

} // namespace

BatchTransferEngine::BatchTransferEngine(const core::TransferConfig& config,
                                         const core::RetryConfig& retry,
                                         std::shared_ptr<core::SourceStorage> source,
                                         std::shared_ptr<core::DestinationStorage> destination,
                                         std::shared_ptr<state::StateStore> store,
                                         std::shared_ptr<core::IntegrityVerifier> verifier)
    : config_(config),
      retry_(retry),
      source_(std::move(source)),
      destination_(std::move(destination)),
      store_(std::move(store)),
      verifier_(std::move(verifier)),
      queue_(config.max_queue_size),
      limiter_(config.max_bytes_per_second) {
    workers_.resize(std::max<uint32_t>(config_.max_workers, 1));
    for (uint32_t i = 0; i < workers_.size(); ++i) {
        workers_[i].worker_id = i;
    }
}

BatchTransferEngine::~BatchTransferEngine() {
    cancel();
}

void BatchTransferEngine::cancel() {
    cancel_.cancel();
}

void BatchTransferEngine::setTaskCallback(TaskCallback callback) {
    callback_ = std::move(callback);
}

std::vector<FileTask> BatchTransferEngine::takePending() {
    std::vector<FileTask> pending;
    for (auto& task : queue_.drain()) {
        pending.push_back(std::move(*task));
    }
    return pending;
}

std::vector<WorkerStats> BatchTransferEngine::workerStats() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return workers_;
}

BatchResult BatchTransferEngine::processBatch(const BatchContext& context, std::vector<FileTask> tasks) {
    cancel_.reset();
    running_.store(true);
    stats_.reset(0, 0);
    Run run;

    // Tasks left over from a cancelled call run together with this batch.
    for (auto& leftover : queue_.drain()) {
        stats_.addTasks(1, leftover->size);
        queue_.requeue(std::move(leftover));
    }

    for (auto& task : tasks) {
        auto owned = std::make_unique<FileTask>(std::move(task));
        if (owned->created_at == 0) {
            owned->created_at = core::NowMicros();
        }
        // Every task gets at least the one attempt it is about to make.
        owned->max_retries = std::max<uint32_t>(owned->max_retries, 1);
        const uint64_t size = owned->size;
        const std::string id = owned->id;
        auto pushed = queue_.push(std::move(owned));
        if (pushed.ok()) {
            stats_.addTasks(1, size);
        } else if (pushed.code() == core::Error::Code::ALREADY_EXISTS) {
            MIGRATOR_DEBUG("Task {} is already queued, keeping the queued copy", id);
        } else {
            // The queue rejected the task; it never ran.
            MIGRATOR_ERROR("Task {} could not be queued: {}", id, pushed.error());
            auto rejected = std::make_unique<FileTask>();
            rejected->id = id;
            rejected->size = size;
            rejected->recordFailure(pushed.code(), pushed.error());
            rejected->status = core::TaskStatus::FAILED;
            rejected->completed_at = core::NowMicros();
            stats_.addTasks(1, size);
            finishTask(0, context, run, std::move(rejected), 0);
        }
    }

    core::BatchRecord record;
    record.id = context.batch_id;
    record.session_id = context.session_id;
    record.batch_number = context.batch_number;
    record.total = stats_.snapshot().total_tasks;
    record.status = core::BatchStatus::RUNNING;
    record.started_at = core::NowMicros();
    if (store_ && !context.session_id.empty()) {
        auto persisted = store_->recordBatch(record);
        if (!persisted.ok()) {
            MIGRATOR_WARN("Failed to persist start of batch {}: {}", context.batch_id, persisted.error());
        }
    }

    const size_t queued = queue_.size();
    const uint32_t num_workers = static_cast<uint32_t>(
        std::min<size_t>(workers_.size(), std::max<size_t>(queued, 1)));
    MIGRATOR_INFO("Batch {} started: {} tasks, {} workers", context.batch_id, queued, num_workers);

    std::vector<std::thread> threads;
    threads.reserve(num_workers);
    for (uint32_t i = 0; i < num_workers; ++i) {
        threads.emplace_back(&BatchTransferEngine::workerLoop, this, i, std::cref(context), std::ref(run));
    }
    for (auto& thread : threads) {
        thread.join();
    }

    BatchResult result;
    result.batch_id = context.batch_id;
    result.stats = stats_.snapshot();
    result.finished = std::move(run.finished);
    result.pending = queue_.size();
    result.cancelled = cancel_.isCancelled() && result.pending > 0;

    record.completed = result.stats.completed_tasks;
    record.failed = result.stats.failed_tasks;
    record.skipped = result.stats.skipped_tasks;
    record.status = result.cancelled ? core::BatchStatus::CANCELLED : core::BatchStatus::COMPLETED;
    record.finished_at = core::NowMicros();
    if (store_ && !context.session_id.empty()) {
        auto persisted = store_->recordBatch(record);
        if (!persisted.ok()) {
            MIGRATOR_WARN("Failed to persist end of batch {}: {}", context.batch_id, persisted.error());
        }
    }

    running_.store(false);
    MIGRATOR_INFO("Batch {} {}: {} completed, {} failed, {} skipped, {} pending, {:.1f} KiB/s",
                  context.batch_id, result.cancelled ? "cancelled" : "finished",
                  result.stats.completed_tasks, result.stats.failed_tasks, result.stats.skipped_tasks,
                  result.pending, result.stats.throughput / 1024.0);
    return result;
}

void BatchTransferEngine::workerLoop(uint32_t worker_id, const BatchContext& context, Run& run) {
    while (!cancel_.isCancelled()) {
        auto task = queue_.tryPop();
        if (!task) {
            break;
        }

        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            workers_[worker_id].current_task = task->id;
        }

        auto bytes = processTask(*task);
        if (!bytes) {
            MIGRATOR_DEBUG("Worker {} returning task {} to the queue", worker_id, task->id);
            queue_.requeue(std::move(task));
            std::lock_guard<std::mutex> lock(workers_mutex_);
            workers_[worker_id].current_task.clear();
            break;
        }
        finishTask(worker_id, context, run, std::move(task), *bytes);
    }
}

std::optional<uint64_t> BatchTransferEngine::processTask(FileTask& task) {
    if (task.started_at == 0) {
        task.started_at = core::NowMicros();
    }

    while (true) {
        task.attempt_count++;
        bool skipped = false;
        bool interrupted = false;
        auto attempt = attemptTransfer(task, skipped, interrupted);
        if (interrupted) {
            // Nothing was uploaded; the attempt is given back with the task.
            task.attempt_count--;
            task.status = core::TaskStatus::PENDING;
            return std::nullopt;
        }
        if (attempt.ok()) {
            task.status = skipped ? core::TaskStatus::SKIPPED : core::TaskStatus::COMPLETED;
            task.completed_at = core::NowMicros();
            return attempt.value();
        }

        task.recordFailure(attempt.code(), attempt.error());
        const core::ErrorKind kind = core::ClassifyError(attempt.code());
        if (!retry_.shouldRetry(task, kind)) {
            task.status = core::TaskStatus::FAILED;
            task.completed_at = core::NowMicros();
            MIGRATOR_ERROR("Task {} failed permanently after {} attempt(s) [{}]: {}", task.id,
                           task.attempt_count, core::ErrorKindName(kind), attempt.error());
            return uint64_t{0};
        }

        task.status = core::TaskStatus::RETRYING;
        stats_.recordRetry();
        auto delay = retry_.delayFor(task.attempt_count - 1);
        MIGRATOR_WARN("Task {} attempt {}/{} failed [{}]: {}. Retrying in {}ms", task.id,
                      task.attempt_count, task.max_retries, core::ErrorKindName(kind),
                      attempt.error(), delay.count());
        if (cancel_.waitFor(delay)) {
            return std::nullopt;
        }
    }
}

core::Result<uint64_t> BatchTransferEngine::attemptTransfer(FileTask& task, bool& skipped, bool& interrupted) {
    const auto start = SteadyClock::now();
    task.status = core::TaskStatus::PROCESSING;

    if (config_.skip_existing && !task.checksum.empty()) {
        auto existing = destination_->head(task.target_key, config_.verify_timeout);
        if (existing.ok() && existing.value().size == task.size &&
            existing.value().checksum == task.checksum) {
            skipped = true;
            return core::Result<uint64_t>(uint64_t{0});
        }
    }

    auto read = source_->read(task.source_path, config_.upload_timeout);
    if (!read.ok()) {
        return core::Result<uint64_t>::error("read " + task.source_path + ": " + read.error(), read.code());
    }
    std::vector<uint8_t> bytes = read.take_value();
    const std::string fingerprint = core::ContentFingerprint(bytes);
    if (!task.checksum.empty() && task.checksum != fingerprint) {
        return core::Result<uint64_t>::error(
            "source content of " + task.source_path + " changed: expected " + task.checksum +
            ", read " + fingerprint, core::Error::Code::DATA_LOSS);
    }

    // Charged by what is actually sent; the planned size may be stale or unknown.
    if (!limiter_.acquire(bytes.size(), &cancel_)) {
        interrupted = true;
        return core::Result<uint64_t>::error("transfer of " + task.source_path + " cancelled",
                                             core::Error::Code::CANCELLED);
    }

    task.status = core::TaskStatus::UPLOADING;
    auto put = destination_->put(task.target_key, bytes, config_.upload_timeout);
    if (!put.ok()) {
        return core::Result<uint64_t>::error("upload " + task.target_key + ": " + put.error(), put.code());
    }
    auto elapsed = ElapsedSince(start);
    if (elapsed > config_.upload_timeout) {
        return core::Result<uint64_t>::error(
            "upload of " + task.target_key + " took " + std::to_string(elapsed.count()) + "ms",
            core::Error::Code::TIMEOUT);
    }

    if (config_.verify_uploads) {
        task.status = core::TaskStatus::VERIFYING;
        auto verified = verifyUpload(task, bytes.size(), fingerprint);
        if (!verified.ok()) {
            return core::Result<uint64_t>::error(verified.error(), verified.code());
        }
    }
    return core::Result<uint64_t>(static_cast<uint64_t>(bytes.size()));
}

core::Result<void> BatchTransferEngine::verifyUpload(const FileTask& task, uint64_t size,
                                                     const std::string& fingerprint) {
    const auto start = SteadyClock::now();
    auto head = destination_->head(task.target_key, config_.verify_timeout);
    if (!head.ok()) {
        return core::Result<void>::error("verify " + task.target_key + ": " + head.error(), head.code());
    }
    auto elapsed = ElapsedSince(start);
    if (elapsed > config_.verify_timeout) {
        return core::Result<void>::error(
            "verification of " + task.target_key + " took " + std::to_string(elapsed.count()) + "ms",
            core::Error::Code::TIMEOUT);
    }

    const core::ObjectInfo& info = head.value();
    if (info.size != size) {
        return core::Result<void>::error(
            "size mismatch for " + task.target_key + ": uploaded " + std::to_string(size) +
            ", stored " + std::to_string(info.size), core::Error::Code::DATA_LOSS);
    }
    if (info.checksum != fingerprint) {
        return core::Result<void>::error(
            "fingerprint mismatch for " + task.target_key + ": uploaded " + fingerprint +
            ", stored " + info.checksum, core::Error::Code::DATA_LOSS);
    }

    if (verifier_) {
        auto verdict = verifier_->verify(task.id, task.target_key);
        if (!verdict.ok()) {
            return verdict;
        }
    }
    return core::Result<void>();
}

void BatchTransferEngine::finishTask(uint32_t worker_id, const BatchContext& context, Run& run,
                                     std::unique_ptr<FileTask> task, uint64_t bytes) {
    switch (task->status) {
        case core::TaskStatus::COMPLETED:
            stats_.recordCompleted(bytes);
            break;
        case core::TaskStatus::SKIPPED:
            stats_.recordSkipped();
            break;
        default:
            stats_.recordFailed(task->lastErrorKind().value_or(core::ErrorKind::UNKNOWN));
            break;
    }

    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        WorkerStats& worker = workers_[worker_id];
        worker.files_processed++;
        worker.bytes_transferred += bytes;
        worker.errors += task->error_history.size();
        worker.current_task.clear();
    }

    persistTask(context, *task);
    if (callback_) {
        callback_(*task);
    }

    std::lock_guard<std::mutex> lock(run.mutex);
    run.finished.push_back(std::move(*task));
}

void BatchTransferEngine::persistTask(const BatchContext& context, const FileTask& task) {
    if (!store_ || context.session_id.empty()) {
        return;
    }

    core::FileRecord record;
    record.session_id = context.session_id;
    record.batch_id = context.batch_id;
    record.file_id = task.id;
    record.source_path = task.source_path;
    record.target_key = task.target_key;
    record.size = task.size;
    record.checksum = task.checksum;
    record.status = task.status;
    record.attempt_count = task.attempt_count;
    record.last_error = task.lastErrorMessage();
    auto persisted = store_->recordFile(record);
    if (!persisted.ok()) {
        MIGRATOR_WARN("Failed to persist file record for {}: {}", task.id, persisted.error());
    }

    if (task.status == core::TaskStatus::FAILED) {
        const core::ErrorKind kind = task.lastErrorKind().value_or(core::ErrorKind::UNKNOWN);
        core::ErrorRecord error;
        error.session_id = context.session_id;
        error.error_type = std::string("transfer_") + core::ErrorKindName(kind);
        error.message = task.lastErrorMessage();
        error.severity = SeverityFor(kind);
        error.phase = context.phase;
        error.file_id = task.id;
        error.batch_id = context.batch_id;
        error.metadata["attempts"] = std::to_string(task.attempt_count);
        error.metadata["source_path"] = task.source_path;
        error.metadata["target_key"] = task.target_key;
        store_->recordError(std::move(error));
    }
}

std::string BatchTransferEngine::FormatReport(const BatchResult& result) {
    const auto& s = result.stats;
    std::ostringstream out;
    out << std::fixed << std::setprecision(1);
    out << "Batch " << result.batch_id << (result.cancelled ? " (cancelled)" : "") << "\n";
    out << "  tasks:       " << s.finished() << "/" << s.total_tasks << " finished, "
        << result.pending << " pending\n";
    out << "  completed:   " << s.completed_tasks << "\n";
    out << "  failed:      " << s.failed_tasks << "\n";
    out << "  skipped:     " << s.skipped_tasks << "\n";
    out << "  retries:     " << s.retried_attempts << "\n";
    out << "  bytes:       " << s.transferred_bytes << "/" << s.total_bytes << "\n";
    out << "  throughput:  " << s.throughput / 1024.0 << " KiB/s (peak "
        << s.peak_throughput / 1024.0 << " KiB/s)\n";
    out << "  success:     " << s.successRate() << "%\n";
    for (size_t i = 0; i < BatchStats::kNumErrorKinds; ++i) {
        if (s.failures_by_kind[i] > 0) {
            out << "  failures[" << core::ErrorKindName(static_cast<core::ErrorKind>(i)) << "]: "
                << s.failures_by_kind[i] << "\n";
        }
    }
    return out.str();
}

} // namespace transfer
} // namespace migrator
