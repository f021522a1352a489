#include "migrator/transfer/batch_stats.h"

#include <algorithm>

namespace migrator {
namespace transfer {

namespace {
// Rates sampled earlier than this after start are too noisy to count as a peak.
constexpr double kMinPeakWindowSeconds = 0.01;
}

BatchStats::BatchStats() {
    reset(0, 0);
}

void BatchStats::reset(uint64_t total_tasks, uint64_t total_bytes) {
    total_tasks_.store(total_tasks);
    completed_tasks_.store(0);
    failed_tasks_.store(0);
    skipped_tasks_.store(0);
    retried_attempts_.store(0);
    total_bytes_.store(total_bytes);
    transferred_bytes_.store(0);
    peak_throughput_.store(0.0);
    for (auto& counter : failures_by_kind_) {
        counter.store(0);
    }
    start_ns_.store(Clock::now().time_since_epoch().count());
}

void BatchStats::addTasks(uint64_t tasks, uint64_t bytes) {
    total_tasks_.fetch_add(tasks);
    total_bytes_.fetch_add(bytes);
}

void BatchStats::recordCompleted(uint64_t bytes) {
    completed_tasks_.fetch_add(1);
    transferred_bytes_.fetch_add(bytes);
    updatePeak();
}

void BatchStats::recordFailed(core::ErrorKind kind) {
    failed_tasks_.fetch_add(1);
    failures_by_kind_[static_cast<size_t>(kind)].fetch_add(1);
}

void BatchStats::recordSkipped() {
    skipped_tasks_.fetch_add(1);
}

void BatchStats::recordRetry() {
    retried_attempts_.fetch_add(1);
}

double BatchStats::elapsedSeconds() const {
    auto start = Clock::time_point(Clock::duration(start_ns_.load()));
    return std::chrono::duration<double>(Clock::now() - start).count();
}

void BatchStats::updatePeak() {
    double elapsed = elapsedSeconds();
    if (elapsed < kMinPeakWindowSeconds) return;
    double rate = static_cast<double>(transferred_bytes_.load()) / elapsed;
    double current = peak_throughput_.load();
    while (rate > current && !peak_throughput_.compare_exchange_weak(current, rate)) {
    }
}

BatchStats::Snapshot BatchStats::snapshot() const {
    Snapshot s;
    s.total_tasks = total_tasks_.load();
    s.completed_tasks = completed_tasks_.load();
    s.failed_tasks = failed_tasks_.load();
    s.skipped_tasks = skipped_tasks_.load();
    s.retried_attempts = retried_attempts_.load();
    s.total_bytes = total_bytes_.load();
    s.transferred_bytes = transferred_bytes_.load();
    s.elapsed_seconds = elapsedSeconds();
    s.throughput = s.elapsed_seconds > 0 ? static_cast<double>(s.transferred_bytes) / s.elapsed_seconds : 0.0;
    s.peak_throughput = std::max(peak_throughput_.load(), 0.0);
    for (size_t i = 0; i < kNumErrorKinds; ++i) {
        s.failures_by_kind[i] = failures_by_kind_[i].load();
    }
    return s;
}

} // namespace transfer
} // namespace migrator
