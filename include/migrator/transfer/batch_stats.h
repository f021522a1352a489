#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>

#include "migrator/core/error.h"

namespace migrator {
namespace transfer {

/**
 * @brief Live counters of one batch. Updated by workers right after a
 * task reaches a terminal state; read lock-free through snapshot().
 */
class BatchStats {
public:
    static constexpr size_t kNumErrorKinds = 7;

    struct Snapshot {
        uint64_t total_tasks = 0;
        uint64_t completed_tasks = 0;
        uint64_t failed_tasks = 0;
        uint64_t skipped_tasks = 0;
        uint64_t retried_attempts = 0;
        uint64_t total_bytes = 0;
        uint64_t transferred_bytes = 0;
        double throughput = 0.0;       // bytes/sec since start
        double peak_throughput = 0.0;  // bytes/sec
        double elapsed_seconds = 0.0;
        std::array<uint64_t, kNumErrorKinds> failures_by_kind{};

        uint64_t finished() const { return completed_tasks + failed_tasks + skipped_tasks; }
        double successRate() const {
            uint64_t done = finished();
            return done == 0 ? 0.0 : 100.0 * static_cast<double>(completed_tasks) / static_cast<double>(done);
        }
    };

    BatchStats();

    void reset(uint64_t total_tasks, uint64_t total_bytes);
    void addTasks(uint64_t tasks, uint64_t bytes);
    void recordCompleted(uint64_t bytes);
    void recordFailed(core::ErrorKind kind);
    void recordSkipped();
    void recordRetry();

    Snapshot snapshot() const;

private:
    using Clock = std::chrono::steady_clock;

    double elapsedSeconds() const;
    void updatePeak();

    std::atomic<uint64_t> total_tasks_{0};
    std::atomic<uint64_t> completed_tasks_{0};
    std::atomic<uint64_t> failed_tasks_{0};
    std::atomic<uint64_t> skipped_tasks_{0};
    std::atomic<uint64_t> retried_attempts_{0};
    std::atomic<uint64_t> total_bytes_{0};
    std::atomic<uint64_t> transferred_bytes_{0};
    std::atomic<double> peak_throughput_{0.0};
    std::array<std::atomic<uint64_t>, kNumErrorKinds> failures_by_kind_;
    std::atomic<int64_t> start_ns_{0};
};

} // namespace transfer
} // namespace migrator
