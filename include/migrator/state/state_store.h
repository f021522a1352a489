#ifndef MIGRATOR_STATE_STATE_STORE_H_
#define MIGRATOR_STATE_STATE_STORE_H_

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "migrator/core/result.h"
#include "migrator/core/types.h"

namespace migrator {
namespace state {

/**
 * @brief Finite, restartable iteration over a session's checkpoints,
 * newest first. Checkpoints are materialized one per next() call.
 */
class CheckpointCursor {
public:
    virtual ~CheckpointCursor() = default;

    // Returns nullopt once exhausted.
    virtual std::optional<core::Checkpoint> next() = 0;
    virtual void reset() = 0;
};

struct StoreStats {
    uint64_t sessions = 0;
    uint64_t checkpoints = 0;
    uint64_t errors = 0;
    uint64_t metrics = 0;
    uint64_t batches = 0;
    uint64_t files = 0;
    uint64_t records_written = 0;
    uint64_t bytes_written = 0;
    uint64_t failed_audit_writes = 0;
};

/**
 * @brief Durable record of migration sessions and everything that
 * happens to them.
 *
 * Writes are durable when the call returns. Writers to different
 * sessions do not contend; writers to one session are serialized.
 */
class StateStore {
public:
    virtual ~StateStore() = default;

    virtual core::Result<std::string> createSession(const std::string& name,
                                                    const std::string& description,
                                                    const std::string& config_json) = 0;
    virtual core::Result<void> updateSession(const std::string& session_id,
                                             const core::SessionUpdate& update) = 0;
    virtual core::Result<core::Session> getSession(const std::string& session_id) const = 0;
    virtual std::vector<core::Session> listSessions(std::optional<core::SessionStatus> status = std::nullopt,
                                                    size_t limit = 100) const = 0;

    virtual core::Result<std::string> createCheckpoint(const std::string& session_id,
                                                       const std::string& name,
                                                       const std::string& description,
                                                       core::Phase phase,
                                                       const core::MigrationStats& stats,
                                                       const core::Metadata& metadata) = 0;
    virtual core::Result<core::Checkpoint> getCheckpoint(const std::string& checkpoint_id) const = 0;
    virtual core::Result<std::unique_ptr<CheckpointCursor>> listCheckpoints(
        const std::string& session_id) const = 0;

    // Audit writes never fail the caller. Returns the record id.
    virtual std::string recordError(core::ErrorRecord record) = 0;
    virtual std::string recordMetric(const std::string& session_id, const std::string& name,
                                     double value, const std::string& unit,
                                     const core::Metadata& metadata = {}) = 0;
    virtual std::vector<core::ErrorRecord> getErrors(
        const std::string& session_id,
        std::optional<core::ErrorSeverity> severity = std::nullopt) const = 0;
    virtual std::vector<core::MetricRecord> getMetrics(
        const std::string& session_id,
        std::optional<std::string> name = std::nullopt) const = 0;

    virtual core::Result<void> recordBatch(const core::BatchRecord& batch) = 0;
    virtual std::vector<core::BatchRecord> listBatches(const std::string& session_id) const = 0;
    virtual core::Result<void> recordFile(const core::FileRecord& file) = 0;
    virtual std::vector<core::FileRecord> listFiles(
        const std::string& session_id,
        std::optional<std::string> batch_id = std::nullopt) const = 0;
    virtual std::set<std::string> completedFileIds(const std::string& session_id) const = 0;

    // Removes COMPLETED, FAILED and ARCHIVED sessions last updated before
    // now - max_age. Returns the number of sessions removed.
    virtual core::Result<size_t> cleanupOldSessions(std::chrono::hours max_age) = 0;
    virtual core::Result<std::string> exportSession(const std::string& session_id) const = 0;
    virtual StoreStats getStoreStats() const = 0;
};

} // namespace state
} // namespace migrator

#endif // MIGRATOR_STATE_STATE_STORE_H_
