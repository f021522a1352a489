#ifndef MIGRATOR_STATE_JOURNAL_STATE_STORE_H_
#define MIGRATOR_STATE_JOURNAL_STATE_STORE_H_

#include <atomic>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "migrator/core/config.h"
#include "migrator/state/journal.h"
#include "migrator/state/record_codec.h"
#include "migrator/state/state_store.h"

namespace migrator {
namespace state {

/**
 * @brief StateStore backed by one append-only journal per session.
 *
 * Layout: <data_dir>/sessions/<session_id>/journal_NNNNNN.log. Every
 * mutation is appended (and fsync'ed) before the in-memory index is
 * updated; opening the store replays all journals to rebuild the index.
 * Session records are full snapshots, the last one wins on replay.
 */
class JournalStateStore : public StateStore {
public:
    // Throws core::InternalError when the data directory is unusable.
    explicit JournalStateStore(const core::StateStoreConfig& config);
    ~JournalStateStore() override;

    static core::Result<std::unique_ptr<JournalStateStore>> Open(const core::StateStoreConfig& config);

    core::Result<std::string> createSession(const std::string& name,
                                            const std::string& description,
                                            const std::string& config_json) override;
    core::Result<void> updateSession(const std::string& session_id,
                                     const core::SessionUpdate& update) override;
    core::Result<core::Session> getSession(const std::string& session_id) const override;
    std::vector<core::Session> listSessions(std::optional<core::SessionStatus> status = std::nullopt,
                                            size_t limit = 100) const override;

    core::Result<std::string> createCheckpoint(const std::string& session_id,
                                               const std::string& name,
                                               const std::string& description,
                                               core::Phase phase,
                                               const core::MigrationStats& stats,
                                               const core::Metadata& metadata) override;
    core::Result<core::Checkpoint> getCheckpoint(const std::string& checkpoint_id) const override;
    core::Result<std::unique_ptr<CheckpointCursor>> listCheckpoints(
        const std::string& session_id) const override;

    std::string recordError(core::ErrorRecord record) override;
    std::string recordMetric(const std::string& session_id, const std::string& name,
                             double value, const std::string& unit,
                             const core::Metadata& metadata = {}) override;
    std::vector<core::ErrorRecord> getErrors(
        const std::string& session_id,
        std::optional<core::ErrorSeverity> severity = std::nullopt) const override;
    std::vector<core::MetricRecord> getMetrics(
        const std::string& session_id,
        std::optional<std::string> name = std::nullopt) const override;

    core::Result<void> recordBatch(const core::BatchRecord& batch) override;
    std::vector<core::BatchRecord> listBatches(const std::string& session_id) const override;
    core::Result<void> recordFile(const core::FileRecord& file) override;
    std::vector<core::FileRecord> listFiles(
        const std::string& session_id,
        std::optional<std::string> batch_id = std::nullopt) const override;
    std::set<std::string> completedFileIds(const std::string& session_id) const override;

    core::Result<size_t> cleanupOldSessions(std::chrono::hours max_age) override;
    core::Result<std::string> exportSession(const std::string& session_id) const override;
    StoreStats getStoreStats() const override;

private:
    struct SessionState {
        mutable std::mutex mutex;
        core::Session session;
        bool has_session = false;
        bool removed = false;
        std::vector<core::Checkpoint> checkpoints;  // Creation order
        std::vector<core::ErrorRecord> errors;
        std::vector<core::MetricRecord> metrics;
        std::vector<core::BatchRecord> batches;    // Latest version per batch id
        std::map<std::string, core::FileRecord> files;  // Latest version per file id
        core::Timestamp last_checkpoint_at = 0;
        std::unique_ptr<Journal> journal;
    };

    class Cursor;

    std::shared_ptr<SessionState> find(const std::string& session_id) const;
    void load();
    static void apply(SessionState& state, JournalRecord record);
    // Caller holds state.mutex.
    core::Result<void> persist(SessionState& state, const JournalRecord& record);

    core::StateStoreConfig config_;
    std::string sessions_dir_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<SessionState>> sessions_;

    mutable std::mutex index_mutex_;
    std::unordered_map<std::string, std::string> checkpoint_index_;  // checkpoint id -> session id

    std::atomic<uint64_t> records_written_{0};
    std::atomic<uint64_t> bytes_written_{0};
    std::atomic<uint64_t> failed_audit_writes_{0};

    // Audit records addressed to a session this store does not know, newest
    // last and capped at kMaxFallbackRecords each.
    static constexpr size_t kMaxFallbackRecords = 1000;
    mutable std::mutex fallback_mutex_;
    std::deque<core::ErrorRecord> fallback_errors_;
    std::deque<core::MetricRecord> fallback_metrics_;
};

} // namespace state
} // namespace migrator

#endif // MIGRATOR_STATE_JOURNAL_STATE_STORE_H_
