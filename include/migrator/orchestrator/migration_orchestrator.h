#ifndef MIGRATOR_ORCHESTRATOR_MIGRATION_ORCHESTRATOR_H_
#define MIGRATOR_ORCHESTRATOR_MIGRATION_ORCHESTRATOR_H_

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "migrator/core/cancellation.h"
#include "migrator/core/config.h"
#include "migrator/core/interfaces.h"
#include "migrator/core/result.h"
#include "migrator/orchestrator/event_sink.h"
#include "migrator/recovery/health_probe.h"
#include "migrator/recovery/incident.h"
#include "migrator/recovery/rollback_manager.h"
#include "migrator/state/state_store.h"
#include "migrator/transfer/batch_transfer_engine.h"

namespace migrator {
namespace orchestrator {

/**
 * @brief Collaborators of the orchestrator. store, source, destination
 * and metadata are required; the rest may be null.
 */
struct OrchestratorDependencies {
    std::shared_ptr<state::StateStore> store;
    std::shared_ptr<core::SourceStorage> source;
    std::shared_ptr<core::DestinationStorage> destination;
    std::shared_ptr<core::MetadataStore> metadata;
    std::shared_ptr<core::TrafficController> traffic;
    std::shared_ptr<core::ErrorRateSampler> error_rate;
    std::shared_ptr<core::NotificationSink> notifier;
    std::shared_ptr<EventSink> events;
    std::shared_ptr<core::IntegrityVerifier> verifier;
    // Re-probed by the last rollback step
    std::vector<std::shared_ptr<recovery::HealthProbe>> rollback_probes;
};

struct SessionStatusView {
    std::string session_id;
    core::Phase phase = core::Phase::PREPARATION;
    core::SessionStatus status = core::SessionStatus::PENDING;
    std::optional<core::Phase> resume_phase;
    double progress = 0.0;  // Percent of files processed
    core::MigrationStats stats;
    bool active = false;    // A run() is driving the session right now
};

/**
 * @brief Drives one session at a time through the migration phases.
 *
 * run() blocks on the calling thread until the session completes,
 * fails, pauses or is rolled back, and also resumes a PAUSED session or
 * one left RUNNING by a crashed process. Pause and rollback requests may
 * arrive from any thread; while a run is active they are applied by the
 * run thread at the next batch or phase boundary.
 */
class MigrationOrchestrator {
public:
    using RollbackHook = std::function<core::Result<void>(const std::string& session_id,
                                                          const recovery::Incident& incident)>;

    MigrationOrchestrator(const core::MigrationConfig& config, OrchestratorDependencies deps);
    ~MigrationOrchestrator();

    MigrationOrchestrator(const MigrationOrchestrator&) = delete;
    MigrationOrchestrator& operator=(const MigrationOrchestrator&) = delete;

    core::Result<std::string> startSession(const std::string& name, const std::string& description);
    core::Result<core::Session> run(const std::string& session_id);

    core::Result<SessionStatusView> getSessionStatus(const std::string& session_id) const;
    core::Result<void> requestPause(const std::string& session_id);

    core::Result<void> requestRollback(const std::string& session_id,
                                       std::optional<std::string> checkpoint_id = std::nullopt);
    core::Result<void> requestRollback(const std::string& session_id, core::Timestamp not_after,
                                       const std::string& reason);

    // For DisasterRecoveryMonitor::setRollbackHook.
    RollbackHook rollbackHook();

    // Frees every metadata snapshot held by the session's checkpoints, for
    // sessions that can no longer roll back. Returns how many were freed.
    size_t releaseSnapshots(const std::string& session_id);

    transfer::BatchTransferEngine& engine() { return *engine_; }
    std::optional<recovery::RollbackReport> lastRollbackReport() const { return rollback_->lastReport(); }

private:
    struct FileEntry {
        std::string path;
        uint64_t size = 0;
        std::string checksum;
    };

    core::Result<void> drive(const std::string& session_id);
    core::Result<void> runPhase(core::Phase phase, const std::string& session_id);
    core::Result<void> prepare(const std::string& session_id);
    core::Result<void> setupDualWrite(const std::string& session_id);
    core::Result<void> backgroundMigration(const std::string& session_id);
    core::Result<void> cutover(const std::string& session_id, core::Phase phase);
    core::Result<void> validateCutover(const std::string& session_id, core::Phase phase);
    core::Result<void> cleanup(const std::string& session_id);

    core::Result<std::vector<FileEntry>> buildPlan();
    core::Result<void> transitionTo(const std::string& session_id, core::Phase from, core::Phase to);
    core::Result<std::string> checkpoint(const std::string& session_id, const std::string& name,
                                         const std::string& description, core::Phase phase,
                                         core::Metadata metadata);
    uint64_t lastCheckpointedBatch(const std::string& session_id) const;
    void releaseSupersededSnapshots(const std::string& session_id, uint64_t newest_batch);
    bool releaseSnapshotOf(const core::Checkpoint& saved);

    void pause(const std::string& session_id, core::Phase phase);
    void failSession(const std::string& session_id, core::Phase phase, const std::string& reason);
    void handleFailure(const std::string& session_id, core::Phase phase, const std::string& reason);
    void drainRollbacks(const std::string& session_id);
    core::Result<void> submitRollback(const recovery::RollbackRequest& request);
    core::Result<void> executeRollback(const recovery::RollbackRequest& request);
    core::Result<void> halt(std::chrono::milliseconds timeout);
    core::Result<void> interrupted() const;

    void emit(const std::string& type, const std::string& session_id,
              std::optional<core::Phase> phase, core::Metadata fields = {});
    void notify(const std::string& title, const std::string& message, recovery::IncidentSeverity severity,
                const std::string& session_id, core::Metadata details = {});

    core::MigrationConfig config_;
    OrchestratorDependencies deps_;
    std::unique_ptr<transfer::BatchTransferEngine> engine_;
    std::unique_ptr<recovery::RollbackManager> rollback_;
    core::CancellationToken cancel_;

    std::vector<FileEntry> plan_;
    std::string plan_session_;  // Session the cached plan belongs to

    mutable std::mutex run_mutex_;
    bool running_ = false;
    std::string active_session_;
    std::thread::id run_thread_;
    std::atomic<bool> pause_requested_{false};
    std::optional<recovery::RollbackRequest> pending_rollback_;
};

} // namespace orchestrator
} // namespace migrator

#endif // MIGRATOR_ORCHESTRATOR_MIGRATION_ORCHESTRATOR_H_
