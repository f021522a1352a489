#include "migrator/recovery/rollback_manager.h"

#include <algorithm>
#include <cstdlib>

#include "migrator/common/logger.h"
#include "migrator/orchestrator/phase_state_machine.h"
#include "migrator/recovery/recovery_plan.h"

namespace migrator {
namespace recovery {

namespace {

using SteadyClock = std::chrono::steady_clock;

std::chrono::milliseconds ElapsedSince(SteadyClock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start);
}

const char* kTrafficDestination = "DESTINATION";

// Batch checkpoints at or below the session's release marker no longer hold a snapshot.
bool SnapshotReleased(const core::Session& session, const core::Checkpoint& checkpoint) {
    auto marker = session.metadata.find(core::kSnapshotsReleasedThroughKey);
    auto batch = checkpoint.metadata.find(core::kBatchNumberKey);
    if (marker == session.metadata.end() || batch == checkpoint.metadata.end()) {
        return false;
    }
    return std::strtoull(batch->second.c_str(), nullptr, 10) <= std::strtoull(marker->second.c_str(), nullptr, 10);
}

} // namespace

RollbackManager::RollbackManager(const core::RecoveryConfig& config,
                                 std::shared_ptr<state::StateStore> store,
                                 std::shared_ptr<core::MetadataStore> metadata,
                                 std::shared_ptr<core::TrafficController> traffic,
                                 std::shared_ptr<core::NotificationSink> notifier,
                                 std::vector<std::shared_ptr<HealthProbe>> verification_probes,
                                 HaltFn halt)
    : config_(config),
      store_(std::move(store)),
      metadata_(std::move(metadata)),
      traffic_(std::move(traffic)),
      notifier_(std::move(notifier)),
      probes_(std::move(verification_probes)),
      halt_(std::move(halt)) {}

core::Result<core::Checkpoint> RollbackManager::selectTarget(const std::string& session_id,
                                                             std::optional<core::Timestamp> not_after) const {
    auto session = store_->getSession(session_id);
    if (!session.ok()) {
        return core::Result<core::Checkpoint>::error(session.error(), session.code());
    }
    auto cursor = store_->listCheckpoints(session_id);
    if (!cursor.ok()) {
        return core::Result<core::Checkpoint>::error(cursor.error(), cursor.code());
    }
    auto& checkpoints = cursor.value();
    while (auto checkpoint = checkpoints->next()) {
        if (!orchestrator::PhaseStateMachine::isSafeRollbackTarget(checkpoint->phase)) continue;
        if (not_after && checkpoint->created_at > *not_after) continue;
        if (SnapshotReleased(session.value(), *checkpoint)) continue;
        return core::Result<core::Checkpoint>(std::move(*checkpoint));
    }
    return core::Result<core::Checkpoint>::error("No safe rollback checkpoint for session " + session_id,
                                                 core::Error::Code::NOT_FOUND);
}

core::Result<RollbackReport> RollbackManager::execute(const RollbackRequest& request) {
    std::lock_guard<std::mutex> guard(execute_mutex_);
    const auto started = SteadyClock::now();

    RollbackReport report;
    report.session_id = request.session_id;

    auto session_result = store_->getSession(request.session_id);
    if (!session_result.ok()) {
        return core::Result<RollbackReport>::error(session_result.error(), session_result.code());
    }
    const core::Session session = session_result.take_value();

    if (session.status == core::SessionStatus::ROLLED_BACK) {
        MIGRATOR_INFO("Session {} is already rolled back", session.id);
        report.success = true;
        report.already_rolled_back = true;
        return core::Result<RollbackReport>(std::move(report));
    }
    if (session.status != core::SessionStatus::FAILED ||
        !orchestrator::PhaseStateMachine::canTransition(session.phase, core::Phase::ROLLED_BACK)) {
        return core::Result<RollbackReport>::error(
            "Session " + session.id + " must be FAILED to roll back (status " +
            core::SessionStatusName(session.status) + ", phase " + core::PhaseName(session.phase) + ")",
            core::Error::Code::FAILED_PRECONDITION);
    }

    core::Checkpoint target;
    if (request.checkpoint_id) {
        auto explicit_target = store_->getCheckpoint(*request.checkpoint_id);
        if (!explicit_target.ok()) {
            return core::Result<RollbackReport>::error(explicit_target.error(), explicit_target.code());
        }
        target = explicit_target.take_value();
        if (target.session_id != session.id ||
            !orchestrator::PhaseStateMachine::isSafeRollbackTarget(target.phase)) {
            return core::Result<RollbackReport>::error(
                "Checkpoint " + target.id + " is not a safe rollback target for session " + session.id,
                core::Error::Code::INVALID_ARGUMENT);
        }
        if (SnapshotReleased(session, target)) {
            return core::Result<RollbackReport>::error(
                "Checkpoint " + target.id + " no longer holds a metadata snapshot",
                core::Error::Code::INVALID_ARGUMENT);
        }
    } else {
        auto selected = selectTarget(session.id, request.not_after);
        if (!selected.ok()) {
            core::ErrorRecord error;
            error.session_id = session.id;
            error.error_type = "rollback_failed";
            error.message = selected.error();
            error.severity = core::ErrorSeverity::CRITICAL;
            error.phase = session.phase;
            store_->recordError(std::move(error));
            return core::Result<RollbackReport>::error(selected.error(), selected.code());
        }
        target = selected.take_value();
    }
    report.target_checkpoint_id = target.id;
    report.target_phase = target.phase;

    MIGRATOR_WARN("Rolling back session {} to checkpoint {} ({}): {}", session.id, target.id,
                  core::PhaseName(target.phase), request.reason);

    bool ok = runStep(report, "halt_intake", true, config_.halt_timeout,
                      [this](std::chrono::milliseconds timeout) {
                          return halt_ ? halt_(timeout) : core::Result<void>();
                      });

    ok = ok && runStep(report, "forensic_snapshot", true, config_.snapshot_timeout,
                       [&](std::chrono::milliseconds) -> core::Result<void> {
                           core::Metadata details = {
                               {"rollback_target", target.id},
                               {"reason", request.reason}};
                           auto id = store_->createCheckpoint(session.id, "rollback_forensics",
                                                              "State captured before rollback",
                                                              core::Phase::FAILED, session.stats, details);
                           if (!id.ok()) {
                               return core::Result<void>::error(id.error(), id.code());
                           }
                           return core::Result<void>();
                       });

    ok = ok && runStep(report, "restore_metadata", true, config_.metadata_restore_timeout,
                       [&](std::chrono::milliseconds timeout) -> core::Result<void> {
                           auto it = target.metadata.find(core::kMetadataSnapshotKey);
                           if (it == target.metadata.end() || it->second.empty()) {
                               return core::Result<void>::error(
                                   "Checkpoint " + target.id + " has no metadata snapshot",
                                   core::Error::Code::FAILED_PRECONDITION);
                           }
                           if (!metadata_) {
                               return core::Result<void>::error("No metadata store configured",
                                                                core::Error::Code::FAILED_PRECONDITION);
                           }
                           return metadata_->restore(it->second, timeout);
                       });

    if (ok) {
        runStep(report, "restore_traffic", false, config_.traffic_restore_timeout,
                [&](std::chrono::milliseconds) { return restoreTraffic(session); });
    }

    ok = ok && runStep(report, "verify_health", true, config_.health_check_timeout,
                       [this](std::chrono::milliseconds timeout) { return verifyHealth(timeout); });

    report.duration = ElapsedSince(started);
    report.success = ok;

    if (ok) {
        core::SessionUpdate update;
        update.phase = core::Phase::ROLLED_BACK;
        update.status = core::SessionStatus::ROLLED_BACK;
        update.clear_resume_phase = true;
        core::MigrationStats stats = session.stats;
        stats.end_time = core::NowMicros();
        update.stats = stats;
        update.metadata["rollback_checkpoint"] = target.id;
        update.metadata["rollback_target_phase"] = core::PhaseName(target.phase);
        update.metadata["rollback_reason"] = request.reason;
        auto updated = store_->updateSession(session.id, update);
        if (!updated.ok()) {
            report.success = false;
            report.failed_step = "finalize";
            MIGRATOR_CRITICAL("Rollback of {} finished but the session could not be updated: {}",
                              session.id, updated.error());
        }
    }

    {
        std::lock_guard<std::mutex> lock(report_mutex_);
        last_report_ = report;
    }

    if (!report.success) {
        core::ErrorRecord error;
        error.session_id = session.id;
        error.error_type = "rollback_failed";
        error.message = "Rollback failed at step " + report.failed_step;
        error.severity = core::ErrorSeverity::CRITICAL;
        error.phase = session.phase;
        error.metadata["target_checkpoint"] = target.id;
        for (const auto& step : report.steps) {
            if (step.name == report.failed_step) {
                error.message += ": " + step.message;
            }
        }
        store_->recordError(std::move(error));

        core::SessionUpdate update;
        update.metadata["rollback_failed_step"] = report.failed_step;
        auto updated = store_->updateSession(session.id, update);
        if (!updated.ok()) {
            MIGRATOR_ERROR("Failed to record rollback failure on {}: {}", session.id, updated.error());
        }

        notify("Rollback failed", "Rollback of session " + session.id + " failed at " + report.failed_step +
               "; manual intervention required", IncidentSeverity::CRITICAL, session.id,
               {{"target_checkpoint", target.id}});
        MIGRATOR_CRITICAL("Rollback of session {} failed at step {}", session.id, report.failed_step);
        return core::Result<RollbackReport>::error("Rollback failed at step " + report.failed_step,
                                                   core::Error::Code::INTERNAL);
    }

    store_->recordMetric(session.id, "rollback_duration_seconds",
                         static_cast<double>(report.duration.count()) / 1000.0, "seconds");
    notify("Rollback completed", "Session " + session.id + " rolled back to checkpoint " + target.id,
           IncidentSeverity::WARNING, session.id, {{"target_checkpoint", target.id}});
    MIGRATOR_INFO("Session {} rolled back to {} in {}ms", session.id, target.id, report.duration.count());
    return core::Result<RollbackReport>(std::move(report));
}

bool RollbackManager::runStep(RollbackReport& report, const std::string& name, bool critical,
                              std::chrono::milliseconds timeout, const StepFn& step) {
    RollbackStepResult result;
    result.name = name;
    result.critical = critical;

    const auto started = SteadyClock::now();
    auto outcome = step(timeout);
    result.duration = ElapsedSince(started);

    if (!outcome.ok()) {
        result.message = outcome.error();
    } else if (result.duration > timeout) {
        result.message = "step exceeded its timeout of " + std::to_string(timeout.count()) + "ms";
    } else {
        result.success = true;
    }

    if (result.success) {
        MIGRATOR_INFO("Rollback step {} done in {}ms", name, result.duration.count());
    } else if (critical) {
        MIGRATOR_ERROR("Critical rollback step {} failed: {}", name, result.message);
        report.failed_step = name;
    } else {
        MIGRATOR_WARN("Rollback step {} failed, continuing: {}", name, result.message);
    }

    report.steps.push_back(result);
    return result.success || !critical;
}

core::Result<void> RollbackManager::restoreTraffic(const core::Session& session) {
    if (!traffic_) {
        return core::Result<void>();
    }

    auto routed_to_destination = [&session](const char* key) {
        auto it = session.metadata.find(key);
        return it != session.metadata.end() && it->second == kTrafficDestination;
    };

    std::string failures;
    core::SessionUpdate update;
    if (routed_to_destination("writes_routed")) {
        auto r = traffic_->routeWrites(core::TrafficTarget::SOURCE);
        if (r.ok()) update.metadata["writes_routed"] = "SOURCE";
        else failures += "writes: " + r.error() + "; ";
    }
    if (routed_to_destination("reads_routed")) {
        auto r = traffic_->routeReads(core::TrafficTarget::SOURCE);
        if (r.ok()) update.metadata["reads_routed"] = "SOURCE";
        else failures += "reads: " + r.error() + "; ";
    }
    auto dual = session.metadata.find("dual_write");
    if (dual != session.metadata.end() && dual->second == "enabled") {
        auto r = traffic_->setDualWrite(false);
        if (r.ok()) update.metadata["dual_write"] = "disabled";
        else failures += "dual-write: " + r.error() + "; ";
    }

    if (!update.metadata.empty()) {
        auto updated = store_->updateSession(session.id, update);
        if (!updated.ok()) {
            failures += "state: " + updated.error();
        }
    }
    if (!failures.empty()) {
        return core::Result<void>::error(failures, core::Error::Code::UNAVAILABLE);
    }
    return core::Result<void>();
}

core::Result<void> RollbackManager::verifyHealth(std::chrono::milliseconds timeout) {
    const auto deadline = SteadyClock::now() + timeout;
    std::string unhealthy;
    for (const auto& probe : probes_) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
        ProbeReading reading = ProbeWithin(probe, std::max(remaining, std::chrono::milliseconds(0)));
        auto severity = GradeSeverity(reading);
        if (severity) {
            unhealthy += reading.probe + " (" + IncidentSeverityName(*severity) +
                         (reading.detail.empty() ? "" : ": " + reading.detail) + ") ";
        }
    }
    if (!unhealthy.empty()) {
        return core::Result<void>::error("unhealthy after rollback: " + unhealthy,
                                         core::Error::Code::UNAVAILABLE);
    }
    return core::Result<void>();
}

void RollbackManager::notify(const std::string& title, const std::string& message,
                             IncidentSeverity severity, const std::string& session_id,
                             const core::Metadata& details) {
    if (!notifier_) return;
    core::Notification notification;
    notification.title = title;
    notification.message = message;
    notification.severity = IncidentSeverityName(severity);
    notification.channels = NotificationChannels(severity);
    notification.session_id = session_id;
    notification.details = details;
    notification.created_at = core::NowMicros();
    notifier_->notify(notification);
}

std::optional<RollbackReport> RollbackManager::lastReport() const {
    std::lock_guard<std::mutex> lock(report_mutex_);
    return last_report_;
}

} // namespace recovery
} // namespace migrator
