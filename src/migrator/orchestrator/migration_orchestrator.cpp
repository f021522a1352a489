#include "migrator/orchestrator/migration_orchestrator.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include "migrator/common/logger.h"
#include "migrator/core/error.h"
#include "migrator/orchestrator/phase_state_machine.h"
#include "migrator/recovery/recovery_plan.h"

namespace migrator {
namespace orchestrator {

using core::kBatchNumberKey;
using core::kMetadataSnapshotKey;
using core::Phase;
using core::SessionStatus;

namespace {

core::Result<void> Cancelled(const std::string& message) {
    return core::Result<void>::error(message, core::Error::Code::CANCELLED);
}

double SecondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

MigrationOrchestrator::MigrationOrchestrator(const core::MigrationConfig& config, OrchestratorDependencies deps)
    : config_(config), deps_(std::move(deps)) {
    if (!deps_.store || !deps_.source || !deps_.destination || !deps_.metadata) {
        throw core::InvalidArgumentError("Orchestrator requires a state store, source, destination and metadata store");
    }
    auto valid = core::ValidateConfig(config_);
    if (!valid.ok()) {
        throw core::InvalidArgumentError("Invalid migration config: " + valid.error());
    }
    engine_ = std::make_unique<transfer::BatchTransferEngine>(
        config_.transfer, config_.retry, deps_.source, deps_.destination, deps_.store, deps_.verifier);
    rollback_ = std::make_unique<recovery::RollbackManager>(
        config_.recovery, deps_.store, deps_.metadata, deps_.traffic, deps_.notifier, deps_.rollback_probes,
        [this](std::chrono::milliseconds timeout) { return halt(timeout); });
}

MigrationOrchestrator::~MigrationOrchestrator() {
    engine_->cancel();
    cancel_.cancel();
}

core::Result<std::string> MigrationOrchestrator::startSession(const std::string& name,
                                                              const std::string& description) {
    auto created = deps_.store->createSession(name, description, core::ConfigLoader::ToJson(config_));
    if (!created.ok()) {
        return created;
    }
    std::string session_id = created.take_value();

    auto initial = checkpoint(session_id, "session_start", "Initial state before migration",
                              Phase::PREPARATION, {});
    if (!initial.ok()) {
        MIGRATOR_ERROR("Session {} created but the initial checkpoint failed: {}", session_id, initial.error());
        return core::Result<std::string>::error(initial.error(), initial.code());
    }

    MIGRATOR_INFO("Created migration session {} ({})", session_id, name);
    emit("session_created", session_id, Phase::PREPARATION, {{"name", name}});
    return core::Result<std::string>(session_id);
}

core::Result<core::Session> MigrationOrchestrator::run(const std::string& session_id) {
    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        if (running_) {
            return core::Result<core::Session>::error(
                "Orchestrator is busy with session " + active_session_, core::Error::Code::FAILED_PRECONDITION);
        }
        running_ = true;
        active_session_ = session_id;
        run_thread_ = std::this_thread::get_id();
        pending_rollback_.reset();
        pause_requested_.store(false);
    }
    cancel_.reset();

    auto driven = drive(session_id);
    drainRollbacks(session_id);
    if (!driven.ok()) {
        return core::Result<core::Session>::error(driven.error(), driven.code());
    }
    return deps_.store->getSession(session_id);
}

core::Result<void> MigrationOrchestrator::drive(const std::string& session_id) {
    auto loaded = deps_.store->getSession(session_id);
    if (!loaded.ok()) {
        return core::Result<void>::error(loaded.error(), loaded.code());
    }
    const core::Session session = loaded.take_value();

    if (core::IsTerminal(session.status) || session.status == SessionStatus::FAILED) {
        return core::Result<void>::error(
            "Session " + session_id + " is " + core::SessionStatusName(session.status) + " and cannot run",
            core::Error::Code::FAILED_PRECONDITION);
    }

    Phase phase = session.phase;
    bool resumed = session.status == SessionStatus::RUNNING;
    if (session.status == SessionStatus::PAUSED) {
        if (!session.resume_phase || !PhaseStateMachine::canTransition(Phase::PAUSED, *session.resume_phase)) {
            return core::Result<void>::error("Paused session " + session_id + " has no valid resume phase",
                                             core::Error::Code::FAILED_PRECONDITION);
        }
        phase = *session.resume_phase;
        resumed = true;
    }
    if (!PhaseStateMachine::isRunningPhase(phase)) {
        return core::Result<void>::error(
            std::string("Session ") + session_id + " is in phase " + core::PhaseName(phase),
            core::Error::Code::FAILED_PRECONDITION);
    }

    core::SessionUpdate update;
    update.phase = phase;
    update.status = SessionStatus::RUNNING;
    update.clear_resume_phase = true;
    if (session.stats.start_time == 0) {
        core::MigrationStats stats = session.stats;
        stats.start_time = core::NowMicros();
        update.stats = stats;
    }
    auto updated = deps_.store->updateSession(session_id, update);
    if (!updated.ok()) {
        return updated;
    }

    MIGRATOR_INFO("{} session {} in phase {}", resumed ? "Resuming" : "Starting", session_id, core::PhaseName(phase));
    emit(resumed ? "session_resumed" : "session_started", session_id, phase);

    while (true) {
        const auto phase_started = std::chrono::steady_clock::now();
        auto result = interrupted();
        if (result.ok()) {
            result = runPhase(phase, session_id);
        }

        if (!result.ok()) {
            bool rollback_pending = false;
            {
                std::lock_guard<std::mutex> lock(run_mutex_);
                rollback_pending = pending_rollback_.has_value();
            }
            if (result.code() == core::Error::Code::CANCELLED && rollback_pending) {
                MIGRATOR_WARN("Phase {} of {} interrupted for rollback", core::PhaseName(phase), session_id);
            } else if (result.code() == core::Error::Code::CANCELLED && pause_requested_.load()) {
                pause(session_id, phase);
            } else {
                handleFailure(session_id, phase, result.error());
            }
            return core::Result<void>();
        }

        deps_.store->recordMetric(session_id, "phase_duration_seconds", SecondsSince(phase_started), "s",
                                  {{"phase", core::PhaseName(phase)}});

        auto next = PhaseStateMachine::next(phase);
        if (!next || *next == Phase::COMPLETED) {
            auto current = deps_.store->getSession(session_id);
            core::SessionUpdate done;
            done.phase = Phase::COMPLETED;
            done.status = SessionStatus::COMPLETED;
            if (current.ok()) {
                core::MigrationStats stats = current.value().stats;
                stats.end_time = core::NowMicros();
                done.stats = stats;
            }
            auto completed = deps_.store->updateSession(session_id, done);
            if (!completed.ok()) {
                handleFailure(session_id, phase, "Could not mark session completed: " + completed.error());
                return core::Result<void>();
            }
            releaseSnapshots(session_id);
            MIGRATOR_INFO("Migration session {} completed", session_id);
            emit("session_completed", session_id, Phase::COMPLETED);
            notify("Migration completed", "Session " + session_id + " completed",
                   recovery::IncidentSeverity::INFO, session_id);
            return core::Result<void>();
        }

        auto moved = transitionTo(session_id, phase, *next);
        if (!moved.ok()) {
            handleFailure(session_id, phase, moved.error());
            return core::Result<void>();
        }
        phase = *next;
    }
}

core::Result<void> MigrationOrchestrator::runPhase(Phase phase, const std::string& session_id) {
    MIGRATOR_INFO("Session {}: running phase {}", session_id, core::PhaseName(phase));
    switch (phase) {
        case Phase::PREPARATION:
            return prepare(session_id);
        case Phase::DUAL_WRITE_SETUP:
            return setupDualWrite(session_id);
        case Phase::BACKGROUND_MIGRATION:
            return backgroundMigration(session_id);
        case Phase::READ_CUTOVER:
        case Phase::WRITE_CUTOVER:
            return cutover(session_id, phase);
        case Phase::CLEANUP:
            return cleanup(session_id);
        default:
            return core::Result<void>::error(std::string("Phase ") + core::PhaseName(phase) + " cannot be executed",
                                             core::Error::Code::FAILED_PRECONDITION);
    }
}

core::Result<void> MigrationOrchestrator::prepare(const std::string& session_id) {
    auto source = deps_.source->ping();
    if (!source.ok()) {
        return core::Result<void>::error("Source storage unreachable: " + source.error(), source.code());
    }
    auto destination = deps_.destination->ping();
    if (!destination.ok()) {
        return core::Result<void>::error("Destination storage unreachable: " + destination.error(),
                                         destination.code());
    }
    auto metadata = deps_.metadata->ping();
    if (!metadata.ok()) {
        return core::Result<void>::error("Metadata store unreachable: " + metadata.error(), metadata.code());
    }

    auto plan = buildPlan();
    if (!plan.ok()) {
        return core::Result<void>::error(plan.error(), plan.code());
    }
    plan_ = plan.take_value();
    plan_session_ = session_id;

    auto session = deps_.store->getSession(session_id);
    if (!session.ok()) {
        return core::Result<void>::error(session.error(), session.code());
    }
    core::MigrationStats stats = session.value().stats;
    stats.total_files = plan_.size();
    stats.total_bytes = 0;
    for (const auto& entry : plan_) {
        stats.total_bytes += entry.size;
    }
    core::SessionUpdate update;
    update.stats = stats;
    auto updated = deps_.store->updateSession(session_id, update);
    if (!updated.ok()) {
        return updated;
    }

    deps_.store->recordMetric(session_id, "total_files", static_cast<double>(stats.total_files), "files");
    deps_.store->recordMetric(session_id, "total_bytes", static_cast<double>(stats.total_bytes), "bytes");
    emit("plan_built", session_id, Phase::PREPARATION,
         {{"total_files", std::to_string(stats.total_files)}, {"total_bytes", std::to_string(stats.total_bytes)}});
    MIGRATOR_INFO("Session {}: {} files, {} bytes to migrate", session_id, stats.total_files, stats.total_bytes);
    return core::Result<void>();
}

core::Result<std::vector<MigrationOrchestrator::FileEntry>> MigrationOrchestrator::buildPlan() {
    auto listed = deps_.source->list();
    if (!listed.ok()) {
        return core::Result<std::vector<FileEntry>>::error("Listing source failed: " + listed.error(),
                                                           listed.code());
    }
    std::vector<std::string> paths = listed.take_value();
    std::sort(paths.begin(), paths.end());
    paths.erase(std::unique(paths.begin(), paths.end()), paths.end());

    std::vector<FileEntry> entries(paths.size());
    std::atomic<size_t> stat_failures{0};
    tbb::parallel_for(tbb::blocked_range<size_t>(0, paths.size()),
        [&](const tbb::blocked_range<size_t>& range) {
            for (size_t i = range.begin(); i != range.end(); ++i) {
                entries[i].path = paths[i];
                auto info = deps_.source->stat(paths[i]);
                if (info.ok()) {
                    entries[i].size = info.value().size;
                    entries[i].checksum = info.value().checksum;
                } else {
                    // The transfer reports the definitive error for this file.
                    stat_failures.fetch_add(1);
                    MIGRATOR_WARN("Could not stat {}: {}", paths[i], info.error());
                }
            }
        });

    if (stat_failures.load() > 0) {
        MIGRATOR_WARN("{} of {} source files could not be stat'ed", stat_failures.load(), entries.size());
    }
    return core::Result<std::vector<FileEntry>>(std::move(entries));
}

core::Result<void> MigrationOrchestrator::setupDualWrite(const std::string& session_id) {
    if (!config_.cutover.dual_write_enabled) {
        MIGRATOR_INFO("Session {}: dual-write disabled, nothing to set up", session_id);
        return core::Result<void>();
    }
    if (!deps_.traffic) {
        return core::Result<void>::error("Dual-write requires a traffic controller",
                                         core::Error::Code::FAILED_PRECONDITION);
    }
    auto enabled = deps_.traffic->setDualWrite(true);
    if (!enabled.ok()) {
        return core::Result<void>::error("Enabling dual-write failed: " + enabled.error(), enabled.code());
    }
    core::SessionUpdate update;
    update.metadata["dual_write"] = "enabled";
    auto updated = deps_.store->updateSession(session_id, update);
    if (!updated.ok()) {
        return updated;
    }
    emit("dual_write_enabled", session_id, Phase::DUAL_WRITE_SETUP);
    return core::Result<void>();
}

uint64_t MigrationOrchestrator::lastCheckpointedBatch(const std::string& session_id) const {
    auto cursor = deps_.store->listCheckpoints(session_id);
    if (!cursor.ok()) {
        return 0;
    }
    while (auto saved = cursor.value()->next()) {
        auto it = saved->metadata.find(kBatchNumberKey);
        if (it != saved->metadata.end()) {
            return std::strtoull(it->second.c_str(), nullptr, 10);
        }
    }
    return 0;
}

core::Result<void> MigrationOrchestrator::backgroundMigration(const std::string& session_id) {
    if (plan_session_ != session_id) {
        auto plan = buildPlan();
        if (!plan.ok()) {
            return core::Result<void>::error(plan.error(), plan.code());
        }
        plan_ = plan.take_value();
        plan_session_ = session_id;
    }

    auto loaded = deps_.store->getSession(session_id);
    if (!loaded.ok()) {
        return core::Result<void>::error(loaded.error(), loaded.code());
    }
    core::MigrationStats stats = loaded.value().stats;

    const std::set<std::string> completed = deps_.store->completedFileIds(session_id);
    const uint64_t batch_size = config_.batch_size;
    const uint64_t total_batches = (plan_.size() + batch_size - 1) / batch_size;
    const uint64_t first_batch = lastCheckpointedBatch(session_id);
    if (first_batch > 0) {
        MIGRATOR_INFO("Session {}: resuming after batch {} of {} ({} files already done)", session_id,
                      first_batch, total_batches, completed.size());
        emit("migration_resumed", session_id, Phase::BACKGROUND_MIGRATION,
             {{"after_batch", std::to_string(first_batch)}});
    }

    for (uint64_t batch = first_batch; batch < total_batches; ++batch) {
        auto interrupt = interrupted();
        if (!interrupt.ok()) {
            return interrupt;
        }

        std::vector<transfer::FileTask> tasks;
        const size_t begin = batch * batch_size;
        const size_t end = std::min<size_t>(plan_.size(), begin + batch_size);
        for (size_t i = begin; i < end; ++i) {
            const FileEntry& entry = plan_[i];
            if (completed.count(entry.path) > 0) {
                continue;
            }
            transfer::FileTask task;
            task.id = entry.path;
            task.source_path = entry.path;
            task.target_key = entry.path;
            task.size = entry.size;
            task.checksum = entry.checksum;
            task.max_retries = config_.retry.max_retries;
            task.created_at = core::NowMicros();
            tasks.push_back(std::move(task));
        }

        transfer::BatchContext context;
        context.session_id = session_id;
        context.batch_id = core::GenerateId("batch");
        context.batch_number = batch + 1;
        context.phase = Phase::BACKGROUND_MIGRATION;

        transfer::BatchResult result = engine_->processBatch(context, std::move(tasks));
        if (result.cancelled) {
            auto dropped = engine_->takePending();
            return Cancelled("Batch " + std::to_string(batch + 1) + " interrupted with " +
                             std::to_string(dropped.size()) + " files pending");
        }

        uint64_t finished_bytes = 0;
        for (const auto& task : result.finished) {
            finished_bytes += task.size;
        }
        stats.processed_files += result.stats.completed_tasks + result.stats.failed_tasks + result.stats.skipped_tasks;
        stats.successful_files += result.stats.completed_tasks;
        stats.failed_files += result.stats.failed_tasks;
        stats.skipped_files += result.stats.skipped_tasks;
        stats.processed_bytes += finished_bytes;
        stats.transferred_bytes += result.stats.transferred_bytes;
        stats.error_count += result.stats.failed_tasks;
        stats.retry_count += result.stats.retried_attempts;
        stats.completed_batches++;
        stats.peak_transfer_rate = std::max(stats.peak_transfer_rate, result.stats.peak_throughput);
        const double elapsed = static_cast<double>(core::NowMicros() - stats.start_time) / 1e6;
        if (elapsed > 0) {
            stats.avg_transfer_rate = static_cast<double>(stats.transferred_bytes) / elapsed;
        }

        for (const auto& task : result.finished) {
            if (task.status != core::TaskStatus::COMPLETED && task.status != core::TaskStatus::SKIPPED) {
                continue;
            }
            auto located = deps_.metadata->recordLocation(task.id, task.target_key);
            if (!located.ok()) {
                return core::Result<void>::error("Recording the location of " + task.id + " failed: " +
                                                 located.error(), located.code());
            }
        }

        core::SessionUpdate update;
        update.stats = stats;
        auto updated = deps_.store->updateSession(session_id, update);
        if (!updated.ok()) {
            return updated;
        }

        auto saved = checkpoint(session_id, "batch_" + std::to_string(batch + 1),
                                "Batch " + std::to_string(batch + 1) + " of " + std::to_string(total_batches),
                                Phase::BACKGROUND_MIGRATION,
                                {{kBatchNumberKey, std::to_string(batch + 1)},
                                 {"batch_id", context.batch_id},
                                 {"total_batches", std::to_string(total_batches)}});
        if (!saved.ok()) {
            return core::Result<void>::error("Checkpoint after batch " + std::to_string(batch + 1) +
                                             " failed: " + saved.error(), saved.code());
        }
        releaseSupersededSnapshots(session_id, batch + 1);

        deps_.store->recordMetric(session_id, "batch_throughput", result.stats.throughput, "bytes/s",
                                  {{"batch_id", context.batch_id}});
        deps_.store->recordMetric(session_id, "batch_success_rate", result.stats.successRate(), "percent",
                                  {{"batch_id", context.batch_id}});
        deps_.store->recordMetric(session_id, "progress", stats.progressPercentage(), "percent");
        MIGRATOR_INFO("Session {} batch {}/{}:\n{}", session_id, batch + 1, total_batches,
                      transfer::BatchTransferEngine::FormatReport(result));
        emit("batch_completed", session_id, Phase::BACKGROUND_MIGRATION,
             {{kBatchNumberKey, std::to_string(batch + 1)},
              {"batch_id", context.batch_id},
              {"completed", std::to_string(result.stats.completed_tasks)},
              {"failed", std::to_string(result.stats.failed_tasks)},
              {"skipped", std::to_string(result.stats.skipped_tasks)}});
    }

    if (stats.failed_files > 0) {
        return core::Result<void>::error(std::to_string(stats.failed_files) + " files failed permanently",
                                         core::Error::Code::DATA_LOSS);
    }
    return core::Result<void>();
}

core::Result<void> MigrationOrchestrator::cutover(const std::string& session_id, Phase phase) {
    if (!deps_.traffic) {
        return core::Result<void>::error("Cutover requires a traffic controller",
                                         core::Error::Code::FAILED_PRECONDITION);
    }
    const bool reads = phase == Phase::READ_CUTOVER;
    auto routed = reads ? deps_.traffic->routeReads(core::TrafficTarget::DESTINATION)
                        : deps_.traffic->routeWrites(core::TrafficTarget::DESTINATION);
    if (!routed.ok()) {
        return core::Result<void>::error(std::string("Routing ") + (reads ? "reads" : "writes") +
                                         " failed: " + routed.error(), routed.code());
    }

    core::SessionUpdate update;
    update.metadata[reads ? "reads_routed" : "writes_routed"] =
        core::TrafficTargetName(core::TrafficTarget::DESTINATION);
    auto updated = deps_.store->updateSession(session_id, update);
    if (!updated.ok()) {
        return updated;
    }
    emit(reads ? "reads_routed" : "writes_routed", session_id, phase,
         {{"target", core::TrafficTargetName(core::TrafficTarget::DESTINATION)}});

    return validateCutover(session_id, phase);
}

core::Result<void> MigrationOrchestrator::validateCutover(const std::string& session_id, Phase phase) {
    if (!deps_.error_rate) {
        MIGRATOR_WARN("Session {}: no error rate sampler, skipping {} validation", session_id,
                      core::PhaseName(phase));
        return core::Result<void>();
    }

    const auto interval = config_.cutover.sample_interval;
    const int64_t samples = std::max<int64_t>(1, config_.cutover.validation_window.count() / interval.count());
    for (int64_t i = 0; i < samples; ++i) {
        if (cancel_.waitFor(interval)) {
            return Cancelled(std::string(core::PhaseName(phase)) + " validation interrupted");
        }
        auto rate = deps_.error_rate->sample();
        if (!rate.ok()) {
            return core::Result<void>::error("Error rate sampling failed: " + rate.error(),
                                             core::Error::Code::UNAVAILABLE);
        }
        deps_.store->recordMetric(session_id, "error_rate", rate.value(), "ratio",
                                  {{"phase", core::PhaseName(phase)}, {"sample", std::to_string(i + 1)}});
        if (rate.value() > config_.cutover.max_error_rate) {
            return core::Result<void>::error(
                fmt::format("Error rate {:.4f} exceeds {:.4f} during {}", rate.value(),
                            config_.cutover.max_error_rate, core::PhaseName(phase)),
                core::Error::Code::FAILED_PRECONDITION);
        }
    }
    MIGRATOR_INFO("Session {}: {} validated over {} samples", session_id, core::PhaseName(phase), samples);
    return core::Result<void>();
}

core::Result<void> MigrationOrchestrator::cleanup(const std::string& session_id) {
    if (config_.cutover.dual_write_enabled && deps_.traffic) {
        auto disabled = deps_.traffic->setDualWrite(false);
        if (!disabled.ok()) {
            return core::Result<void>::error("Disabling dual-write failed: " + disabled.error(), disabled.code());
        }
        core::SessionUpdate update;
        update.metadata["dual_write"] = "disabled";
        auto updated = deps_.store->updateSession(session_id, update);
        if (!updated.ok()) {
            return updated;
        }
    }
    engine_->takePending();
    if (plan_session_ == session_id) {
        plan_.clear();
        plan_session_.clear();
    }
    emit("cleanup_finished", session_id, Phase::CLEANUP);
    return core::Result<void>();
}

core::Result<void> MigrationOrchestrator::transitionTo(const std::string& session_id, Phase from, Phase to) {
    if (!PhaseStateMachine::canTransition(from, to)) {
        core::ErrorRecord error;
        error.session_id = session_id;
        error.error_type = "invalid_transition";
        error.message = std::string("Refused transition ") + core::PhaseName(from) + " -> " + core::PhaseName(to);
        error.severity = core::ErrorSeverity::HIGH;
        error.phase = from;
        deps_.store->recordError(error);
        return core::Result<void>::error(error.message, core::Error::Code::FAILED_PRECONDITION);
    }

    auto saved = checkpoint(session_id, std::string("phase_") + core::PhaseName(to),
                            std::string("Entering ") + core::PhaseName(to), to,
                            {{"from_phase", core::PhaseName(from)}});
    if (!saved.ok()) {
        return core::Result<void>::error(saved.error(), saved.code());
    }

    core::SessionUpdate update;
    update.phase = to;
    auto updated = deps_.store->updateSession(session_id, update);
    if (!updated.ok()) {
        return updated;
    }

    MIGRATOR_INFO("Session {}: {} -> {}", session_id, core::PhaseName(from), core::PhaseName(to));
    deps_.store->recordMetric(session_id, "phase_transition", static_cast<double>(static_cast<int>(to)), "phase",
                              {{"from", core::PhaseName(from)}, {"to", core::PhaseName(to)}});
    emit("phase_transition", session_id, to, {{"from", core::PhaseName(from)}, {"to", core::PhaseName(to)}});
    return core::Result<void>();
}

core::Result<std::string> MigrationOrchestrator::checkpoint(const std::string& session_id, const std::string& name,
                                                            const std::string& description, Phase phase,
                                                            core::Metadata metadata) {
    auto snapshot = deps_.metadata->snapshot();
    if (!snapshot.ok()) {
        return core::Result<std::string>::error("Metadata snapshot failed: " + snapshot.error(), snapshot.code());
    }
    metadata[kMetadataSnapshotKey] = snapshot.take_value();

    auto session = deps_.store->getSession(session_id);
    if (!session.ok()) {
        return core::Result<std::string>::error(session.error(), session.code());
    }
    auto created = deps_.store->createCheckpoint(session_id, name, description, phase,
                                                 session.value().stats, metadata);
    if (created.ok()) {
        MIGRATOR_DEBUG("Session {}: checkpoint {} ({})", session_id, created.value(), name);
        emit("checkpoint_created", session_id, phase, {{"checkpoint_id", created.value()}, {"name", name}});
    }
    return created;
}

void MigrationOrchestrator::pause(const std::string& session_id, Phase phase) {
    auto saved = checkpoint(session_id, "paused", std::string("Paused during ") + core::PhaseName(phase),
                            Phase::PAUSED, {{"resume_phase", core::PhaseName(phase)}});
    if (!saved.ok()) {
        MIGRATOR_WARN("Session {}: pause checkpoint failed: {}", session_id, saved.error());
    }

    core::SessionUpdate update;
    update.phase = Phase::PAUSED;
    update.status = SessionStatus::PAUSED;
    update.resume_phase = phase;
    auto updated = deps_.store->updateSession(session_id, update);
    if (!updated.ok()) {
        MIGRATOR_ERROR("Session {}: could not record pause: {}", session_id, updated.error());
        return;
    }
    MIGRATOR_INFO("Session {} paused in {}", session_id, core::PhaseName(phase));
    emit("session_paused", session_id, Phase::PAUSED, {{"resume_phase", core::PhaseName(phase)}});
}

core::Result<void> MigrationOrchestrator::interrupted() const {
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (pending_rollback_) {
        return Cancelled("Rollback requested");
    }
    if (pause_requested_.load()) {
        return Cancelled("Pause requested");
    }
    return core::Result<void>();
}

void MigrationOrchestrator::failSession(const std::string& session_id, Phase phase, const std::string& reason) {
    MIGRATOR_ERROR("Session {} failed in {}: {}", session_id, core::PhaseName(phase), reason);

    core::ErrorRecord error;
    error.session_id = session_id;
    error.error_type = "phase_failure";
    error.message = reason;
    error.severity = core::ErrorSeverity::HIGH;
    error.phase = phase;
    deps_.store->recordError(std::move(error));

    core::SessionUpdate update;
    update.phase = Phase::FAILED;
    update.status = SessionStatus::FAILED;
    update.clear_resume_phase = true;
    update.metadata["failed_phase"] = core::PhaseName(phase);
    update.metadata["failure_reason"] = reason;
    auto updated = deps_.store->updateSession(session_id, update);
    if (!updated.ok()) {
        MIGRATOR_CRITICAL("Session {}: could not record failure: {}", session_id, updated.error());
    }

    notify("Migration failed", reason, recovery::IncidentSeverity::ERROR, session_id,
           {{"failed_phase", core::PhaseName(phase)}});
    emit("session_failed", session_id, phase, {{"failed_phase", core::PhaseName(phase)}, {"reason", reason}});
}

void MigrationOrchestrator::handleFailure(const std::string& session_id, Phase phase, const std::string& reason) {
    failSession(session_id, phase, reason);
    if (!config_.recovery.auto_rollback) {
        MIGRATOR_WARN("Session {}: automatic rollback disabled, waiting for an operator", session_id);
        return;
    }
    recovery::RollbackRequest request;
    request.session_id = session_id;
    request.reason = std::string("automatic rollback after ") + core::PhaseName(phase) + " failure: " + reason;
    auto rolled_back = executeRollback(request);
    if (!rolled_back.ok()) {
        MIGRATOR_CRITICAL("Session {}: automatic rollback failed: {}", session_id, rolled_back.error());
    }
}

void MigrationOrchestrator::drainRollbacks(const std::string& session_id) {
    while (true) {
        std::optional<recovery::RollbackRequest> request;
        {
            std::lock_guard<std::mutex> lock(run_mutex_);
            if (!pending_rollback_) {
                running_ = false;
                active_session_.clear();
                run_thread_ = std::thread::id();
                return;
            }
            request.swap(pending_rollback_);
        }

        auto session = deps_.store->getSession(session_id);
        if (!session.ok()) {
            MIGRATOR_ERROR("Rollback of {} dropped: {}", session_id, session.error());
            continue;
        }
        const core::Session& current = session.value();
        if (current.status == SessionStatus::COMPLETED || current.status == SessionStatus::ARCHIVED) {
            MIGRATOR_WARN("Rollback of {} dropped: session is {}", session_id,
                          core::SessionStatusName(current.status));
            continue;
        }
        if (current.status != SessionStatus::FAILED && current.status != SessionStatus::ROLLED_BACK) {
            failSession(session_id, current.resume_phase.value_or(current.phase),
                        "rollback requested: " + request->reason);
        }
        auto rolled_back = executeRollback(*request);
        if (!rolled_back.ok()) {
            MIGRATOR_CRITICAL("Session {}: requested rollback failed: {}", session_id, rolled_back.error());
        }
    }
}

core::Result<void> MigrationOrchestrator::executeRollback(const recovery::RollbackRequest& request) {
    emit("rollback_started", request.session_id, std::nullopt, {{"reason", request.reason}});
    auto report = rollback_->execute(request);
    if (!report.ok()) {
        emit("rollback_failed", request.session_id, Phase::FAILED, {{"error", report.error()}});
        return core::Result<void>::error(report.error(), report.code());
    }
    const recovery::RollbackReport& result = report.value();
    if (!result.already_rolled_back) {
        releaseSnapshots(request.session_id);
    }
    emit("rollback_completed", request.session_id, Phase::ROLLED_BACK,
         {{"checkpoint_id", result.target_checkpoint_id},
          {"target_phase", core::PhaseName(result.target_phase)},
          {"already_rolled_back", result.already_rolled_back ? "true" : "false"}});
    return core::Result<void>();
}

bool MigrationOrchestrator::releaseSnapshotOf(const core::Checkpoint& saved) {
    auto it = saved.metadata.find(kMetadataSnapshotKey);
    if (it == saved.metadata.end() || it->second.empty()) {
        return false;
    }
    auto released = deps_.metadata->release(it->second);
    if (!released.ok()) {
        if (released.code() != core::Error::Code::NOT_FOUND) {
            MIGRATOR_WARN("Could not release metadata snapshot {} of checkpoint {}: {}", it->second, saved.id,
                          released.error());
        }
        return false;
    }
    return true;
}

void MigrationOrchestrator::releaseSupersededSnapshots(const std::string& session_id, uint64_t newest_batch) {
    const uint64_t retained = config_.recovery.retained_batch_snapshots;
    if (newest_batch <= retained) {
        return;
    }
    const uint64_t release_through = newest_batch - retained;

    auto session = deps_.store->getSession(session_id);
    if (!session.ok()) {
        MIGRATOR_WARN("Session {}: snapshot release skipped: {}", session_id, session.error());
        return;
    }
    uint64_t released_through = 0;
    auto marker = session.value().metadata.find(core::kSnapshotsReleasedThroughKey);
    if (marker != session.value().metadata.end()) {
        released_through = std::strtoull(marker->second.c_str(), nullptr, 10);
    }
    if (release_through <= released_through) {
        return;
    }

    // The marker goes first so no checkpoint ever looks restorable without its snapshot.
    core::SessionUpdate update;
    update.metadata[core::kSnapshotsReleasedThroughKey] = std::to_string(release_through);
    auto updated = deps_.store->updateSession(session_id, update);
    if (!updated.ok()) {
        MIGRATOR_WARN("Session {}: snapshot release skipped: {}", session_id, updated.error());
        return;
    }

    auto cursor = deps_.store->listCheckpoints(session_id);
    if (!cursor.ok()) {
        MIGRATOR_WARN("Session {}: cannot list checkpoints for snapshot release: {}", session_id, cursor.error());
        return;
    }
    size_t released = 0;
    while (auto saved = cursor.value()->next()) {
        auto batch = saved->metadata.find(kBatchNumberKey);
        if (batch == saved->metadata.end()) continue;
        const uint64_t number = std::strtoull(batch->second.c_str(), nullptr, 10);
        if (number <= released_through) break;
        if (number > release_through) continue;
        if (releaseSnapshotOf(*saved)) released++;
    }
    MIGRATOR_DEBUG("Session {}: released {} metadata snapshots through batch {}", session_id, released,
                   release_through);
}

size_t MigrationOrchestrator::releaseSnapshots(const std::string& session_id) {
    auto cursor = deps_.store->listCheckpoints(session_id);
    if (!cursor.ok()) {
        MIGRATOR_WARN("Session {}: cannot list checkpoints for snapshot release: {}", session_id, cursor.error());
        return 0;
    }
    size_t released = 0;
    while (auto saved = cursor.value()->next()) {
        if (releaseSnapshotOf(*saved)) released++;
    }
    if (released > 0) {
        MIGRATOR_INFO("Session {}: released {} metadata snapshots", session_id, released);
    }
    return released;
}

core::Result<void> MigrationOrchestrator::halt(std::chrono::milliseconds timeout) {
    engine_->cancel();
    cancel_.cancel();
    const auto started = std::chrono::steady_clock::now();
    while (engine_->isRunning()) {
        if (std::chrono::steady_clock::now() - started > timeout) {
            return core::Result<void>::error("Transfer workers did not stop in time", core::Error::Code::TIMEOUT);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    auto dropped = engine_->takePending();
    if (!dropped.empty()) {
        MIGRATOR_INFO("Dropped {} queued transfers", dropped.size());
    }
    return core::Result<void>();
}

core::Result<SessionStatusView> MigrationOrchestrator::getSessionStatus(const std::string& session_id) const {
    auto session = deps_.store->getSession(session_id);
    if (!session.ok()) {
        return core::Result<SessionStatusView>::error(session.error(), session.code());
    }
    SessionStatusView view;
    view.session_id = session_id;
    view.phase = session.value().phase;
    view.status = session.value().status;
    view.resume_phase = session.value().resume_phase;
    view.stats = session.value().stats;
    view.progress = view.stats.progressPercentage();
    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        view.active = running_ && active_session_ == session_id;
    }
    return core::Result<SessionStatusView>(std::move(view));
}

core::Result<void> MigrationOrchestrator::requestPause(const std::string& session_id) {
    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        if (running_ && active_session_ == session_id) {
            pause_requested_.store(true);
            if (std::this_thread::get_id() != run_thread_) {
                engine_->cancel();
                cancel_.cancel();
            }
            MIGRATOR_INFO("Pause requested for session {}", session_id);
            return core::Result<void>();
        }
    }

    auto session = deps_.store->getSession(session_id);
    if (!session.ok()) {
        return core::Result<void>::error(session.error(), session.code());
    }
    const core::Session& current = session.value();
    if (current.status == SessionStatus::PAUSED) {
        return core::Result<void>();
    }
    if ((current.status != SessionStatus::PENDING && current.status != SessionStatus::RUNNING) ||
        !PhaseStateMachine::isRunningPhase(current.phase)) {
        return core::Result<void>::error(
            "Session " + session_id + " is " + core::SessionStatusName(current.status) + " and cannot be paused",
            core::Error::Code::FAILED_PRECONDITION);
    }
    pause(session_id, current.phase);
    return core::Result<void>();
}

core::Result<void> MigrationOrchestrator::requestRollback(const std::string& session_id,
                                                          std::optional<std::string> checkpoint_id) {
    recovery::RollbackRequest request;
    request.session_id = session_id;
    request.checkpoint_id = std::move(checkpoint_id);
    request.reason = "operator request";
    return submitRollback(request);
}

core::Result<void> MigrationOrchestrator::requestRollback(const std::string& session_id, core::Timestamp not_after,
                                                          const std::string& reason) {
    recovery::RollbackRequest request;
    request.session_id = session_id;
    request.not_after = not_after;
    request.reason = reason;
    return submitRollback(request);
}

core::Result<void> MigrationOrchestrator::submitRollback(const recovery::RollbackRequest& request) {
    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        if (running_) {
            if (active_session_ != request.session_id) {
                return core::Result<void>::error("Orchestrator is busy with session " + active_session_,
                                                 core::Error::Code::FAILED_PRECONDITION);
            }
            pending_rollback_ = request;
            if (std::this_thread::get_id() != run_thread_) {
                engine_->cancel();
                cancel_.cancel();
            }
            MIGRATOR_WARN("Rollback of running session {} queued: {}", request.session_id, request.reason);
            return core::Result<void>();
        }
        running_ = true;
        active_session_ = request.session_id;
        run_thread_ = std::this_thread::get_id();
    }

    core::Result<void> result;
    auto session = deps_.store->getSession(request.session_id);
    if (!session.ok()) {
        result = core::Result<void>::error(session.error(), session.code());
    } else {
        const core::Session& current = session.value();
        if (current.status == SessionStatus::COMPLETED || current.status == SessionStatus::ARCHIVED) {
            result = core::Result<void>::error(
                "Session " + request.session_id + " is " + core::SessionStatusName(current.status),
                core::Error::Code::FAILED_PRECONDITION);
        } else {
            if (current.status != SessionStatus::FAILED && current.status != SessionStatus::ROLLED_BACK) {
                failSession(request.session_id, current.resume_phase.value_or(current.phase),
                            "rollback requested: " + request.reason);
            }
            result = executeRollback(request);
        }
    }
    drainRollbacks(request.session_id);
    return result;
}

MigrationOrchestrator::RollbackHook MigrationOrchestrator::rollbackHook() {
    return [this](const std::string& session_id, const recovery::Incident& incident) {
        emit("incident", session_id, incident.phase,
             {{"incident_id", incident.id},
              {"type", recovery::IncidentTypeName(incident.type)},
              {"severity", recovery::IncidentSeverityName(incident.severity)}});
        return requestRollback(session_id, incident.detected_at,
                               "incident " + incident.id + ": " + incident.description);
    };
}

void MigrationOrchestrator::emit(const std::string& type, const std::string& session_id,
                                 std::optional<Phase> phase, core::Metadata fields) {
    if (!deps_.events) return;
    MigrationEvent event;
    event.type = type;
    event.session_id = session_id;
    event.phase = phase;
    event.fields = std::move(fields);
    event.timestamp = core::NowMicros();
    deps_.events->emit(event);
}

void MigrationOrchestrator::notify(const std::string& title, const std::string& message,
                                   recovery::IncidentSeverity severity, const std::string& session_id,
                                   core::Metadata details) {
    if (!deps_.notifier) return;
    core::Notification notification;
    notification.title = title;
    notification.message = message;
    notification.severity = recovery::IncidentSeverityName(severity);
    notification.channels = recovery::NotificationChannels(severity);
    notification.session_id = session_id;
    notification.details = std::move(details);
    notification.created_at = core::NowMicros();
    deps_.notifier->notify(notification);
}

} // namespace orchestrator
} // namespace migrator
