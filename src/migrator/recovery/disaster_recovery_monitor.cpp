#include "migrator/recovery/disaster_recovery_monitor.h"

#include <chrono>

#include "migrator/common/logger.h"

namespace migrator {
namespace recovery {

namespace {

using SteadyClock = std::chrono::steady_clock;

std::chrono::milliseconds ElapsedSince(SteadyClock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start);
}

} // namespace

DisasterRecoveryMonitor::DisasterRecoveryMonitor(const core::RecoveryConfig& config,
                                                 std::shared_ptr<state::StateStore> store,
                                                 std::shared_ptr<core::NotificationSink> notifier)
    : config_(config),
      store_(std::move(store)),
      notifier_(std::move(notifier)),
      plans_(DefaultRecoveryPlans(config)) {}

DisasterRecoveryMonitor::~DisasterRecoveryMonitor() {
    stop();
}

void DisasterRecoveryMonitor::addProbe(std::shared_ptr<HealthProbe> probe) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    probes_.push_back(std::move(probe));
}

void DisasterRecoveryMonitor::setRollbackHook(RollbackHook hook) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    rollback_hook_ = std::move(hook);
}

void DisasterRecoveryMonitor::setActionHandler(RecoveryAction action, ActionHandler handler) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    handlers_[action] = std::move(handler);
}

void DisasterRecoveryMonitor::setRecoveryPlan(const RecoveryPlan& plan) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    plans_[plan.type] = plan;
}

void DisasterRecoveryMonitor::watchSession(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    session_id_ = session_id;
}

void DisasterRecoveryMonitor::unwatchSession() {
    std::lock_guard<std::mutex> lock(config_mutex_);
    session_id_.clear();
}

std::string DisasterRecoveryMonitor::watchedSession() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return session_id_;
}

core::Result<void> DisasterRecoveryMonitor::start() {
    if (running_.exchange(true)) {
        return core::Result<void>::error("Disaster recovery monitor already running",
                                         core::Error::Code::FAILED_PRECONDITION);
    }
    stop_token_.reset();
    thread_ = std::thread(&DisasterRecoveryMonitor::loop, this);
    MIGRATOR_INFO("Disaster recovery monitor started (interval {}ms)", config_.monitoring_interval.count());
    return core::Result<void>();
}

void DisasterRecoveryMonitor::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    stop_token_.cancel();
    if (thread_.joinable()) {
        thread_.join();
    }
    MIGRATOR_INFO("Disaster recovery monitor stopped");
}

void DisasterRecoveryMonitor::loop() {
    while (running_.load()) {
        pollOnce();
        if (stop_token_.waitFor(config_.monitoring_interval)) {
            break;
        }
    }
}

std::vector<Incident> DisasterRecoveryMonitor::pollOnce() {
    std::lock_guard<std::mutex> poll_lock(poll_mutex_);

    std::vector<std::shared_ptr<HealthProbe>> probes;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        probes = probes_;
    }
    {
        std::lock_guard<std::mutex> lock(incidents_mutex_);
        stats_.polls++;
    }

    std::vector<Incident> raised;
    for (const auto& probe : probes) {
        ProbeReading reading = ProbeWithin(probe, config_.probe_timeout);
        std::optional<IncidentSeverity> severity = GradeSeverity(reading);

        std::optional<Incident> open;
        {
            std::lock_guard<std::mutex> lock(incidents_mutex_);
            auto it = active_.find(reading.probe);
            if (it != active_.end()) open = it->second;
        }

        if (open) {
            if (!severity) {
                open->resolved_at = core::NowMicros();
                open->transition(IncidentState::RESOLVED, "probe healthy again");
                MIGRATOR_INFO("Incident {} ({}) resolved", open->id, reading.probe);
                std::lock_guard<std::mutex> lock(incidents_mutex_);
                active_.erase(reading.probe);
                archive(*open);
                stats_.incidents_resolved++;
            }
            continue;
        }
        if (!severity) {
            continue;
        }

        Incident incident;
        incident.id = core::GenerateId("incident");
        incident.type = reading.type;
        incident.severity = *severity;
        incident.probe = reading.probe;
        incident.observed_value = reading.value;
        incident.threshold = reading.threshold;
        incident.description = reading.reachable
            ? reading.probe + " at " + std::to_string(reading.value) + " exceeds " + std::to_string(reading.threshold)
            : reading.probe + " unreachable: " + reading.detail;
        incident.session_id = watchedSession();
        incident.detected_at = core::NowMicros();
        if (!incident.session_id.empty()) {
            auto session = store_->getSession(incident.session_id);
            if (session.ok()) incident.phase = session.value().phase;
        }
        incident.transition(IncidentState::DETECTED, incident.description);
        {
            std::lock_guard<std::mutex> lock(incidents_mutex_);
            stats_.incidents_detected++;
        }
        MIGRATOR_WARN("Incident {} detected: {} {} ({})", incident.id, IncidentSeverityName(incident.severity),
                      IncidentTypeName(incident.type), incident.description);

        handleNewIncident(incident, probe);

        {
            std::lock_guard<std::mutex> lock(incidents_mutex_);
            if (incident.state == IncidentState::RESOLVED) {
                archive(incident);
                stats_.incidents_resolved++;
            } else {
                active_[incident.probe] = incident;
            }
        }
        raised.push_back(incident);
    }
    return raised;
}

// Caller holds incidents_mutex_.
void DisasterRecoveryMonitor::archive(const Incident& incident) {
    archived_.push_back(incident);
    while (archived_.size() > config_.max_archived_incidents) {
        archived_.pop_front();
    }
}

void DisasterRecoveryMonitor::handleNewIncident(Incident& incident, const std::shared_ptr<HealthProbe>& probe) {
    incident.acknowledged_at = core::NowMicros();
    incident.transition(IncidentState::ACKNOWLEDGED, "acknowledged automatically");
    recordIncident(incident, incident.description);
    notifyIncident(incident, "Incident detected");

    std::optional<RecoveryPlan> plan;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        auto it = plans_.find(incident.type);
        if (it != plans_.end()) plan = it->second;
    }
    if (!plan || incident.severity < plan->threshold) {
        return;
    }
    if (!plan->auto_execute || !config_.auto_recovery) {
        incident.transition(IncidentState::MANUAL_ACTION_REQUIRED, "recovery plan requires an operator");
        {
            std::lock_guard<std::mutex> lock(incidents_mutex_);
            stats_.manual_actions_required++;
        }
        notifyIncident(incident, "Manual action required");
        return;
    }

    incident.transition(IncidentState::RECOVERING, "executing recovery plan");
    {
        std::lock_guard<std::mutex> lock(incidents_mutex_);
        stats_.recoveries_attempted++;
    }

    const auto started = SteadyClock::now();
    for (const auto& step : plan->steps) {
        const auto step_started = SteadyClock::now();
        auto result = runAction(step.action, incident, probe);
        incident.actions_taken.push_back(step.action);
        if (result.ok() && ElapsedSince(step_started) > step.timeout) {
            result = core::Result<void>::error("exceeded step timeout", core::Error::Code::TIMEOUT);
        }

        if (ElapsedSince(started) > config_.recovery_timeout) {
            incident.transition(IncidentState::MANUAL_ACTION_REQUIRED, "recovery timeout exceeded");
            {
                std::lock_guard<std::mutex> lock(incidents_mutex_);
                stats_.manual_actions_required++;
            }
            recordIncident(incident, "recovery timed out; manual action required");
            notifyIncident(incident, "Recovery timed out");
            return;
        }
        if (!result.ok()) {
            escalate(incident, std::string(RecoveryActionName(step.action)) + " failed: " + result.error());
            return;
        }
    }

    ProbeReading verification = ProbeWithin(probe, config_.probe_timeout);
    if (GradeSeverity(verification)) {
        escalate(incident, "still unhealthy after recovery");
        return;
    }
    incident.resolved_at = core::NowMicros();
    incident.transition(IncidentState::RESOLVED, "verification probe passed");
    MIGRATOR_INFO("Incident {} resolved after recovery", incident.id);
}

core::Result<void> DisasterRecoveryMonitor::runAction(RecoveryAction action, Incident& incident,
                                                      const std::shared_ptr<HealthProbe>& probe) {
    MIGRATOR_INFO("Incident {}: executing {}", incident.id, RecoveryActionName(action));
    switch (action) {
        case RecoveryAction::ROLLBACK: {
            RollbackHook hook;
            {
                std::lock_guard<std::mutex> lock(config_mutex_);
                hook = rollback_hook_;
            }
            if (incident.session_id.empty()) {
                return core::Result<void>::error("no session to roll back", core::Error::Code::FAILED_PRECONDITION);
            }
            if (!hook) {
                return core::Result<void>::error("no rollback hook installed", core::Error::Code::FAILED_PRECONDITION);
            }
            return hook(incident.session_id, incident);
        }
        case RecoveryAction::NOTIFY:
            notifyIncident(incident, "Recovery in progress");
            return core::Result<void>();
        case RecoveryAction::ESCALATE:
            incident.severity = Escalate(incident.severity);
            notifyIncident(incident, "Incident escalated");
            return core::Result<void>();
        case RecoveryAction::MONITOR: {
            ProbeReading reading = ProbeWithin(probe, config_.probe_timeout);
            if (GradeSeverity(reading)) {
                return core::Result<void>::error(reading.probe + " still unhealthy", core::Error::Code::UNAVAILABLE);
            }
            return core::Result<void>();
        }
        case RecoveryAction::RESTART:
        case RecoveryAction::FAILOVER:
        case RecoveryAction::REPAIR:
        case RecoveryAction::ISOLATE:
            break;
    }

    ActionHandler handler;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        auto it = handlers_.find(action);
        if (it != handlers_.end()) handler = it->second;
    }
    if (!handler) {
        return core::Result<void>::error(std::string("no handler for ") + RecoveryActionName(action),
                                         core::Error::Code::FAILED_PRECONDITION);
    }
    return handler(incident);
}

void DisasterRecoveryMonitor::escalate(Incident& incident, const std::string& note) {
    incident.severity = Escalate(incident.severity);
    incident.transition(IncidentState::ESCALATED, note);
    {
        std::lock_guard<std::mutex> lock(incidents_mutex_);
        stats_.incidents_escalated++;
    }
    MIGRATOR_ERROR("Incident {} escalated to {}: {}", incident.id, IncidentSeverityName(incident.severity), note);
    recordIncident(incident, "escalated: " + note);
    notifyIncident(incident, "Incident escalated");
}

void DisasterRecoveryMonitor::notifyIncident(const Incident& incident, const std::string& headline) {
    if (!notifier_) return;
    core::Notification notification;
    notification.title = headline + ": " + IncidentTypeName(incident.type);
    notification.message = incident.description;
    notification.severity = IncidentSeverityName(incident.severity);
    notification.channels = NotificationChannels(incident.severity);
    notification.session_id = incident.session_id;
    notification.details = {
        {"incident_id", incident.id},
        {"probe", incident.probe},
        {"state", IncidentStateName(incident.state)}};
    notification.created_at = core::NowMicros();
    notifier_->notify(notification);
}

void DisasterRecoveryMonitor::recordIncident(const Incident& incident, const std::string& message) {
    if (incident.session_id.empty() || !store_) return;
    core::ErrorRecord error;
    error.session_id = incident.session_id;
    error.error_type = std::string("incident_") + IncidentTypeName(incident.type);
    error.message = message;
    error.severity = ToErrorSeverity(incident.severity);
    error.phase = incident.phase;
    error.metadata["incident_id"] = incident.id;
    error.metadata["probe"] = incident.probe;
    error.metadata["state"] = IncidentStateName(incident.state);
    store_->recordError(std::move(error));
}

std::vector<Incident> DisasterRecoveryMonitor::activeIncidents() const {
    std::lock_guard<std::mutex> lock(incidents_mutex_);
    std::vector<Incident> result;
    for (const auto& [probe, incident] : active_) {
        result.push_back(incident);
    }
    return result;
}

std::vector<Incident> DisasterRecoveryMonitor::archivedIncidents() const {
    std::lock_guard<std::mutex> lock(incidents_mutex_);
    return std::vector<Incident>(archived_.begin(), archived_.end());
}

MonitorStats DisasterRecoveryMonitor::stats() const {
    std::lock_guard<std::mutex> lock(incidents_mutex_);
    return stats_;
}

} // namespace recovery
} // namespace migrator
