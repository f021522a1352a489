#ifndef MIGRATOR_RECOVERY_DISASTER_RECOVERY_MONITOR_H_
#define MIGRATOR_RECOVERY_DISASTER_RECOVERY_MONITOR_H_

#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "migrator/core/cancellation.h"
#include "migrator/core/config.h"
#include "migrator/core/interfaces.h"
#include "migrator/recovery/health_probe.h"
#include "migrator/recovery/incident.h"
#include "migrator/recovery/recovery_plan.h"
#include "migrator/state/state_store.h"

namespace migrator {
namespace recovery {

struct MonitorStats {
    uint64_t polls = 0;
    uint64_t incidents_detected = 0;
    uint64_t incidents_resolved = 0;
    uint64_t incidents_escalated = 0;
    uint64_t manual_actions_required = 0;
    uint64_t recoveries_attempted = 0;
};

/**
 * @brief Polls health probes on a fixed interval, raises incidents and
 * runs the matching recovery plan.
 *
 * At most one incident per probe is open at a time. An open incident is
 * resolved as soon as its probe reads healthy again.
 */
class DisasterRecoveryMonitor {
public:
    using RollbackHook = std::function<core::Result<void>(const std::string& session_id,
                                                          const Incident& incident)>;
    using ActionHandler = std::function<core::Result<void>(const Incident& incident)>;

    DisasterRecoveryMonitor(const core::RecoveryConfig& config,
                            std::shared_ptr<state::StateStore> store,
                            std::shared_ptr<core::NotificationSink> notifier);
    ~DisasterRecoveryMonitor();

    DisasterRecoveryMonitor(const DisasterRecoveryMonitor&) = delete;
    DisasterRecoveryMonitor& operator=(const DisasterRecoveryMonitor&) = delete;

    void addProbe(std::shared_ptr<HealthProbe> probe);
    void setRollbackHook(RollbackHook hook);
    void setActionHandler(RecoveryAction action, ActionHandler handler);
    void setRecoveryPlan(const RecoveryPlan& plan);

    // Incidents are attributed to this session and may roll it back.
    void watchSession(const std::string& session_id);
    void unwatchSession();

    core::Result<void> start();
    void stop();
    bool isRunning() const { return running_.load(); }

    // One detection pass. Returns the incidents raised by this pass.
    std::vector<Incident> pollOnce();

    std::vector<Incident> activeIncidents() const;
    std::vector<Incident> archivedIncidents() const;
    MonitorStats stats() const;

private:
    void loop();
    void archive(const Incident& incident);
    void handleNewIncident(Incident& incident, const std::shared_ptr<HealthProbe>& probe);
    core::Result<void> runAction(RecoveryAction action, Incident& incident,
                                 const std::shared_ptr<HealthProbe>& probe);
    void escalate(Incident& incident, const std::string& note);
    void notifyIncident(const Incident& incident, const std::string& headline);
    void recordIncident(const Incident& incident, const std::string& message);
    std::string watchedSession() const;

    core::RecoveryConfig config_;
    std::shared_ptr<state::StateStore> store_;
    std::shared_ptr<core::NotificationSink> notifier_;

    mutable std::mutex config_mutex_;
    std::vector<std::shared_ptr<HealthProbe>> probes_;
    std::map<IncidentType, RecoveryPlan> plans_;
    std::map<RecoveryAction, ActionHandler> handlers_;
    RollbackHook rollback_hook_;
    std::string session_id_;

    std::mutex poll_mutex_;
    mutable std::mutex incidents_mutex_;
    std::map<std::string, Incident> active_;  // By probe name
    std::deque<Incident> archived_;  // Oldest first, at most max_archived_incidents
    MonitorStats stats_;

    std::atomic<bool> running_{false};
    core::CancellationToken stop_token_;
    std::thread thread_;
};

} // namespace recovery
} // namespace migrator

#endif // MIGRATOR_RECOVERY_DISASTER_RECOVERY_MONITOR_H_
