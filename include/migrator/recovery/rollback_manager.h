#ifndef MIGRATOR_RECOVERY_ROLLBACK_MANAGER_H_
#define MIGRATOR_RECOVERY_ROLLBACK_MANAGER_H_

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "migrator/core/config.h"
#include "migrator/core/interfaces.h"
#include "migrator/recovery/health_probe.h"
#include "migrator/state/state_store.h"

namespace migrator {
namespace recovery {

struct RollbackRequest {
    std::string session_id;
    std::optional<std::string> checkpoint_id;   // Explicit target
    std::optional<core::Timestamp> not_after;   // Newest safe checkpoint created at or before
    std::string reason;
};

struct RollbackStepResult {
    std::string name;
    bool critical = true;
    bool success = false;
    bool skipped = false;
    std::string message;
    std::chrono::milliseconds duration{0};
};

struct RollbackReport {
    std::string session_id;
    std::string target_checkpoint_id;
    core::Phase target_phase = core::Phase::PREPARATION;
    bool success = false;
    bool already_rolled_back = false;
    std::string failed_step;
    std::vector<RollbackStepResult> steps;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Returns a FAILED session to a safe checkpoint.
 *
 * Steps, in order: halt intake, forensic checkpoint, metadata restore,
 * traffic restore (non-critical) and a health re-probe. A failed
 * critical step aborts the rest; the session then stays FAILED with a
 * CRITICAL error and is not retried. Rolling back a session that is
 * already ROLLED_BACK succeeds without touching anything.
 */
class RollbackManager {
public:
    using HaltFn = std::function<core::Result<void>(std::chrono::milliseconds)>;

    RollbackManager(const core::RecoveryConfig& config,
                    std::shared_ptr<state::StateStore> store,
                    std::shared_ptr<core::MetadataStore> metadata,
                    std::shared_ptr<core::TrafficController> traffic,
                    std::shared_ptr<core::NotificationSink> notifier,
                    std::vector<std::shared_ptr<HealthProbe>> verification_probes,
                    HaltFn halt);

    core::Result<RollbackReport> execute(const RollbackRequest& request);

    core::Result<core::Checkpoint> selectTarget(const std::string& session_id,
                                                std::optional<core::Timestamp> not_after) const;

    std::optional<RollbackReport> lastReport() const;

private:
    using StepFn = std::function<core::Result<void>(std::chrono::milliseconds)>;

    bool runStep(RollbackReport& report, const std::string& name, bool critical,
                 std::chrono::milliseconds timeout, const StepFn& step);
    core::Result<void> restoreTraffic(const core::Session& session);
    core::Result<void> verifyHealth(std::chrono::milliseconds timeout);
    void notify(const std::string& title, const std::string& message, IncidentSeverity severity,
                const std::string& session_id, const core::Metadata& details);

    core::RecoveryConfig config_;
    std::shared_ptr<state::StateStore> store_;
    std::shared_ptr<core::MetadataStore> metadata_;
    std::shared_ptr<core::TrafficController> traffic_;
    std::shared_ptr<core::NotificationSink> notifier_;
    std::vector<std::shared_ptr<HealthProbe>> probes_;
    HaltFn halt_;

    std::mutex execute_mutex_;
    mutable std::mutex report_mutex_;
    std::optional<RollbackReport> last_report_;
};

} // namespace recovery
} // namespace migrator

#endif // MIGRATOR_RECOVERY_ROLLBACK_MANAGER_H_
