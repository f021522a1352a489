#include "migrator/recovery/recovery_plan.h"

namespace migrator {
namespace recovery {

namespace {

RecoveryPlan MakePlan(IncidentType type, IncidentSeverity threshold, bool auto_execute,
                      std::vector<RecoveryStep> steps) {
    RecoveryPlan plan;
    plan.type = type;
    plan.threshold = threshold;
    plan.auto_execute = auto_execute;
    plan.steps = std::move(steps);
    return plan;
}

} // namespace

std::map<IncidentType, RecoveryPlan> DefaultRecoveryPlans(const core::RecoveryConfig& config) {
    const std::chrono::milliseconds rollback_timeout = config.recovery_timeout;
    const std::chrono::milliseconds quick{30000};

    std::map<IncidentType, RecoveryPlan> plans;
    plans[IncidentType::MIGRATION_FAILURE] = MakePlan(
        IncidentType::MIGRATION_FAILURE, IncidentSeverity::ERROR, true,
        {{RecoveryAction::ROLLBACK, rollback_timeout}, {RecoveryAction::NOTIFY, quick}});
    plans[IncidentType::DATA_CORRUPTION] = MakePlan(
        IncidentType::DATA_CORRUPTION, IncidentSeverity::ERROR, true,
        {{RecoveryAction::ROLLBACK, rollback_timeout}, {RecoveryAction::NOTIFY, quick}});
    plans[IncidentType::STORAGE_FAILURE] = MakePlan(
        IncidentType::STORAGE_FAILURE, IncidentSeverity::CRITICAL, true,
        {{RecoveryAction::ROLLBACK, rollback_timeout}, {RecoveryAction::NOTIFY, quick}});
    plans[IncidentType::PERFORMANCE_DEGRADATION] = MakePlan(
        IncidentType::PERFORMANCE_DEGRADATION, IncidentSeverity::CRITICAL, true,
        {{RecoveryAction::ROLLBACK, rollback_timeout}, {RecoveryAction::NOTIFY, quick}});
    plans[IncidentType::SERVICE_OUTAGE] = MakePlan(
        IncidentType::SERVICE_OUTAGE, IncidentSeverity::CRITICAL, true,
        {{RecoveryAction::RESTART, quick}, {RecoveryAction::ESCALATE, quick}});
    plans[IncidentType::INFRASTRUCTURE_FAILURE] = MakePlan(
        IncidentType::INFRASTRUCTURE_FAILURE, IncidentSeverity::CRITICAL, true,
        {{RecoveryAction::MONITOR, quick}, {RecoveryAction::NOTIFY, quick}});
    plans[IncidentType::NETWORK_FAILURE] = MakePlan(
        IncidentType::NETWORK_FAILURE, IncidentSeverity::CRITICAL, true,
        {{RecoveryAction::MONITOR, quick}, {RecoveryAction::NOTIFY, quick}});
    plans[IncidentType::DATABASE_FAILURE] = MakePlan(
        IncidentType::DATABASE_FAILURE, IncidentSeverity::CRITICAL, false,
        {{RecoveryAction::NOTIFY, quick}, {RecoveryAction::ESCALATE, quick}});
    return plans;
}

std::vector<std::string> NotificationChannels(IncidentSeverity severity) {
    std::vector<std::string> channels = {"log"};
    if (severity >= IncidentSeverity::WARNING) channels.push_back("webhook");
    if (severity >= IncidentSeverity::ERROR) channels.push_back("email");
    if (severity >= IncidentSeverity::CRITICAL) channels.push_back("sms");
    return channels;
}

} // namespace recovery
} // namespace migrator
