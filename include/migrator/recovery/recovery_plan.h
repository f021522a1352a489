#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "migrator/core/config.h"
#include "migrator/recovery/incident.h"

namespace migrator {
namespace recovery {

struct RecoveryStep {
    RecoveryAction action = RecoveryAction::NOTIFY;
    std::chrono::milliseconds timeout{60000};
};

/**
 * @brief What to do about an incident type once its severity reaches
 * `threshold`. Plans that are not auto-executable always wait for an
 * operator.
 */
struct RecoveryPlan {
    IncidentType type = IncidentType::MIGRATION_FAILURE;
    IncidentSeverity threshold = IncidentSeverity::ERROR;
    bool auto_execute = true;
    std::vector<RecoveryStep> steps;
};

std::map<IncidentType, RecoveryPlan> DefaultRecoveryPlans(const core::RecoveryConfig& config);

// Channels engaged for a severity: "log" always, then webhook, email and sms.
std::vector<std::string> NotificationChannels(IncidentSeverity severity);

} // namespace recovery
} // namespace migrator
