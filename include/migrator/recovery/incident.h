#ifndef MIGRATOR_RECOVERY_INCIDENT_H_
#define MIGRATOR_RECOVERY_INCIDENT_H_

#include <optional>
#include <string>
#include <vector>

#include "migrator/core/types.h"

namespace migrator {
namespace recovery {

enum class IncidentSeverity {
    INFO = 0,
    WARNING = 1,
    ERROR = 2,
    CRITICAL = 3,
    EMERGENCY = 4
};

enum class IncidentType {
    MIGRATION_FAILURE,
    DATA_CORRUPTION,
    SERVICE_OUTAGE,
    PERFORMANCE_DEGRADATION,
    INFRASTRUCTURE_FAILURE,
    DATABASE_FAILURE,
    STORAGE_FAILURE,
    NETWORK_FAILURE
};

enum class IncidentState {
    DETECTED,
    ACKNOWLEDGED,
    RECOVERING,
    RESOLVED,
    ESCALATED,
    MANUAL_ACTION_REQUIRED
};

enum class RecoveryAction {
    ROLLBACK,
    RESTART,
    FAILOVER,
    REPAIR,
    ISOLATE,
    ESCALATE,
    MONITOR,
    NOTIFY
};

const char* IncidentSeverityName(IncidentSeverity severity);
const char* IncidentTypeName(IncidentType type);
const char* IncidentStateName(IncidentState state);
const char* RecoveryActionName(RecoveryAction action);

// One level up, saturating at EMERGENCY.
IncidentSeverity Escalate(IncidentSeverity severity);

core::ErrorSeverity ToErrorSeverity(IncidentSeverity severity);

struct TimelineEntry {
    core::Timestamp timestamp = 0;
    IncidentState state = IncidentState::DETECTED;
    std::string note;
};

struct Incident {
    std::string id;
    IncidentType type = IncidentType::MIGRATION_FAILURE;
    IncidentSeverity severity = IncidentSeverity::WARNING;
    IncidentState state = IncidentState::DETECTED;
    std::string probe;
    std::string description;
    std::string session_id;  // Empty when no session was being watched
    std::optional<core::Phase> phase;
    double observed_value = 0.0;
    double threshold = 0.0;
    core::Timestamp detected_at = 0;
    core::Timestamp acknowledged_at = 0;
    core::Timestamp resolved_at = 0;
    std::vector<RecoveryAction> actions_taken;
    std::vector<TimelineEntry> timeline;

    void transition(IncidentState next, const std::string& note);
    bool isOpen() const { return state != IncidentState::RESOLVED; }
};

} // namespace recovery
} // namespace migrator

#endif // MIGRATOR_RECOVERY_INCIDENT_H_
