#include "migrator/recovery/incident.h"

namespace migrator {
namespace recovery {

const char* IncidentSeverityName(IncidentSeverity severity) {
    switch (severity) {
        case IncidentSeverity::INFO: return "INFO";
        case IncidentSeverity::WARNING: return "WARNING";
        case IncidentSeverity::ERROR: return "ERROR";
        case IncidentSeverity::CRITICAL: return "CRITICAL";
        case IncidentSeverity::EMERGENCY: return "EMERGENCY";
    }
    return "UNKNOWN";
}

const char* IncidentTypeName(IncidentType type) {
    switch (type) {
        case IncidentType::MIGRATION_FAILURE: return "MIGRATION_FAILURE";
        case IncidentType::DATA_CORRUPTION: return "DATA_CORRUPTION";
        case IncidentType::SERVICE_OUTAGE: return "SERVICE_OUTAGE";
        case IncidentType::PERFORMANCE_DEGRADATION: return "PERFORMANCE_DEGRADATION";
        case IncidentType::INFRASTRUCTURE_FAILURE: return "INFRASTRUCTURE_FAILURE";
        case IncidentType::DATABASE_FAILURE: return "DATABASE_FAILURE";
        case IncidentType::STORAGE_FAILURE: return "STORAGE_FAILURE";
        case IncidentType::NETWORK_FAILURE: return "NETWORK_FAILURE";
    }
    return "UNKNOWN";
}

const char* IncidentStateName(IncidentState state) {
    switch (state) {
        case IncidentState::DETECTED: return "DETECTED";
        case IncidentState::ACKNOWLEDGED: return "ACKNOWLEDGED";
        case IncidentState::RECOVERING: return "RECOVERING";
        case IncidentState::RESOLVED: return "RESOLVED";
        case IncidentState::ESCALATED: return "ESCALATED";
        case IncidentState::MANUAL_ACTION_REQUIRED: return "MANUAL_ACTION_REQUIRED";
    }
    return "UNKNOWN";
}

const char* RecoveryActionName(RecoveryAction action) {
    switch (action) {
        case RecoveryAction::ROLLBACK: return "ROLLBACK";
        case RecoveryAction::RESTART: return "RESTART";
        case RecoveryAction::FAILOVER: return "FAILOVER";
        case RecoveryAction::REPAIR: return "REPAIR";
        case RecoveryAction::ISOLATE: return "ISOLATE";
        case RecoveryAction::ESCALATE: return "ESCALATE";
        case RecoveryAction::MONITOR: return "MONITOR";
        case RecoveryAction::NOTIFY: return "NOTIFY";
    }
    return "UNKNOWN";
}

IncidentSeverity Escalate(IncidentSeverity severity) {
    if (severity == IncidentSeverity::EMERGENCY) {
        return severity;
    }
    return static_cast<IncidentSeverity>(static_cast<int>(severity) + 1);
}

core::ErrorSeverity ToErrorSeverity(IncidentSeverity severity) {
    switch (severity) {
        case IncidentSeverity::INFO: return core::ErrorSeverity::LOW;
        case IncidentSeverity::WARNING: return core::ErrorSeverity::MEDIUM;
        case IncidentSeverity::ERROR: return core::ErrorSeverity::HIGH;
        case IncidentSeverity::CRITICAL:
        case IncidentSeverity::EMERGENCY:
            return core::ErrorSeverity::CRITICAL;
    }
    return core::ErrorSeverity::MEDIUM;
}

void Incident::transition(IncidentState next, const std::string& note) {
    state = next;
    timeline.push_back(TimelineEntry{core::NowMicros(), next, note});
}

} // namespace recovery
} // namespace migrator
