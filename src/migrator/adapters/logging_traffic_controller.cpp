#include "migrator/adapters/logging_traffic_controller.h"

#include "migrator/common/logger.h"

namespace migrator {
namespace adapters {

core::Result<void> LoggingTrafficController::setDualWrite(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    dual_write_ = enabled;
    MIGRATOR_INFO("Traffic: dual-write {}", enabled ? "enabled" : "disabled");
    return core::Result<void>();
}

core::Result<void> LoggingTrafficController::routeReads(core::TrafficTarget target) {
    std::lock_guard<std::mutex> lock(mutex_);
    reads_ = target;
    MIGRATOR_INFO("Traffic: reads routed to {}", core::TrafficTargetName(target));
    return core::Result<void>();
}

core::Result<void> LoggingTrafficController::routeWrites(core::TrafficTarget target) {
    std::lock_guard<std::mutex> lock(mutex_);
    writes_ = target;
    MIGRATOR_INFO("Traffic: writes routed to {}", core::TrafficTargetName(target));
    return core::Result<void>();
}

bool LoggingTrafficController::dualWrite() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dual_write_;
}

core::TrafficTarget LoggingTrafficController::reads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reads_;
}

core::TrafficTarget LoggingTrafficController::writes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
}

} // namespace adapters
} // namespace migrator
