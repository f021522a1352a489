#include "migrator/recovery/health_probe.h"

#include <future>
#include <thread>

namespace migrator {
namespace recovery {

std::optional<IncidentSeverity> GradeSeverity(const ProbeReading& reading) {
    if (!reading.reachable) {
        return IncidentSeverity::CRITICAL;
    }
    if (reading.value <= reading.threshold) {
        return std::nullopt;
    }
    if (reading.threshold <= 0.0) {
        return IncidentSeverity::EMERGENCY;
    }

    const double ratio = reading.value / reading.threshold;
    if (ratio <= 1.5) return IncidentSeverity::WARNING;
    if (ratio <= 2.0) return IncidentSeverity::ERROR;
    if (ratio <= 3.0) return IncidentSeverity::CRITICAL;
    return IncidentSeverity::EMERGENCY;
}

ProbeReading ProbeWithin(const std::shared_ptr<HealthProbe>& probe, std::chrono::milliseconds timeout) {
    auto task = std::make_shared<std::packaged_task<ProbeReading()>>([probe] { return probe->probe(); });
    std::future<ProbeReading> answer = task->get_future();
    std::thread([task] { (*task)(); }).detach();

    if (answer.wait_for(timeout) == std::future_status::ready) {
        return answer.get();
    }
    ProbeReading reading;
    reading.probe = probe->name();
    reading.reachable = false;
    reading.detail = "no answer within " + std::to_string(timeout.count()) + "ms";
    return reading;
}

ProbeReading ReachabilityProbe::probe() {
    ProbeReading reading;
    reading.probe = name_;
    reading.type = type_;
    auto result = ping_();
    if (!result.ok()) {
        reading.reachable = false;
        reading.detail = result.error();
    }
    return reading;
}

ProbeReading ErrorRateProbe::probe() {
    ProbeReading reading;
    reading.probe = name();
    reading.type = IncidentType::PERFORMANCE_DEGRADATION;
    reading.threshold = max_error_rate_;
    auto sample = sampler_->sample();
    if (!sample.ok()) {
        reading.reachable = false;
        reading.type = IncidentType::SERVICE_OUTAGE;
        reading.detail = sample.error();
        return reading;
    }
    reading.value = sample.value();
    return reading;
}

ProbeReading ResourceSaturationProbe::probe() {
    ProbeReading reading;
    reading.probe = name();
    reading.type = IncidentType::INFRASTRUCTURE_FAILURE;
    reading.threshold = max_utilization_;
    auto utilization = monitor_->utilization();
    if (!utilization.ok()) {
        reading.reachable = false;
        reading.detail = utilization.error();
        return reading;
    }
    reading.value = utilization.value();
    return reading;
}

} // namespace recovery
} // namespace migrator
