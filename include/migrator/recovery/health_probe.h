#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "migrator/core/interfaces.h"
#include "migrator/recovery/incident.h"

namespace migrator {
namespace recovery {

struct ProbeReading {
    std::string probe;
    IncidentType type = IncidentType::SERVICE_OUTAGE;
    bool reachable = true;
    double value = 0.0;
    double threshold = 0.0;
    std::string detail;
};

/**
 * @brief Grades a reading. Nullopt when healthy.
 *
 * An unreachable dependency is CRITICAL. Otherwise the ratio
 * value/threshold selects the band: up to 1.5 WARNING, up to 2.0 ERROR,
 * up to 3.0 CRITICAL, beyond that EMERGENCY.
 */
std::optional<IncidentSeverity> GradeSeverity(const ProbeReading& reading);

class HealthProbe {
public:
    virtual ~HealthProbe() = default;
    virtual std::string name() const = 0;
    virtual ProbeReading probe() = 0;
};

/**
 * @brief Runs `probe` on its own thread and waits at most `timeout`.
 *
 * A probe that has not answered in time reads as unreachable; its thread
 * is left to finish on its own and keeps the probe alive until then.
 */
ProbeReading ProbeWithin(const std::shared_ptr<HealthProbe>& probe, std::chrono::milliseconds timeout);

/**
 * @brief Healthy while `ping` succeeds.
 */
class ReachabilityProbe : public HealthProbe {
public:
    using PingFn = std::function<core::Result<void>()>;

    ReachabilityProbe(std::string name, IncidentType type, PingFn ping)
        : name_(std::move(name)), type_(type), ping_(std::move(ping)) {}

    std::string name() const override { return name_; }
    ProbeReading probe() override;

private:
    std::string name_;
    IncidentType type_;
    PingFn ping_;
};

class ErrorRateProbe : public HealthProbe {
public:
    ErrorRateProbe(std::shared_ptr<core::ErrorRateSampler> sampler, double max_error_rate)
        : sampler_(std::move(sampler)), max_error_rate_(max_error_rate) {}

    std::string name() const override { return "error_rate"; }
    ProbeReading probe() override;

private:
    std::shared_ptr<core::ErrorRateSampler> sampler_;
    double max_error_rate_;
};

class ResourceSaturationProbe : public HealthProbe {
public:
    ResourceSaturationProbe(std::shared_ptr<core::ResourceMonitor> monitor, double max_utilization)
        : monitor_(std::move(monitor)), max_utilization_(max_utilization) {}

    std::string name() const override { return "resource_saturation"; }
    ProbeReading probe() override;

private:
    std::shared_ptr<core::ResourceMonitor> monitor_;
    double max_utilization_;
};

} // namespace recovery
} // namespace migrator
