#pragma once

#include <atomic>
#include <mutex>

#include "migrator/core/interfaces.h"

namespace migrator {
namespace adapters {

/**
 * @brief Traffic controller for deployments where the serving
 * application flips its own switches: logs each cutover call and
 * remembers the requested routing. Also reports a settable error rate.
 */
class LoggingTrafficController : public core::TrafficController, public core::ErrorRateSampler {
public:
    core::Result<void> setDualWrite(bool enabled) override;
    core::Result<void> routeReads(core::TrafficTarget target) override;
    core::Result<void> routeWrites(core::TrafficTarget target) override;

    core::Result<double> sample() override { return core::Result<double>(error_rate_.load()); }
    void setErrorRate(double rate) { error_rate_.store(rate); }

    bool dualWrite() const;
    core::TrafficTarget reads() const;
    core::TrafficTarget writes() const;

private:
    mutable std::mutex mutex_;
    bool dual_write_ = false;
    core::TrafficTarget reads_ = core::TrafficTarget::SOURCE;
    core::TrafficTarget writes_ = core::TrafficTarget::SOURCE;
    std::atomic<double> error_rate_{0.0};
};

} // namespace adapters
} // namespace migrator
