#pragma once

#include <string>

#include "migrator/core/interfaces.h"

namespace migrator {
namespace adapters {

/**
 * @brief Memory saturation from /proc/meminfo: 1 - MemAvailable/MemTotal.
 */
class ProcResourceMonitor : public core::ResourceMonitor {
public:
    explicit ProcResourceMonitor(std::string meminfo_path = "/proc/meminfo")
        : meminfo_path_(std::move(meminfo_path)) {}

    core::Result<double> utilization() override;

private:
    std::string meminfo_path_;
};

} // namespace adapters
} // namespace migrator
