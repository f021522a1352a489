#include "migrator/adapters/proc_resource_monitor.h"

#include <fstream>
#include <sstream>

namespace migrator {
namespace adapters {

core::Result<double> ProcResourceMonitor::utilization() {
    std::ifstream in(meminfo_path_);
    if (!in) {
        return core::Result<double>::error("Cannot open " + meminfo_path_, core::Error::Code::UNAVAILABLE);
    }
    uint64_t total = 0;
    uint64_t available = 0;
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string key;
        uint64_t value = 0;
        fields >> key >> value;
        if (key == "MemTotal:") {
            total = value;
        } else if (key == "MemAvailable:") {
            available = value;
        }
    }
    if (total == 0 || available > total) {
        return core::Result<double>::error("Unexpected contents in " + meminfo_path_,
                                           core::Error::Code::INTERNAL);
    }
    return core::Result<double>(1.0 - static_cast<double>(available) / static_cast<double>(total));
}

} // namespace adapters
} // namespace migrator
