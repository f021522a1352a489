#include "migrator/core/interfaces.h"

namespace migrator {
namespace core {

const char* TrafficTargetName(TrafficTarget target) {
    switch (target) {
        case TrafficTarget::SOURCE: return "SOURCE";
        case TrafficTarget::DESTINATION: return "DESTINATION";
    }
    return "UNKNOWN";
}

} // namespace core
} // namespace migrator
