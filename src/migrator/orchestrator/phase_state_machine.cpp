#include "migrator/orchestrator/phase_state_machine.h"

#include <algorithm>

namespace migrator {
namespace orchestrator {

using core::Phase;

const std::vector<Phase>& PhaseStateMachine::linearOrder() {
    static const std::vector<Phase> order = {
        Phase::PREPARATION,
        Phase::DUAL_WRITE_SETUP,
        Phase::BACKGROUND_MIGRATION,
        Phase::READ_CUTOVER,
        Phase::WRITE_CUTOVER,
        Phase::CLEANUP,
        Phase::COMPLETED
    };
    return order;
}

std::optional<Phase> PhaseStateMachine::next(Phase phase) {
    const auto& order = linearOrder();
    auto it = std::find(order.begin(), order.end(), phase);
    if (it == order.end() || std::next(it) == order.end()) {
        return std::nullopt;
    }
    return *std::next(it);
}

bool PhaseStateMachine::isRunningPhase(Phase phase) {
    switch (phase) {
        case Phase::PREPARATION:
        case Phase::DUAL_WRITE_SETUP:
        case Phase::BACKGROUND_MIGRATION:
        case Phase::READ_CUTOVER:
        case Phase::WRITE_CUTOVER:
        case Phase::CLEANUP:
            return true;
        default:
            return false;
    }
}

bool PhaseStateMachine::isSafeRollbackTarget(Phase phase) {
    return phase == Phase::PREPARATION || phase == Phase::DUAL_WRITE_SETUP ||
           phase == Phase::BACKGROUND_MIGRATION;
}

bool PhaseStateMachine::canTransition(Phase from, Phase to) {
    if (isRunningPhase(from)) {
        if (to == Phase::FAILED || to == Phase::PAUSED) return true;
        auto following = next(from);
        return following && *following == to;
    }
    switch (from) {
        case Phase::PAUSED:
            return isRunningPhase(to) || to == Phase::FAILED;
        case Phase::FAILED:
            return to == Phase::ROLLED_BACK;
        default:
            return false;
    }
}

} // namespace orchestrator
} // namespace migrator
