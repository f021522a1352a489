#pragma once

#include <optional>
#include <vector>

#include "migrator/core/types.h"

namespace migrator {
namespace orchestrator {

/**
 * @brief Allowed phase edges of a migration session.
 *
 *   PREPARATION -> DUAL_WRITE_SETUP -> BACKGROUND_MIGRATION -> READ_CUTOVER
 *     -> WRITE_CUTOVER -> CLEANUP -> COMPLETED
 *   running phase -> FAILED | PAUSED
 *   PAUSED -> running phase | FAILED
 *   FAILED -> ROLLED_BACK
 */
class PhaseStateMachine {
public:
    static bool canTransition(core::Phase from, core::Phase to);

    // Next phase of the linear sequence, nullopt past COMPLETED or off it.
    static std::optional<core::Phase> next(core::Phase phase);

    // PREPARATION through CLEANUP.
    static bool isRunningPhase(core::Phase phase);

    // Phases whose checkpoints a rollback may restore.
    static bool isSafeRollbackTarget(core::Phase phase);

    static const std::vector<core::Phase>& linearOrder();
};

} // namespace orchestrator
} // namespace migrator
