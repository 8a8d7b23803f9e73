/**
 * @file ElapsedTimeAccountant.cpp
 * @brief Pause-aware accounting of run and cooldown time
 */

#include "ElapsedTimeAccountant.h"

namespace ElapsedTimeAccountant {

bool advance(RunState &state, unsigned long tick_ms) {
    if (!isRunningPhase(state.phase))
        return false;

    if (!state.paused) {
        unsigned long left = remainingMs(state);
        state.active_elapsed_ms += (tick_ms < left) ? tick_ms : left;
    }
    return state.active_elapsed_ms >= state.duration_target_ms;
}

bool advanceCooling(RunState &state, unsigned long tick_ms) {
    if (state.phase != Phase::COOLING)
        return false;

    unsigned long left = coolingRemainingMs(state);
    state.cooling_elapsed_ms += (tick_ms < left) ? tick_ms : left;
    return state.cooling_elapsed_ms >= state.cooldown_budget_ms;
}

unsigned long remainingMs(const RunState &state) {
    if (state.active_elapsed_ms >= state.duration_target_ms)
        return 0;
    return state.duration_target_ms - state.active_elapsed_ms;
}

unsigned long coolingRemainingMs(const RunState &state) {
    if (state.cooling_elapsed_ms >= state.cooldown_budget_ms)
        return 0;
    return state.cooldown_budget_ms - state.cooling_elapsed_ms;
}

} // namespace ElapsedTimeAccountant
