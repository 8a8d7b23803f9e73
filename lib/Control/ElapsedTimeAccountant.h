/**
 * @file ElapsedTimeAccountant.h
 * @brief Active-time bookkeeping for a run, driven by control ticks
 *
 * Time is accumulated from tick intervals rather than derived from wall
 * clock differences, so pauses and crash gaps never count toward the run.
 */

#ifndef ELAPSED_TIME_ACCOUNTANT_H
#define ELAPSED_TIME_ACCOUNTANT_H

#include "EnclosureTypes.h"

namespace ElapsedTimeAccountant {

/**
 * @brief Advance active time by one tick
 *
 * Only counts in HEATING/MAINTAINING while not paused. Clamped so
 * active_elapsed_ms never exceeds duration_target_ms.
 * @return true if the duration target has been reached
 */
bool advance(RunState &state, unsigned long tick_ms);

/**
 * @brief Advance the cooling accumulator by one tick (COOLING only)
 * @return true if the cooldown budget is exhausted
 */
bool advanceCooling(RunState &state, unsigned long tick_ms);

unsigned long remainingMs(const RunState &state);
unsigned long coolingRemainingMs(const RunState &state);

} // namespace ElapsedTimeAccountant

#endif // ELAPSED_TIME_ACCOUNTANT_H
