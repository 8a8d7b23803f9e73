/**
 * @file PhaseStateMachine.h
 * @brief Run lifecycle: IDLE -> WARMING_UP -> HEATING/MAINTAINING -> COOLING
 *
 * Owns the single RunState. Not thread-safe by itself; the Coordinator calls
 * it only while holding its lock.
 *
 * TRANSITIONS:
 * ------------
 * - IDLE -> WARMING_UP on Start (or straight to HEATING when skip_preheat is
 *   set and the enclosure is already at the setpoint)
 * - WARMING_UP -> HEATING once temperature >= setpoint - tolerance; with
 *   require_confirmation the run parks in the awaiting-confirmation sub-state
 *   until ConfirmPreheat
 * - HEATING <-> MAINTAINING by distance to the setpoint
 * - HEATING/MAINTAINING -> COOLING when the duration target is reached, or on
 *   JobFinished for runs that follow a print job
 * - COOLING -> IDLE at the cooldown target or when the budget is spent
 * - any -> IDLE on Stop, Emergency Stop or JobFailed
 *
 * While no probe is healthy the phase is held: no transition is taken, the
 * accountant keeps counting (capped at the target).
 */

#ifndef PHASE_STATE_MACHINE_H
#define PHASE_STATE_MACHINE_H

#include "EnclosureTypes.h"
#include "Logger.h"

class PhaseStateMachine {
  public:
    explicit PhaseStateMachine(Logger &logger);

    /**
     * @brief Judge an intent against the current phase without applying it
     */
    CommandResult check(const Intent &intent) const;

    /**
     * @brief Validate and apply an intent
     * @param probes Latest probe summary (Start uses it for skip_preheat)
     * @param now_epoch Wall-clock seconds, 0 if unknown
     */
    CommandResult apply(const Intent &intent, const ProbeSummary &probes,
                        uint32_t now_epoch);

    /**
     * @brief Advance time and take automatic transitions
     */
    void tick(const ProbeSummary &probes, unsigned long tick_ms);

    /**
     * @brief Drop to IDLE from any phase, clearing overrides
     * @return true if the state changed (false when already idle)
     */
    bool emergencyStop(const char *reason);

    /**
     * @brief Re-enter a checkpointed run
     *
     * run_started_at is recomputed from active time so the gap spent
     * powered off is not counted.
     */
    void restore(const RunState &state, uint32_t now_epoch);

    void recordHardwareIntent(const ActuatorIntent &intent) {
        _state.hardware_intent = intent;
    }
    void markCheckpoint(uint32_t now_epoch) {
        _state.last_checkpoint_at = now_epoch;
    }

    /**
     * @brief Setpoint the regulator should use now (ramped in COOLING)
     */
    float effectiveSetpoint() const;

    const RunState &state() const { return _state; }
    Phase phase() const { return _state.phase; }
    uint32_t transitionCount() const { return _transition_count; }
    const PhaseTransition &lastTransition() const { return _last_transition; }

    /**
     * @brief Range checks for Start parameters
     * @return nullptr if valid, otherwise the reason
     */
    static const char *validateSettings(const RunSettings &settings);

  private:
    Logger &_logger;
    RunState _state;
    uint32_t _transition_count;
    PhaseTransition _last_transition;

    void transitionTo(Phase next, const char *reason);
    void startRun(const RunSettings &settings, const ProbeSummary &probes,
                  uint32_t now_epoch);
    void enterCooling(const char *reason);
    void enterIdle(const char *reason);
    Phase runningPhaseFor(float temperature) const;
};

#endif // PHASE_STATE_MACHINE_H
