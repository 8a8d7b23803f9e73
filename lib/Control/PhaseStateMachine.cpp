/**
 * @file PhaseStateMachine.cpp
 * @brief Implementation of the run lifecycle
 */

#include "PhaseStateMachine.h"
#include "ElapsedTimeAccountant.h"
#include "config.h"
#include <cmath>

PhaseStateMachine::PhaseStateMachine(Logger &logger)
    : _logger(logger), _transition_count(0) {}

// =============================================================================
// Validation
// =============================================================================

const char *PhaseStateMachine::validateSettings(const RunSettings &settings) {
    if (std::isnan(settings.setpoint) ||
        settings.setpoint < Limits::MIN_SETPOINT_C ||
        settings.setpoint > Limits::MAX_SETPOINT_C)
        return "setpoint out of range";
    if (settings.duration_ms == 0 ||
        settings.duration_ms > Limits::MAX_DURATION_MS)
        return "duration out of range";
    if (std::isnan(settings.hysteresis) || settings.hysteresis <= 0.0f ||
        settings.hysteresis > Limits::MAX_HYSTERESIS_C)
        return "hysteresis out of range";
    if (std::isnan(settings.cooldown_target) ||
        settings.cooldown_target < Limits::MIN_SETPOINT_C ||
        settings.cooldown_target > Limits::MAX_SETPOINT_C)
        return "cooldown target out of range";
    if (settings.cooldown_budget_ms >
        CheckpointPolicy::MAX_COOLDOWN_BUDGET_S * 1000UL)
        return "cooldown budget too long";
    return nullptr;
}

CommandResult PhaseStateMachine::check(const Intent &intent) const {
    const Phase phase = _state.phase;
    const bool active_run = phase == Phase::WARMING_UP || isRunningPhase(phase);

    auto reject = [phase](CommandStatus status, const char *reason) {
        return CommandResult{status, phase, reason};
    };

    switch (intent.type) {
    case IntentType::START: {
        if (phase != Phase::IDLE)
            return reject(CommandStatus::INVALID_TRANSITION,
                          "run already active");
        const char *why = validateSettings(intent.settings);
        if (why != nullptr)
            return reject(CommandStatus::VALIDATION_ERROR, why);
        break;
    }
    case IntentType::PAUSE:
        if (!isRunningPhase(phase))
            return reject(CommandStatus::INVALID_TRANSITION,
                          "pause needs a running timer");
        if (_state.paused)
            return reject(CommandStatus::INVALID_TRANSITION, "already paused");
        break;
    case IntentType::RESUME:
        if (!isRunningPhase(phase))
            return reject(CommandStatus::INVALID_TRANSITION,
                          "resume needs a running timer");
        if (!_state.paused)
            return reject(CommandStatus::INVALID_TRANSITION, "not paused");
        break;
    case IntentType::CONFIRM_PREHEAT:
        if (phase != Phase::WARMING_UP || !_state.awaiting_confirmation)
            return reject(CommandStatus::INVALID_TRANSITION,
                          "not awaiting confirmation");
        break;
    case IntentType::STOP:
        if (phase == Phase::IDLE)
            return reject(CommandStatus::INVALID_TRANSITION, "no active run");
        break;
    case IntentType::SET_SETPOINT:
        if (!active_run)
            return reject(CommandStatus::INVALID_TRANSITION,
                          "setpoint fixed outside a run");
        if (std::isnan(intent.value) || intent.value < Limits::MIN_SETPOINT_C ||
            intent.value > Limits::MAX_SETPOINT_C)
            return reject(CommandStatus::VALIDATION_ERROR,
                          "setpoint out of range");
        break;
    case IntentType::ADJUST_DURATION: {
        if (!active_run)
            return reject(CommandStatus::INVALID_TRANSITION,
                          "duration fixed outside a run");
        long long target = static_cast<long long>(_state.duration_target_ms) +
                           intent.delta_ms;
        if (target <= 0 ||
            target > static_cast<long long>(Limits::MAX_DURATION_MS))
            return reject(CommandStatus::VALIDATION_ERROR,
                          "duration out of range");
        break;
    }
    case IntentType::SET_OVERRIDE:
        if (phase == Phase::IDLE)
            return reject(CommandStatus::INVALID_TRANSITION, "no active run");
        break;
    case IntentType::JOB_FINISHED:
        if (!active_run || !_state.follow_job)
            return reject(CommandStatus::INVALID_TRANSITION,
                          "run does not follow a job");
        break;
    case IntentType::JOB_FAILED:
        if (phase == Phase::IDLE || !_state.follow_job)
            return reject(CommandStatus::INVALID_TRANSITION,
                          "run does not follow a job");
        break;
    default:
        return reject(CommandStatus::VALIDATION_ERROR, "unknown intent");
    }

    return CommandResult{CommandStatus::OK, phase, "accepted"};
}

// =============================================================================
// Mutations
// =============================================================================

CommandResult PhaseStateMachine::apply(const Intent &intent,
                                       const ProbeSummary &probes,
                                       uint32_t now_epoch) {
    CommandResult result = check(intent);
    if (!isOk(result))
        return result;

    switch (intent.type) {
    case IntentType::START:
        startRun(intent.settings, probes, now_epoch);
        break;
    case IntentType::PAUSE:
        _state.paused = true;
        _logger.logf(false, "PSM: paused at %lus",
                     _state.active_elapsed_ms / 1000UL);
        break;
    case IntentType::RESUME:
        _state.paused = false;
        _logger.logf(false, "PSM: resumed at %lus",
                     _state.active_elapsed_ms / 1000UL);
        break;
    case IntentType::CONFIRM_PREHEAT:
        _state.awaiting_confirmation = false;
        transitionTo(Phase::HEATING, "preheat confirmed");
        break;
    case IntentType::STOP:
        enterIdle("stop");
        break;
    case IntentType::SET_SETPOINT:
        _logger.logf(false, "PSM: setpoint %.1f -> %.1fC", _state.setpoint,
                     intent.value);
        _state.setpoint = intent.value;
        break;
    case IntentType::ADJUST_DURATION:
        _state.duration_target_ms = static_cast<unsigned long>(
            static_cast<long long>(_state.duration_target_ms) +
            intent.delta_ms);
        _logger.logf(false, "PSM: duration now %lus",
                     _state.duration_target_ms / 1000UL);
        // Counted time is never given back; a target already behind it
        // ends the run here.
        if (isRunningPhase(_state.phase) &&
            _state.active_elapsed_ms >= _state.duration_target_ms)
            enterCooling("duration shortened");
        break;
    case IntentType::SET_OVERRIDE:
        if (intent.actuator == Actuator::HEATER) {
            _state.heater_override = intent.mode;
        } else {
            _state.fan_override = intent.mode;
        }
        _logger.logf(false, "PSM: %s override %s",
                     intent.actuator == Actuator::HEATER ? "heater" : "fans",
                     overrideToString(intent.mode));
        break;
    case IntentType::JOB_FINISHED:
        if (isRunningPhase(_state.phase)) {
            enterCooling("job finished");
        } else {
            enterIdle("job finished before preheat");
        }
        break;
    case IntentType::JOB_FAILED:
        enterIdle("job failed or cancelled");
        break;
    }
    return result;
}

void PhaseStateMachine::startRun(const RunSettings &settings,
                                 const ProbeSummary &probes,
                                 uint32_t now_epoch) {
    RunState next;
    next.setpoint = settings.setpoint;
    next.hysteresis = settings.hysteresis;
    next.duration_target_ms = settings.duration_ms;
    next.fans_enabled = settings.fans_enabled;
    next.require_confirmation = settings.require_confirmation;
    next.follow_job = settings.follow_job;
    next.cooldown_target = settings.cooldown_target;
    next.cooldown_budget_ms = settings.cooldown_budget_ms;
    next.run_started_at = now_epoch;
    _state = next;

    _logger.logf(false, "PSM: start %.1fC for %lumin%s", settings.setpoint,
                 settings.duration_ms / 60000UL,
                 settings.follow_job ? " (job)" : "");

    if (settings.skip_preheat && probes.available &&
        probes.temperature >= settings.setpoint) {
        transitionTo(Phase::HEATING, "start, preheat skipped");
    } else {
        transitionTo(Phase::WARMING_UP, "start");
    }
}

void PhaseStateMachine::tick(const ProbeSummary &probes,
                             unsigned long tick_ms) {
    switch (_state.phase) {
    case Phase::IDLE:
        return;

    case Phase::WARMING_UP:
        if (!probes.available || _state.awaiting_confirmation)
            return;
        if (probes.temperature >=
            _state.setpoint - Regulation::WARMUP_TOLERANCE_C) {
            if (_state.require_confirmation) {
                _state.awaiting_confirmation = true;
                _logger.log("PSM: preheat reached, awaiting confirmation");
            } else {
                transitionTo(Phase::HEATING, "preheat reached");
            }
        }
        return;

    case Phase::HEATING:
    case Phase::MAINTAINING: {
        bool done = ElapsedTimeAccountant::advance(_state, tick_ms);
        if (!probes.available)
            return;
        if (done) {
            enterCooling("duration reached");
            return;
        }
        Phase next = runningPhaseFor(probes.temperature);
        transitionTo(next, next == Phase::MAINTAINING ? "within band"
                                                       : "outside band");
        return;
    }

    case Phase::COOLING: {
        bool spent = ElapsedTimeAccountant::advanceCooling(_state, tick_ms);
        if (!probes.available)
            return;
        if (probes.temperature <= _state.cooldown_target) {
            enterIdle("cooldown target reached");
        } else if (spent) {
            enterIdle("cooldown budget spent");
        }
        return;
    }
    }
}

bool PhaseStateMachine::emergencyStop(const char *reason) {
    if (_state.phase == Phase::IDLE)
        return false;
    enterIdle(reason);
    return true;
}

void PhaseStateMachine::restore(const RunState &state, uint32_t now_epoch) {
    Phase target = state.phase;
    _state = state;
    _state.phase = Phase::IDLE;

    unsigned long counted_s =
        (_state.active_elapsed_ms + _state.cooling_elapsed_ms) / 1000UL;
    _state.run_started_at =
        (now_epoch > counted_s) ? now_epoch - counted_s : 0;

    transitionTo(target, "resumed from checkpoint");
    _logger.logf(false, "PSM: resumed %s at %lus of %lus, %s", phaseToString(target),
                 _state.active_elapsed_ms / 1000UL,
                 _state.duration_target_ms / 1000UL,
                 _state.paused ? "paused" : "running");
}

// =============================================================================
// Internals
// =============================================================================

float PhaseStateMachine::effectiveSetpoint() const {
    if (_state.phase != Phase::COOLING)
        return _state.setpoint;
    if (_state.cooldown_from <= _state.cooldown_target)
        return _state.cooldown_target;

    unsigned long total_steps =
        _state.cooldown_budget_ms / Timing::COOLDOWN_STEP_INTERVAL_MS;
    if (total_steps == 0)
        return _state.cooldown_target;

    // First step is taken on entry, then one per interval
    unsigned long step =
        _state.cooling_elapsed_ms / Timing::COOLDOWN_STEP_INTERVAL_MS + 1;
    if (step > total_steps)
        step = total_steps;

    float span = _state.cooldown_from - _state.cooldown_target;
    return _state.cooldown_from -
           span * static_cast<float>(step) / static_cast<float>(total_steps);
}

Phase PhaseStateMachine::runningPhaseFor(float temperature) const {
    return std::fabs(temperature - _state.setpoint) <=
                   Regulation::MAINTAIN_BAND_C
               ? Phase::MAINTAINING
               : Phase::HEATING;
}

void PhaseStateMachine::enterCooling(const char *reason) {
    _state.cooldown_from = _state.setpoint;
    _state.cooling_elapsed_ms = 0;
    _state.paused = false;
    transitionTo(Phase::COOLING, reason);
}

void PhaseStateMachine::enterIdle(const char *reason) {
    Phase from = _state.phase;
    _state = RunState();
    _state.phase = from;
    transitionTo(Phase::IDLE, reason);
}

void PhaseStateMachine::transitionTo(Phase next, const char *reason) {
    if (next == _state.phase)
        return;

    _last_transition = PhaseTransition{_state.phase, next, reason};
    _transition_count++;
    _state.phase = next;

    // Band flapping between HEATING and MAINTAINING stays off the screen
    bool quiet = isRunningPhase(_last_transition.from) && isRunningPhase(next);
    _logger.logf(quiet, "PSM: -> %s (%s)", phaseToString(next), reason);
}
