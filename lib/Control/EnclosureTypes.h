/**
 * @file EnclosureTypes.h
 * @brief Shared type definitions for the enclosure heater control system
 *
 * Types used by PhaseStateMachine, Coordinator, CheckpointStore and the
 * status observers. Kept in one header so none of those modules depends on
 * another just for a type.
 */

#ifndef ENCLOSURE_TYPES_H
#define ENCLOSURE_TYPES_H

#include <cstddef>
#include <cstdint>

/**
 * @brief Lifecycle phase of a heating run
 *
 * HEATING and MAINTAINING are both "running" sub-states: the duration timer
 * counts down in either, the split only says whether the enclosure is within
 * the maintain band around the setpoint.
 */
enum class Phase : uint8_t {
    IDLE,        // No run, all actuators off
    WARMING_UP,  // Bringing the enclosure to the setpoint, timer not started
    HEATING,     // Timer running, temperature outside the maintain band
    MAINTAINING, // Timer running, temperature within the maintain band
    COOLING      // Controlled ramp down after the run
};

inline const char *phaseToString(Phase phase) {
    switch (phase) {
    case Phase::IDLE:
        return "IDLE";
    case Phase::WARMING_UP:
        return "WARMUP";
    case Phase::HEATING:
        return "HEATING";
    case Phase::MAINTAINING:
        return "MAINTAIN";
    case Phase::COOLING:
        return "COOLING";
    default:
        return "???";
    }
}

inline bool isRunningPhase(Phase phase) {
    return phase == Phase::HEATING || phase == Phase::MAINTAINING;
}

/**
 * @brief Manual override for one actuator
 */
enum class ManualOverride : uint8_t { AUTO, FORCE_OFF, FORCE_ON };

inline const char *overrideToString(ManualOverride mode) {
    switch (mode) {
    case ManualOverride::AUTO:
        return "AUTO";
    case ManualOverride::FORCE_OFF:
        return "OFF";
    case ManualOverride::FORCE_ON:
        return "ON";
    default:
        return "???";
    }
}

enum class Actuator : uint8_t { HEATER, FANS };

/**
 * @brief On/off command for every actuator
 */
struct ActuatorIntent {
    bool heater = false;
    bool fans = false;
};

inline bool operator==(const ActuatorIntent &a, const ActuatorIntent &b) {
    return a.heater == b.heater && a.fans == b.fans;
}
inline bool operator!=(const ActuatorIntent &a, const ActuatorIntent &b) {
    return !(a == b);
}

/**
 * @brief Outcome of a command, ordered from success to hardest rejection
 */
enum class CommandStatus : uint8_t {
    OK,
    INVALID_TRANSITION, // Command not allowed in the current phase
    VALIDATION_ERROR,   // Parameter out of range
    BUSY,               // Coordinator lock or intent queue unavailable
    ACTUATOR_FAULT      // Direct actuator command did not reach the relay
};

inline const char *commandStatusToString(CommandStatus status) {
    switch (status) {
    case CommandStatus::OK:
        return "OK";
    case CommandStatus::INVALID_TRANSITION:
        return "INVALID_TRANSITION";
    case CommandStatus::VALIDATION_ERROR:
        return "VALIDATION_ERROR";
    case CommandStatus::BUSY:
        return "BUSY";
    case CommandStatus::ACTUATOR_FAULT:
        return "ACTUATOR_FAULT";
    default:
        return "???";
    }
}

struct CommandResult {
    CommandStatus status;
    Phase phase;        // Phase observed when the command was judged
    const char *reason; // Static string, never null
};

inline bool isOk(const CommandResult &result) {
    return result.status == CommandStatus::OK;
}

/**
 * @brief Parameters supplied with Start
 */
struct RunSettings {
    float setpoint = 60.0f;
    float hysteresis = 2.0f;
    unsigned long duration_ms = 0;
    bool fans_enabled = true;
    bool skip_preheat = false;
    bool require_confirmation = false;
    unsigned long cooldown_budget_ms = 0;
    float cooldown_target = 21.0f;
    bool follow_job = false; // Run tracks JobFinished/JobFailedOrCancelled
};

/**
 * @brief The single run record owned by PhaseStateMachine
 *
 * Durations are milliseconds of controller time, wall-clock fields are epoch
 * seconds (0 when wall time was not valid).
 */
struct RunState {
    Phase phase = Phase::IDLE;
    bool awaiting_confirmation = false;
    bool paused = false;
    float setpoint = 0.0f;
    float hysteresis = 0.0f;
    unsigned long duration_target_ms = 0;
    unsigned long active_elapsed_ms = 0;
    ManualOverride heater_override = ManualOverride::AUTO;
    ManualOverride fan_override = ManualOverride::AUTO;
    ActuatorIntent hardware_intent;
    bool fans_enabled = false;
    bool require_confirmation = false;
    bool follow_job = false;
    float cooldown_from = 0.0f;
    float cooldown_target = 0.0f;
    unsigned long cooldown_budget_ms = 0;
    unsigned long cooling_elapsed_ms = 0;
    uint32_t run_started_at = 0;
    uint32_t last_checkpoint_at = 0;
};

/**
 * @brief One probe reading as delivered by the sensor layer
 */
struct ProbeReading {
    float temperature = 0.0f;
    bool valid = false;
};

/**
 * @brief Average over the healthy probes of one acquisition cycle
 */
struct ProbeSummary {
    bool available = false; // false when no probe is healthy
    float temperature = 0.0f;
    uint8_t healthy = 0;
    uint8_t total = 0;
};

/**
 * @brief Immutable status record broadcast to observers
 *
 * Observers must drop any snapshot whose sequence_number is not greater than
 * the last one they accepted (see SequenceFilter).
 */
struct StatusSnapshot {
    uint32_t sequence_number = 0;
    Phase phase = Phase::IDLE;
    bool awaiting_confirmation = false;
    float temperature = 0.0f;
    uint8_t healthy_probes = 0;
    float setpoint = 0.0f; // Effective regulator setpoint (ramp in COOLING)
    unsigned long active_elapsed_ms = 0;
    unsigned long remaining_ms = 0;
    unsigned long cooldown_remaining_ms = 0;
    bool paused = false;
    ActuatorIntent actuators;
    ManualOverride heater_override = ManualOverride::AUTO;
    ManualOverride fan_override = ManualOverride::AUTO;
    bool sensor_unavailable = false;
    bool actuator_fault = false;
    bool alarm_latched = false;
    uint32_t eta_s = 0;          // Time to setpoint, 0 when unknown
    bool lights_on = false;
    bool resume_pending = false; // Interrupted run awaiting resume or abort
};

/**
 * @brief Command converted into a queued mutation of RunState
 *
 * Plain data so it can travel through a FreeRTOS queue by copy.
 */
enum class IntentType : uint8_t {
    START,
    PAUSE,
    RESUME,
    CONFIRM_PREHEAT,
    STOP,
    SET_SETPOINT,
    ADJUST_DURATION,
    SET_OVERRIDE,
    JOB_FINISHED,
    JOB_FAILED
};

inline const char *intentToString(IntentType type) {
    switch (type) {
    case IntentType::START:
        return "Start";
    case IntentType::PAUSE:
        return "Pause";
    case IntentType::RESUME:
        return "Resume";
    case IntentType::CONFIRM_PREHEAT:
        return "ConfirmPreheat";
    case IntentType::STOP:
        return "Stop";
    case IntentType::SET_SETPOINT:
        return "SetSetpoint";
    case IntentType::ADJUST_DURATION:
        return "AdjustDuration";
    case IntentType::SET_OVERRIDE:
        return "Override";
    case IntentType::JOB_FINISHED:
        return "JobFinished";
    case IntentType::JOB_FAILED:
        return "JobFailed";
    default:
        return "???";
    }
}

struct Intent {
    IntentType type = IntentType::STOP;
    RunSettings settings;  // START
    float value = 0.0f;    // SET_SETPOINT
    long delta_ms = 0;     // ADJUST_DURATION
    Actuator actuator = Actuator::HEATER;       // SET_OVERRIDE
    ManualOverride mode = ManualOverride::AUTO; // SET_OVERRIDE
};

/**
 * @brief Record of the last phase change
 */
struct PhaseTransition {
    Phase from = Phase::IDLE;
    Phase to = Phase::IDLE;
    const char *reason = "";
};

#endif // ENCLOSURE_TYPES_H
