/**
 * @file Coordinator.cpp
 * @brief Implementation of the run lock domain and control tick
 */

#include "Coordinator.h"
#include "CrashLog.h"
#include "ElapsedTimeAccountant.h"
#include "ThermalRegulator.h"
#include "TimeService.h"
#include <esp_task_wdt.h>

namespace {
const TickType_t COMMAND_WAIT = pdMS_TO_TICKS(Timing::LOCK_TIMEOUT_MS);
} // namespace

Coordinator::Coordinator(Logger &logger, ActuatorDriver &actuators,
                         CheckpointStore &checkpoints)
    : _logger(logger), _actuators(actuators), _checkpoints(checkpoints),
      _machine(logger), _mutex(nullptr), _queue(nullptr), _task(nullptr),
      _source(nullptr), _observer_count(0), _auto_start_enabled(false),
      _job_start_seen(false), _last_job_start_ms(0), _uptime_ms(0),
      _ms_since_sample(0), _lights_on(false), _resume_pending(false),
      _alarm_latched(false),
      _actuator_fault(false), _sensor_unavailable(false),
      _checkpoint_present(false), _checkpoint_dirty(false),
      _no_time_warned(false), _ms_since_checkpoint(0) {
    for (size_t i = 0; i < Coordination::MAX_OBSERVERS; i++) {
        _observers[i] = nullptr;
    }
    _materials.loadDefaults();
}

bool Coordinator::begin() {
    if (_mutex != nullptr)
        return true;

    _mutex = xSemaphoreCreateMutex();
    _queue = xQueueCreate(Coordination::INTENT_QUEUE_LEN, sizeof(Intent));
    if (_mutex == nullptr || _queue == nullptr) {
        _logger.log("CO: RTOS allocation failed");
        return false;
    }
    return true;
}

bool Coordinator::addObserver(StatusObserver *observer) {
    if (observer == nullptr ||
        _observer_count >= Coordination::MAX_OBSERVERS)
        return false;
    _observers[_observer_count++] = observer;
    return true;
}

void Coordinator::setRunDefaults(const RunSettings &defaults,
                                 bool auto_start_enabled) {
    if (!lock(portMAX_DELAY))
        return;
    _run_defaults = defaults;
    _auto_start_enabled = auto_start_enabled;
    unlock();
}

void Coordinator::setMaterials(const MaterialTable &materials) {
    if (!lock(portMAX_DELAY))
        return;
    _materials = materials;
    unlock();
}

CheckpointLoadResult Coordinator::resumeFromCheckpoint(uint32_t now_epoch) {
    RunState restored;
    CheckpointLoadResult result = _checkpoints.load(now_epoch, restored);
    if (result != CheckpointLoadResult::RESUMABLE)
        return result;

    if (!lock(portMAX_DELAY))
        return result;
    _pending_resume = restored;
    _resume_pending = true;
    StatusSnapshot snapshot = buildSnapshotLocked();
    unlock();

    _logger.logf(false, "CO: interrupted %s run, resume or abort?",
                 phaseToString(restored.phase));
    broadcast(snapshot);
    return result;
}

CommandResult Coordinator::confirmResume(uint32_t now_epoch) {
    if (!lock(COMMAND_WAIT))
        return CommandResult{CommandStatus::BUSY, Phase::IDLE,
                             "coordinator busy"};

    Phase phase = _machine.phase();
    if (!_resume_pending) {
        unlock();
        return CommandResult{CommandStatus::INVALID_TRANSITION, phase,
                             "no run to resume"};
    }
    if (_alarm_latched) {
        unlock();
        return CommandResult{CommandStatus::INVALID_TRANSITION, phase,
                             "safety alarm latched"};
    }

    // The record has aged while waiting for the user
    CheckpointLoadResult verdict = CheckpointStore::evaluate(
        _pending_resume, _pending_resume.last_checkpoint_at, now_epoch);
    if (verdict == CheckpointLoadResult::STALE) {
        _resume_pending = false;
        _checkpoint_present = !_checkpoints.remove();
        StatusSnapshot snapshot = buildSnapshotLocked();
        unlock();
        _logger.log("CO: pending run went stale, checkpoint removed");
        broadcast(snapshot);
        return CommandResult{CommandStatus::VALIDATION_ERROR, phase,
                             "checkpoint went stale"};
    }
    if (verdict != CheckpointLoadResult::RESUMABLE) {
        unlock();
        return CommandResult{CommandStatus::INVALID_TRANSITION, phase,
                             loadResultToString(verdict)};
    }

    _resume_pending = false;
    _machine.restore(_pending_resume, now_epoch);
    _checkpoint_present = true;
    _checkpoint_dirty = false;
    _ms_since_checkpoint = 0;
    driveActuatorsLocked(_pending_resume.hardware_intent);
    phase = _machine.phase();
    StatusSnapshot snapshot = buildSnapshotLocked();
    unlock();

    broadcast(snapshot);
    return CommandResult{CommandStatus::OK, phase, "run resumed"};
}

CommandResult Coordinator::abortResume() {
    if (!lock(COMMAND_WAIT))
        return CommandResult{CommandStatus::BUSY, Phase::IDLE,
                             "coordinator busy"};

    Phase phase = _machine.phase();
    if (!_resume_pending) {
        unlock();
        return CommandResult{CommandStatus::INVALID_TRANSITION, phase,
                             "no run to resume"};
    }

    _resume_pending = false;
    // A failed erase is retried by the next idle checkpoint pass
    _checkpoint_present = !_checkpoints.remove();
    StatusSnapshot snapshot = buildSnapshotLocked();
    unlock();

    _logger.log("CO: resume aborted, checkpoint removed");
    broadcast(snapshot);
    return CommandResult{CommandStatus::OK, phase, "resume aborted"};
}

// =============================================================================
// Commands
// =============================================================================

CommandResult Coordinator::submit(const Intent &intent) {
    if (!lock(COMMAND_WAIT)) {
        _logger.logf(true, "CO: %s busy", intentToString(intent.type));
        return CommandResult{CommandStatus::BUSY, Phase::IDLE,
                             "coordinator busy"};
    }

    CommandResult result;
    if (intent.type == IntentType::START && _alarm_latched) {
        result = CommandResult{CommandStatus::INVALID_TRANSITION,
                               _machine.phase(), "safety alarm latched"};
    } else {
        result = _machine.check(intent);
    }

    if (isOk(result) && xQueueSendToBack(_queue, &intent, 0) != pdTRUE) {
        result = CommandResult{CommandStatus::BUSY, _machine.phase(),
                               "intent queue full"};
    }

    bool dropped_resume = false;
    if (isOk(result) && intent.type == IntentType::START && _resume_pending) {
        // The new run replaces the interrupted one
        _resume_pending = false;
        _checkpoint_present = true;
        dropped_resume = true;
    }
    if (!isOk(result))
        _rejected_intents.record(millis());

    StatusSnapshot snapshot = buildSnapshotLocked();
    unlock();

    if (dropped_resume)
        _logger.log("CO: pending resume dropped by new Start");
    if (!isOk(result)) {
        _logger.logf(true, "CO: %s rejected in %s: %s",
                     intentToString(intent.type), phaseToString(result.phase),
                     result.reason);
    }
    broadcast(snapshot);
    return result;
}

CommandResult Coordinator::start(const RunSettings &settings) {
    Intent intent;
    intent.type = IntentType::START;
    intent.settings = settings;
    return submit(intent);
}

CommandResult Coordinator::pause() {
    Intent intent;
    intent.type = IntentType::PAUSE;
    return submit(intent);
}

CommandResult Coordinator::resume() {
    Intent intent;
    intent.type = IntentType::RESUME;
    return submit(intent);
}

CommandResult Coordinator::confirmPreheat() {
    Intent intent;
    intent.type = IntentType::CONFIRM_PREHEAT;
    return submit(intent);
}

CommandResult Coordinator::stop() {
    Intent intent;
    intent.type = IntentType::STOP;
    return submit(intent);
}

CommandResult Coordinator::setSetpoint(float value) {
    Intent intent;
    intent.type = IntentType::SET_SETPOINT;
    intent.value = value;
    return submit(intent);
}

CommandResult Coordinator::adjustDuration(long delta_ms) {
    Intent intent;
    intent.type = IntentType::ADJUST_DURATION;
    intent.delta_ms = delta_ms;
    return submit(intent);
}

CommandResult Coordinator::submitOverride(Actuator actuator,
                                          ManualOverride mode) {
    Intent intent;
    intent.type = IntentType::SET_OVERRIDE;
    intent.actuator = actuator;
    intent.mode = mode;
    return submit(intent);
}

CommandResult Coordinator::setManualOverride(Actuator actuator, bool on) {
    return submitOverride(actuator, on ? ManualOverride::FORCE_ON
                                       : ManualOverride::FORCE_OFF);
}

CommandResult Coordinator::clearManualOverride(Actuator actuator) {
    return submitOverride(actuator, ManualOverride::AUTO);
}

CommandResult Coordinator::emergencyStop() {
    requestEmergencyStop("user emergency stop");
    return CommandResult{CommandStatus::OK, Phase::IDLE, "emergency stop"};
}

CommandResult Coordinator::setLights(bool on) {
    if (!lock(COMMAND_WAIT))
        return CommandResult{CommandStatus::BUSY, Phase::IDLE,
                             "coordinator busy"};

    bool ok = _actuators.setLights(on);
    if (ok) {
        _lights_on = on;
    } else {
        _actuator_failures.record(millis());
    }
    Phase phase = _machine.phase();
    StatusSnapshot snapshot = buildSnapshotLocked();
    unlock();

    broadcast(snapshot);
    if (!ok) {
        _logger.log("CO: lights command failed");
        return CommandResult{CommandStatus::ACTUATOR_FAULT, phase,
                             "lights relay did not respond"};
    }
    return CommandResult{CommandStatus::OK, phase, on ? "lights on" : "lights off"};
}

bool Coordinator::requestEmergencyStop(const char *reason) {
    if (!lock(portMAX_DELAY)) {
        // No lock domain yet: still make the hardware safe
        bool ok = _actuators.setHeater(false);
        ok = _actuators.setFans(false) && ok;
        if (!ok)
            _logger.log("CO: emergency stop could not reach actuators");
        CrashLog::logCritical("ESTOP", reason);
        return false;
    }

    bool changed = _machine.emergencyStop(reason);
    if (_resume_pending) {
        _resume_pending = false;
        _checkpoint_present = true;
    }
    if (_queue != nullptr)
        xQueueReset(_queue);
    driveActuatorsLocked(ActuatorIntent{});
    if ((changed || _checkpoint_present) && _checkpoints.remove())
        _checkpoint_present = false;
    _checkpoint_dirty = false;
    _ms_since_checkpoint = 0;
    StatusSnapshot snapshot = buildSnapshotLocked();
    unlock();

    if (changed) {
        CrashLog::logCritical("ESTOP", reason);
        _logger.logf(false, "CO: EMERGENCY STOP (%s)", reason);
    }
    broadcast(snapshot);
    return changed;
}

// =============================================================================
// Print job events
// =============================================================================

CommandResult Coordinator::onJobStarted(const char *material,
                                        unsigned long duration_ms) {
    if (!lock(COMMAND_WAIT))
        return CommandResult{CommandStatus::BUSY, Phase::IDLE,
                             "coordinator busy"};

    Phase phase = _machine.phase();
    unsigned long now = millis();
    if (_job_start_seen &&
        now - _last_job_start_ms < Timing::JOB_START_DEBOUNCE_MS) {
        unlock();
        _logger.log("CO: JobStarted ignored (debounce)", true);
        return CommandResult{CommandStatus::INVALID_TRANSITION, phase,
                             "duplicate job start"};
    }
    _job_start_seen = true;
    _last_job_start_ms = now;

    RunSettings settings = _run_defaults;
    bool auto_start = _auto_start_enabled;
    bool named = material != nullptr && material[0] != '\0';
    MaterialProfile profile{};
    bool known = false;
    if (named) {
        const MaterialProfile *entry = _materials.find(material);
        if (entry != nullptr) {
            profile = *entry;
            known = true;
        }
    }
    unlock();

    if (!auto_start) {
        _logger.log("CO: JobStarted, auto-start disabled", true);
        return CommandResult{CommandStatus::INVALID_TRANSITION, phase,
                             "auto-start disabled"};
    }

    if (named) {
        if (!known) {
            _logger.logf(false, "CO: unknown material %s, not heating",
                         material);
            return CommandResult{CommandStatus::VALIDATION_ERROR, phase,
                                 "unknown material"};
        }
        if (profile.setpoint <= 0.0f) {
            _logger.logf(false, "CO: %s needs no enclosure heat",
                         profile.material);
            return CommandResult{CommandStatus::INVALID_TRANSITION, phase,
                                 "material needs no heat"};
        }
        settings.setpoint = profile.setpoint;
        settings.fans_enabled = profile.fans_enabled;
    }

    if (duration_ms > 0)
        settings.duration_ms = duration_ms;
    settings.follow_job = true;

    _logger.logf(false, "CO: job started (%s), auto-start",
                 named ? material : "default");
    return start(settings);
}

CommandResult Coordinator::onJobFinished() {
    Intent intent;
    intent.type = IntentType::JOB_FINISHED;
    return submit(intent);
}

CommandResult Coordinator::onJobFailed() {
    Intent intent;
    intent.type = IntentType::JOB_FAILED;
    return submit(intent);
}

// =============================================================================
// Safety interlock
// =============================================================================

void Coordinator::setAlarmLatched(bool latched) {
    if (!lock(portMAX_DELAY))
        return;
    _alarm_latched = latched;
    StatusSnapshot snapshot = buildSnapshotLocked();
    unlock();
    broadcast(snapshot);
}

bool Coordinator::isAlarmLatched() {
    if (!lock(portMAX_DELAY))
        return false;
    bool latched = _alarm_latched;
    unlock();
    return latched;
}

// =============================================================================
// Control tick
// =============================================================================

void Coordinator::runTick(const ProbeReading *readings, size_t count,
                          unsigned long tick_ms, uint32_t now_epoch) {
    ProbeSummary probes = ThermalRegulator::summarizeProbes(readings, count);

    if (!lock(COMMAND_WAIT)) {
        _logger.log("CO: tick skipped (lock busy)", true);
        return;
    }

    _last_probes = probes;
    Phase phase_before = _machine.phase();
    uint32_t transitions_before = _machine.transitionCount();

    drainIntentsLocked(probes, now_epoch);
    _machine.tick(probes, tick_ms);
    trackSensorsLocked(probes);
    recordHistoryLocked(probes, tick_ms);

    Phase phase_after = _machine.phase();
    bool significant = _machine.transitionCount() != transitions_before &&
                       !(isRunningPhase(phase_before) &&
                         isRunningPhase(phase_after));

    RegulatorDecision decision = ThermalRegulator::decide(
        _machine.state(), probes, _machine.effectiveSetpoint());
    driveActuatorsLocked(decision.intent);
    checkpointLocked(significant, tick_ms, now_epoch);

    StatusSnapshot snapshot = buildSnapshotLocked();
    unlock();

    broadcast(snapshot);
}

void Coordinator::drainIntentsLocked(const ProbeSummary &probes,
                                     uint32_t now_epoch) {
    Intent intent;
    while (xQueueReceive(_queue, &intent, 0) == pdTRUE) {
        CommandResult result;
        if (intent.type == IntentType::START && _alarm_latched) {
            result = CommandResult{CommandStatus::INVALID_TRANSITION,
                                   _machine.phase(), "safety alarm latched"};
        } else {
            result = _machine.apply(intent, probes, now_epoch);
        }

        if (isOk(result)) {
            _checkpoint_dirty = true;
        } else {
            _rejected_intents.record(millis());
            _logger.logf(true, "CO: queued %s dropped: %s",
                         intentToString(intent.type), result.reason);
        }
    }
}

void Coordinator::trackSensorsLocked(const ProbeSummary &probes) {
    if (!probes.available && !_sensor_unavailable) {
        _sensor_unavailable = true;
        if (_machine.phase() != Phase::IDLE) {
            CrashLog::logCritical("SENSOR", "no healthy probe");
            _logger.log("CO: no healthy probe, actuators off, phase held");
        }
    } else if (probes.available && _sensor_unavailable) {
        _sensor_unavailable = false;
        _logger.logf(false, "CO: probes back (%u/%u)",
                     static_cast<unsigned>(probes.healthy),
                     static_cast<unsigned>(probes.total));
    }
}

void Coordinator::recordHistoryLocked(const ProbeSummary &probes,
                                      unsigned long tick_ms) {
    _uptime_ms += tick_ms;
    if (_machine.phase() == Phase::IDLE) {
        _history.clear();
        _ms_since_sample = 0;
        return;
    }

    _ms_since_sample += tick_ms;
    if (_ms_since_sample < History::SAMPLE_INTERVAL_MS || !probes.available)
        return;
    _history.recordSample(TemperatureSample{_uptime_ms, probes.temperature});
    _ms_since_sample = 0;
}

void Coordinator::driveActuatorsLocked(const ActuatorIntent &intent) {
    bool ok = _actuators.setHeater(intent.heater);
    ok = _actuators.setFans(intent.fans) && ok;
    _machine.recordHardwareIntent(intent);

    if (!ok) {
        _actuator_failures.record(millis());
        if (!_actuator_fault) {
            _logger.log("CO: actuator command failed, retrying");
        }
        _actuator_fault = true;
    } else if (_actuator_fault) {
        _actuator_fault = false;
        _logger.log("CO: actuators responding again");
    }
}

void Coordinator::checkpointLocked(bool significant, unsigned long tick_ms,
                                   uint32_t now_epoch) {
    const RunState &state = _machine.state();

    // Keep the interrupted run's record until the user decides
    if (_resume_pending)
        return;

    // Only running and cooling phases are resumable
    if (state.phase == Phase::IDLE || state.phase == Phase::WARMING_UP) {
        if (_checkpoint_present && _checkpoints.remove())
            _checkpoint_present = false;
        _checkpoint_dirty = false;
        _ms_since_checkpoint = 0;
        return;
    }

    _ms_since_checkpoint += tick_ms;
    unsigned long interval = state.phase == Phase::COOLING
                                 ? CheckpointPolicy::COOLING_SAVE_INTERVAL_MS
                                 : CheckpointPolicy::SAVE_INTERVAL_MS;
    if (!significant && !_checkpoint_dirty && _ms_since_checkpoint < interval)
        return;

    if (now_epoch == 0) {
        if (!_no_time_warned) {
            _no_time_warned = true;
            _logger.log("CKPT: no wall time, run not checkpointed");
        }
        return;
    }

    if (_checkpoints.save(state, now_epoch)) {
        _machine.markCheckpoint(now_epoch);
        _checkpoint_present = true;
        _checkpoint_dirty = false;
        _ms_since_checkpoint = 0;
    }
}

StatusSnapshot Coordinator::buildSnapshotLocked() {
    const RunState &state = _machine.state();

    StatusSnapshot snapshot;
    snapshot.sequence_number = _sequencer.next();
    snapshot.phase = state.phase;
    snapshot.awaiting_confirmation = state.awaiting_confirmation;
    snapshot.temperature = _last_probes.temperature;
    snapshot.healthy_probes = _last_probes.healthy;
    snapshot.setpoint = _machine.effectiveSetpoint();
    snapshot.active_elapsed_ms = state.active_elapsed_ms;
    snapshot.remaining_ms = ElapsedTimeAccountant::remainingMs(state);
    snapshot.cooldown_remaining_ms =
        state.phase == Phase::COOLING
            ? ElapsedTimeAccountant::coolingRemainingMs(state)
            : 0;
    snapshot.paused = state.paused;
    snapshot.actuators = state.hardware_intent;
    snapshot.heater_override = state.heater_override;
    snapshot.fan_override = state.fan_override;
    snapshot.sensor_unavailable = !_last_probes.available;
    snapshot.actuator_fault = _actuator_fault;
    snapshot.alarm_latched = _alarm_latched;
    snapshot.lights_on = _lights_on;
    snapshot.resume_pending = _resume_pending;
    if (_last_probes.available &&
        (state.phase == Phase::WARMING_UP || isRunningPhase(state.phase)))
        snapshot.eta_s =
            _history.etaSeconds(_last_probes.temperature, state.setpoint);

    _last_snapshot = snapshot;
    return snapshot;
}

void Coordinator::broadcast(const StatusSnapshot &snapshot) {
    for (size_t i = 0; i < _observer_count; i++) {
        _observers[i]->onStatus(snapshot);
    }
}

// =============================================================================
// Inspection
// =============================================================================

StatusSnapshot Coordinator::latestStatus() {
    StatusSnapshot snapshot;
    if (lock(portMAX_DELAY)) {
        snapshot = _last_snapshot;
        unlock();
    }
    return snapshot;
}

ProbeSummary Coordinator::lastProbes() {
    ProbeSummary probes;
    if (lock(portMAX_DELAY)) {
        probes = _last_probes;
        unlock();
    }
    return probes;
}

RunState Coordinator::runState() {
    RunState state;
    if (lock(portMAX_DELAY)) {
        state = _machine.state();
        unlock();
    }
    return state;
}

uint16_t Coordinator::rejectedIntents() {
    uint16_t count = 0;
    if (lock(portMAX_DELAY)) {
        count = _rejected_intents.count();
        unlock();
    }
    return count;
}

uint16_t Coordinator::actuatorFailures() {
    uint16_t count = 0;
    if (lock(portMAX_DELAY)) {
        count = _actuator_failures.count();
        unlock();
    }
    return count;
}

unsigned long Coordinator::actuatorFailureAgeMs(unsigned long now_ms) {
    unsigned long age = 0;
    if (lock(portMAX_DELAY)) {
        age = _actuator_failures.ageMs(now_ms);
        unlock();
    }
    return age;
}

size_t Coordinator::copyHistory(TemperatureSample *out, size_t max) {
    if (!lock(portMAX_DELAY))
        return 0;
    size_t count = _history.getCount() < max ? _history.getCount() : max;
    for (size_t i = 0; i < count; i++) {
        out[i] = *_history.getSample(count - 1 - i);
    }
    unlock();
    return count;
}

// =============================================================================
// RTOS task plumbing
// =============================================================================

bool Coordinator::startControlTask(ProbeSource &source) {
    if (_task != nullptr)
        return true;
    if (_mutex == nullptr && !begin())
        return false;

    _source = &source;
    BaseType_t ok = xTaskCreate(
        controlTaskTrampoline, "ControlTask", Coordination::CONTROL_TASK_STACK,
        this, Coordination::CONTROL_TASK_PRIORITY, &_task);
    if (ok != pdPASS) {
        _task = nullptr;
        _logger.log("CO: control task create failed");
        return false;
    }
    return true;
}

void Coordinator::controlTaskTrampoline(void *param) {
    auto *self = static_cast<Coordinator *>(param);
    self->controlTaskLoop();
    vTaskDelete(nullptr);
}

void Coordinator::controlTaskLoop() {
    esp_task_wdt_add(nullptr);

    ProbeReading readings[Intervals::MAX_PROBES];
    TickType_t last_wake = xTaskGetTickCount();

    for (;;) {
        size_t count = _source->read(readings, Intervals::MAX_PROBES);
        runTick(readings, count, Timing::CONTROL_TICK_MS,
                TimeService::epochNow());
        esp_task_wdt_reset();
        vTaskDelayUntil(&last_wake, pdMS_TO_TICKS(Timing::CONTROL_TICK_MS));
    }
}
