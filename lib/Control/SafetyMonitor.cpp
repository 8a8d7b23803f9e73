/**
 * @file SafetyMonitor.cpp
 * @brief Implementation of the fire and over-temperature interlock
 */

#include "SafetyMonitor.h"
#include "CrashLog.h"
#include "config.h"
#include <esp_task_wdt.h>

SafetyMonitor::SafetyMonitor(Logger &logger, Coordinator &coordinator)
    : _logger(logger), _coordinator(coordinator), _initialized(false),
      _latched(false), _fire_active(false),
      _latched_status(SafetyStatus::OK), _task(nullptr),
      _mutex(xSemaphoreCreateMutex()) {
    _last_fault_reason[0] = '\0';
}

void SafetyMonitor::begin() {
    if (_initialized)
        return;
    pinMode(PIN_FIRE, INPUT_PULLUP);
    digitalWrite(PIN_BUZZER, LOW);
    pinMode(PIN_BUZZER, OUTPUT);
    _initialized = true;
}

void SafetyMonitor::setBuzzer(bool on) {
    if (_initialized)
        digitalWrite(PIN_BUZZER, on ? HIGH : LOW);
}

SafetyResult SafetyMonitor::evaluate(bool fire_input_active,
                                     const ProbeSummary &probes) {
    if (fire_input_active) {
        snprintf(_last_fault_reason, sizeof(_last_fault_reason),
                 "fire detector active");
        return SafetyResult{SafetyStatus::FIRE_DETECTED, _last_fault_reason};
    }

    if (probes.available && probes.temperature > Limits::ENCLOSURE_FAULT_C) {
        snprintf(_last_fault_reason, sizeof(_last_fault_reason),
                 "enclosure %.1fC > %.0fC", probes.temperature,
                 Limits::ENCLOSURE_FAULT_C);
        return SafetyResult{SafetyStatus::OVER_TEMPERATURE,
                            _last_fault_reason};
    }

    return SafetyResult{SafetyStatus::OK, ""};
}

SafetyResult SafetyMonitor::process(bool fire_input_active,
                                    const ProbeSummary &probes) {
    if (!lock())
        return SafetyResult{SafetyStatus::OK, ""};

    _fire_active = fire_input_active;
    SafetyResult result = evaluate(fire_input_active, probes);

    if (result.status == SafetyStatus::OK) {
        unlock();
        return result;
    }

    // Escalate the latch to the most severe condition seen
    if (!_latched || result.status > _latched_status) {
        _latched = true;
        _latched_status = result.status;
        setBuzzer(true);
        CrashLog::logCritical(safetyStatusToString(result.status),
                              result.reason);
        _logger.logf(false, "SAFE: %s, alarm latched", result.reason);
        _coordinator.setAlarmLatched(true);
    }
    unlock();

    // Repeated while the fault persists; a no-op once IDLE
    _coordinator.requestEmergencyStop(result.reason);
    return result;
}

SafetyResult SafetyMonitor::update() {
    bool fire = _initialized && digitalRead(PIN_FIRE) == LOW;
    return process(fire, _coordinator.lastProbes());
}

CommandResult SafetyMonitor::resetAlarm() {
    Phase phase = _coordinator.latestStatus().phase;
    if (!lock())
        return CommandResult{CommandStatus::BUSY, phase, "safety busy"};

    if (!_latched) {
        unlock();
        return CommandResult{CommandStatus::INVALID_TRANSITION, phase,
                             "no alarm latched"};
    }
    if (_fire_active) {
        unlock();
        _logger.log("SAFE: reset refused, fire input still active");
        return CommandResult{CommandStatus::INVALID_TRANSITION, phase,
                             "fire input still active"};
    }

    _latched = false;
    _latched_status = SafetyStatus::OK;
    setBuzzer(false);
    _coordinator.setAlarmLatched(false);
    unlock();

    _logger.log("SAFE: alarm reset");
    return CommandResult{CommandStatus::OK, phase, "alarm reset"};
}

bool SafetyMonitor::isLatched() const {
    if (!lock())
        return true;
    bool latched = _latched;
    unlock();
    return latched;
}

SafetyStatus SafetyMonitor::latchedStatus() const {
    if (!lock())
        return SafetyStatus::OK;
    SafetyStatus status = _latched_status;
    unlock();
    return status;
}

void SafetyMonitor::copyLastFaultReason(char *out, size_t len) const {
    if (len == 0)
        return;
    if (!lock()) {
        out[0] = '\0';
        return;
    }
    snprintf(out, len, "%s", _last_fault_reason);
    unlock();
}

// =============================================================================
// RTOS task plumbing
// =============================================================================

bool SafetyMonitor::startTask() {
    if (_task != nullptr)
        return true;
    BaseType_t ok = xTaskCreate(taskTrampoline, "SafetyTask",
                                Coordination::SAFETY_TASK_STACK, this,
                                Coordination::SAFETY_TASK_PRIORITY, &_task);
    if (ok != pdPASS) {
        _task = nullptr;
        _logger.log("SAFE: task create failed");
        return false;
    }
    return true;
}

void SafetyMonitor::taskTrampoline(void *param) {
    auto *self = static_cast<SafetyMonitor *>(param);
    self->taskLoop();
    vTaskDelete(nullptr);
}

void SafetyMonitor::taskLoop() {
    esp_task_wdt_add(nullptr);
    TickType_t last_wake = xTaskGetTickCount();
    for (;;) {
        update();
        esp_task_wdt_reset();
        vTaskDelayUntil(&last_wake, pdMS_TO_TICKS(Timing::SAFETY_TICK_MS));
    }
}
