/**
 * @file SafetyMonitor.h
 * @brief Independent fire and over-temperature interlock
 *
 * Runs as its own FreeRTOS task so a stalled control loop cannot delay it.
 * Every period it reads the MQ-2 fire detector (active LOW) and the last
 * averaged enclosure temperature. Any fault:
 * - latches the alarm (Start is refused while latched)
 * - sounds the buzzer
 * - forces Emergency Stop through the Coordinator
 *
 * The latch is only released by resetAlarm(), and only once the fire input
 * reads clear again. Latch state is read and written under an internal
 * mutex, so the console may query or reset it while the task runs.
 */

#ifndef SAFETY_MONITOR_H
#define SAFETY_MONITOR_H

#include "Coordinator.h"
#include "EnclosureTypes.h"
#include "Logger.h"

/**
 * @brief Result of a safety check, ordered by severity
 */
enum class SafetyStatus : uint8_t {
    OK,
    OVER_TEMPERATURE, // Enclosure above Limits::ENCLOSURE_FAULT_C
    FIRE_DETECTED     // Smoke/flame input active (most severe)
};

inline const char *safetyStatusToString(SafetyStatus status) {
    switch (status) {
    case SafetyStatus::OK:
        return "OK";
    case SafetyStatus::OVER_TEMPERATURE:
        return "OVER_TEMP";
    case SafetyStatus::FIRE_DETECTED:
        return "FIRE";
    default:
        return "???";
    }
}

struct SafetyResult {
    SafetyStatus status;
    const char *reason; // Points to internal buffer, valid until next check
};

class SafetyMonitor {
  public:
    SafetyMonitor(Logger &logger, Coordinator &coordinator);

    /**
     * @brief Configure the fire input and buzzer output
     */
    void begin();

    /**
     * @brief Judge one set of inputs without side effects
     */
    SafetyResult evaluate(bool fire_input_active, const ProbeSummary &probes);

    /**
     * @brief Evaluate and act: latch, buzzer, Emergency Stop
     */
    SafetyResult process(bool fire_input_active, const ProbeSummary &probes);

    /**
     * @brief Read the hardware and process (one task period)
     */
    SafetyResult update();

    /**
     * @brief Release the latch if the fire input is clear
     */
    CommandResult resetAlarm();

    bool isLatched() const;
    SafetyStatus latchedStatus() const;
    void copyLastFaultReason(char *out, size_t len) const;

    bool startTask();

  private:
    Logger &_logger;
    Coordinator &_coordinator;
    bool _initialized;
    bool _latched;
    bool _fire_active;
    SafetyStatus _latched_status;
    TaskHandle_t _task;

    char _last_fault_reason[48];

    // Guards the latch, the fire flag and the reason buffer between the
    // safety task and console callers. Taken before the coordinator lock.
    SemaphoreHandle_t _mutex;

    bool lock() const {
        if (_mutex == nullptr)
            return true;
        return xSemaphoreTake(_mutex, portMAX_DELAY) == pdTRUE;
    }
    void unlock() const {
        if (_mutex)
            xSemaphoreGive(_mutex);
    }

    void setBuzzer(bool on);
    static void taskTrampoline(void *param);
    void taskLoop();
};

#endif // SAFETY_MONITOR_H
