/**
 * @file main.cpp
 * @brief Enclosure heater controller - 3D printer chamber preheat and hold
 *
 * IMPORTANT: NEVER use Serial.print/println directly in this application.
 * Always use logger.log() for all output - it handles both display and Serial.
 *
 * Architecture:
 * - Logger: Manages TFT display (KV store + live log area) and Serial output
 * - ProbeArray: DS18B20 enclosure probes via OneWire (averaged)
 * - RelayActuators: Heater, fan and lights relay outputs
 * - Coordinator: Owns the run state, intent queue and control task
 * - SafetyMonitor: Fire input and over-temperature interlock (own task)
 * - CheckpointStore / SettingsStore: NVS persistence
 * - StatusDisplay: Renders numbered status snapshots
 * - SerialConsole: Bench commands typed over USB serial
 *
 * TASKS:
 * - ControlTask: 1 Hz drain/tick/drive/checkpoint/publish
 * - SafetyTask: 1 Hz interlock evaluation
 * - loopTask: display refresh and console input
 *
 * SAFETY:
 * - Task Watchdog Timer (WDT) covers all three tasks
 * - Heater and fans are driven OFF before anything else runs
 * - Alarm latch survives until an explicit 'alarm reset' with the fire
 *   input clear
 * - An interrupted run found at boot waits for 'recover resume' or
 *   'recover abort' before anything is energized
 */

#include "CheckpointStore.h"
#include "Coordinator.h"
#include "CrashLog.h"
#include "Logger.h"
#include "ProbeArray.h"
#include "RelayActuators.h"
#include "SafetyMonitor.h"
#include "SerialConsole.h"
#include "SettingsStore.h"
#include "StatusDisplay.h"
#include "TimeService.h"
#include "config.h"
#include <Arduino.h>
#include <esp_task_wdt.h>

Logger logger;

RelayActuators actuators(logger);
ProbeArray probes(logger);
CheckpointStore checkpoints(logger);
SettingsStore settings(logger);

Coordinator coordinator(logger, actuators, checkpoints);
SafetyMonitor safety(logger, coordinator);
StatusDisplay statusDisplay(logger);

#if FEATURE_SERIAL_CONSOLE
SerialConsole console(logger, coordinator, safety, settings);
#endif

static void initializeWatchdog() {
    // Using older API compatible with Arduino ESP32 core
    esp_task_wdt_init(Watchdog::TIMEOUT_SECONDS,
                      true); // timeout, panic on trigger
    esp_task_wdt_add(NULL);  // loopTask; control and safety tasks add themselves
}

static void initializeHardware() {
    // Outputs first so the relays never float during boot
    actuators.begin();

    logger.initializeDisplay();
    logger.log("=== BOOT ===");
    CrashLog::begin();
    if (CrashLog::wasUncleanReset()) {
        logger.logf(false, "Unclean reset: %s", CrashLog::getResetReasonString());
    }

    // Optional one-shot wall-clock sync via home WiFi + NTP
    TimeService::trySyncFromWifi(
        [](const char *msg, bool serialOnly) { logger.log(msg, serialOnly); });

    initializeWatchdog();
    settings.begin();
    probes.begin();
    safety.begin();
}

static void initializeControl() {
    if (!coordinator.begin()) {
        logger.log("BOOT: coordinator alloc failed, outputs held OFF");
        CrashLog::logCritical("BOOT", "coordinator alloc failed");
        return;
    }

    statusDisplay.begin();
    coordinator.addObserver(&statusDisplay);
    coordinator.setRunDefaults(settings.runDefaults(),
                               settings.autoStartEnabled());
    coordinator.setMaterials(settings.materials());

    CommandResult lights = coordinator.setLights(settings.lightsEnabled());
    if (!isOk(lights))
        logger.logf(false, "BOOT: lights %s", lights.reason);

    CheckpointLoadResult resumed =
        coordinator.resumeFromCheckpoint(TimeService::epochNow());
    logger.logf(false, "BOOT: checkpoint %s", loadResultToString(resumed));

    if (!coordinator.startControlTask(probes)) {
        CrashLog::logCritical("BOOT", "control task not started");
    }
    if (!safety.startTask()) {
        // No interlock: refuse every Start until reboot
        CrashLog::logCritical("BOOT", "safety task not started");
        coordinator.setAlarmLatched(true);
        coordinator.requestEmergencyStop("safety task unavailable");
    }

#if FEATURE_SERIAL_CONSOLE
    console.begin();
#endif
}

void setup() {
    initializeHardware();
    initializeControl();
}

void loop() {
    esp_task_wdt_reset();
    logger.update();
#if FEATURE_SERIAL_CONSOLE
    console.poll();
#endif
    delay(Display::DISPLAY_INTERVAL_MS / 2);
}
