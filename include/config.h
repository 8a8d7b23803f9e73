/**
 * @file config.h
 * @brief Tunable configuration parameters
 *
 * Only namespaced configuration values live here. Use the namespaces directly
 * (e.g., `Limits::MAX_SETPOINT_C`, `Timing::CONTROL_TICK_MS`).
 */

#ifndef CONFIG_H
#define CONFIG_H

#include "pins.h"
#include <cstddef>
#include <cstdint>

// =============================================================================
// Feature Flags (0=disabled, 1=enabled)
// =============================================================================
// Can be overridden from build flags, e.g. `-D FEATURE_WIFI_TIME_SYNC=0`.
#ifndef FEATURE_WIFI_TIME_SYNC
#define FEATURE_WIFI_TIME_SYNC 1
#endif

#ifndef FEATURE_SERIAL_CONSOLE
#define FEATURE_SERIAL_CONSOLE 1
#endif

// =============================================================================
// Sensor Update Intervals
// =============================================================================
namespace Intervals {
constexpr unsigned long DS18B20_CONVERSION_TIME_MS =
    750; // 12-bit resolution conversion time
constexpr unsigned long PROBE_DISCOVERY_RETRY_MS = 30000;
constexpr size_t MAX_PROBES = 4;
} // namespace Intervals

// =============================================================================
// Display and Logging Settings
// =============================================================================
namespace Display {
constexpr unsigned long DISPLAY_INTERVAL_MS = 100;
constexpr int LOG_AREA_LINES = 3; // Lines reserved for live logs
constexpr unsigned long STATUS_LOG_INTERVAL_MS = 10000; // serial summary
} // namespace Display

// =============================================================================
// Watchdog Configuration
// =============================================================================
namespace Watchdog {
constexpr unsigned long TIMEOUT_SECONDS = 10; // Task WDT timeout
} // namespace Watchdog

// =============================================================================
// WiFi Time Sync (boot-time, optional)
// =============================================================================
namespace WiFiTimeSync {
// If WIFI_SSID from env.h is present and reachable, the system connects
// briefly on boot, syncs wall time via NTP, then disconnects. Without wall
// time checkpoints cannot be aged and are not resumed.
constexpr unsigned long WIFI_CONNECT_TIMEOUT_MS = 10000;
constexpr unsigned long NTP_SYNC_TIMEOUT_MS = 8000;

constexpr const char *NTP_SERVER_1 = "pool.ntp.org";
constexpr const char *NTP_SERVER_2 = "time.nist.gov";

// POSIX TZ rule for log timestamps. Checkpoint ages use raw epoch seconds.
constexpr const char *TIME_TZ_STRING = "CET-1CEST,M3.5.0/2,M10.5.0/3";
} // namespace WiFiTimeSync

// =============================================================================
// Limits (hardware and safety limits)
// =============================================================================
namespace Limits {
// Accepted setpoint range for Start and SetSetpoint
constexpr float MIN_SETPOINT_C = 0.0f;
constexpr float MAX_SETPOINT_C = 80.0f;

// Hysteresis half-width must lie in (0, MAX]
constexpr float MAX_HYSTERESIS_C = 10.0f;

// Safety monitor trips Emergency Stop above this enclosure temperature
constexpr float ENCLOSURE_FAULT_C = 90.0f;

// Readings outside this window are treated as probe failures
constexpr float PROBE_MIN_VALID_C = -40.0f;
constexpr float PROBE_MAX_VALID_C = 125.0f;

// Longest run accepted from a command or job event (7 days)
constexpr unsigned long MAX_DURATION_MS = 7UL * 24UL * 3600UL * 1000UL;
} // namespace Limits

// =============================================================================
// Timing (milliseconds)
// =============================================================================
namespace Timing {
constexpr unsigned long CONTROL_TICK_MS = 1000;
constexpr unsigned long SAFETY_TICK_MS = 1000;

// Bounded wait on the coordinator mutex before a command reports BUSY
constexpr unsigned long LOCK_TIMEOUT_MS = 250;

// Repeated JobStarted events inside this window are ignored
constexpr unsigned long JOB_START_DEBOUNCE_MS = 30000;

// Cooling setpoint steps down once per interval
constexpr unsigned long COOLDOWN_STEP_INTERVAL_MS = 5UL * 60UL * 1000UL;
} // namespace Timing

// =============================================================================
// Regulation (thermal policy thresholds)
// =============================================================================
namespace Regulation {
// WarmingUp completes once temperature >= setpoint - tolerance
constexpr float WARMUP_TOLERANCE_C = 1.0f;

// Running phase is MAINTAINING while |t - setpoint| <= band, else HEATING
constexpr float MAINTAIN_BAND_C = 1.0f;
} // namespace Regulation

// =============================================================================
// Temperature history (warm-up ETA)
// =============================================================================
namespace History {
constexpr unsigned long SAMPLE_INTERVAL_MS = 5000;
constexpr size_t CAPACITY = 120; // 10 minutes of samples

// ETA needs this many samples and uses at most the newest RATE_WINDOW
constexpr size_t MIN_SAMPLES_FOR_ETA = 10;
constexpr size_t RATE_WINDOW_SAMPLES = 24; // 2 minutes

// Estimates beyond this are reported as this
constexpr uint32_t MAX_ETA_S = 24UL * 3600UL;
} // namespace History

// =============================================================================
// Checkpoint policy
// =============================================================================
namespace CheckpointPolicy {
constexpr const char *NVS_NAMESPACE = "enc_ckpt";
constexpr const char *NVS_KEY = "run";

constexpr unsigned long SAVE_INTERVAL_MS = 10000; // Heating/Maintaining
constexpr unsigned long COOLING_SAVE_INTERVAL_MS =
    Timing::COOLDOWN_STEP_INTERVAL_MS;

// Heating checkpoint stays resumable this long past its remaining time
constexpr uint32_t STALE_GRACE_S = 300;

// Cooling checkpoint stays resumable this long after it was written
constexpr uint32_t MAX_COOLDOWN_BUDGET_S = 12UL * 3600UL;

// Minimum free NVS entries before a write is attempted
constexpr size_t NVS_MIN_FREE_ENTRIES = 8;
} // namespace CheckpointPolicy

// =============================================================================
// Run defaults (first boot values written to NVS by SettingsStore)
// =============================================================================
namespace Defaults {
constexpr const char *NVS_NAMESPACE = "enc_cfg";

constexpr float SETPOINT_C = 60.0f;
constexpr float HYSTERESIS_C = 2.0f;
constexpr unsigned long DURATION_MS = 8UL * 3600UL * 1000UL;
constexpr bool FANS_ENABLED = true;
constexpr bool SKIP_PREHEAT = false;
constexpr bool REQUIRE_CONFIRMATION = false;
constexpr unsigned long COOLDOWN_BUDGET_MS = 4UL * 3600UL * 1000UL;
constexpr float COOLDOWN_TARGET_C = 21.0f;
constexpr bool AUTO_START_ENABLED = true;
constexpr bool LIGHTS_ENABLED = true;

// User-editable tables stored as blobs next to the run defaults
constexpr size_t MAX_MATERIALS = 12;
constexpr size_t MAX_PRESETS = 8;
} // namespace Defaults

// =============================================================================
// Coordinator sizing
// =============================================================================
namespace Coordination {
constexpr size_t INTENT_QUEUE_LEN = 16;
constexpr size_t MAX_OBSERVERS = 4;

constexpr uint32_t CONTROL_TASK_STACK = 6144;
constexpr uint32_t SAFETY_TASK_STACK = 4096;
constexpr uint32_t CONTROL_TASK_PRIORITY = 3;
constexpr uint32_t SAFETY_TASK_PRIORITY = 4;
} // namespace Coordination

static_assert(Limits::MIN_SETPOINT_C < Limits::MAX_SETPOINT_C,
              "Setpoint range is empty");
static_assert(Defaults::SETPOINT_C <= Limits::MAX_SETPOINT_C,
              "Default setpoint out of range");
static_assert(Defaults::HYSTERESIS_C > 0.0f &&
                  Defaults::HYSTERESIS_C <= Limits::MAX_HYSTERESIS_C,
              "Default hysteresis out of range");
static_assert(Limits::ENCLOSURE_FAULT_C > Limits::MAX_SETPOINT_C,
              "Fault limit must sit above the highest setpoint");

#endif // CONFIG_H
