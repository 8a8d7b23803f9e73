/**
 * @file TimeService.h
 * @brief Boot-time WiFi + NTP sync, wall-clock validity and timestamps
 *
 * Wall time is needed for two things: ISO timestamps in the log and aging
 * checkpoints at boot. The ESP32 RTC keeps counting across software and
 * watchdog resets, so a clock synced before a crash stays valid after it
 * even when WiFi is unavailable on the next boot.
 */

#ifndef TIME_SERVICE_H
#define TIME_SERVICE_H

#include <Arduino.h>

using TimeLogCallback = void (*)(const char *message, bool serialOnly);

namespace TimeService {

/**
 * @brief Attempt to sync time using WiFi + NTP (bounded by config.h timeouts)
 *
 * Uses WIFI_SSID / WIFI_PASSWORD from env.h when available. Also accepts an
 * RTC that is already valid (survived a reset).
 *
 * @param logCb Optional logging sink for progress and outcome
 * @return true if wall time is valid afterwards
 */
bool trySyncFromWifi(TimeLogCallback logCb = nullptr);

/**
 * @brief Whether wall-clock time is valid
 */
bool isWallTimeValid();

/**
 * @brief Current epoch seconds, or 0 while wall time is not valid
 */
uint32_t epochNow();

/**
 * @brief Current local time as YYYY-MM-DDTHH:MM:SS, nullptr if not valid
 */
const char *getIsoTimestamp();

} // namespace TimeService

#endif // TIME_SERVICE_H
