/**
 * @file TimeService.cpp
 * @brief Implementation of boot-time WiFi + NTP synchronization
 */

#include "TimeService.h"
#include "config.h"

#include <WiFi.h>
#include <time.h>

#if __has_include("env.h")
#include "env.h"
#define TIME_SERVICE_HAS_WIFI_CREDS 1
#else
#define TIME_SERVICE_HAS_WIFI_CREDS 0
#endif

namespace {
// Consider wall time valid if epoch is after 2024-01-01.
constexpr time_t VALID_EPOCH_THRESHOLD = 1704067200;

volatile bool wall_time_valid = false;

bool clockLooksValid() { return time(nullptr) > VALID_EPOCH_THRESHOLD; }

bool waitFor(bool (*condition)(), unsigned long timeout_ms) {
    unsigned long start = millis();
    while (!condition()) {
        if (millis() - start >= timeout_ms)
            return false;
        delay(200);
    }
    return true;
}

bool wifiConnected() { return WiFi.status() == WL_CONNECTED; }

} // namespace

namespace TimeService {

bool trySyncFromWifi(TimeLogCallback logCb) {
    auto log = [logCb](const char *msg) {
        if (logCb) {
            logCb(msg, false);
        }
    };

    setenv("TZ", WiFiTimeSync::TIME_TZ_STRING, 1);
    tzset();

    // RTC keeps running across soft resets
    if (clockLooksValid()) {
        wall_time_valid = true;
        log("Time valid from RTC");
    }

#if !FEATURE_WIFI_TIME_SYNC || !TIME_SERVICE_HAS_WIFI_CREDS
    if (!wall_time_valid)
        log("Time sync skipped (no Wi-Fi config)");
    return wall_time_valid;
#else
    if (WIFI_SSID == nullptr || WIFI_SSID[0] == '\0') {
        log("Time sync skipped (SSID empty)");
        return wall_time_valid;
    }

    log("Wi-Fi time sync...");
    WiFi.mode(WIFI_STA);
    WiFi.begin(WIFI_SSID, WIFI_PASSWORD);

    if (!waitFor(wifiConnected, WiFiTimeSync::WIFI_CONNECT_TIMEOUT_MS)) {
        WiFi.disconnect(true, true);
        WiFi.mode(WIFI_OFF);
        log("Time sync failed (connect timeout)");
        return wall_time_valid;
    }

    configTzTime(WiFiTimeSync::TIME_TZ_STRING, WiFiTimeSync::NTP_SERVER_1,
                 WiFiTimeSync::NTP_SERVER_2);
    bool ok = waitFor(clockLooksValid, WiFiTimeSync::NTP_SYNC_TIMEOUT_MS);

    WiFi.disconnect(true, true);
    WiFi.mode(WIFI_OFF);

    if (ok)
        wall_time_valid = true;
    log(ok ? "Time sync OK" : "Time sync failed (NTP timeout)");
    return wall_time_valid;
#endif
}

bool isWallTimeValid() { return wall_time_valid; }

uint32_t epochNow() {
    if (!wall_time_valid)
        return 0;
    return static_cast<uint32_t>(time(nullptr));
}

const char *getIsoTimestamp() {
    if (!wall_time_valid) {
        return nullptr;
    }

    // Only the logger calls this, under its own mutex
    static char buf[24];
    time_t now = time(nullptr);
    struct tm tm_local;
    localtime_r(&now, &tm_local);
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_local);
    return buf;
}

} // namespace TimeService
