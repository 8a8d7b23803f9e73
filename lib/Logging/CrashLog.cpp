#include "CrashLog.h"
#include <cstring>
#include <esp_attr.h>
#include <esp_system.h>
#include <freertos/FreeRTOS.h>

namespace {

constexpr uint32_t RETAINED_MAGIC = 0x43524C47; // "CRLG"

struct Retained {
    uint32_t magic;
    uint32_t boot;
    uint32_t head; // next slot to write
    uint32_t count;
};

portMUX_TYPE g_mux = portMUX_INITIALIZER_UNLOCKED;

bool retainedValid(const Retained &r) {
    return r.magic == RETAINED_MAGIC && r.head < CrashLog::CAPACITY &&
           r.count <= CrashLog::CAPACITY;
}

void resetRetained(Retained &r) {
    r.magic = RETAINED_MAGIC;
    r.boot = 0;
    r.head = 0;
    r.count = 0;
}

void copyField(char *dst, size_t size, const char *src) {
    strncpy(dst, src ? src : "", size - 1);
    dst[size - 1] = '\0';
}

} // namespace

// Left untouched by the startup code so entries outlive a reset
RTC_NOINIT_ATTR static Retained g_retained;
RTC_NOINIT_ATTR CrashLog::Entry CrashLog::_entries[CrashLog::CAPACITY];

uint32_t CrashLog::_critical_count = 0;

void CrashLog::begin() {
    bool power_on = esp_reset_reason() == ESP_RST_POWERON;
    portENTER_CRITICAL(&g_mux);
    if (!retainedValid(g_retained) || power_on)
        resetRetained(g_retained);
    g_retained.boot++;
    portEXIT_CRITICAL(&g_mux);

    Serial.printf("Reset reason: %s%s (boot %lu)\n", getResetReasonString(),
                  wasUncleanReset() ? " (unclean)" : "",
                  static_cast<unsigned long>(g_retained.boot));
    if (wasUncleanReset() && g_retained.count > 0) {
        dumpToSerial();
    }
}

void CrashLog::logCritical(const char *category, const char *message) {
    Entry entry;
    entry.uptime_ms = millis();
    copyField(entry.category, sizeof(entry.category), category);
    copyField(entry.message, sizeof(entry.message), message);

    portENTER_CRITICAL(&g_mux);
    _critical_count++;
    if (!retainedValid(g_retained))
        resetRetained(g_retained);
    entry.boot = g_retained.boot;
    _entries[g_retained.head] = entry;
    g_retained.head = (g_retained.head + 1) % CAPACITY;
    if (g_retained.count < CAPACITY)
        g_retained.count++;
    portEXIT_CRITICAL(&g_mux);

    Serial.printf("CRASH[%s]: %s\n", entry.category, entry.message);
}

void CrashLog::dumpToSerial() {
    Entry snapshot[CAPACITY];
    uint32_t count;
    uint32_t head;

    portENTER_CRITICAL(&g_mux);
    count = g_retained.count;
    head = g_retained.head;
    memcpy(snapshot, _entries, sizeof(snapshot));
    portEXIT_CRITICAL(&g_mux);

    Serial.printf("Crash log: %lu entries\n", static_cast<unsigned long>(count));
    uint32_t first = (head + CAPACITY - count) % CAPACITY;
    for (uint32_t i = 0; i < count; i++) {
        const Entry &e = snapshot[(first + i) % CAPACITY];
        Serial.printf("  boot %lu +%lus %s: %s\n",
                      static_cast<unsigned long>(e.boot),
                      static_cast<unsigned long>(e.uptime_ms / 1000UL),
                      e.category, e.message);
    }
}

void CrashLog::clear() {
    portENTER_CRITICAL(&g_mux);
    g_retained.head = 0;
    g_retained.count = 0;
    portEXIT_CRITICAL(&g_mux);
}

size_t CrashLog::retainedCount() {
    portENTER_CRITICAL(&g_mux);
    size_t count = g_retained.count;
    portEXIT_CRITICAL(&g_mux);
    return count;
}

const char *CrashLog::getResetReasonString() {
    switch (esp_reset_reason()) {
    case ESP_RST_POWERON:
        return "Power-on";
    case ESP_RST_EXT:
        return "External reset";
    case ESP_RST_SW:
        return "Software reset";
    case ESP_RST_PANIC:
        return "Exception/panic";
    case ESP_RST_INT_WDT:
        return "Interrupt watchdog";
    case ESP_RST_TASK_WDT:
        return "Task watchdog";
    case ESP_RST_WDT:
        return "Other watchdog";
    case ESP_RST_DEEPSLEEP:
        return "Deep sleep wake";
    case ESP_RST_BROWNOUT:
        return "Brownout";
    default:
        return "Unknown";
    }
}

bool CrashLog::wasUncleanReset() {
    switch (esp_reset_reason()) {
    case ESP_RST_PANIC:
    case ESP_RST_INT_WDT:
    case ESP_RST_TASK_WDT:
    case ESP_RST_WDT:
    case ESP_RST_BROWNOUT:
        return true;
    default:
        return false;
    }
}
