/**
 * @file StatusDisplay.cpp
 * @brief Status observer that mirrors snapshots onto the TFT lines
 */

#include "StatusDisplay.h"
#include "config.h"

StatusDisplay::StatusDisplay(Logger &logger)
    : _logger(logger), _mutex(xSemaphoreCreateMutex()), _dropped(0),
      _have_phase(false), _last_phase(Phase::IDLE), _last_summary_ms(0) {}

void StatusDisplay::begin() {
    _logger.registerTextLine("phase", "Phase:", phaseToString(Phase::IDLE));
    _logger.registerLine("temp", "Temp:", "C", 0.0f);
    _logger.registerLine("setpt", "Target:", "C", 0.0f);
    _logger.registerTextLine("left", "Left:", "-");
    _logger.registerTextLine("eta", "ETA:", "-");
    _logger.registerTextLine("heat", "Heater:", "OFF");
    _logger.registerTextLine("fans", "Fans:", "OFF");
    _logger.registerTextLine("lights", "Lights:", "OFF");
    _logger.registerTextLine("flags", "Flags:", "");
}

void StatusDisplay::formatDuration(char *buf, size_t size, unsigned long ms) {
    unsigned long total = ms / 1000UL;
    snprintf(buf, size, "%lu:%02lu:%02lu", total / 3600UL,
             (total / 60UL) % 60UL, total % 60UL);
}

void StatusDisplay::onStatus(const StatusSnapshot &snapshot) {
    if (_mutex == nullptr || xSemaphoreTake(_mutex, portMAX_DELAY) != pdTRUE)
        return;

    if (!_filter.accept(snapshot.sequence_number)) {
        _dropped++;
        xSemaphoreGive(_mutex);
        return;
    }

    render(snapshot);

    unsigned long now = millis();
    bool phase_changed = !_have_phase || snapshot.phase != _last_phase;
    if (phase_changed ||
        now - _last_summary_ms >= Display::STATUS_LOG_INTERVAL_MS) {
        _last_summary_ms = now;
        logSummary(snapshot);
    }
    _have_phase = true;
    _last_phase = snapshot.phase;

    xSemaphoreGive(_mutex);
}

void StatusDisplay::render(const StatusSnapshot &snapshot) {
    char buf[16];

    if (snapshot.phase == Phase::WARMING_UP && snapshot.awaiting_confirmation) {
        _logger.updateLineText("phase", "CONFIRM?");
    } else if (snapshot.resume_pending) {
        _logger.updateLineText("phase", "RESUME?");
    } else if (snapshot.paused) {
        _logger.updateLineText("phase", "PAUSED");
    } else {
        _logger.updateLineText("phase", phaseToString(snapshot.phase));
    }

    if (snapshot.sensor_unavailable) {
        _logger.updateLineText("temp", "NO PROBE");
    } else {
        _logger.updateLine("temp", snapshot.temperature);
    }
    _logger.updateLine("setpt", snapshot.setpoint);

    if (isRunningPhase(snapshot.phase)) {
        formatDuration(buf, sizeof(buf), snapshot.remaining_ms);
        _logger.updateLineText("left", buf);
    } else if (snapshot.phase == Phase::COOLING) {
        formatDuration(buf, sizeof(buf), snapshot.cooldown_remaining_ms);
        _logger.updateLineText("left", buf);
    } else {
        _logger.updateLineText("left", "-");
    }

    if (snapshot.eta_s > 0) {
        formatDuration(buf, sizeof(buf), snapshot.eta_s * 1000UL);
        _logger.updateLineText("eta", buf);
    } else {
        _logger.updateLineText("eta", "-");
    }

    snprintf(buf, sizeof(buf), "%s%s", snapshot.actuators.heater ? "ON" : "OFF",
             snapshot.heater_override != ManualOverride::AUTO ? " (M)" : "");
    _logger.updateLineText("heat", buf);
    snprintf(buf, sizeof(buf), "%s%s", snapshot.actuators.fans ? "ON" : "OFF",
             snapshot.fan_override != ManualOverride::AUTO ? " (M)" : "");
    _logger.updateLineText("fans", buf);
    _logger.updateLineText("lights", snapshot.lights_on ? "ON" : "OFF");

    snprintf(buf, sizeof(buf), "%s%s%s", snapshot.alarm_latched ? "ALM " : "",
             snapshot.sensor_unavailable ? "SNS " : "",
             snapshot.actuator_fault ? "ACT" : "");
    _logger.updateLineText("flags", buf);
}

void StatusDisplay::logSummary(const StatusSnapshot &snapshot) {
    char left[16];
    formatDuration(left, sizeof(left),
                   snapshot.phase == Phase::COOLING
                       ? snapshot.cooldown_remaining_ms
                       : snapshot.remaining_ms);

    _logger.logf(true,
                 "#%lu %s%s T:%.1fC(%u) S:%.1fC left:%s eta:%lus H:%d F:%d "
                 "L:%d%s%s%s%s",
                 static_cast<unsigned long>(snapshot.sequence_number),
                 phaseToString(snapshot.phase), snapshot.paused ? "(P)" : "",
                 snapshot.temperature,
                 static_cast<unsigned>(snapshot.healthy_probes),
                 snapshot.setpoint, left,
                 static_cast<unsigned long>(snapshot.eta_s),
                 snapshot.actuators.heater ? 1 : 0,
                 snapshot.actuators.fans ? 1 : 0, snapshot.lights_on ? 1 : 0,
                 snapshot.resume_pending ? " RESUME?" : "",
                 snapshot.alarm_latched ? " ALARM" : "",
                 snapshot.sensor_unavailable ? " NO_PROBE" : "",
                 snapshot.actuator_fault ? " ACT_FAULT" : "");
}
