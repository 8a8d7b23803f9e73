/**
 * @file RunPresets.cpp
 * @brief Built-in presets and list editing
 */

#include "RunPresets.h"
#include <cmath>
#include <cstring>

void PresetList::loadDefaults() {
    _count = 0;
    add("ABS Standard", 60.0f, 8UL * 3600000UL);
    add("ASA Standard", 65.0f, 10UL * 3600000UL);
    add("Quick Test", 40.0f, 30UL * 60000UL);
}

const char *PresetList::add(const char *name, float setpoint,
                            unsigned long duration_ms) {
    if (name == nullptr || name[0] == '\0' || strlen(name) > MAX_NAME_LEN)
        return "bad preset name";
    if (std::isnan(setpoint) || setpoint < Limits::MIN_SETPOINT_C ||
        setpoint > Limits::MAX_SETPOINT_C)
        return "setpoint out of range";
    if (duration_ms == 0 || duration_ms > Limits::MAX_DURATION_MS)
        return "duration out of range";
    if (_count >= CAPACITY)
        return "preset list full";

    RunPreset &preset = _presets[_count++];
    memset(preset.name, 0, sizeof(preset.name));
    memcpy(preset.name, name, strlen(name));
    preset.setpoint = setpoint;
    preset.duration_ms = duration_ms;
    return nullptr;
}

bool PresetList::remove(size_t index) {
    if (index >= _count)
        return false;
    for (size_t i = index; i + 1 < _count; i++) {
        _presets[i] = _presets[i + 1];
    }
    _count--;
    return true;
}
