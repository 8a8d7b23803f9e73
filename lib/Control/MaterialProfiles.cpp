/**
 * @file MaterialProfiles.cpp
 * @brief Built-in material profiles and table editing
 */

#include "MaterialProfiles.h"
#include <cctype>
#include <cmath>
#include <cstring>
#include <strings.h>

namespace {

struct BuiltInProfile {
    const char *material;
    float setpoint;
    bool fans_enabled;
};

constexpr BuiltInProfile BUILT_IN_PROFILES[] = {
    {"PC", 60.0f, false},   {"ABS", 60.0f, true},  {"ASA", 65.0f, true},
    {"PETG", 40.0f, true},  {"PLA", 0.0f, false},  {"HIPS", 60.0f, true},
    {"TPU", 40.0f, false},  {"NYLON", 60.0f, false},
};

} // namespace

void MaterialTable::loadDefaults() {
    _count = 0;
    for (const BuiltInProfile &profile : BUILT_IN_PROFILES) {
        set(profile.material, profile.setpoint, profile.fans_enabled);
    }
}

bool MaterialTable::validName(const char *material) {
    if (material == nullptr || material[0] == '\0')
        return false;
    size_t len = strlen(material);
    if (len > MAX_NAME_LEN)
        return false;
    for (size_t i = 0; i < len; i++) {
        if (!isalnum(static_cast<unsigned char>(material[i])))
            return false;
    }
    return true;
}

int MaterialTable::indexOf(const char *material) const {
    if (material == nullptr)
        return -1;
    for (size_t i = 0; i < _count; i++) {
        if (strcasecmp(_entries[i].material, material) == 0)
            return static_cast<int>(i);
    }
    return -1;
}

const MaterialProfile *MaterialTable::find(const char *material) const {
    if (material == nullptr || material[0] == '\0')
        return nullptr;
    int index = indexOf(material);
    return index < 0 ? nullptr : &_entries[index];
}

const char *MaterialTable::set(const char *material, float setpoint,
                               bool fans_enabled) {
    if (!validName(material))
        return "bad material name";
    // 0 is allowed here: it marks a material that gets no heat
    if (std::isnan(setpoint) || setpoint < 0.0f ||
        setpoint > Limits::MAX_SETPOINT_C)
        return "setpoint out of range";

    int index = indexOf(material);
    if (index < 0) {
        if (_count >= CAPACITY)
            return "material table full";
        index = static_cast<int>(_count++);
    }

    MaterialProfile &entry = _entries[index];
    memset(entry.material, 0, sizeof(entry.material));
    for (size_t i = 0; material[i] != '\0'; i++) {
        entry.material[i] =
            static_cast<char>(toupper(static_cast<unsigned char>(material[i])));
    }
    entry.setpoint = setpoint;
    entry.fans_enabled = fans_enabled;
    return nullptr;
}

bool MaterialTable::remove(const char *material) {
    int index = indexOf(material);
    if (index < 0)
        return false;
    for (size_t i = static_cast<size_t>(index); i + 1 < _count; i++) {
        _entries[i] = _entries[i + 1];
    }
    _count--;
    return true;
}
