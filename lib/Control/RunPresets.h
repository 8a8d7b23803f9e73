/**
 * @file RunPresets.h
 * @brief Named setpoint and duration pairs the user can recall as defaults
 */

#ifndef RUN_PRESETS_H
#define RUN_PRESETS_H

#include "config.h"
#include <cstddef>

struct RunPreset {
    char name[16];
    float setpoint;
    unsigned long duration_ms;
};

class PresetList {
  public:
    static constexpr size_t CAPACITY = Defaults::MAX_PRESETS;
    static constexpr size_t MAX_NAME_LEN = sizeof(RunPreset::name) - 1;

    PresetList() : _count(0) {}

    /**
     * @brief Replace the contents with the built-in presets
     */
    void loadDefaults();

    /**
     * @brief Append a preset (names need not be unique)
     * @return why it was refused, nullptr on success
     */
    const char *add(const char *name, float setpoint,
                    unsigned long duration_ms);

    bool remove(size_t index);

    size_t size() const { return _count; }
    const RunPreset *at(size_t index) const {
        return index < _count ? &_presets[index] : nullptr;
    }

  private:
    RunPreset _presets[CAPACITY];
    size_t _count;
};

#endif // RUN_PRESETS_H
