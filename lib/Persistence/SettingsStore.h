/**
 * @file SettingsStore.h
 * @brief NVS-backed run defaults used by the console and job auto-start
 *
 * On first boot the namespace is created and filled from config.h Defaults.
 * Later boots read whatever was last saved.
 *
 * Besides the run defaults the namespace holds the lights preference, the
 * material table used by job auto-start and the user's run presets. The two
 * tables are stored as versioned blobs; a blob that fails to parse is
 * replaced by the built-in table.
 */

#ifndef SETTINGS_STORE_H
#define SETTINGS_STORE_H

#include "EnclosureTypes.h"
#include "Logger.h"
#include "MaterialProfiles.h"
#include "RunPresets.h"
#include "config.h"
#include <Preferences.h>

class SettingsStore {
  public:
    SettingsStore(Logger &logger,
                  const char *nvs_namespace = Defaults::NVS_NAMESPACE);

    /**
     * @brief Load stored values, writing defaults on first run
     */
    void begin();

    /**
     * @brief Persist new defaults (rejected if they fail Start validation)
     */
    bool save(const RunSettings &settings, bool auto_start_enabled);

    const RunSettings &runDefaults() const { return _defaults; }
    bool autoStartEnabled() const { return _auto_start_enabled; }

    bool lightsEnabled() const { return _lights_enabled; }
    bool saveLights(bool on);

    const MaterialTable &materials() const { return _materials; }
    bool saveMaterials(const MaterialTable &materials);

    const PresetList &presets() const { return _presets; }
    bool savePresets(const PresetList &presets);

    /**
     * @brief Copy a preset's setpoint and duration into the run defaults
     * @return false for an unknown index or a failed write
     */
    bool loadPreset(size_t index);

    static RunSettings compiledDefaults();

  private:
    static constexpr uint16_t TABLE_VERSION = 1;

    struct MaterialBlob {
        uint16_t version;
        uint16_t count;
        MaterialProfile entries[MaterialTable::CAPACITY];
    };

    struct PresetBlob {
        uint16_t version;
        uint16_t count;
        RunPreset entries[PresetList::CAPACITY];
    };

    Logger &_logger;
    const char *_namespace;
    Preferences _prefs;
    RunSettings _defaults;
    bool _auto_start_enabled;
    bool _lights_enabled;
    MaterialTable _materials;
    PresetList _presets;

    bool writeAll();
    bool writeMaterials();
    bool writePresets();
    void readTables();

    static constexpr const char *KEY_SETPOINT = "setpoint";
    static constexpr const char *KEY_HYSTERESIS = "hyst";
    static constexpr const char *KEY_DURATION = "duration";
    static constexpr const char *KEY_FANS = "fans";
    static constexpr const char *KEY_SKIP_PREHEAT = "skip_pre";
    static constexpr const char *KEY_CONFIRM = "confirm";
    static constexpr const char *KEY_COOL_BUDGET = "cool_ms";
    static constexpr const char *KEY_COOL_TARGET = "cool_c";
    static constexpr const char *KEY_AUTO_START = "auto";
    static constexpr const char *KEY_LIGHTS = "lights";
    static constexpr const char *KEY_MATERIALS = "materials";
    static constexpr const char *KEY_PRESETS = "presets";
};

#endif // SETTINGS_STORE_H
