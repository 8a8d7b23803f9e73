/**
 * @file SettingsStore.cpp
 * @brief Run defaults and user tables persisted in NVS
 */

#include "SettingsStore.h"
#include "PhaseStateMachine.h"
#include <cstring>

SettingsStore::SettingsStore(Logger &logger, const char *nvs_namespace)
    : _logger(logger), _namespace(nvs_namespace),
      _defaults(compiledDefaults()),
      _auto_start_enabled(Defaults::AUTO_START_ENABLED),
      _lights_enabled(Defaults::LIGHTS_ENABLED) {
    _materials.loadDefaults();
    _presets.loadDefaults();
}

RunSettings SettingsStore::compiledDefaults() {
    RunSettings settings;
    settings.setpoint = Defaults::SETPOINT_C;
    settings.hysteresis = Defaults::HYSTERESIS_C;
    settings.duration_ms = Defaults::DURATION_MS;
    settings.fans_enabled = Defaults::FANS_ENABLED;
    settings.skip_preheat = Defaults::SKIP_PREHEAT;
    settings.require_confirmation = Defaults::REQUIRE_CONFIRMATION;
    settings.cooldown_budget_ms = Defaults::COOLDOWN_BUDGET_MS;
    settings.cooldown_target = Defaults::COOLDOWN_TARGET_C;
    settings.follow_job = false;
    return settings;
}

void SettingsStore::begin() {
    if (!_prefs.begin(_namespace, true)) { // Read-only
        _logger.log("NVS: settings init (first run)");
        _prefs.end();
        bool ok = writeAll();
        ok = writeMaterials() && ok;
        ok = writePresets() && ok;
        if (!ok)
            _logger.log("NVS: settings init write failed!");
        return;
    }

    RunSettings loaded = compiledDefaults();
    loaded.setpoint = _prefs.getFloat(KEY_SETPOINT, loaded.setpoint);
    loaded.hysteresis = _prefs.getFloat(KEY_HYSTERESIS, loaded.hysteresis);
    loaded.duration_ms = _prefs.getULong(KEY_DURATION, loaded.duration_ms);
    loaded.fans_enabled = _prefs.getBool(KEY_FANS, loaded.fans_enabled);
    loaded.skip_preheat = _prefs.getBool(KEY_SKIP_PREHEAT, loaded.skip_preheat);
    loaded.require_confirmation =
        _prefs.getBool(KEY_CONFIRM, loaded.require_confirmation);
    loaded.cooldown_budget_ms =
        _prefs.getULong(KEY_COOL_BUDGET, loaded.cooldown_budget_ms);
    loaded.cooldown_target =
        _prefs.getFloat(KEY_COOL_TARGET, loaded.cooldown_target);
    bool auto_start = _prefs.getBool(KEY_AUTO_START, _auto_start_enabled);
    _lights_enabled = _prefs.getBool(KEY_LIGHTS, _lights_enabled);
    readTables();
    _prefs.end();

    const char *why = PhaseStateMachine::validateSettings(loaded);
    if (why != nullptr) {
        _logger.logf(false, "NVS: stored settings invalid (%s), using defaults", why);
        return;
    }

    _defaults = loaded;
    _auto_start_enabled = auto_start;
    _logger.logf(true, "NVS: defaults %.1fC %lumin auto=%d", _defaults.setpoint,
                 _defaults.duration_ms / 60000UL, _auto_start_enabled ? 1 : 0);
}

bool SettingsStore::save(const RunSettings &settings, bool auto_start_enabled) {
    if (PhaseStateMachine::validateSettings(settings) != nullptr)
        return false;
    _defaults = settings;
    _defaults.follow_job = false;
    _auto_start_enabled = auto_start_enabled;
    return writeAll();
}

bool SettingsStore::writeAll() {
    if (!_prefs.begin(_namespace, false))
        return false;

    bool ok = true;
    ok &= _prefs.putFloat(KEY_SETPOINT, _defaults.setpoint) > 0;
    ok &= _prefs.putFloat(KEY_HYSTERESIS, _defaults.hysteresis) > 0;
    ok &= _prefs.putULong(KEY_DURATION, _defaults.duration_ms) > 0;
    ok &= _prefs.putBool(KEY_FANS, _defaults.fans_enabled) > 0;
    ok &= _prefs.putBool(KEY_SKIP_PREHEAT, _defaults.skip_preheat) > 0;
    ok &= _prefs.putBool(KEY_CONFIRM, _defaults.require_confirmation) > 0;
    ok &= _prefs.putULong(KEY_COOL_BUDGET, _defaults.cooldown_budget_ms) > 0;
    ok &= _prefs.putFloat(KEY_COOL_TARGET, _defaults.cooldown_target) > 0;
    ok &= _prefs.putBool(KEY_AUTO_START, _auto_start_enabled) > 0;
    ok &= _prefs.putBool(KEY_LIGHTS, _lights_enabled) > 0;
    _prefs.end();

    if (!ok)
        _logger.log("NVS: settings write failed!");
    return ok;
}

bool SettingsStore::saveLights(bool on) {
    if (!_prefs.begin(_namespace, false))
        return false;
    bool ok = _prefs.putBool(KEY_LIGHTS, on) > 0;
    _prefs.end();
    if (!ok) {
        _logger.log("NVS: lights write failed!");
        return false;
    }
    _lights_enabled = on;
    return true;
}

// =============================================================================
// Material table and presets
// =============================================================================

bool SettingsStore::saveMaterials(const MaterialTable &materials) {
    _materials = materials;
    return writeMaterials();
}

bool SettingsStore::savePresets(const PresetList &presets) {
    _presets = presets;
    return writePresets();
}

bool SettingsStore::loadPreset(size_t index) {
    const RunPreset *preset = _presets.at(index);
    if (preset == nullptr)
        return false;

    RunSettings next = _defaults;
    next.setpoint = preset->setpoint;
    next.duration_ms = preset->duration_ms;
    if (!save(next, _auto_start_enabled))
        return false;
    _logger.logf(false, "NVS: preset '%s' loaded", preset->name);
    return true;
}

bool SettingsStore::writeMaterials() {
    MaterialBlob blob;
    memset(static_cast<void *>(&blob), 0, sizeof(blob));
    blob.version = TABLE_VERSION;
    blob.count = static_cast<uint16_t>(_materials.size());
    for (size_t i = 0; i < _materials.size(); i++) {
        blob.entries[i] = _materials.at(i);
    }

    if (!_prefs.begin(_namespace, false))
        return false;
    bool ok = _prefs.putBytes(KEY_MATERIALS, &blob, sizeof(blob)) ==
              sizeof(blob);
    _prefs.end();
    if (!ok)
        _logger.log("NVS: material table write failed!");
    return ok;
}

bool SettingsStore::writePresets() {
    PresetBlob blob;
    memset(static_cast<void *>(&blob), 0, sizeof(blob));
    blob.version = TABLE_VERSION;
    blob.count = static_cast<uint16_t>(_presets.size());
    for (size_t i = 0; i < _presets.size(); i++) {
        blob.entries[i] = *_presets.at(i);
    }

    if (!_prefs.begin(_namespace, false))
        return false;
    bool ok = _prefs.putBytes(KEY_PRESETS, &blob, sizeof(blob)) == sizeof(blob);
    _prefs.end();
    if (!ok)
        _logger.log("NVS: preset write failed!");
    return ok;
}

// Called with _prefs open read-only. Missing keys keep the built-in tables.
void SettingsStore::readTables() {
    if (_prefs.isKey(KEY_MATERIALS)) {
        MaterialBlob blob;
        MaterialTable loaded;
        bool ok = _prefs.getBytesLength(KEY_MATERIALS) == sizeof(blob) &&
                  _prefs.getBytes(KEY_MATERIALS, &blob, sizeof(blob)) ==
                      sizeof(blob) &&
                  blob.version == TABLE_VERSION &&
                  blob.count <= MaterialTable::CAPACITY;
        for (size_t i = 0; ok && i < blob.count; i++) {
            const MaterialProfile &entry = blob.entries[i];
            ok = memchr(entry.material, '\0', sizeof(entry.material)) !=
                     nullptr &&
                 loaded.set(entry.material, entry.setpoint,
                            entry.fans_enabled) == nullptr;
        }
        if (ok) {
            _materials = loaded;
        } else {
            _logger.log("NVS: material table unreadable, using built-in");
        }
    }

    if (_prefs.isKey(KEY_PRESETS)) {
        PresetBlob blob;
        PresetList loaded;
        bool ok = _prefs.getBytesLength(KEY_PRESETS) == sizeof(blob) &&
                  _prefs.getBytes(KEY_PRESETS, &blob, sizeof(blob)) ==
                      sizeof(blob) &&
                  blob.version == TABLE_VERSION &&
                  blob.count <= PresetList::CAPACITY;
        for (size_t i = 0; ok && i < blob.count; i++) {
            const RunPreset &entry = blob.entries[i];
            ok = memchr(entry.name, '\0', sizeof(entry.name)) != nullptr &&
                 loaded.add(entry.name, entry.setpoint, entry.duration_ms) ==
                     nullptr;
        }
        if (ok) {
            _presets = loaded;
        } else {
            _logger.log("NVS: presets unreadable, using built-in");
        }
    }
}
