/**
 * @file MaterialProfiles.h
 * @brief Enclosure setpoint and fan policy per filament material
 *
 * Used when a print job announces its material. A setpoint of 0 means the
 * material prints best in an unheated enclosure, so no run is started.
 *
 * The table starts from the built-in profiles and is edited from the console;
 * SettingsStore persists it. Names are matched case-insensitively and stored
 * upper-case.
 */

#ifndef MATERIAL_PROFILES_H
#define MATERIAL_PROFILES_H

#include "config.h"
#include <cstddef>

struct MaterialProfile {
    char material[8];
    float setpoint;
    bool fans_enabled;
};

class MaterialTable {
  public:
    static constexpr size_t CAPACITY = Defaults::MAX_MATERIALS;
    static constexpr size_t MAX_NAME_LEN = sizeof(MaterialProfile::material) - 1;

    MaterialTable() : _count(0) {}

    /**
     * @brief Replace the contents with the built-in profiles
     */
    void loadDefaults();

    /**
     * @return nullptr for unknown or empty material names
     */
    const MaterialProfile *find(const char *material) const;

    /**
     * @brief Insert or update one material
     * @return why it was refused, nullptr on success
     */
    const char *set(const char *material, float setpoint, bool fans_enabled);

    bool remove(const char *material);

    size_t size() const { return _count; }
    const MaterialProfile &at(size_t index) const { return _entries[index]; }

  private:
    MaterialProfile _entries[CAPACITY];
    size_t _count;

    int indexOf(const char *material) const;
    static bool validName(const char *material);
};

#endif // MATERIAL_PROFILES_H
