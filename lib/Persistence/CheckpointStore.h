/**
 * @file CheckpointStore.h
 * @brief Crash-safe snapshot of the active run in NVS
 *
 * The run is stored as a single binary blob (magic, format version, size,
 * write time, RunState, CRC-32) under one key. NVS replaces a blob entry as a
 * whole, so a reader sees either the previous record or the new one.
 *
 * STALENESS (checked once at boot):
 * ---------------------------------
 * - HEATING/MAINTAINING: resumable while
 *     age <= remaining run time + CheckpointPolicy::STALE_GRACE_S
 * - COOLING: resumable while age <= CheckpointPolicy::MAX_COOLDOWN_BUDGET_S
 * - WARMING_UP / IDLE: never resumed
 * A negative age (clock stepped backwards) counts as zero. Stale, corrupt and
 * non-resumable records are erased; a record that cannot be aged because
 * wall time is unknown is kept for a later boot.
 */

#ifndef CHECKPOINT_STORE_H
#define CHECKPOINT_STORE_H

#include "EnclosureTypes.h"
#include "Logger.h"
#include "config.h"
#include <Arduino.h>
#include <Preferences.h>

enum class CheckpointLoadResult : uint8_t {
    NONE,          // Nothing stored
    RESUMABLE,     // Record valid and fresh enough
    STALE,         // Older than the phase allows
    NOT_RESUMABLE, // Phase is never resumed
    CORRUPT,       // Bad magic, version, size or CRC
    NO_WALL_TIME   // Cannot judge age without wall time
};

inline const char *loadResultToString(CheckpointLoadResult result) {
    switch (result) {
    case CheckpointLoadResult::NONE:
        return "none";
    case CheckpointLoadResult::RESUMABLE:
        return "resumable";
    case CheckpointLoadResult::STALE:
        return "stale";
    case CheckpointLoadResult::NOT_RESUMABLE:
        return "not resumable";
    case CheckpointLoadResult::CORRUPT:
        return "corrupt";
    case CheckpointLoadResult::NO_WALL_TIME:
        return "no wall time";
    default:
        return "???";
    }
}

class CheckpointStore {
  public:
    CheckpointStore(Logger &logger,
                    const char *nvs_namespace = CheckpointPolicy::NVS_NAMESPACE);

    /**
     * @brief Overwrite the stored record
     * @param now_epoch Wall-clock seconds stored as written_at
     * @return false if NVS is full or the write failed
     */
    bool save(const RunState &state, uint32_t now_epoch);

    /**
     * @brief Read and judge the stored record
     * @param now_epoch Wall-clock seconds, 0 if unknown
     * @param out Filled only when the result is RESUMABLE
     */
    CheckpointLoadResult load(uint32_t now_epoch, RunState &out);

    /**
     * @brief Erase the stored record (no-op when none exists)
     */
    bool remove();

    bool exists();

    /**
     * @brief Phase-aware staleness rule, independent of storage
     */
    static CheckpointLoadResult evaluate(const RunState &state,
                                         uint32_t written_at,
                                         uint32_t now_epoch);

    uint32_t saveCount() const { return _save_count; }

  private:
    static constexpr uint32_t RECORD_MAGIC = 0x454E4331; // "ENC1"
    static constexpr uint16_t RECORD_VERSION = 1;

    struct Record {
        uint32_t magic;
        uint16_t version;
        uint16_t size;
        uint32_t written_at;
        RunState state;
        uint32_t crc;
    };

    Logger &_logger;
    const char *_namespace;
    Preferences _prefs;
    uint32_t _save_count;

    bool checkNvsSpace();
    static uint32_t recordCrc(const void *record);
};

#endif // CHECKPOINT_STORE_H
