/**
 * @file CheckpointStore.cpp
 * @brief Implementation of the NVS run checkpoint
 */

#include "CheckpointStore.h"
#include "CrashLog.h"
#include "ElapsedTimeAccountant.h"
#include <cstddef>
#include <cstring>
#include <esp_rom_crc.h>
#include <nvs.h>

CheckpointStore::CheckpointStore(Logger &logger, const char *nvs_namespace)
    : _logger(logger), _namespace(nvs_namespace), _save_count(0) {}

uint32_t CheckpointStore::recordCrc(const void *record) {
    // CRC-32/ISO-HDLC from the ROM table, everything before the crc field
    return esp_rom_crc32_le(0, static_cast<const uint8_t *>(record),
                            offsetof(Record, crc));
}

bool CheckpointStore::checkNvsSpace() {
    nvs_stats_t nvs_stats;
    esp_err_t err = nvs_get_stats(NULL, &nvs_stats);

    if (err != ESP_OK) {
        _logger.log("NVS: Stats unavailable", true);
        return true; // Allow writes if we can't check
    }

    if (nvs_stats.free_entries < CheckpointPolicy::NVS_MIN_FREE_ENTRIES) {
        _logger.logf(false, "NVS: Low space! %d free",
                     static_cast<int>(nvs_stats.free_entries));
        return false;
    }
    return true;
}

bool CheckpointStore::save(const RunState &state, uint32_t now_epoch) {
    if (!checkNvsSpace())
        return false;

    Record record;
    memset(static_cast<void *>(&record), 0, sizeof(record));
    record.magic = RECORD_MAGIC;
    record.version = RECORD_VERSION;
    record.size = sizeof(Record);
    record.written_at = now_epoch;
    record.state = state;
    record.state.last_checkpoint_at = now_epoch;
    record.crc = recordCrc(&record);

    if (!_prefs.begin(_namespace, false)) {
        _logger.log("CKPT: NVS open failed");
        return false;
    }
    size_t written =
        _prefs.putBytes(CheckpointPolicy::NVS_KEY, &record, sizeof(record));
    _prefs.end();

    if (written != sizeof(record)) {
        _logger.log("CKPT: write failed");
        return false;
    }

    _save_count++;
    return true;
}

CheckpointLoadResult CheckpointStore::load(uint32_t now_epoch, RunState &out) {
    Record record;
    memset(static_cast<void *>(&record), 0, sizeof(record));
    size_t length = 0;

    if (_prefs.begin(_namespace, true)) {
        if (_prefs.isKey(CheckpointPolicy::NVS_KEY)) {
            length = _prefs.getBytesLength(CheckpointPolicy::NVS_KEY);
            if (length == sizeof(record)) {
                _prefs.getBytes(CheckpointPolicy::NVS_KEY, &record,
                                sizeof(record));
            }
        }
        _prefs.end();
    }

    if (length == 0)
        return CheckpointLoadResult::NONE;

    CheckpointLoadResult result;
    if (length != sizeof(record) || record.magic != RECORD_MAGIC ||
        record.version != RECORD_VERSION || record.size != sizeof(Record) ||
        record.crc != recordCrc(&record)) {
        result = CheckpointLoadResult::CORRUPT;
    } else {
        result = evaluate(record.state, record.written_at, now_epoch);
    }

    switch (result) {
    case CheckpointLoadResult::RESUMABLE:
        out = record.state;
        _logger.logf(false, "CKPT: %s checkpoint, %lus active, written %lus ago",
                     phaseToString(record.state.phase),
                     record.state.active_elapsed_ms / 1000UL,
                     static_cast<unsigned long>(
                         now_epoch > record.written_at
                             ? now_epoch - record.written_at
                             : 0));
        break;
    case CheckpointLoadResult::NO_WALL_TIME:
        _logger.log("CKPT: no wall time, checkpoint kept, not resumed");
        break;
    default:
        _logger.logf(false, "CKPT: discarding %s checkpoint",
                     loadResultToString(result));
        if (result == CheckpointLoadResult::CORRUPT)
            CrashLog::logCritical("CKPT", "corrupt checkpoint erased");
        remove();
        break;
    }
    return result;
}

bool CheckpointStore::remove() {
    if (!_prefs.begin(_namespace, false))
        return false;
    bool ok = true;
    if (_prefs.isKey(CheckpointPolicy::NVS_KEY))
        ok = _prefs.remove(CheckpointPolicy::NVS_KEY);
    _prefs.end();
    if (!ok)
        _logger.log("CKPT: remove failed");
    return ok;
}

bool CheckpointStore::exists() {
    if (!_prefs.begin(_namespace, true))
        return false;
    bool present = _prefs.isKey(CheckpointPolicy::NVS_KEY);
    _prefs.end();
    return present;
}

CheckpointLoadResult CheckpointStore::evaluate(const RunState &state,
                                               uint32_t written_at,
                                               uint32_t now_epoch) {
    if (state.phase == Phase::IDLE || state.phase == Phase::WARMING_UP)
        return CheckpointLoadResult::NOT_RESUMABLE;
    if (written_at == 0)
        return CheckpointLoadResult::NOT_RESUMABLE;
    if (now_epoch == 0)
        return CheckpointLoadResult::NO_WALL_TIME;

    uint32_t age = now_epoch > written_at ? now_epoch - written_at : 0;

    if (state.phase == Phase::COOLING) {
        return age <= CheckpointPolicy::MAX_COOLDOWN_BUDGET_S
                   ? CheckpointLoadResult::RESUMABLE
                   : CheckpointLoadResult::STALE;
    }

    uint32_t allowed = ElapsedTimeAccountant::remainingMs(state) / 1000UL +
                       CheckpointPolicy::STALE_GRACE_S;
    return age <= allowed ? CheckpointLoadResult::RESUMABLE
                          : CheckpointLoadResult::STALE;
}
