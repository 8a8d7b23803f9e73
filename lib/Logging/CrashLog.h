/**
 * @file CrashLog.h
 * @brief Critical event log that survives panic and watchdog resets
 *
 * USAGE:
 * ------
 *   CrashLog::begin();                       // once in setup(), prints reason
 *   CrashLog::logCritical("ESTOP", "fire");  // emergency stops, fire, ...
 *   CrashLog::dumpToSerial();                // console 'crashlog'
 *
 * STORAGE:
 * --------
 * The last CrashLog::CAPACITY events are kept in RTC slow memory, which is
 * not cleared by a software, panic, watchdog or brownout reset. A power
 * cycle loses them; the run itself is recovered through the checkpoint
 * store. Each entry holds the uptime at logging time and the boot it came
 * from, so entries from before the last reset can be told apart.
 *
 * Critical lines are also echoed with a "CRASH[category]" prefix so they can
 * be grepped out of a serial capture. Safe to call from any task.
 */

#ifndef CRASH_LOG_H
#define CRASH_LOG_H

#include <Arduino.h>

class CrashLog {
  public:
    static constexpr size_t CAPACITY = 16;
    static constexpr size_t CATEGORY_LEN = 12;
    static constexpr size_t MESSAGE_LEN = 48;

    /**
     * @brief Validate retained entries, bump the boot counter, print the
     * reset reason and, after an unclean reset, the retained entries
     */
    static void begin();

    static void logCritical(const char *category, const char *message);

    /**
     * @brief Print every retained entry, oldest first
     */
    static void dumpToSerial();

    static void clear();

    /**
     * @brief Human-readable reason for the last reset
     */
    static const char *getResetReasonString();

    /**
     * @brief True if the last reset was a panic, watchdog or brownout
     *
     * A run interrupted this way is expected to be resumed from its
     * checkpoint rather than restarted.
     */
    static bool wasUncleanReset();

    static uint32_t criticalCount() { return _critical_count; }
    static size_t retainedCount();

  private:
    struct Entry {
        uint32_t boot;
        uint32_t uptime_ms;
        char category[CATEGORY_LEN];
        char message[MESSAGE_LEN];
    };

    static Entry _entries[CAPACITY];
    static uint32_t _critical_count;
};

#endif // CRASH_LOG_H
