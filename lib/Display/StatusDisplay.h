/**
 * @file StatusDisplay.h
 * @brief Status observer that renders snapshots on the TFT and Serial
 *
 * Registers its lines with the Logger in begin(). Snapshots arrive from the
 * control, safety and console tasks in any order; each one is passed through
 * a SequenceFilter and only newer snapshots are drawn. A one-line summary is
 * written to Serial every Display::STATUS_LOG_INTERVAL_MS and on every phase
 * change.
 */

#ifndef STATUS_DISPLAY_H
#define STATUS_DISPLAY_H

#include "Logger.h"
#include "StatusObserver.h"
#include "StatusSequencer.h"
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>

class StatusDisplay : public StatusObserver {
  public:
    explicit StatusDisplay(Logger &logger);

    void begin();

    void onStatus(const StatusSnapshot &snapshot) override;

    uint32_t lastShownSequence() const { return _filter.lastAccepted(); }
    uint32_t droppedCount() const { return _dropped; }

    /**
     * @brief Format remaining time as H:MM:SS
     */
    static void formatDuration(char *buf, size_t size, unsigned long ms);

  private:
    Logger &_logger;
    SemaphoreHandle_t _mutex;
    SequenceFilter _filter;
    uint32_t _dropped;
    bool _have_phase;
    Phase _last_phase;
    unsigned long _last_summary_ms;

    void render(const StatusSnapshot &snapshot);
    void logSummary(const StatusSnapshot &snapshot);
};

#endif // STATUS_DISPLAY_H
