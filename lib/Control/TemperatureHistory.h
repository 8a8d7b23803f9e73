/**
 * @file TemperatureHistory.h
 * @brief Rolling enclosure temperature samples and time-to-setpoint estimate
 *
 * The Coordinator records one sample every History::SAMPLE_INTERVAL_MS while
 * a run is active and clears the buffer when the run ends. The ETA is the
 * straight-line rate over the newest RATE_WINDOW_SAMPLES samples applied to
 * the remaining distance to the setpoint.
 */

#ifndef TEMPERATURE_HISTORY_H
#define TEMPERATURE_HISTORY_H

#include "RingBuffer.h"
#include "config.h"
#include <cstdint>

struct TemperatureSample {
    unsigned long timestamp_ms; // Controller time, monotonic
    float temperature;
};

class TemperatureHistory {
  public:
    void recordSample(const TemperatureSample &sample) {
        _samples.push(sample);
    }

    /**
     * @brief Seconds until current reaches target at the recent rate
     * @return 0 when history is short, the trend is flat or falling, or the
     *         target is already reached
     */
    uint32_t etaSeconds(float current, float target) const;

    size_t getCount() const { return _samples.size(); }

    /**
     * @param samples_ago 0 = most recent
     */
    const TemperatureSample *getSample(size_t samples_ago) const {
        return _samples.getFromNewest(samples_ago);
    }

    void clear() { _samples.clear(); }

  private:
    RingBuffer<TemperatureSample, History::CAPACITY> _samples;
};

#endif // TEMPERATURE_HISTORY_H
