/**
 * @file TemperatureHistory.cpp
 * @brief Warm-up ETA from the recent temperature slope
 */

#include "TemperatureHistory.h"

uint32_t TemperatureHistory::etaSeconds(float current, float target) const {
    size_t count = _samples.size();
    if (count < History::MIN_SAMPLES_FOR_ETA)
        return 0;

    size_t window =
        count < History::RATE_WINDOW_SAMPLES ? count : History::RATE_WINDOW_SAMPLES;
    const TemperatureSample *newest = _samples.getFromNewest(0);
    const TemperatureSample *oldest = _samples.getFromNewest(window - 1);

    unsigned long span_ms = newest->timestamp_ms - oldest->timestamp_ms;
    float rise = newest->temperature - oldest->temperature;
    if (span_ms == 0 || rise <= 0.0f)
        return 0;

    float remaining = target - current;
    if (remaining <= 0.0f)
        return 0;

    // degC per second
    float rate = rise / (static_cast<float>(span_ms) / 1000.0f);
    float eta_s = remaining / rate;
    if (eta_s > static_cast<float>(History::MAX_ETA_S))
        return History::MAX_ETA_S;
    return static_cast<uint32_t>(eta_s);
}
