/**
 * @file ProbeArray.h
 * @brief DS18B20 enclosure probes on one OneWire bus
 *
 * USAGE:
 * ------
 *   ProbeArray probes(logger);
 *   probes.begin();                      // discovers up to MAX_PROBES
 *
 *   // once per control tick:
 *   ProbeReading r[Intervals::MAX_PROBES];
 *   size_t n = probes.read(r, Intervals::MAX_PROBES);
 *
 * BUS COORDINATION:
 * -----------------
 * One requestTemperatures() converts every probe at once (750ms at 12-bit).
 * read() never blocks: it collects the previous conversion once it has had
 * time to finish, then starts the next one. With a 1s control tick every
 * tick sees a fresh conversion. A probe that returns DEVICE_DISCONNECTED_C or
 * the 85C power-on value is reported invalid until it reads sane again, as is
 * one outside the valid window; error and recovery are each logged once.
 */

#ifndef PROBE_ARRAY_H
#define PROBE_ARRAY_H

#include "Logger.h"
#include "ProbeSource.h"
#include "config.h"
#include <DallasTemperature.h>
#include <OneWire.h>

class ProbeArray : public ProbeSource {
  public:
    explicit ProbeArray(Logger &logger);

    void begin();

    size_t read(ProbeReading *out, size_t max) override;

    size_t probeCount() const { return _count; }

    // Plausibility filter applied to every raw reading
    static bool isSane(float temp_c);

    // Scratchpad value of a probe that reset without converting
    static constexpr float POWER_ON_RESET_C = 85.0f;

  private:
    struct Probe {
        DeviceAddress address;
        float temperature;
        bool valid;
        bool in_error;
    };

    Logger &_logger;
    OneWire _oneWire;
    DallasTemperature _dallas;

    Probe _probes[Intervals::MAX_PROBES];
    size_t _count;

    bool _conversion_pending;
    unsigned long _conversion_start;
    unsigned long _last_discovery;

    void discover();
    void collect();
};

#endif // PROBE_ARRAY_H
