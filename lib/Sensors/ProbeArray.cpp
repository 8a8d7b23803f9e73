/**
 * @file ProbeArray.cpp
 * @brief Implementation of the non-blocking DS18B20 probe bus
 */

#include "ProbeArray.h"
#include <cmath>

ProbeArray::ProbeArray(Logger &logger)
    : _logger(logger), _oneWire(PIN_DS18B20), _dallas(&_oneWire), _count(0),
      _conversion_pending(false), _conversion_start(0), _last_discovery(0) {}

void ProbeArray::begin() {
    _dallas.begin();
    _dallas.setWaitForConversion(false);
    discover();
}

void ProbeArray::discover() {
    _last_discovery = millis();
    _dallas.begin();

    size_t found = 0;
    uint8_t devices = _dallas.getDeviceCount();
    for (uint8_t i = 0; i < devices && found < Intervals::MAX_PROBES; i++) {
        Probe &probe = _probes[found];
        if (!_dallas.getAddress(probe.address, i))
            continue;
        _dallas.setResolution(probe.address, 12);
        probe.temperature = 0.0f;
        probe.valid = false;
        probe.in_error = false;
        found++;
    }

    if (found != _count || found == 0) {
        _logger.logf(false, "DS18B20: %u probe(s) found", static_cast<unsigned>(found));
    }
    _count = found;
    _conversion_pending = false;
}

bool ProbeArray::isSane(float temp_c) {
    return temp_c != DEVICE_DISCONNECTED_C && temp_c != POWER_ON_RESET_C &&
           !std::isnan(temp_c) &&
           temp_c >= Limits::PROBE_MIN_VALID_C &&
           temp_c <= Limits::PROBE_MAX_VALID_C;
}

void ProbeArray::collect() {
    for (size_t i = 0; i < _count; i++) {
        Probe &probe = _probes[i];
        float temp_c = _dallas.getTempC(probe.address);

        if (!isSane(temp_c)) {
            probe.valid = false;
            if (!probe.in_error) {
                probe.in_error = true;
                _logger.logf(false, "DS18B20 #%u error", static_cast<unsigned>(i));
            }
            continue;
        }

        if (probe.in_error) {
            probe.in_error = false;
            _logger.logf(false, "DS18B20 #%u recovered", static_cast<unsigned>(i));
        }
        probe.temperature = temp_c;
        probe.valid = true;
    }
}

size_t ProbeArray::read(ProbeReading *out, size_t max) {
    unsigned long now = millis();

    // Nothing on the bus: retry discovery now and then
    if (_count == 0) {
        if (now - _last_discovery >= Intervals::PROBE_DISCOVERY_RETRY_MS)
            discover();
        return 0;
    }

    if (_conversion_pending &&
        now - _conversion_start >= Intervals::DS18B20_CONVERSION_TIME_MS) {
        collect();
        _conversion_pending = false;
    }

    if (!_conversion_pending) {
        _dallas.requestTemperatures();
        _conversion_start = now;
        _conversion_pending = true;
    }

    size_t n = _count < max ? _count : max;
    for (size_t i = 0; i < n; i++) {
        out[i].temperature = _probes[i].temperature;
        out[i].valid = _probes[i].valid;
    }
    return n;
}
