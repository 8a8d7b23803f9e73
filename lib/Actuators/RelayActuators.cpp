/**
 * @file RelayActuators.cpp
 * @brief Relay and SSR output driver
 */

#include "RelayActuators.h"
#include "config.h"

RelayActuators::RelayActuators(Logger &logger)
    : _logger(logger), _initialized(false), _heater_on(false),
      _fans_on(false), _lights_on(false) {}

void RelayActuators::writeOutput(int pin, bool on, bool active_high) {
    digitalWrite(pin, (on == active_high) ? HIGH : LOW);
}

void RelayActuators::begin() {
    if (_initialized)
        return;

    // Set the OFF level before switching the pin to output
    writeOutput(PIN_HEATER, false, HEATER_ACTIVE_HIGH);
    writeOutput(PIN_FAN_1, false, FANS_ACTIVE_HIGH);
    writeOutput(PIN_FAN_2, false, FANS_ACTIVE_HIGH);
    writeOutput(PIN_LIGHTS, false, LIGHTS_ACTIVE_HIGH);
    pinMode(PIN_HEATER, OUTPUT);
    pinMode(PIN_FAN_1, OUTPUT);
    pinMode(PIN_FAN_2, OUTPUT);
    pinMode(PIN_LIGHTS, OUTPUT);

    _initialized = true;
    _logger.log("ACT: relays off");
}

bool RelayActuators::setHeater(bool on) {
    if (!_initialized)
        return false;
    writeOutput(PIN_HEATER, on, HEATER_ACTIVE_HIGH);
    if (on != _heater_on)
        _logger.logf(true, "ACT: heater %s", on ? "ON" : "OFF");
    _heater_on = on;
    return true;
}

bool RelayActuators::setFans(bool on) {
    if (!_initialized)
        return false;
    writeOutput(PIN_FAN_1, on, FANS_ACTIVE_HIGH);
    writeOutput(PIN_FAN_2, on, FANS_ACTIVE_HIGH);
    if (on != _fans_on)
        _logger.logf(true, "ACT: fans %s", on ? "ON" : "OFF");
    _fans_on = on;
    return true;
}

bool RelayActuators::setLights(bool on) {
    if (!_initialized)
        return false;
    writeOutput(PIN_LIGHTS, on, LIGHTS_ACTIVE_HIGH);
    if (on != _lights_on)
        _logger.logf(true, "ACT: lights %s", on ? "ON" : "OFF");
    _lights_on = on;
    return true;
}
