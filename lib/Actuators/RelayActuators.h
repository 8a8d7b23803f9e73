/**
 * @file RelayActuators.h
 * @brief GPIO driver for the heater SSR, the two fan relays and the lights
 *
 * All outputs are driven to their OFF level in begin(), before any task
 * starts, so a reset never leaves the heater energized.
 */

#ifndef RELAY_ACTUATORS_H
#define RELAY_ACTUATORS_H

#include "ActuatorDriver.h"
#include "Logger.h"

class RelayActuators : public ActuatorDriver {
  public:
    explicit RelayActuators(Logger &logger);

    void begin();

    bool setHeater(bool on) override;
    bool setFans(bool on) override;
    bool setLights(bool on) override;

    bool isHeaterOn() const { return _heater_on; }
    bool areFansOn() const { return _fans_on; }
    bool areLightsOn() const { return _lights_on; }

  private:
    Logger &_logger;
    bool _initialized;
    bool _heater_on;
    bool _fans_on;
    bool _lights_on;

    static void writeOutput(int pin, bool on, bool active_high);
};

#endif // RELAY_ACTUATORS_H
