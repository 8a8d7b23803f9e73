/**
 * @file ActuatorDriver.h
 * @brief Abstract sink for heater, fan and lights commands
 *
 * The Coordinator talks to actuators only through this interface so the
 * relay board can be replaced by a fake in tests. A false return means the
 * command did not reach the hardware; heater and fans are retried on the next
 * tick. Lights are not part of a run and are only switched on request.
 */

#ifndef ACTUATOR_DRIVER_H
#define ACTUATOR_DRIVER_H

class ActuatorDriver {
  public:
    virtual ~ActuatorDriver() = default;

    virtual bool setHeater(bool on) = 0;
    virtual bool setFans(bool on) = 0;
    virtual bool setLights(bool on) = 0;
};

#endif // ACTUATOR_DRIVER_H
