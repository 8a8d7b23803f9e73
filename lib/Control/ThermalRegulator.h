/**
 * @file ThermalRegulator.h
 * @brief Bang-bang heater policy with a hysteresis deadband
 *
 * Stateless: every decision is computed from its inputs, the previous heater
 * intent included. The caller owns whatever history it needs.
 *
 * POLICY:
 * -------
 * - heater ON  when temperature < setpoint - h
 * - heater OFF when temperature > setpoint + h
 * - otherwise the previous intent is kept (deadband)
 *
 * Manual overrides replace the computed value for their actuator. With no
 * healthy probe the regulator reports SENSOR_UNAVAILABLE and every actuator
 * is forced off regardless of overrides.
 */

#ifndef THERMAL_REGULATOR_H
#define THERMAL_REGULATOR_H

#include "EnclosureTypes.h"

enum class RegulatorStatus : uint8_t { OK, SENSOR_UNAVAILABLE };

struct RegulatorDecision {
    RegulatorStatus status;
    ActuatorIntent intent;
};

namespace ThermalRegulator {

/**
 * @brief Average the healthy probes of one acquisition cycle
 */
ProbeSummary summarizeProbes(const ProbeReading *readings, size_t count);

/**
 * @brief Heater intent for one temperature sample
 */
bool heaterIntent(float temperature, float setpoint, float hysteresis,
                  bool previous);

/**
 * @brief Apply a manual override to a computed intent
 */
bool applyOverride(ManualOverride mode, bool computed);

/**
 * @brief Full actuator decision for the current run
 *
 * @param state Current run; IDLE always yields all-off
 * @param probes Summary of the latest acquisition
 * @param setpoint Effective setpoint (cooling ramp value in COOLING)
 */
RegulatorDecision decide(const RunState &state, const ProbeSummary &probes,
                         float setpoint);

} // namespace ThermalRegulator

#endif // THERMAL_REGULATOR_H
