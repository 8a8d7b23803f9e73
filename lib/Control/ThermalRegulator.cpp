/**
 * @file ThermalRegulator.cpp
 * @brief Implementation of the hysteresis heater policy
 */

#include "ThermalRegulator.h"
#include <cmath>

namespace ThermalRegulator {

ProbeSummary summarizeProbes(const ProbeReading *readings, size_t count) {
    ProbeSummary summary;
    summary.total = static_cast<uint8_t>(count > 255 ? 255 : count);

    float sum = 0.0f;
    for (size_t i = 0; i < count; i++) {
        if (!readings[i].valid || std::isnan(readings[i].temperature))
            continue;
        sum += readings[i].temperature;
        summary.healthy++;
    }

    if (summary.healthy > 0) {
        summary.available = true;
        summary.temperature = sum / summary.healthy;
    }
    return summary;
}

bool heaterIntent(float temperature, float setpoint, float hysteresis,
                  bool previous) {
    if (temperature < setpoint - hysteresis)
        return true;
    if (temperature > setpoint + hysteresis)
        return false;
    return previous;
}

bool applyOverride(ManualOverride mode, bool computed) {
    switch (mode) {
    case ManualOverride::FORCE_ON:
        return true;
    case ManualOverride::FORCE_OFF:
        return false;
    case ManualOverride::AUTO:
    default:
        return computed;
    }
}

RegulatorDecision decide(const RunState &state, const ProbeSummary &probes,
                         float setpoint) {
    RegulatorDecision decision{RegulatorStatus::OK, ActuatorIntent{}};

    if (!probes.available) {
        decision.status = RegulatorStatus::SENSOR_UNAVAILABLE;
        return decision;
    }

    if (state.phase == Phase::IDLE)
        return decision;

    // The cooldown ramp only paces the descent; it never calls for heat
    bool heater = state.phase != Phase::COOLING &&
                  heaterIntent(probes.temperature, setpoint, state.hysteresis,
                               state.hardware_intent.heater);
    decision.intent.heater = applyOverride(state.heater_override, heater);
    decision.intent.fans =
        applyOverride(state.fan_override, state.fans_enabled);
    return decision;
}

} // namespace ThermalRegulator
