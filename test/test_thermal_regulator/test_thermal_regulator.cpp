#include "ThermalRegulator.h"
#include <Arduino.h>
#include <cmath>
#include <unity.h>

void setUp(void) {}

void tearDown(void) {}

static RunState runningState() {
    RunState state;
    state.phase = Phase::HEATING;
    state.setpoint = 60.0f;
    state.hysteresis = 2.0f;
    state.fans_enabled = true;
    return state;
}

static ProbeSummary probesAt(float temperature) {
    ProbeSummary probes;
    probes.available = true;
    probes.temperature = temperature;
    probes.healthy = 1;
    probes.total = 1;
    return probes;
}

// Test: Heater switches on below the lower band edge
void test_heater_on_below_band(void) {
    TEST_ASSERT_TRUE(ThermalRegulator::heaterIntent(57.9f, 60.0f, 2.0f, false));
}

// Test: Heater switches off above the upper band edge
void test_heater_off_above_band(void) {
    TEST_ASSERT_FALSE(ThermalRegulator::heaterIntent(62.1f, 60.0f, 2.0f, true));
}

// Test: Inside the band the previous command is held
void test_band_holds_previous(void) {
    TEST_ASSERT_TRUE(ThermalRegulator::heaterIntent(61.0f, 60.0f, 2.0f, true));
    TEST_ASSERT_FALSE(ThermalRegulator::heaterIntent(59.0f, 60.0f, 2.0f, false));

    // Band edges are inclusive
    TEST_ASSERT_TRUE(ThermalRegulator::heaterIntent(62.0f, 60.0f, 2.0f, true));
    TEST_ASSERT_FALSE(ThermalRegulator::heaterIntent(58.0f, 60.0f, 2.0f, false));
}

// Test: Hysteresis loop over a slow temperature sweep
void test_hysteresis_sweep(void) {
    bool heater = false;
    const float up[] = {55.0f, 58.5f, 60.0f, 61.9f, 62.5f};
    const bool up_expected[] = {true, true, true, true, false};
    for (size_t i = 0; i < 5; i++) {
        heater = ThermalRegulator::heaterIntent(up[i], 60.0f, 2.0f, heater);
        TEST_ASSERT_EQUAL(up_expected[i], heater);
    }

    const float down[] = {61.0f, 59.0f, 58.1f, 57.5f};
    const bool down_expected[] = {false, false, false, true};
    for (size_t i = 0; i < 4; i++) {
        heater = ThermalRegulator::heaterIntent(down[i], 60.0f, 2.0f, heater);
        TEST_ASSERT_EQUAL(down_expected[i], heater);
    }
}

// Test: Overrides take precedence over the computed value
void test_overrides(void) {
    TEST_ASSERT_TRUE(
        ThermalRegulator::applyOverride(ManualOverride::FORCE_ON, false));
    TEST_ASSERT_FALSE(
        ThermalRegulator::applyOverride(ManualOverride::FORCE_OFF, true));
    TEST_ASSERT_TRUE(ThermalRegulator::applyOverride(ManualOverride::AUTO, true));
}

// Test: Average only counts valid readings
void test_summarize_skips_invalid(void) {
    ProbeReading readings[4];
    readings[0] = {50.0f, true};
    readings[1] = {NAN, true};
    readings[2] = {90.0f, false};
    readings[3] = {54.0f, true};

    ProbeSummary summary = ThermalRegulator::summarizeProbes(readings, 4);
    TEST_ASSERT_TRUE(summary.available);
    TEST_ASSERT_EQUAL_UINT8(2, summary.healthy);
    TEST_ASSERT_EQUAL_UINT8(4, summary.total);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 52.0f, summary.temperature);
}

// Test: No valid reading means no temperature
void test_summarize_none_valid(void) {
    ProbeReading readings[2];
    readings[0] = {50.0f, false};
    readings[1] = {51.0f, false};

    ProbeSummary summary = ThermalRegulator::summarizeProbes(readings, 2);
    TEST_ASSERT_FALSE(summary.available);
    TEST_ASSERT_EQUAL_UINT8(0, summary.healthy);

    summary = ThermalRegulator::summarizeProbes(nullptr, 0);
    TEST_ASSERT_FALSE(summary.available);
}

// Test: Missing probes force everything off, overrides included
void test_sensor_unavailable_forces_off(void) {
    RunState state = runningState();
    state.heater_override = ManualOverride::FORCE_ON;
    state.fan_override = ManualOverride::FORCE_ON;
    state.hardware_intent.heater = true;

    ProbeSummary none;
    RegulatorDecision decision = ThermalRegulator::decide(state, none, 60.0f);
    TEST_ASSERT_EQUAL(RegulatorStatus::SENSOR_UNAVAILABLE, decision.status);
    TEST_ASSERT_FALSE(decision.intent.heater);
    TEST_ASSERT_FALSE(decision.intent.fans);
}

// Test: IDLE drives nothing even with overrides recorded
void test_idle_all_off(void) {
    RunState state;
    state.fans_enabled = true;
    state.heater_override = ManualOverride::FORCE_ON;

    RegulatorDecision decision =
        ThermalRegulator::decide(state, probesAt(20.0f), 60.0f);
    TEST_ASSERT_EQUAL(RegulatorStatus::OK, decision.status);
    TEST_ASSERT_FALSE(decision.intent.heater);
    TEST_ASSERT_FALSE(decision.intent.fans);
}

// Test: Running state uses previous hardware intent inside the band
void test_decide_uses_hardware_intent(void) {
    RunState state = runningState();
    state.hardware_intent.heater = true;

    RegulatorDecision decision =
        ThermalRegulator::decide(state, probesAt(61.0f), 60.0f);
    TEST_ASSERT_TRUE(decision.intent.heater);
    TEST_ASSERT_TRUE(decision.intent.fans);

    state.hardware_intent.heater = false;
    decision = ThermalRegulator::decide(state, probesAt(61.0f), 60.0f);
    TEST_ASSERT_FALSE(decision.intent.heater);
}

// Test: Fans follow the run setting unless overridden
void test_decide_fans(void) {
    RunState state = runningState();
    state.fans_enabled = false;
    RegulatorDecision decision =
        ThermalRegulator::decide(state, probesAt(50.0f), 60.0f);
    TEST_ASSERT_TRUE(decision.intent.heater);
    TEST_ASSERT_FALSE(decision.intent.fans);

    state.fan_override = ManualOverride::FORCE_ON;
    decision = ThermalRegulator::decide(state, probesAt(50.0f), 60.0f);
    TEST_ASSERT_TRUE(decision.intent.fans);
}

// Test: Cooling keeps the heater off below the ramp unless forced on
void test_cooling_heater_stays_off(void) {
    RunState state = runningState();
    state.phase = Phase::COOLING;
    state.fans_enabled = true;

    RegulatorDecision decision =
        ThermalRegulator::decide(state, probesAt(45.0f), 50.0f);
    TEST_ASSERT_FALSE(decision.intent.heater);
    TEST_ASSERT_TRUE(decision.intent.fans);

    state.hardware_intent.heater = true;
    decision = ThermalRegulator::decide(state, probesAt(30.0f), 55.0f);
    TEST_ASSERT_FALSE(decision.intent.heater);

    state.heater_override = ManualOverride::FORCE_ON;
    decision = ThermalRegulator::decide(state, probesAt(45.0f), 40.0f);
    TEST_ASSERT_TRUE(decision.intent.heater);
}

void setup() {
    delay(2000); // Wait for serial monitor

    UNITY_BEGIN();

    RUN_TEST(test_heater_on_below_band);
    RUN_TEST(test_heater_off_above_band);
    RUN_TEST(test_band_holds_previous);
    RUN_TEST(test_hysteresis_sweep);
    RUN_TEST(test_overrides);
    RUN_TEST(test_summarize_skips_invalid);
    RUN_TEST(test_summarize_none_valid);
    RUN_TEST(test_sensor_unavailable_forces_off);
    RUN_TEST(test_idle_all_off);
    RUN_TEST(test_decide_uses_hardware_intent);
    RUN_TEST(test_decide_fans);
    RUN_TEST(test_cooling_heater_stays_off);

    UNITY_END();
}

void loop() {
    // Nothing to do here
}
