#include "CheckpointStore.h"
#include "Coordinator.h"
#include "Logger.h"
#include <Arduino.h>
#include <unity.h>

static const char *TEST_NS = "coord_test";
static const uint32_t T0 = 1700000000UL;
static const unsigned long MINUTE_MS = 60000UL;
static const unsigned long HOUR_MS = 3600000UL;

Logger logger;
CheckpointStore checkpoints(logger, TEST_NS);

class FakeActuators : public ActuatorDriver {
  public:
    bool heater = false;
    bool fans = false;
    bool lights = false;
    bool fail = false;
    int calls = 0;

    bool setHeater(bool on) override {
        calls++;
        if (fail)
            return false;
        heater = on;
        return true;
    }
    bool setFans(bool on) override {
        calls++;
        if (fail)
            return false;
        fans = on;
        return true;
    }
    bool setLights(bool on) override {
        calls++;
        if (fail)
            return false;
        lights = on;
        return true;
    }
};

class RecordingObserver : public StatusObserver {
  public:
    uint32_t received = 0;
    uint32_t regressions = 0;
    StatusSnapshot last;

    void onStatus(const StatusSnapshot &snapshot) override {
        if (received > 0 && snapshot.sequence_number <= last.sequence_number)
            regressions++;
        received++;
        last = snapshot;
    }
};

static uint32_t g_now;

static void tickAt(Coordinator &coordinator, float temperature,
                   unsigned long tick_ms = 1000) {
    ProbeReading readings[2];
    readings[0] = {temperature, true};
    readings[1] = {temperature, true};
    g_now += tick_ms / 1000UL;
    coordinator.runTick(readings, 2, tick_ms, g_now);
}

static void tickWithoutProbes(Coordinator &coordinator) {
    ProbeReading readings[2];
    readings[0] = {85.0f, false};
    readings[1] = {0.0f, false};
    g_now += 1;
    coordinator.runTick(readings, 2, 1000, g_now);
}

static RunSettings runFor(float setpoint, unsigned long duration_ms) {
    RunSettings settings;
    settings.setpoint = setpoint;
    settings.hysteresis = 2.0f;
    settings.duration_ms = duration_ms;
    settings.cooldown_target = 30.0f;
    settings.cooldown_budget_ms = HOUR_MS;
    return settings;
}

void setUp(void) {
    g_now = T0;
    checkpoints.remove();
}

void tearDown(void) {}

// Test: Commands are judged at once but applied at the next tick, in order
void test_intents_apply_at_next_tick(void) {
    FakeActuators act;
    Coordinator coordinator(logger, act, checkpoints);
    TEST_ASSERT_TRUE(coordinator.begin());

    CommandResult result = coordinator.start(runFor(60.0f, HOUR_MS));
    TEST_ASSERT_EQUAL(CommandStatus::OK, result.status);
    TEST_ASSERT_EQUAL(Phase::IDLE, coordinator.runState().phase);

    tickAt(coordinator, 40.0f);
    TEST_ASSERT_EQUAL(Phase::WARMING_UP, coordinator.runState().phase);

    TEST_ASSERT_EQUAL(CommandStatus::OK, coordinator.setSetpoint(55.0f).status);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 60.0f, coordinator.runState().setpoint);

    tickAt(coordinator, 40.0f);
    RunState state = coordinator.runState();
    TEST_ASSERT_EQUAL(Phase::WARMING_UP, state.phase);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 55.0f, state.setpoint);
    TEST_ASSERT_TRUE(act.heater);
    TEST_ASSERT_TRUE(act.fans);
}

// Test: Rejected commands are counted and leave the run untouched
void test_rejected_command_changes_nothing(void) {
    FakeActuators act;
    Coordinator coordinator(logger, act, checkpoints);
    coordinator.begin();

    CommandResult result = coordinator.pause();
    TEST_ASSERT_EQUAL(CommandStatus::INVALID_TRANSITION, result.status);
    TEST_ASSERT_EQUAL(Phase::IDLE, result.phase);
    TEST_ASSERT_EQUAL_UINT16(1, coordinator.rejectedIntents());

    RunSettings bad = runFor(120.0f, HOUR_MS);
    TEST_ASSERT_EQUAL(CommandStatus::VALIDATION_ERROR,
                      coordinator.start(bad).status);

    tickAt(coordinator, 20.0f);
    TEST_ASSERT_EQUAL(Phase::IDLE, coordinator.runState().phase);
    TEST_ASSERT_FALSE(act.heater);
}

// Test: Two Starts queued within one tick, only the first takes effect
void test_second_start_dropped_at_drain(void) {
    FakeActuators act;
    Coordinator coordinator(logger, act, checkpoints);
    coordinator.begin();

    TEST_ASSERT_EQUAL(CommandStatus::OK,
                      coordinator.start(runFor(50.0f, HOUR_MS)).status);
    TEST_ASSERT_EQUAL(CommandStatus::OK,
                      coordinator.start(runFor(70.0f, HOUR_MS)).status);

    tickAt(coordinator, 20.0f);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 50.0f, coordinator.runState().setpoint);
    TEST_ASSERT_EQUAL_UINT16(1, coordinator.rejectedIntents());
}

// Test: Preheat, half an hour of holding, then Emergency Stop
void test_run_then_emergency_stop(void) {
    FakeActuators act;
    Coordinator coordinator(logger, act, checkpoints);
    coordinator.begin();

    coordinator.start(runFor(60.0f, HOUR_MS));
    tickAt(coordinator, 20.0f);
    TEST_ASSERT_EQUAL(Phase::WARMING_UP, coordinator.runState().phase);
    TEST_ASSERT_FALSE(checkpoints.exists());

    tickAt(coordinator, 59.0f);
    TEST_ASSERT_EQUAL(Phase::HEATING, coordinator.runState().phase);
    TEST_ASSERT_TRUE(checkpoints.exists());

    for (int i = 0; i < 30; i++) {
        tickAt(coordinator, 60.0f, MINUTE_MS);
    }
    RunState state = coordinator.runState();
    TEST_ASSERT_TRUE(isRunningPhase(state.phase));
    TEST_ASSERT_EQUAL_UINT32(1800000UL, state.active_elapsed_ms);

    TEST_ASSERT_TRUE(coordinator.requestEmergencyStop("test"));
    TEST_ASSERT_EQUAL(Phase::IDLE, coordinator.runState().phase);
    TEST_ASSERT_FALSE(checkpoints.exists());
    TEST_ASSERT_FALSE(act.heater);
    TEST_ASSERT_FALSE(act.fans);
    TEST_ASSERT_FALSE(coordinator.latestStatus().actuators.heater);
}

// Test: Emergency Stop flushes queued intents and converges
void test_emergency_stop_converges(void) {
    FakeActuators act;
    Coordinator coordinator(logger, act, checkpoints);
    coordinator.begin();

    coordinator.start(runFor(60.0f, HOUR_MS));
    tickAt(coordinator, 20.0f);
    coordinator.setSetpoint(70.0f);

    TEST_ASSERT_TRUE(coordinator.requestEmergencyStop("first"));
    TEST_ASSERT_FALSE(coordinator.requestEmergencyStop("second"));
    TEST_ASSERT_EQUAL(CommandStatus::OK, coordinator.emergencyStop().status);

    tickAt(coordinator, 20.0f);
    RunState state = coordinator.runState();
    TEST_ASSERT_EQUAL(Phase::IDLE, state.phase);
    TEST_ASSERT_EQUAL_UINT16(0, coordinator.rejectedIntents());
    TEST_ASSERT_FALSE(act.heater);
}

// Test: A failing actuator is flagged and retried every tick
void test_actuator_failure_flagged(void) {
    FakeActuators act;
    Coordinator coordinator(logger, act, checkpoints);
    coordinator.begin();

    coordinator.start(runFor(60.0f, HOUR_MS));
    act.fail = true;
    tickAt(coordinator, 30.0f);
    TEST_ASSERT_TRUE(coordinator.latestStatus().actuator_fault);
    TEST_ASSERT_EQUAL_UINT16(1, coordinator.actuatorFailures());
    TEST_ASSERT_TRUE(coordinator.runState().hardware_intent.heater);

    int calls = act.calls;
    tickAt(coordinator, 30.0f);
    TEST_ASSERT_GREATER_THAN(calls, act.calls);
    TEST_ASSERT_EQUAL_UINT16(2, coordinator.actuatorFailures());

    act.fail = false;
    tickAt(coordinator, 30.0f);
    TEST_ASSERT_FALSE(coordinator.latestStatus().actuator_fault);
    TEST_ASSERT_TRUE(act.heater);
}

// Test: No healthy probe forces outputs off even with overrides
void test_sensor_unavailable_forces_off(void) {
    FakeActuators act;
    Coordinator coordinator(logger, act, checkpoints);
    coordinator.begin();

    coordinator.start(runFor(60.0f, HOUR_MS));
    tickAt(coordinator, 59.5f);
    coordinator.setManualOverride(Actuator::HEATER, true);
    tickAt(coordinator, 60.0f);
    TEST_ASSERT_TRUE(act.heater);

    Phase held = coordinator.runState().phase;
    tickWithoutProbes(coordinator);
    StatusSnapshot status = coordinator.latestStatus();
    TEST_ASSERT_TRUE(status.sensor_unavailable);
    TEST_ASSERT_FALSE(act.heater);
    TEST_ASSERT_FALSE(act.fans);
    TEST_ASSERT_EQUAL(held, coordinator.runState().phase);

    tickAt(coordinator, 60.0f);
    TEST_ASSERT_FALSE(coordinator.latestStatus().sensor_unavailable);
    TEST_ASSERT_TRUE(act.heater);
}

// Test: A latched alarm blocks Start until released
void test_alarm_blocks_start(void) {
    FakeActuators act;
    Coordinator coordinator(logger, act, checkpoints);
    coordinator.begin();

    coordinator.setAlarmLatched(true);
    TEST_ASSERT_TRUE(coordinator.isAlarmLatched());
    CommandResult result = coordinator.start(runFor(60.0f, HOUR_MS));
    TEST_ASSERT_EQUAL(CommandStatus::INVALID_TRANSITION, result.status);
    TEST_ASSERT_TRUE(coordinator.latestStatus().alarm_latched);

    coordinator.setAlarmLatched(false);
    TEST_ASSERT_EQUAL(CommandStatus::OK,
                      coordinator.start(runFor(60.0f, HOUR_MS)).status);
}

// Test: Job start uses the material profile, repeats are debounced
void test_job_start_auto_run(void) {
    FakeActuators act;
    Coordinator coordinator(logger, act, checkpoints);
    coordinator.begin();
    coordinator.setRunDefaults(runFor(45.0f, 2 * HOUR_MS), true);

    CommandResult result = coordinator.onJobStarted("asa", 90 * MINUTE_MS);
    TEST_ASSERT_EQUAL(CommandStatus::OK, result.status);
    TEST_ASSERT_EQUAL(CommandStatus::INVALID_TRANSITION,
                      coordinator.onJobStarted("asa", 0).status);

    tickAt(coordinator, 30.0f);
    RunState state = coordinator.runState();
    TEST_ASSERT_EQUAL(Phase::WARMING_UP, state.phase);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 65.0f, state.setpoint);
    TEST_ASSERT_EQUAL_UINT32(90 * MINUTE_MS, state.duration_target_ms);
    TEST_ASSERT_TRUE(state.follow_job);

    TEST_ASSERT_EQUAL(CommandStatus::OK, coordinator.onJobFailed().status);
    tickAt(coordinator, 30.0f);
    TEST_ASSERT_EQUAL(Phase::IDLE, coordinator.runState().phase);
}

// Test: Job start is refused for unknown or unheated materials
void test_job_start_refusals(void) {
    FakeActuators act;

    Coordinator unknown(logger, act, checkpoints);
    unknown.begin();
    unknown.setRunDefaults(runFor(45.0f, HOUR_MS), true);
    TEST_ASSERT_EQUAL(CommandStatus::VALIDATION_ERROR,
                      unknown.onJobStarted("unobtainium", 0).status);

    Coordinator pla(logger, act, checkpoints);
    pla.begin();
    pla.setRunDefaults(runFor(45.0f, HOUR_MS), true);
    TEST_ASSERT_EQUAL(CommandStatus::INVALID_TRANSITION,
                      pla.onJobStarted("PLA", 0).status);

    Coordinator manual(logger, act, checkpoints);
    manual.begin();
    manual.setRunDefaults(runFor(45.0f, HOUR_MS), false);
    TEST_ASSERT_EQUAL(CommandStatus::INVALID_TRANSITION,
                      manual.onJobStarted(nullptr, 0).status);

    tickAt(manual, 20.0f);
    TEST_ASSERT_EQUAL(Phase::IDLE, manual.runState().phase);
}

// Test: Observers see strictly increasing sequence numbers
void test_observer_sequence(void) {
    FakeActuators act;
    RecordingObserver observer;
    Coordinator coordinator(logger, act, checkpoints);
    coordinator.begin();
    TEST_ASSERT_TRUE(coordinator.addObserver(&observer));

    coordinator.start(runFor(60.0f, HOUR_MS));
    for (int i = 0; i < 5; i++) {
        tickAt(coordinator, 40.0f);
    }
    coordinator.pause(); // rejected, still published

    TEST_ASSERT_EQUAL_UINT32(7, observer.received);
    TEST_ASSERT_EQUAL_UINT32(0, observer.regressions);
    TEST_ASSERT_EQUAL_UINT32(coordinator.latestStatus().sequence_number,
                             observer.last.sequence_number);
}

// Test: Normal stop removes the checkpoint at the next tick
void test_stop_removes_checkpoint(void) {
    FakeActuators act;
    Coordinator coordinator(logger, act, checkpoints);
    coordinator.begin();

    coordinator.start(runFor(60.0f, HOUR_MS));
    tickAt(coordinator, 60.0f);
    tickAt(coordinator, 60.0f);
    TEST_ASSERT_TRUE(checkpoints.exists());

    TEST_ASSERT_EQUAL(CommandStatus::OK, coordinator.stop().status);
    tickAt(coordinator, 60.0f);
    TEST_ASSERT_EQUAL(Phase::IDLE, coordinator.runState().phase);
    TEST_ASSERT_FALSE(checkpoints.exists());
}

static RunState interruptedRun() {
    RunState saved;
    saved.phase = Phase::MAINTAINING;
    saved.setpoint = 60.0f;
    saved.hysteresis = 2.0f;
    saved.duration_target_ms = HOUR_MS;
    saved.active_elapsed_ms = 1000000UL;
    saved.fans_enabled = true;
    saved.hardware_intent.heater = true;
    saved.hardware_intent.fans = true;
    return saved;
}

// Test: Boot checkpoint is held until confirmed, then re-issues its outputs
void test_resume_from_checkpoint(void) {
    TEST_ASSERT_TRUE(checkpoints.save(interruptedRun(), T0));

    FakeActuators act;
    Coordinator coordinator(logger, act, checkpoints);
    coordinator.begin();
    g_now = T0 + 300;
    TEST_ASSERT_EQUAL(CheckpointLoadResult::RESUMABLE,
                      coordinator.resumeFromCheckpoint(g_now));

    TEST_ASSERT_EQUAL(Phase::IDLE, coordinator.runState().phase);
    TEST_ASSERT_TRUE(coordinator.latestStatus().resume_pending);
    TEST_ASSERT_FALSE(act.heater);

    // Idle ticks while waiting keep the record
    tickAt(coordinator, 58.0f);
    TEST_ASSERT_TRUE(checkpoints.exists());
    TEST_ASSERT_FALSE(act.heater);

    CommandResult result = coordinator.confirmResume(g_now);
    TEST_ASSERT_EQUAL(CommandStatus::OK, result.status);
    TEST_ASSERT_EQUAL(Phase::MAINTAINING, result.phase);

    RunState state = coordinator.runState();
    TEST_ASSERT_EQUAL(Phase::MAINTAINING, state.phase);
    TEST_ASSERT_EQUAL_UINT32(1000000UL, state.active_elapsed_ms);
    TEST_ASSERT_TRUE(act.heater);
    TEST_ASSERT_TRUE(act.fans);
    TEST_ASSERT_FALSE(coordinator.latestStatus().resume_pending);

    TEST_ASSERT_EQUAL(CommandStatus::INVALID_TRANSITION,
                      coordinator.confirmResume(g_now).status);
}

// Test: Aborting the pending run erases its checkpoint and stays idle
void test_abort_resume_removes_checkpoint(void) {
    TEST_ASSERT_TRUE(checkpoints.save(interruptedRun(), T0));

    FakeActuators act;
    Coordinator coordinator(logger, act, checkpoints);
    coordinator.begin();
    TEST_ASSERT_EQUAL(CommandStatus::INVALID_TRANSITION,
                      coordinator.abortResume().status);
    coordinator.resumeFromCheckpoint(T0 + 60);

    TEST_ASSERT_EQUAL(CommandStatus::OK, coordinator.abortResume().status);
    TEST_ASSERT_FALSE(checkpoints.exists());
    TEST_ASSERT_FALSE(coordinator.latestStatus().resume_pending);

    tickAt(coordinator, 40.0f);
    TEST_ASSERT_EQUAL(Phase::IDLE, coordinator.runState().phase);
    TEST_ASSERT_FALSE(act.heater);
    TEST_ASSERT_EQUAL(CommandStatus::INVALID_TRANSITION,
                      coordinator.confirmResume(T0 + 61).status);
}

// Test: A pending run is refused once it has aged past its remaining time
void test_confirm_resume_when_stale(void) {
    TEST_ASSERT_TRUE(checkpoints.save(interruptedRun(), T0));

    FakeActuators act;
    Coordinator coordinator(logger, act, checkpoints);
    coordinator.begin();
    TEST_ASSERT_EQUAL(CheckpointLoadResult::RESUMABLE,
                      coordinator.resumeFromCheckpoint(T0 + 60));

    // 2600 s left plus the grace period
    CommandResult result = coordinator.confirmResume(T0 + 3000);
    TEST_ASSERT_EQUAL(CommandStatus::VALIDATION_ERROR, result.status);
    TEST_ASSERT_EQUAL_STRING("checkpoint went stale", result.reason);
    TEST_ASSERT_FALSE(checkpoints.exists());
    TEST_ASSERT_EQUAL(Phase::IDLE, coordinator.runState().phase);
    TEST_ASSERT_FALSE(act.heater);
}

// Test: Confirm is refused while the safety alarm is latched
void test_confirm_resume_blocked_by_alarm(void) {
    TEST_ASSERT_TRUE(checkpoints.save(interruptedRun(), T0));

    FakeActuators act;
    Coordinator coordinator(logger, act, checkpoints);
    coordinator.begin();
    coordinator.resumeFromCheckpoint(T0 + 60);
    coordinator.setAlarmLatched(true);

    TEST_ASSERT_EQUAL(CommandStatus::INVALID_TRANSITION,
                      coordinator.confirmResume(T0 + 60).status);
    TEST_ASSERT_EQUAL(Phase::IDLE, coordinator.runState().phase);
    TEST_ASSERT_TRUE(coordinator.latestStatus().resume_pending);
}

// Test: A new Start replaces the pending run
void test_start_drops_pending_resume(void) {
    TEST_ASSERT_TRUE(checkpoints.save(interruptedRun(), T0));

    FakeActuators act;
    Coordinator coordinator(logger, act, checkpoints);
    coordinator.begin();
    g_now = T0 + 60;
    coordinator.resumeFromCheckpoint(g_now);

    TEST_ASSERT_EQUAL(CommandStatus::OK,
                      coordinator.start(runFor(50.0f, 2 * HOUR_MS)).status);
    TEST_ASSERT_FALSE(coordinator.latestStatus().resume_pending);
    TEST_ASSERT_EQUAL(CommandStatus::INVALID_TRANSITION,
                      coordinator.confirmResume(g_now).status);

    tickAt(coordinator, 30.0f);
    RunState state = coordinator.runState();
    TEST_ASSERT_EQUAL(Phase::WARMING_UP, state.phase);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 50.0f, state.setpoint);
    TEST_ASSERT_EQUAL_UINT32(0, state.active_elapsed_ms);
}

// Test: Emergency stop drops the pending run and its checkpoint
void test_estop_drops_pending_resume(void) {
    TEST_ASSERT_TRUE(checkpoints.save(interruptedRun(), T0));

    FakeActuators act;
    Coordinator coordinator(logger, act, checkpoints);
    coordinator.begin();
    g_now = T0 + 60;
    coordinator.resumeFromCheckpoint(g_now);

    coordinator.emergencyStop();
    TEST_ASSERT_FALSE(coordinator.latestStatus().resume_pending);
    tickAt(coordinator, 30.0f);
    TEST_ASSERT_FALSE(checkpoints.exists());
    TEST_ASSERT_EQUAL(CommandStatus::INVALID_TRANSITION,
                      coordinator.confirmResume(g_now).status);
}

// Test: Lights follow the command and a dead relay is reported
void test_lights_command(void) {
    FakeActuators act;
    Coordinator coordinator(logger, act, checkpoints);
    coordinator.begin();

    CommandResult result = coordinator.setLights(true);
    TEST_ASSERT_EQUAL(CommandStatus::OK, result.status);
    TEST_ASSERT_EQUAL_STRING("lights on", result.reason);
    TEST_ASSERT_TRUE(act.lights);
    TEST_ASSERT_TRUE(coordinator.latestStatus().lights_on);

    act.fail = true;
    result = coordinator.setLights(false);
    TEST_ASSERT_EQUAL(CommandStatus::ACTUATOR_FAULT, result.status);
    TEST_ASSERT_TRUE(act.lights);
    TEST_ASSERT_TRUE(coordinator.latestStatus().lights_on);
    TEST_ASSERT_EQUAL_UINT16(1, coordinator.actuatorFailures());

    act.fail = false;
    TEST_ASSERT_EQUAL(CommandStatus::OK, coordinator.setLights(false).status);
    TEST_ASSERT_FALSE(act.lights);
    TEST_ASSERT_FALSE(coordinator.latestStatus().lights_on);
}

// Test: Warm-up publishes an ETA once enough samples have been recorded
void test_warmup_eta_in_snapshot(void) {
    FakeActuators act;
    Coordinator coordinator(logger, act, checkpoints);
    coordinator.begin();
    coordinator.start(runFor(60.0f, HOUR_MS));

    float temperature = 30.0f;
    for (int i = 0; i < 20; i++) {
        tickAt(coordinator, temperature);
        temperature += 0.02f;
    }
    // Four samples so far, too few to extrapolate
    TEST_ASSERT_EQUAL(Phase::WARMING_UP, coordinator.runState().phase);
    TEST_ASSERT_EQUAL_UINT32(0, coordinator.latestStatus().eta_s);

    for (int i = 0; i < 60; i++) {
        tickAt(coordinator, temperature);
        temperature += 0.02f;
    }
    // 0.02 C/s with about 28.4 C left
    uint32_t eta = coordinator.latestStatus().eta_s;
    TEST_ASSERT_UINT32_WITHIN(60, 1420, eta);

    TemperatureSample samples[20];
    size_t count = coordinator.copyHistory(samples, 20);
    TEST_ASSERT_EQUAL_UINT32(16, count);
    TEST_ASSERT_TRUE(samples[0].timestamp_ms < samples[count - 1].timestamp_ms);
    TEST_ASSERT_TRUE(samples[0].temperature < samples[count - 1].temperature);

    coordinator.stop();
    tickAt(coordinator, temperature);
    tickAt(coordinator, temperature);
    TEST_ASSERT_EQUAL(Phase::IDLE, coordinator.runState().phase);
    TEST_ASSERT_EQUAL_UINT32(0, coordinator.copyHistory(samples, 4));
    TEST_ASSERT_EQUAL_UINT32(0, coordinator.latestStatus().eta_s);
}

// Test: Job start uses the edited material table
void test_job_start_uses_edited_materials(void) {
    MaterialTable table;
    table.loadDefaults();
    TEST_ASSERT_NULL(table.set("asa", 70.0f, false));
    TEST_ASSERT_NULL(table.set("cf", 55.0f, true));

    FakeActuators act;
    Coordinator coordinator(logger, act, checkpoints);
    coordinator.begin();
    coordinator.setRunDefaults(runFor(45.0f, 2 * HOUR_MS), true);
    coordinator.setMaterials(table);

    TEST_ASSERT_EQUAL(CommandStatus::OK,
                      coordinator.onJobStarted("ASA", 0).status);
    tickAt(coordinator, 30.0f);
    RunState state = coordinator.runState();
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 70.0f, state.setpoint);
    TEST_ASSERT_FALSE(state.fans_enabled);

    Coordinator custom(logger, act, checkpoints);
    custom.begin();
    custom.setRunDefaults(runFor(45.0f, 2 * HOUR_MS), true);
    custom.setMaterials(table);
    TEST_ASSERT_EQUAL(CommandStatus::OK, custom.onJobStarted("Cf", 0).status);
    tickAt(custom, 30.0f);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 55.0f, custom.runState().setpoint);
}

void setup() {
    delay(2000); // Wait for serial monitor

    UNITY_BEGIN();

    RUN_TEST(test_intents_apply_at_next_tick);
    RUN_TEST(test_rejected_command_changes_nothing);
    RUN_TEST(test_second_start_dropped_at_drain);
    RUN_TEST(test_run_then_emergency_stop);
    RUN_TEST(test_emergency_stop_converges);
    RUN_TEST(test_actuator_failure_flagged);
    RUN_TEST(test_sensor_unavailable_forces_off);
    RUN_TEST(test_alarm_blocks_start);
    RUN_TEST(test_job_start_auto_run);
    RUN_TEST(test_job_start_refusals);
    RUN_TEST(test_observer_sequence);
    RUN_TEST(test_stop_removes_checkpoint);
    RUN_TEST(test_resume_from_checkpoint);
    RUN_TEST(test_abort_resume_removes_checkpoint);
    RUN_TEST(test_confirm_resume_when_stale);
    RUN_TEST(test_confirm_resume_blocked_by_alarm);
    RUN_TEST(test_start_drops_pending_resume);
    RUN_TEST(test_estop_drops_pending_resume);
    RUN_TEST(test_lights_command);
    RUN_TEST(test_warmup_eta_in_snapshot);
    RUN_TEST(test_job_start_uses_edited_materials);

    checkpoints.remove();
    UNITY_END();
}

void loop() {
    // Nothing to do here
}
