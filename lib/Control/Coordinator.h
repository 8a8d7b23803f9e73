/**
 * @file Coordinator.h
 * @brief Single lock domain around the run, intent queue and control tick
 *
 * Every read or write of RunState goes through this class. Three kinds of
 * callers share it:
 * - the control task, which calls runTick() once per second
 * - the safety monitor task, which may call requestEmergencyStop()
 * - command handlers (serial console, job events) on their own tasks
 *
 * COMMAND FLOW:
 * -------------
 * 1. A command is judged against the current phase under the lock. Invalid
 *    commands are rejected right away with INVALID_TRANSITION or
 *    VALIDATION_ERROR and change nothing.
 * 2. Accepted commands are queued as Intents (FreeRTOS queue, by copy).
 * 3. runTick() drains the queue in arrival order before the phase machine
 *    ticks. An intent that became invalid in between (e.g. two Starts
 *    queued in one second) is dropped and logged.
 *
 * Emergency Stop bypasses the queue: it is applied at the lock acquisition
 * that requests it, flushes pending intents, forces actuators off and
 * removes the checkpoint. Repeated or concurrent requests converge on the
 * same IDLE state.
 *
 * Status snapshots are numbered and built under the lock, then delivered to
 * observers after it is released.
 *
 * CRASH RECOVERY:
 * ---------------
 * A resumable checkpoint found at boot is held as a pending resume; nothing
 * is energized until confirmResume() re-enters the run or abortResume()
 * erases the record. An accepted Start or an Emergency Stop drops it too.
 */

#ifndef COORDINATOR_H
#define COORDINATOR_H

#include "ActuatorDriver.h"
#include "CheckpointStore.h"
#include "EventCounter.h"
#include "EnclosureTypes.h"
#include "Logger.h"
#include "MaterialProfiles.h"
#include "PhaseStateMachine.h"
#include "ProbeSource.h"
#include "StatusObserver.h"
#include "StatusSequencer.h"
#include "TemperatureHistory.h"
#include "config.h"
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <freertos/semphr.h>
#include <freertos/task.h>

class Coordinator {
  public:
    Coordinator(Logger &logger, ActuatorDriver &actuators,
                CheckpointStore &checkpoints);

    /**
     * @brief Create the mutex and intent queue
     * @return false if FreeRTOS could not allocate them
     */
    bool begin();

    /**
     * @brief Register an observer (call before tasks start)
     */
    bool addObserver(StatusObserver *observer);

    /**
     * @brief Settings used for job auto-start
     */
    void setRunDefaults(const RunSettings &defaults, bool auto_start_enabled);

    /**
     * @brief Material table used by job auto-start
     */
    void setMaterials(const MaterialTable &materials);

    /**
     * @brief Load the boot checkpoint and hold it as a pending resume
     */
    CheckpointLoadResult resumeFromCheckpoint(uint32_t now_epoch);

    /**
     * @brief Re-enter the pending run if it is still fresh enough
     *
     * Re-issues the checkpointed actuator intents immediately.
     */
    CommandResult confirmResume(uint32_t now_epoch);

    /**
     * @brief Drop the pending run and erase its checkpoint
     */
    CommandResult abortResume();

    // =========================================================================
    // Commands (any task)
    // =========================================================================
    CommandResult start(const RunSettings &settings);
    CommandResult pause();
    CommandResult resume();
    CommandResult confirmPreheat();
    CommandResult stop();
    CommandResult setSetpoint(float value);
    CommandResult adjustDuration(long delta_ms);
    CommandResult setManualOverride(Actuator actuator, bool on);
    CommandResult clearManualOverride(Actuator actuator);
    CommandResult emergencyStop();
    CommandResult setLights(bool on);

    /**
     * @brief Immediate Emergency Stop (user or safety monitor)
     * @return true if this request changed the state
     */
    bool requestEmergencyStop(const char *reason);

    // =========================================================================
    // Print job events
    // =========================================================================
    CommandResult onJobStarted(const char *material, unsigned long duration_ms);
    CommandResult onJobFinished();
    CommandResult onJobFailed();

    // =========================================================================
    // Safety interlock
    // =========================================================================
    void setAlarmLatched(bool latched);
    bool isAlarmLatched();

    // =========================================================================
    // Control loop
    // =========================================================================

    /**
     * @brief One control period: drain intents, tick, drive, persist, publish
     * @param tick_ms Time represented by this tick
     * @param now_epoch Wall-clock seconds, 0 if unknown
     */
    void runTick(const ProbeReading *readings, size_t count,
                 unsigned long tick_ms, uint32_t now_epoch);

    /**
     * @brief Start the periodic control task reading from source
     */
    bool startControlTask(ProbeSource &source);

    // =========================================================================
    // Inspection
    // =========================================================================
    StatusSnapshot latestStatus();
    ProbeSummary lastProbes();
    RunState runState();
    uint16_t rejectedIntents();
    uint16_t actuatorFailures();
    unsigned long actuatorFailureAgeMs(unsigned long now_ms);

    /**
     * @brief Copy the recorded temperature samples, oldest first
     * @return number of samples written
     */
    size_t copyHistory(TemperatureSample *out, size_t max);

  private:
    Logger &_logger;
    ActuatorDriver &_actuators;
    CheckpointStore &_checkpoints;
    PhaseStateMachine _machine;
    StatusSequencer _sequencer;

    SemaphoreHandle_t _mutex;
    QueueHandle_t _queue;
    TaskHandle_t _task;
    ProbeSource *_source;

    StatusObserver *_observers[Coordination::MAX_OBSERVERS];
    size_t _observer_count;

    RunSettings _run_defaults;
    bool _auto_start_enabled;
    bool _job_start_seen;
    unsigned long _last_job_start_ms;
    MaterialTable _materials;

    TemperatureHistory _history;
    unsigned long _uptime_ms;
    unsigned long _ms_since_sample;
    bool _lights_on;

    bool _resume_pending;
    RunState _pending_resume;

    ProbeSummary _last_probes;
    StatusSnapshot _last_snapshot;
    bool _alarm_latched;
    bool _actuator_fault;
    bool _sensor_unavailable;
    EventCounter _rejected_intents;
    EventCounter _actuator_failures;

    bool _checkpoint_present;
    bool _checkpoint_dirty;
    bool _no_time_warned;
    unsigned long _ms_since_checkpoint;

    bool lock(TickType_t wait) const {
        if (_mutex == nullptr)
            return false;
        return xSemaphoreTake(_mutex, wait) == pdTRUE;
    }
    void unlock() const {
        if (_mutex)
            xSemaphoreGive(_mutex);
    }

    CommandResult submit(const Intent &intent);
    CommandResult submitOverride(Actuator actuator, ManualOverride mode);
    void drainIntentsLocked(const ProbeSummary &probes, uint32_t now_epoch);
    void trackSensorsLocked(const ProbeSummary &probes);
    void recordHistoryLocked(const ProbeSummary &probes, unsigned long tick_ms);
    void driveActuatorsLocked(const ActuatorIntent &intent);
    void checkpointLocked(bool significant, unsigned long tick_ms,
                          uint32_t now_epoch);
    StatusSnapshot buildSnapshotLocked();
    void broadcast(const StatusSnapshot &snapshot);

    static void controlTaskTrampoline(void *param);
    void controlTaskLoop();
};

#endif // COORDINATOR_H
