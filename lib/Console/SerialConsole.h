/**
 * @file SerialConsole.h
 * @brief Line-based bench console mapping typed commands onto the Coordinator
 *
 * Polled from loop(). Input is collected into a fixed buffer, split into
 * argc/argv on whitespace and dispatched through a command table. Everything
 * after '#' is ignored. Replies go through the Logger (serial only).
 *
 * COMMANDS:
 * ---------
 *   status                      latest snapshot
 *   start [C] [min]             start with defaults, optional overrides
 *   pause | resume | confirm | stop | estop
 *   setpoint <C>                change the running setpoint
 *   adjust <+/-min>             extend or shorten the run
 *   heater on|off|auto          manual override
 *   fans on|off|auto            manual override
 *   alarm reset                 release the safety latch
 *   job start [material] [min]  simulate a print job start
 *   job finish | job fail
 *   defaults                    show stored defaults
 *   default temp <C> | default min <min> | autostart on|off
 *   crashlog [clear]            retained critical events
 *   lights on|off               enclosure lights, remembered across boots
 *   recover resume|abort        decide on an interrupted run found at boot
 *   materials                   list the job auto-start table
 *   material <name> <C> [fans on|off] | material <name> delete
 *   presets                     list stored presets
 *   preset save <name> | preset load <n> | preset delete <n>
 *   history                     recent samples and warm-up ETA
 */

#ifndef SERIAL_CONSOLE_H
#define SERIAL_CONSOLE_H

#include "Coordinator.h"
#include "Logger.h"
#include "SafetyMonitor.h"
#include "SettingsStore.h"

class SerialConsole {
  public:
    SerialConsole(Logger &logger, Coordinator &coordinator,
                  SafetyMonitor &safety, SettingsStore &settings);

    void begin();

    /**
     * @brief Consume pending serial input, dispatching complete lines
     */
    void poll();

    /**
     * @brief Execute one command line (also used by tests)
     * @return false if the command was unknown or malformed
     */
    bool execute(char *line);

  private:
    static constexpr size_t MAX_LINE = 64;
    static constexpr int MAX_ARGS = 6;
    static constexpr size_t HISTORY_LINES = 6;

    Logger &_logger;
    Coordinator &_coordinator;
    SafetyMonitor &_safety;
    SettingsStore &_settings;

    char _buf[MAX_LINE];
    size_t _len;
    bool _overflow;

    struct Command {
        const char *name;
        bool (SerialConsole::*handler)(int argc, char **argv);
    };
    static const Command COMMANDS[];

    void report(const char *what, const CommandResult &result);

    bool cmdHelp(int argc, char **argv);
    bool cmdStatus(int argc, char **argv);
    bool cmdStart(int argc, char **argv);
    bool cmdPause(int argc, char **argv);
    bool cmdResume(int argc, char **argv);
    bool cmdConfirm(int argc, char **argv);
    bool cmdStop(int argc, char **argv);
    bool cmdEstop(int argc, char **argv);
    bool cmdSetpoint(int argc, char **argv);
    bool cmdAdjust(int argc, char **argv);
    bool cmdHeater(int argc, char **argv);
    bool cmdFans(int argc, char **argv);
    bool cmdAlarm(int argc, char **argv);
    bool cmdJob(int argc, char **argv);
    bool cmdDefaults(int argc, char **argv);
    bool cmdDefault(int argc, char **argv);
    bool cmdAutostart(int argc, char **argv);
    bool cmdCrashlog(int argc, char **argv);
    bool cmdLights(int argc, char **argv);
    bool cmdRecover(int argc, char **argv);
    bool cmdMaterials(int argc, char **argv);
    bool cmdMaterial(int argc, char **argv);
    bool cmdPresets(int argc, char **argv);
    bool cmdPreset(int argc, char **argv);
    bool cmdHistory(int argc, char **argv);

    bool overrideCommand(Actuator actuator, int argc, char **argv);
};

#endif // SERIAL_CONSOLE_H
