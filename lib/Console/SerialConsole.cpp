/**
 * @file SerialConsole.cpp
 * @brief Command table and handlers for the bench console
 */

#include "SerialConsole.h"
#include "CrashLog.h"
#include "StatusDisplay.h"
#include "TimeService.h"
#include "config.h"
#include <cctype>
#include <cstdlib>
#include <cstring>

namespace {

bool parseFloat(const char *text, float &out) {
    char *end = nullptr;
    float value = strtof(text, &end);
    if (end == text || *end != '\0')
        return false;
    out = value;
    return true;
}

bool parseLong(const char *text, long &out) {
    char *end = nullptr;
    long value = strtol(text, &end, 10);
    if (end == text || *end != '\0')
        return false;
    out = value;
    return true;
}

void toLower(char *s) {
    for (; *s; ++s) {
        *s = static_cast<char>(tolower(static_cast<unsigned char>(*s)));
    }
}

bool parseOnOff(char *text, bool &out) {
    toLower(text);
    if (strcmp(text, "on") == 0) {
        out = true;
        return true;
    }
    if (strcmp(text, "off") == 0) {
        out = false;
        return true;
    }
    return false;
}

constexpr unsigned long MS_PER_MINUTE = 60000UL;
constexpr long MAX_MINUTES =
    static_cast<long>(Limits::MAX_DURATION_MS / MS_PER_MINUTE);

// Minutes to ms, bounded before multiplying so nothing wraps
bool parseMinutes(const char *text, bool signed_delta, long &out_ms) {
    long minutes = 0;
    if (!parseLong(text, minutes))
        return false;
    if (minutes > MAX_MINUTES || minutes < -MAX_MINUTES)
        return false;
    if (!signed_delta && minutes <= 0)
        return false;
    out_ms = minutes * static_cast<long>(MS_PER_MINUTE);
    return true;
}

} // namespace

const SerialConsole::Command SerialConsole::COMMANDS[] = {
    {"help", &SerialConsole::cmdHelp},
    {"status", &SerialConsole::cmdStatus},
    {"start", &SerialConsole::cmdStart},
    {"pause", &SerialConsole::cmdPause},
    {"resume", &SerialConsole::cmdResume},
    {"confirm", &SerialConsole::cmdConfirm},
    {"stop", &SerialConsole::cmdStop},
    {"estop", &SerialConsole::cmdEstop},
    {"setpoint", &SerialConsole::cmdSetpoint},
    {"adjust", &SerialConsole::cmdAdjust},
    {"heater", &SerialConsole::cmdHeater},
    {"fans", &SerialConsole::cmdFans},
    {"alarm", &SerialConsole::cmdAlarm},
    {"job", &SerialConsole::cmdJob},
    {"defaults", &SerialConsole::cmdDefaults},
    {"default", &SerialConsole::cmdDefault},
    {"autostart", &SerialConsole::cmdAutostart},
    {"crashlog", &SerialConsole::cmdCrashlog},
    {"lights", &SerialConsole::cmdLights},
    {"recover", &SerialConsole::cmdRecover},
    {"materials", &SerialConsole::cmdMaterials},
    {"material", &SerialConsole::cmdMaterial},
    {"presets", &SerialConsole::cmdPresets},
    {"preset", &SerialConsole::cmdPreset},
    {"history", &SerialConsole::cmdHistory},
};

SerialConsole::SerialConsole(Logger &logger, Coordinator &coordinator,
                             SafetyMonitor &safety, SettingsStore &settings)
    : _logger(logger), _coordinator(coordinator), _safety(safety),
      _settings(settings), _len(0), _overflow(false) {
    _buf[0] = '\0';
}

void SerialConsole::begin() {
    _len = 0;
    _overflow = false;
    _logger.log("Console ready, type 'help'", true);
}

void SerialConsole::poll() {
    while (Serial.available() > 0) {
        int c = Serial.read();
        if (c < 0)
            return;

        if (c == '\r' || c == '\n') {
            if (_overflow) {
                _logger.log("> line too long", true);
            } else if (_len > 0) {
                _buf[_len] = '\0';
                execute(_buf);
            }
            _len = 0;
            _overflow = false;
            continue;
        }

        if (_len + 1 >= MAX_LINE) {
            _overflow = true;
            continue;
        }
        _buf[_len++] = static_cast<char>(c);
    }
}

bool SerialConsole::execute(char *line) {
    char *hash = strchr(line, '#');
    if (hash != nullptr)
        *hash = '\0';

    int argc = 0;
    char *argv[MAX_ARGS];
    char *save = nullptr;
    for (char *tok = strtok_r(line, " \t", &save);
         tok != nullptr && argc < MAX_ARGS;
         tok = strtok_r(nullptr, " \t", &save)) {
        argv[argc++] = tok;
    }
    if (argc == 0)
        return true;

    toLower(argv[0]);
    for (const Command &cmd : COMMANDS) {
        if (strcmp(cmd.name, argv[0]) == 0) {
            bool ok = (this->*cmd.handler)(argc, argv);
            if (!ok)
                _logger.logf(true, "> usage error: %s (try 'help')", argv[0]);
            return ok;
        }
    }

    _logger.logf(true, "> unknown command: %s", argv[0]);
    return false;
}

void SerialConsole::report(const char *what, const CommandResult &result) {
    if (isOk(result)) {
        _logger.logf(true, "> %s: OK", what);
    } else {
        _logger.logf(true, "> %s: %s (%s, phase %s)", what,
                     commandStatusToString(result.status), result.reason,
                     phaseToString(result.phase));
    }
}

// =============================================================================
// Handlers
// =============================================================================

bool SerialConsole::cmdHelp(int, char **) {
    _logger.log("> status | start [C] [min] | pause | resume | confirm", true);
    _logger.log("> stop | estop | setpoint <C> | adjust <+/-min>", true);
    _logger.log("> heater|fans on|off|auto | alarm reset", true);
    _logger.log("> job start [mat] [min] | job finish | job fail", true);
    _logger.log("> defaults | default temp|min <v> | autostart on|off", true);
    _logger.log("> crashlog [clear] | lights on|off | recover resume|abort",
                true);
    _logger.log("> materials | material <name> <C> [fans on|off]|delete",
                true);
    _logger.log("> presets | preset save <name>|load <n>|delete <n>", true);
    _logger.log("> history", true);
    return true;
}

bool SerialConsole::cmdStatus(int, char **) {
    StatusSnapshot s = _coordinator.latestStatus();
    char left[16];
    StatusDisplay::formatDuration(left, sizeof(left), s.remaining_ms);
    _logger.logf(true,
                 "> #%lu %s%s T=%.1fC (%u probes) S=%.1fC active=%lus "
                 "left=%s heater=%s fans=%s",
                 static_cast<unsigned long>(s.sequence_number),
                 phaseToString(s.phase),
                 s.awaiting_confirmation ? " awaiting-confirm" : "",
                 s.temperature, static_cast<unsigned>(s.healthy_probes),
                 s.setpoint, s.active_elapsed_ms / 1000UL, left,
                 s.actuators.heater ? "ON" : "OFF",
                 s.actuators.fans ? "ON" : "OFF");
    if (s.resume_pending)
        _logger.log("> interrupted run found: 'recover resume' or "
                    "'recover abort'",
                    true);
    if (s.eta_s > 0) {
        char eta[16];
        StatusDisplay::formatDuration(eta, sizeof(eta), s.eta_s * 1000UL);
        _logger.logf(true, "> setpoint in about %s", eta);
    }
    _logger.logf(true, "> lights %s", s.lights_on ? "ON" : "OFF");
    if (s.alarm_latched) {
        char reason[48];
        _safety.copyLastFaultReason(reason, sizeof(reason));
        _logger.logf(true, "> alarm latched: %s", reason);
    }
    if (_coordinator.actuatorFailures() > 0)
        _logger.logf(true, "> actuator failures: %u, last %lus ago",
                     static_cast<unsigned>(_coordinator.actuatorFailures()),
                     _coordinator.actuatorFailureAgeMs(millis()) / 1000UL);
    return true;
}

bool SerialConsole::cmdStart(int argc, char **argv) {
    RunSettings settings = _settings.runDefaults();
    if (argc >= 2 && !parseFloat(argv[1], settings.setpoint))
        return false;
    if (argc >= 3) {
        long ms = 0;
        if (!parseMinutes(argv[2], false, ms))
            return false;
        settings.duration_ms = static_cast<unsigned long>(ms);
    }
    report("start", _coordinator.start(settings));
    return true;
}

bool SerialConsole::cmdPause(int, char **) {
    report("pause", _coordinator.pause());
    return true;
}

bool SerialConsole::cmdResume(int, char **) {
    report("resume", _coordinator.resume());
    return true;
}

bool SerialConsole::cmdConfirm(int, char **) {
    report("confirm", _coordinator.confirmPreheat());
    return true;
}

bool SerialConsole::cmdStop(int, char **) {
    report("stop", _coordinator.stop());
    return true;
}

bool SerialConsole::cmdEstop(int, char **) {
    report("estop", _coordinator.emergencyStop());
    return true;
}

bool SerialConsole::cmdSetpoint(int argc, char **argv) {
    float value = 0.0f;
    if (argc != 2 || !parseFloat(argv[1], value))
        return false;
    report("setpoint", _coordinator.setSetpoint(value));
    return true;
}

bool SerialConsole::cmdAdjust(int argc, char **argv) {
    long delta_ms = 0;
    if (argc != 2 || !parseMinutes(argv[1], true, delta_ms))
        return false;
    report("adjust", _coordinator.adjustDuration(delta_ms));
    return true;
}

bool SerialConsole::overrideCommand(Actuator actuator, int argc,
                                    char **argv) {
    if (argc != 2)
        return false;
    toLower(argv[1]);
    const char *what = actuator == Actuator::HEATER ? "heater" : "fans";

    if (strcmp(argv[1], "on") == 0) {
        report(what, _coordinator.setManualOverride(actuator, true));
    } else if (strcmp(argv[1], "off") == 0) {
        report(what, _coordinator.setManualOverride(actuator, false));
    } else if (strcmp(argv[1], "auto") == 0) {
        report(what, _coordinator.clearManualOverride(actuator));
    } else {
        return false;
    }
    return true;
}

bool SerialConsole::cmdHeater(int argc, char **argv) {
    return overrideCommand(Actuator::HEATER, argc, argv);
}

bool SerialConsole::cmdFans(int argc, char **argv) {
    return overrideCommand(Actuator::FANS, argc, argv);
}

bool SerialConsole::cmdAlarm(int argc, char **argv) {
    if (argc != 2)
        return false;
    toLower(argv[1]);
    if (strcmp(argv[1], "reset") != 0)
        return false;
    report("alarm reset", _safety.resetAlarm());
    return true;
}

bool SerialConsole::cmdJob(int argc, char **argv) {
    if (argc < 2)
        return false;
    toLower(argv[1]);

    if (strcmp(argv[1], "start") == 0) {
        const char *material = argc >= 3 ? argv[2] : nullptr;
        unsigned long duration_ms = 0;
        if (argc >= 4) {
            long ms = 0;
            if (!parseMinutes(argv[3], false, ms))
                return false;
            duration_ms = static_cast<unsigned long>(ms);
        }
        report("job start", _coordinator.onJobStarted(material, duration_ms));
        return true;
    }
    if (strcmp(argv[1], "finish") == 0) {
        report("job finish", _coordinator.onJobFinished());
        return true;
    }
    if (strcmp(argv[1], "fail") == 0) {
        report("job fail", _coordinator.onJobFailed());
        return true;
    }
    return false;
}

bool SerialConsole::cmdDefaults(int, char **) {
    const RunSettings &d = _settings.runDefaults();
    _logger.logf(true,
                 "> defaults: %.1fC %lumin h=%.1f fans=%d skip=%d "
                 "confirm=%d cool=%.1fC/%lumin autostart=%d",
                 d.setpoint, d.duration_ms / MS_PER_MINUTE, d.hysteresis,
                 d.fans_enabled ? 1 : 0, d.skip_preheat ? 1 : 0,
                 d.require_confirmation ? 1 : 0, d.cooldown_target,
                 d.cooldown_budget_ms / MS_PER_MINUTE,
                 _settings.autoStartEnabled() ? 1 : 0);
    return true;
}

bool SerialConsole::cmdDefault(int argc, char **argv) {
    if (argc != 3)
        return false;
    toLower(argv[1]);

    RunSettings next = _settings.runDefaults();
    if (strcmp(argv[1], "temp") == 0) {
        if (!parseFloat(argv[2], next.setpoint))
            return false;
    } else if (strcmp(argv[1], "min") == 0) {
        long ms = 0;
        if (!parseMinutes(argv[2], false, ms))
            return false;
        next.duration_ms = static_cast<unsigned long>(ms);
    } else {
        return false;
    }

    if (!_settings.save(next, _settings.autoStartEnabled())) {
        _logger.log("> default rejected or not saved", true);
        return true;
    }
    _coordinator.setRunDefaults(_settings.runDefaults(),
                                _settings.autoStartEnabled());
    _logger.log("> default saved", true);
    return true;
}

bool SerialConsole::cmdAutostart(int argc, char **argv) {
    if (argc != 2)
        return false;
    toLower(argv[1]);

    bool enable;
    if (strcmp(argv[1], "on") == 0) {
        enable = true;
    } else if (strcmp(argv[1], "off") == 0) {
        enable = false;
    } else {
        return false;
    }

    if (!_settings.save(_settings.runDefaults(), enable)) {
        _logger.log("> autostart not saved", true);
        return true;
    }
    _coordinator.setRunDefaults(_settings.runDefaults(), enable);
    _logger.logf(true, "> autostart %s", enable ? "on" : "off");
    return true;
}

bool SerialConsole::cmdCrashlog(int argc, char **argv) {
    if (argc == 1) {
        _logger.logf(true, "> %u critical events this boot",
                     static_cast<unsigned>(CrashLog::criticalCount()));
        CrashLog::dumpToSerial();
        return true;
    }
    toLower(argv[1]);
    if (argc != 2 || strcmp(argv[1], "clear") != 0)
        return false;
    CrashLog::clear();
    _logger.log("> crash log cleared", true);
    return true;
}

bool SerialConsole::cmdLights(int argc, char **argv) {
    bool on = false;
    if (argc != 2 || !parseOnOff(argv[1], on))
        return false;

    CommandResult result = _coordinator.setLights(on);
    report("lights", result);
    if (isOk(result) && !_settings.saveLights(on))
        _logger.log("> lights preference not saved", true);
    return true;
}

bool SerialConsole::cmdRecover(int argc, char **argv) {
    if (argc != 2)
        return false;
    toLower(argv[1]);
    if (strcmp(argv[1], "resume") == 0) {
        report("recover resume",
               _coordinator.confirmResume(TimeService::epochNow()));
        return true;
    }
    if (strcmp(argv[1], "abort") == 0) {
        report("recover abort", _coordinator.abortResume());
        return true;
    }
    return false;
}

bool SerialConsole::cmdMaterials(int, char **) {
    const MaterialTable &table = _settings.materials();
    _logger.logf(true, "> %u materials", static_cast<unsigned>(table.size()));
    for (size_t i = 0; i < table.size(); i++) {
        const MaterialProfile &entry = table.at(i);
        if (entry.setpoint <= 0.0f) {
            _logger.logf(true, ">   %-7s unheated", entry.material);
        } else {
            _logger.logf(true, ">   %-7s %.1fC fans %s", entry.material,
                         entry.setpoint, entry.fans_enabled ? "on" : "off");
        }
    }
    return true;
}

bool SerialConsole::cmdMaterial(int argc, char **argv) {
    if (argc < 3)
        return false;

    MaterialTable table = _settings.materials();
    char *value = argv[2];
    toLower(value);
    if (strcmp(value, "delete") == 0) {
        if (argc != 3)
            return false;
        if (!table.remove(argv[1])) {
            _logger.logf(true, "> no material %s", argv[1]);
            return true;
        }
    } else {
        float setpoint = 0.0f;
        if (!parseFloat(value, setpoint))
            return false;
        const MaterialProfile *existing = table.find(argv[1]);
        bool fans = existing != nullptr ? existing->fans_enabled : true;
        if (argc == 5) {
            toLower(argv[3]);
            if (strcmp(argv[3], "fans") != 0 || !parseOnOff(argv[4], fans))
                return false;
        } else if (argc != 3) {
            return false;
        }
        const char *error = table.set(argv[1], setpoint, fans);
        if (error != nullptr) {
            _logger.logf(true, "> material rejected: %s", error);
            return true;
        }
    }

    if (!_settings.saveMaterials(table)) {
        _logger.log("> material table not saved", true);
        return true;
    }
    _coordinator.setMaterials(_settings.materials());
    _logger.log("> material table saved", true);
    return true;
}

bool SerialConsole::cmdPresets(int, char **) {
    const PresetList &presets = _settings.presets();
    _logger.logf(true, "> %u presets", static_cast<unsigned>(presets.size()));
    for (size_t i = 0; i < presets.size(); i++) {
        const RunPreset *preset = presets.at(i);
        char duration[16];
        StatusDisplay::formatDuration(duration, sizeof(duration),
                                      preset->duration_ms);
        _logger.logf(true, ">   %u: %s %.1fC %s", static_cast<unsigned>(i),
                     preset->name, preset->setpoint, duration);
    }
    return true;
}

bool SerialConsole::cmdPreset(int argc, char **argv) {
    if (argc < 3)
        return false;
    toLower(argv[1]);
    PresetList presets = _settings.presets();

    if (strcmp(argv[1], "save") == 0) {
        // Names may contain spaces
        char name[PresetList::MAX_NAME_LEN + 2];
        name[0] = '\0';
        for (int i = 2; i < argc; i++) {
            if (i > 2)
                strncat(name, " ", sizeof(name) - strlen(name) - 1);
            strncat(name, argv[i], sizeof(name) - strlen(name) - 1);
        }
        const RunSettings &d = _settings.runDefaults();
        const char *error = presets.add(name, d.setpoint, d.duration_ms);
        if (error != nullptr) {
            _logger.logf(true, "> preset rejected: %s", error);
            return true;
        }
        if (!_settings.savePresets(presets)) {
            _logger.log("> presets not saved", true);
            return true;
        }
        _logger.logf(true, "> preset %u saved",
                     static_cast<unsigned>(presets.size() - 1));
        return true;
    }

    long index = 0;
    if (argc != 3 || !parseLong(argv[2], index) || index < 0)
        return false;

    if (strcmp(argv[1], "load") == 0) {
        if (!_settings.loadPreset(static_cast<size_t>(index))) {
            _logger.log("> preset not loaded", true);
            return true;
        }
        _coordinator.setRunDefaults(_settings.runDefaults(),
                                    _settings.autoStartEnabled());
        _logger.log("> preset loaded into defaults", true);
        return true;
    }
    if (strcmp(argv[1], "delete") == 0) {
        if (!presets.remove(static_cast<size_t>(index))) {
            _logger.log("> no such preset", true);
            return true;
        }
        if (!_settings.savePresets(presets)) {
            _logger.log("> presets not saved", true);
            return true;
        }
        _logger.log("> preset deleted", true);
        return true;
    }
    return false;
}

bool SerialConsole::cmdHistory(int, char **) {
    TemperatureSample samples[HISTORY_LINES];
    size_t count = _coordinator.copyHistory(samples, HISTORY_LINES);
    if (count == 0) {
        _logger.log("> no samples (history is kept during a run)", true);
        return true;
    }
    unsigned long newest = samples[count - 1].timestamp_ms;
    for (size_t i = 0; i < count; i++) {
        _logger.logf(true, ">   -%lus %.2fC",
                     (newest - samples[i].timestamp_ms) / 1000UL,
                     samples[i].temperature);
    }

    StatusSnapshot s = _coordinator.latestStatus();
    if (s.eta_s > 0) {
        char eta[16];
        StatusDisplay::formatDuration(eta, sizeof(eta), s.eta_s * 1000UL);
        _logger.logf(true, "> ETA to %.1fC: %s", s.setpoint, eta);
    } else {
        _logger.log("> ETA unknown", true);
    }
    return true;
}
