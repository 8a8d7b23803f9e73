/**
 * @file Logger.cpp
 * @brief Implementation of the status display and live log
 *
 * Fixed-size char arrays are used instead of Arduino String to prevent heap
 * fragmentation during multi-day runs.
 */

#include "Logger.h"
#include "TimeService.h"
#include <cstdarg>
#include <cstring>

namespace {
void copyField(char *dst, size_t size, const char *src) {
    strncpy(dst, src ? src : "", size - 1);
    dst[size - 1] = '\0';
}
} // namespace

Logger::Logger()
    : _mutex(xSemaphoreCreateMutex()), _screen(nullptr),
      _display_initialized(false), _last_display_update(0), _next_slot(0),
      _log_count(0), _log_area_y_start(0) {
    for (size_t i = 0; i < MAX_DISPLAY_LINES; i++) {
        _lines[i].active = false;
    }
}

void Logger::initializeDisplay() {
    if (!lock())
        return;
    if (_display_initialized) {
        unlock();
        return;
    }

    Serial.begin(115200);
    while (!Serial && millis() < SERIAL_TIMEOUT_MS) {
        ; // wait for serial connection
    }

    _screen = new DFRobot_ST7735_128x160_HW_SPI(TFT_DC, TFT_CS, TFT_RST);
    pinMode(LCD_BL, OUTPUT);
    digitalWrite(LCD_BL, HIGH);
    _screen->begin();
    _screen->setRotation(0);
    _screen->fillScreen(COLOR_RGB565_BLACK);
    _screen->setTextColor(COLOR_RGB565_WHITE);
    _screen->setTextSize(1);
    _screen->setTextWrap(false);

    _log_area_y_start = SCREEN_HEIGHT - (Display::LOG_AREA_LINES * LINE_HEIGHT);
    _screen->drawFastHLine(0, _log_area_y_start - 1, SCREEN_WIDTH,
                           COLOR_RGB565_WHITE);

    _display_initialized = true;
    unlock();
}

DisplayLine *Logger::findLine(const char *name) {
    for (size_t i = 0; i < MAX_DISPLAY_LINES; i++) {
        if (_lines[i].active && strcmp(_lines[i].name, name) == 0) {
            return &_lines[i];
        }
    }
    return nullptr;
}

void Logger::drawLabel(const DisplayLine &line) {
    if (!_screen)
        return;
    int y = line.slot * LINE_HEIGHT;
    _screen->fillRect(0, y, VALUE_X, LINE_HEIGHT, COLOR_RGB565_BLACK);
    _screen->setTextColor(COLOR_RGB565_WHITE);
    _screen->setCursor(0, y);
    _screen->print(line.label);
}

void Logger::drawValue(DisplayLine &line, bool full) {
    if (!_screen)
        return;

    int y = line.slot * LINE_HEIGHT;
    _screen->setTextColor(COLOR_RGB565_WHITE);

    if (full) {
        _screen->fillRect(VALUE_X, y, SCREEN_WIDTH - VALUE_X, LINE_HEIGHT,
                          COLOR_RGB565_BLACK);
        _screen->setCursor(VALUE_X, y);
        _screen->print(line.value);
    } else {
        // Redraw only the character cells that differ
        size_t old_len = strlen(line.drawn);
        size_t new_len = strlen(line.value);
        size_t n = old_len > new_len ? old_len : new_len;
        for (size_t i = 0; i < n; i++) {
            char was = i < old_len ? line.drawn[i] : '\0';
            char now = i < new_len ? line.value[i] : '\0';
            if (was == now)
                continue;
            int x = VALUE_X + static_cast<int>(i) * CHAR_WIDTH;
            _screen->fillRect(x, y, CHAR_WIDTH, LINE_HEIGHT,
                              COLOR_RGB565_BLACK);
            if (now != '\0') {
                _screen->setCursor(x, y);
                _screen->print(now);
            }
        }
    }

    copyField(line.drawn, sizeof(line.drawn), line.value);
    line.dirty = false;
}

void Logger::setLineValue(DisplayLine &line, const char *value) {
    if (strcmp(line.value, value) == 0)
        return;
    copyField(line.value, sizeof(line.value), value);
    line.dirty = true;
}

void Logger::registerLine(const char *name, const char *label,
                          const char *unit, float initial_value) {
    char buf[MAX_LINE_VALUE_LEN];
    if (unit != nullptr && unit[0] != '\0') {
        snprintf(buf, sizeof(buf), "%.1f %s", initial_value, unit);
    } else {
        snprintf(buf, sizeof(buf), "%.1f", initial_value);
    }

    registerTextLine(name, label, buf);

    if (!lock())
        return;
    DisplayLine *line = findLine(name);
    if (line != nullptr)
        copyField(line->unit, sizeof(line->unit), unit);
    unlock();
}

void Logger::registerTextLine(const char *name, const char *label,
                              const char *initial_text) {
    if (!lock())
        return;
    if (!_display_initialized) {
        unlock();
        return;
    }

    DisplayLine *line = findLine(name);
    if (line == nullptr) {
        for (size_t i = 0; i < MAX_DISPLAY_LINES; i++) {
            if (!_lines[i].active) {
                line = &_lines[i];
                break;
            }
        }
        if (line == nullptr ||
            (_next_slot + 1) * LINE_HEIGHT > _log_area_y_start) {
            unlock();
            Serial.println("Logger: No free display slots!");
            return;
        }
        line->active = true;
        line->slot = _next_slot++;
        copyField(line->name, sizeof(line->name), name);
        line->unit[0] = '\0';
    }

    copyField(line->label, sizeof(line->label), label);
    copyField(line->value, sizeof(line->value), initial_text);
    line->drawn[0] = '\0';
    drawLabel(*line);
    drawValue(*line, true);
    unlock();
}

void Logger::updateLine(const char *name, float value) {
    if (!lock())
        return;
    DisplayLine *line = _display_initialized ? findLine(name) : nullptr;
    if (line != nullptr) {
        char buf[MAX_LINE_VALUE_LEN];
        if (line->unit[0] != '\0') {
            snprintf(buf, sizeof(buf), "%.1f %s", value, line->unit);
        } else {
            snprintf(buf, sizeof(buf), "%.1f", value);
        }
        setLineValue(*line, buf);
    }
    unlock();
}

void Logger::updateLineText(const char *name, const char *text) {
    if (!lock())
        return;
    DisplayLine *line = _display_initialized ? findLine(name) : nullptr;
    if (line != nullptr)
        setLineValue(*line, text ? text : "");
    unlock();
}

void Logger::update() {
    if (!lock())
        return;

    unsigned long now = millis();
    if (_display_initialized &&
        now - _last_display_update >= Display::DISPLAY_INTERVAL_MS) {
        _last_display_update = now;
        for (size_t i = 0; i < MAX_DISPLAY_LINES; i++) {
            if (_lines[i].active && _lines[i].dirty) {
                drawValue(_lines[i], _lines[i].drawn[0] == '\0');
            }
        }
    }
    unlock();
}

void Logger::appendLogLines(const char *message) {
    size_t len = strlen(message);
    size_t pos = 0;

    while (pos < len) {
        size_t take = len - pos;
        if (take > static_cast<size_t>(MAX_CHARS_PER_LINE)) {
            // Break at the last space that fits, or hard-split
            take = MAX_CHARS_PER_LINE;
            for (size_t i = MAX_CHARS_PER_LINE; i > 0; i--) {
                if (message[pos + i] == ' ') {
                    take = i;
                    break;
                }
            }
        }

        if (_log_count == Display::LOG_AREA_LINES) {
            for (int i = 0; i < Display::LOG_AREA_LINES - 1; i++) {
                memcpy(_log_lines[i], _log_lines[i + 1],
                       sizeof(_log_lines[i]));
            }
            _log_count--;
        }
        memcpy(_log_lines[_log_count], &message[pos], take);
        _log_lines[_log_count][take] = '\0';
        _log_count++;

        pos += take;
        while (pos < len && message[pos] == ' ')
            pos++;
    }
}

void Logger::drawLogArea() {
    if (!_screen)
        return;

    _screen->fillRect(0, _log_area_y_start, SCREEN_WIDTH,
                      Display::LOG_AREA_LINES * LINE_HEIGHT,
                      COLOR_RGB565_BLACK);
    _screen->setTextColor(COLOR_RGB565_WHITE);
    for (int i = 0; i < _log_count; i++) {
        _screen->setCursor(0, _log_area_y_start + i * LINE_HEIGHT + 1);
        _screen->print(_log_lines[i]);
    }
}

void Logger::log(const char *message, bool serialOnly) {
    if (!lock())
        return;

    // [YYYY-MM-DDTHH:MM:SS][HH:MM:SS.mmm] message, wall time when synced
    unsigned long ms = millis();
    unsigned int hours = (ms / 3600000UL) % 24;
    unsigned int mins = (ms / 60000UL) % 60;
    unsigned int secs = (ms / 1000UL) % 60;
    unsigned int frac = ms % 1000;

    char stamped[MAX_LOG_MESSAGE_LEN + 48];
    const char *iso = TimeService::getIsoTimestamp();
    if (iso != nullptr) {
        snprintf(stamped, sizeof(stamped), "[%s][%02u:%02u:%02u.%03u] %s", iso,
                 hours, mins, secs, frac, message);
    } else {
        snprintf(stamped, sizeof(stamped), "[%02u:%02u:%02u.%03u] %s", hours,
                 mins, secs, frac, message);
    }
    Serial.println(stamped);

    if (!serialOnly && _display_initialized) {
        appendLogLines(message);
        drawLogArea();
    }
    unlock();
}

void Logger::logf(bool serialOnly, const char *format, ...) {
    char buf[MAX_LOG_MESSAGE_LEN];
    va_list args;
    va_start(args, format);
    vsnprintf(buf, sizeof(buf), format, args);
    va_end(args);
    log(buf, serialOnly);
}
