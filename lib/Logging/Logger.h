/**
 * @file Logger.h
 * @brief TFT status lines plus live log area, mirrored to Serial
 *
 * USAGE:
 * ------
 * 1. Initialize the display (also initializes Serial):
 *    logger.initializeDisplay();
 *
 * 2. Register status lines once during setup:
 *    logger.registerLine("temp", "Temp:", "C", 25.0f);
 *    logger.registerTextLine("phase", "Phase:", "IDLE");
 *
 * 3. Update values at runtime (redrawn on the next update() if changed):
 *    logger.updateLine("temp", 26.5f);
 *    logger.updateLineText("phase", "HEATING");
 *
 * 4. Log events (bottom area and Serial, or Serial only):
 *    logger.log("Checkpoint restored");
 *    logger.logf(false, "CKPT: saved at %lus", t);  // display and Serial
 *    logger.logf(true, "CO: tick %lu", n);          // Serial only
 *
 * THREADING:
 * ----------
 * The control loop, safety monitor and console run as separate FreeRTOS
 * tasks. Every public method takes an internal mutex, so any task may log.
 * Before initializeDisplay() only Serial is used, which keeps the Logger
 * usable from on-device unit tests without a screen attached.
 *
 * Never use Serial.print/println directly in the application; always go
 * through the logger.
 */

#ifndef LOGGER_H
#define LOGGER_H

#include "DFRobot_GDL.h"
#include "config.h"
#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>

// Display layout
constexpr int LINE_HEIGHT = 12;
constexpr int VALUE_X = 60;

// Display physical properties
constexpr int SCREEN_WIDTH = 128;
constexpr int SCREEN_HEIGHT = 160;
constexpr int CHAR_WIDTH = 6; // pixels per character
constexpr int MAX_CHARS_PER_LINE = SCREEN_WIDTH / CHAR_WIDTH; // 21 characters

constexpr unsigned long SERIAL_TIMEOUT_MS = 1000;

// Fixed buffer sizes (avoid heap fragmentation from String)
constexpr size_t MAX_DISPLAY_LINES = 10;
constexpr size_t MAX_LINE_NAME_LEN = 12;
constexpr size_t MAX_LINE_LABEL_LEN = 10;
constexpr size_t MAX_LINE_VALUE_LEN = 12;
constexpr size_t MAX_LINE_UNIT_LEN = 4;
constexpr size_t MAX_LOG_MESSAGE_LEN = 192;

struct DisplayLine {
    char name[MAX_LINE_NAME_LEN];
    char label[MAX_LINE_LABEL_LEN];
    char value[MAX_LINE_VALUE_LEN];
    char drawn[MAX_LINE_VALUE_LEN]; // what is currently on screen
    char unit[MAX_LINE_UNIT_LEN];
    int slot;
    bool dirty;
    bool active;
};

class Logger {
  public:
    Logger();

    void initializeDisplay();
    void update(); // flush changed status lines (throttled)

    void registerLine(const char *name, const char *label,
                      const char *unit = "", float initial_value = 0.0f);
    void registerTextLine(const char *name, const char *label,
                          const char *initial_text = "");
    void updateLine(const char *name, float value);
    void updateLineText(const char *name, const char *text);

    void log(const char *message, bool serialOnly = false);
    void logf(bool serialOnly, const char *format, ...);

  private:
    bool lock() const {
        if (_mutex == nullptr)
            return true;
        return xSemaphoreTake(_mutex, portMAX_DELAY) == pdTRUE;
    }
    void unlock() const {
        if (_mutex)
            xSemaphoreGive(_mutex);
    }

    DisplayLine *findLine(const char *name);
    void setLineValue(DisplayLine &line, const char *value);
    void drawLabel(const DisplayLine &line);
    void drawValue(DisplayLine &line, bool full);
    void appendLogLines(const char *message);
    void drawLogArea();

    SemaphoreHandle_t _mutex;
    DFRobot_ST7735_128x160_HW_SPI *_screen;
    bool _display_initialized;
    unsigned long _last_display_update;
    int _next_slot;

    DisplayLine _lines[MAX_DISPLAY_LINES];

    char _log_lines[Display::LOG_AREA_LINES][MAX_CHARS_PER_LINE + 1];
    int _log_count;
    int _log_area_y_start;
};

#endif // LOGGER_H
