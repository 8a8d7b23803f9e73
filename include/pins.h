/**
 * @file pins.h
 * @brief Hardware pin definitions
 *
 * GPIO mapping for the enclosure heater board. Separate from config.h to keep
 * hardware mapping distinct from tunable behavior.
 */

#ifndef PINS_H
#define PINS_H

#include <cstdint>

// =============================================================================
// Display Pins (directly mapped to GPIO)
// =============================================================================
#define TFT_DC 3   // GPIO3 - Data/Command selection
#define TFT_CS 18  // GPIO18 - Display chip select
#define TFT_RST 38 // GPIO38 - Display reset
#define LCD_BL 21  // GPIO21 - Backlight control

// =============================================================================
// Sensor Pins
// =============================================================================
constexpr int PIN_DS18B20 = 8; // GPIO8 - DS18B20 OneWire data (all probes)
constexpr int PIN_FIRE = 6;    // GPIO6 - MQ-2 digital out, LOW = smoke/fire

// =============================================================================
// Actuator Pins (relay board inputs)
// =============================================================================
constexpr int PIN_HEATER = 10; // GPIO10 - heater SSR
constexpr int PIN_FAN_1 = 11;  // GPIO11 - filtration fan relay
constexpr int PIN_FAN_2 = 7;   // GPIO7 - circulation fan relay
constexpr int PIN_LIGHTS = 4;  // GPIO4 - enclosure lights relay
constexpr int PIN_BUZZER = 39; // GPIO39 - alarm buzzer

// Relay module inputs are active LOW, the SSR is active HIGH
constexpr bool HEATER_ACTIVE_HIGH = true;
constexpr bool FANS_ACTIVE_HIGH = false;
constexpr bool LIGHTS_ACTIVE_HIGH = false;

/** ============================================================================
 * Unavailable/used GPIO pins
 * ============================================================================
 * In use:
 * - A2 (GPIO6)   - MQ-2 fire detector digital output
 * - A3 (GPIO8)   - DS18B20 OneWire data
 * - A4 (GPIO10)  - Heater SSR
 * - A5 (GPIO11)  - Fan 1 relay
 * - D5 (GPIO7)   - Fan 2 relay
 * - GPIO4        - Lights relay
 * - GPIO39       - Buzzer
 *
 * Display (directly connected via GDI FPC - DFR0928 non-touch):
 * - D2 (GPIO3)   - LCD_DC
 * - D3 (GPIO38)  - LCD_RST
 * - D6 (GPIO18)  - LCD_CS
 * - D13 (GPIO21) - LCD_BL (backlight)
 *
 * System/Special (avoid):
 * - D9 (GPIO0)   - Boot button, strapping pin
 * - GPIO19       - USB D-
 * - GPIO20       - USB D+
 * - GPIO46       - Strapping pin
 */

#endif // PINS_H
