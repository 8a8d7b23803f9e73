#include "Logger.h"
#include "SettingsStore.h"
#include <Arduino.h>
#include <Preferences.h>
#include <unity.h>

static const char *TEST_NS = "settings_test";

Logger logger;

static void wipeNamespace() {
    Preferences prefs;
    if (prefs.begin(TEST_NS, false)) {
        prefs.clear();
        prefs.end();
    }
}

void setUp(void) { wipeNamespace(); }

void tearDown(void) {}

// Test: Material names are validated, matched case-insensitively and stored
// upper-case
void test_material_table_editing(void) {
    MaterialTable table;
    table.loadDefaults();
    TEST_ASSERT_EQUAL_UINT32(8, table.size());
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 65.0f, table.find("asa")->setpoint);
    TEST_ASSERT_NULL(table.find(""));
    TEST_ASSERT_NULL(table.find(nullptr));

    TEST_ASSERT_NULL(table.set("pa12", 70.0f, false));
    TEST_ASSERT_EQUAL_STRING("PA12", table.find("Pa12")->material);

    TEST_ASSERT_EQUAL_STRING("bad material name", table.set("pa-12", 70.0f, true));
    TEST_ASSERT_EQUAL_STRING("bad material name",
                             table.set("polycarb", 70.0f, true));
    TEST_ASSERT_EQUAL_STRING("setpoint out of range",
                             table.set("pa12", 95.0f, true));
    TEST_ASSERT_EQUAL_STRING("setpoint out of range",
                             table.set("pa12", -1.0f, true));

    // Updating keeps the slot
    TEST_ASSERT_NULL(table.set("PA12", 72.0f, true));
    TEST_ASSERT_EQUAL_UINT32(9, table.size());
    TEST_ASSERT_TRUE(table.find("pa12")->fans_enabled);

    TEST_ASSERT_TRUE(table.remove("pa12"));
    TEST_ASSERT_FALSE(table.remove("pa12"));
    TEST_ASSERT_EQUAL_UINT32(8, table.size());

    char name[8];
    for (size_t i = table.size(); i < MaterialTable::CAPACITY; i++) {
        snprintf(name, sizeof(name), "M%u", static_cast<unsigned>(i));
        TEST_ASSERT_NULL(table.set(name, 50.0f, true));
    }
    TEST_ASSERT_EQUAL_STRING("material table full",
                             table.set("EXTRA", 50.0f, true));
}

// Test: Presets are validated and removed by index
void test_preset_list_editing(void) {
    PresetList presets;
    presets.loadDefaults();
    TEST_ASSERT_EQUAL_UINT32(3, presets.size());
    TEST_ASSERT_EQUAL_STRING("ABS Standard", presets.at(0)->name);
    TEST_ASSERT_EQUAL_UINT32(10UL * 3600000UL, presets.at(1)->duration_ms);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 40.0f, presets.at(2)->setpoint);
    TEST_ASSERT_NULL(presets.at(3));

    TEST_ASSERT_EQUAL_STRING("bad preset name", presets.add("", 50.0f, 60000UL));
    TEST_ASSERT_EQUAL_STRING("bad preset name",
                             presets.add("A name far too long", 50.0f, 60000UL));
    TEST_ASSERT_EQUAL_STRING("setpoint out of range",
                             presets.add("Hot", 120.0f, 60000UL));
    TEST_ASSERT_EQUAL_STRING("duration out of range",
                             presets.add("Empty", 50.0f, 0));

    TEST_ASSERT_TRUE(presets.remove(1));
    TEST_ASSERT_EQUAL_STRING("Quick Test", presets.at(1)->name);
    TEST_ASSERT_FALSE(presets.remove(2));

    while (presets.size() < PresetList::CAPACITY) {
        TEST_ASSERT_NULL(presets.add("Filler", 50.0f, 60000UL));
    }
    TEST_ASSERT_EQUAL_STRING("preset list full",
                             presets.add("One more", 50.0f, 60000UL));
}

// Test: An empty namespace starts from the built-in values
void test_first_boot_defaults(void) {
    SettingsStore store(logger, TEST_NS);
    store.begin();

    TEST_ASSERT_EQUAL(Defaults::LIGHTS_ENABLED, store.lightsEnabled());
    TEST_ASSERT_EQUAL_UINT32(8, store.materials().size());
    TEST_ASSERT_EQUAL_UINT32(3, store.presets().size());
    TEST_ASSERT_FLOAT_WITHIN(0.01f, Defaults::SETPOINT_C,
                             store.runDefaults().setpoint);
}

// Test: Lights, materials and presets survive a new instance
void test_tables_persist(void) {
    {
        SettingsStore store(logger, TEST_NS);
        store.begin();
        TEST_ASSERT_TRUE(store.saveLights(!Defaults::LIGHTS_ENABLED));

        MaterialTable table = store.materials();
        TEST_ASSERT_NULL(table.set("abs", 58.0f, false));
        TEST_ASSERT_TRUE(table.remove("TPU"));
        TEST_ASSERT_TRUE(store.saveMaterials(table));

        PresetList presets = store.presets();
        TEST_ASSERT_NULL(presets.add("Overnight", 55.0f, 12UL * 3600000UL));
        TEST_ASSERT_TRUE(store.savePresets(presets));
    }

    SettingsStore reloaded(logger, TEST_NS);
    reloaded.begin();
    TEST_ASSERT_EQUAL(!Defaults::LIGHTS_ENABLED, reloaded.lightsEnabled());
    TEST_ASSERT_EQUAL_UINT32(7, reloaded.materials().size());
    TEST_ASSERT_NULL(reloaded.materials().find("tpu"));
    const MaterialProfile *abs = reloaded.materials().find("ABS");
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 58.0f, abs->setpoint);
    TEST_ASSERT_FALSE(abs->fans_enabled);

    TEST_ASSERT_EQUAL_UINT32(4, reloaded.presets().size());
    TEST_ASSERT_EQUAL_STRING("Overnight", reloaded.presets().at(3)->name);
}

// Test: Loading a preset rewrites only setpoint and duration of the defaults
void test_load_preset_into_defaults(void) {
    SettingsStore store(logger, TEST_NS);
    store.begin();
    RunSettings before = store.runDefaults();

    TEST_ASSERT_TRUE(store.loadPreset(1));
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 65.0f, store.runDefaults().setpoint);
    TEST_ASSERT_EQUAL_UINT32(10UL * 3600000UL, store.runDefaults().duration_ms);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, before.hysteresis,
                             store.runDefaults().hysteresis);
    TEST_ASSERT_EQUAL(before.fans_enabled, store.runDefaults().fans_enabled);
    TEST_ASSERT_FALSE(store.loadPreset(3));

    SettingsStore reloaded(logger, TEST_NS);
    reloaded.begin();
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 65.0f, reloaded.runDefaults().setpoint);
}

// Test: Unreadable table blobs fall back to the built-in tables
void test_corrupt_tables_fall_back(void) {
    uint8_t junk[10] = {0xFF, 0xFF, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06,
                        0x07, 0x08};
    Preferences prefs;
    TEST_ASSERT_TRUE(prefs.begin(TEST_NS, false));
    TEST_ASSERT_EQUAL_UINT32(sizeof(junk),
                             prefs.putBytes("materials", junk, sizeof(junk)));
    TEST_ASSERT_EQUAL_UINT32(sizeof(junk),
                             prefs.putBytes("presets", junk, sizeof(junk)));
    prefs.end();

    SettingsStore store(logger, TEST_NS);
    store.begin();
    TEST_ASSERT_EQUAL_UINT32(8, store.materials().size());
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 65.0f, store.materials().find("asa")->setpoint);
    TEST_ASSERT_EQUAL_UINT32(3, store.presets().size());
}

void setup() {
    delay(2000); // Wait for serial monitor

    UNITY_BEGIN();

    RUN_TEST(test_material_table_editing);
    RUN_TEST(test_preset_list_editing);
    RUN_TEST(test_first_boot_defaults);
    RUN_TEST(test_tables_persist);
    RUN_TEST(test_load_preset_into_defaults);
    RUN_TEST(test_corrupt_tables_fall_back);

    wipeNamespace();
    UNITY_END();
}

void loop() {
    // Nothing to do here
}
