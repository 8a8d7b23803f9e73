#include "StatusSequencer.h"
#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <freertos/task.h>
#include <unity.h>

void setUp(void) {}

void tearDown(void) {}

// Test: Numbers start at 1 and strictly increase
void test_sequencer_monotonic(void) {
    StatusSequencer sequencer;
    TEST_ASSERT_EQUAL_UINT32(0, sequencer.last());
    TEST_ASSERT_EQUAL_UINT32(1, sequencer.next());
    TEST_ASSERT_EQUAL_UINT32(2, sequencer.next());
    TEST_ASSERT_EQUAL_UINT32(2, sequencer.last());
}

// Test: Duplicates and older snapshots are dropped
void test_filter_rejects_stale(void) {
    SequenceFilter filter;
    TEST_ASSERT_TRUE(filter.accept(3));
    TEST_ASSERT_FALSE(filter.accept(3));
    TEST_ASSERT_FALSE(filter.accept(2));
    TEST_ASSERT_TRUE(filter.accept(7));
    TEST_ASSERT_EQUAL_UINT32(7, filter.lastAccepted());

    filter.reset();
    TEST_ASSERT_TRUE(filter.accept(1));
}

// Test: Shuffled delivery ends on the newest snapshot
void test_shuffled_delivery(void) {
    const uint32_t delivered[] = {2, 1, 5, 3, 4, 8, 6, 7, 8, 10, 9};
    SequenceFilter filter;
    uint32_t accepted = 0;
    uint32_t previous = 0;

    for (uint32_t seq : delivered) {
        if (filter.accept(seq)) {
            TEST_ASSERT_GREATER_THAN_UINT32(previous, seq);
            previous = seq;
            accepted++;
        }
    }
    TEST_ASSERT_EQUAL_UINT32(10, filter.lastAccepted());
    TEST_ASSERT_EQUAL_UINT32(4, accepted); // 2, 5, 8, 10
}

// Shared between the two publisher tasks below
static StatusSequencer g_sequencer;
static SequenceFilter g_filter;
static SemaphoreHandle_t g_state_mutex;
static SemaphoreHandle_t g_observer_mutex;
static SemaphoreHandle_t g_done;
static volatile uint32_t g_regressions;
static volatile uint32_t g_last_shown;

static void publisherTask(void *param) {
    uint32_t seed = reinterpret_cast<uintptr_t>(param);
    for (int i = 0; i < 200; i++) {
        xSemaphoreTake(g_state_mutex, portMAX_DELAY);
        uint32_t seq = g_sequencer.next();
        xSemaphoreGive(g_state_mutex);

        // Delivery happens outside the lock, so order between tasks varies
        seed = seed * 1103515245UL + 12345UL;
        if ((seed >> 16) & 1)
            taskYIELD();

        xSemaphoreTake(g_observer_mutex, portMAX_DELAY);
        if (g_filter.accept(seq)) {
            if (seq <= g_last_shown)
                g_regressions++;
            g_last_shown = seq;
        }
        xSemaphoreGive(g_observer_mutex);
    }
    xSemaphoreGive(g_done);
    vTaskDelete(nullptr);
}

// Test: Two concurrent publishers never make the observer go backwards
void test_concurrent_publishers(void) {
    g_state_mutex = xSemaphoreCreateMutex();
    g_observer_mutex = xSemaphoreCreateMutex();
    g_done = xSemaphoreCreateCounting(2, 0);
    TEST_ASSERT_NOT_NULL(g_state_mutex);
    TEST_ASSERT_NOT_NULL(g_observer_mutex);
    TEST_ASSERT_NOT_NULL(g_done);

    xTaskCreate(publisherTask, "pubA", 2048, reinterpret_cast<void *>(1), 2,
                nullptr);
    xTaskCreate(publisherTask, "pubB", 2048, reinterpret_cast<void *>(7), 2,
                nullptr);

    TEST_ASSERT_EQUAL(pdTRUE, xSemaphoreTake(g_done, pdMS_TO_TICKS(5000)));
    TEST_ASSERT_EQUAL(pdTRUE, xSemaphoreTake(g_done, pdMS_TO_TICKS(5000)));

    TEST_ASSERT_EQUAL_UINT32(0, g_regressions);
    TEST_ASSERT_EQUAL_UINT32(400, g_sequencer.last());
    TEST_ASSERT_EQUAL_UINT32(g_sequencer.last(), g_filter.lastAccepted());
}

void setup() {
    delay(2000); // Wait for serial monitor

    UNITY_BEGIN();

    RUN_TEST(test_sequencer_monotonic);
    RUN_TEST(test_filter_rejects_stale);
    RUN_TEST(test_shuffled_delivery);
    RUN_TEST(test_concurrent_publishers);

    UNITY_END();
}

void loop() {
    // Nothing to do here
}
