/**
 * @file EventCounter.h
 * @brief Saturating tally of a recurring fault or rejection
 *
 * Remembers when the event last happened so the console can tell a stale
 * count from an ongoing problem.
 */

#ifndef EVENT_COUNTER_H
#define EVENT_COUNTER_H

#include <cstdint>

class EventCounter {
  public:
    void record(unsigned long now_ms) {
        if (_count < UINT16_MAX)
            ++_count;
        _last_ms = now_ms;
    }

    uint16_t count() const { return _count; }

    /**
     * @brief Milliseconds since the last event, 0 if it never happened
     */
    unsigned long ageMs(unsigned long now_ms) const {
        return _count == 0 ? 0 : now_ms - _last_ms;
    }

  private:
    uint16_t _count = 0;
    unsigned long _last_ms = 0;
};

#endif // EVENT_COUNTER_H
