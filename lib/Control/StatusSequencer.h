/**
 * @file StatusSequencer.h
 * @brief Numbering of outbound status snapshots and the consumer-side filter
 *
 * Snapshots are built under the coordinator lock but delivered after it is
 * released, so two tasks may hand observers their snapshots in either order.
 * Each snapshot carries a number from StatusSequencer; observers run every
 * snapshot through a SequenceFilter and drop anything not newer than what
 * they already showed.
 */

#ifndef STATUS_SEQUENCER_H
#define STATUS_SEQUENCER_H

#include <cstdint>

class StatusSequencer {
  public:
    /**
     * @brief Take the next number (call with the coordinator lock held)
     *
     * Numbers start at 1, are never reused and never decrease.
     */
    uint32_t next() { return ++_last; }

    uint32_t last() const { return _last; }

  private:
    uint32_t _last = 0;
};

class SequenceFilter {
  public:
    /**
     * @brief Accept a snapshot number if it is newer than the last accepted
     * @return false for duplicates and stale snapshots
     */
    bool accept(uint32_t sequence_number) {
        if (sequence_number <= _last_accepted)
            return false;
        _last_accepted = sequence_number;
        return true;
    }

    uint32_t lastAccepted() const { return _last_accepted; }
    void reset() { _last_accepted = 0; }

  private:
    uint32_t _last_accepted = 0;
};

#endif // STATUS_SEQUENCER_H
