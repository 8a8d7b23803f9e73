/**
 * @file StatusObserver.h
 * @brief Receiver of sequenced status snapshots
 */

#ifndef STATUS_OBSERVER_H
#define STATUS_OBSERVER_H

#include "EnclosureTypes.h"

class StatusObserver {
  public:
    virtual ~StatusObserver() = default;

    /**
     * @brief Called after the coordinator lock is released, possibly from
     * several tasks concurrently and out of order
     */
    virtual void onStatus(const StatusSnapshot &snapshot) = 0;
};

#endif // STATUS_OBSERVER_H
