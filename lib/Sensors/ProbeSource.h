/**
 * @file ProbeSource.h
 * @brief Interface through which the control loop acquires probe readings
 */

#ifndef PROBE_SOURCE_H
#define PROBE_SOURCE_H

#include "EnclosureTypes.h"

class ProbeSource {
  public:
    virtual ~ProbeSource() = default;

    /**
     * @brief Run one acquisition step and copy the latest readings
     * @param out Destination, at least max entries
     * @return Number of probes written (failed probes included, valid=false)
     */
    virtual size_t read(ProbeReading *out, size_t max) = 0;
};

#endif // PROBE_SOURCE_H
