#pragma once

#include "core/physics/Observation.h"

#include <vector>

namespace SimPool {

/**
 * Read-only mapping from an observation to actuator commands in [-1, 1].
 * Implementations must be safe to call from the orchestrator's tick thread.
 */
class ActionPolicy {
public:
    virtual ~ActionPolicy() = default;

    virtual std::vector<double> act(const Observation& observation) const = 0;
};

} // namespace SimPool
