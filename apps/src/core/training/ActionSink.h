#pragma once

#include <vector>

namespace SimPool {

/**
 * Write side a trainer uses to drive environments: queue the next action and
 * ask for an episode reset. Both return false if the environment is unknown or
 * the request could not be sent.
 */
class ActionSink {
public:
    virtual ~ActionSink() = default;

    virtual bool setAction(int envId, std::vector<double> action) = 0;
    virtual bool requestReset(int envId) = 0;
};

} // namespace SimPool
