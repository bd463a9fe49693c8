#pragma once

#include "core/physics/Observation.h"

#include <cstddef>
#include <vector>

namespace SimPool::Ppo {

/**
 * Flattens an observation into the trainer's fixed-size state vector.
 *
 * Layout: qpos padded to 34, qvel padded to 34, torso position (3), torso
 * quaternion (4), contacts padded to 8. The result is then padded or truncated
 * to the declared state size.
 */
class StateExtractor {
public:
    static constexpr size_t kQposSize = 34;
    static constexpr size_t kQvelSize = 34;
    static constexpr size_t kContactSize = 8;
    static constexpr size_t kDefaultSize = kQposSize + kQvelSize + 3 + 4 + kContactSize;

    explicit StateExtractor(size_t stateSize = kDefaultSize);

    std::vector<double> extract(const Observation& observation) const;

    size_t size() const { return stateSize_; }

private:
    size_t stateSize_;
};

} // namespace SimPool::Ppo
