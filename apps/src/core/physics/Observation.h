#pragma once

#include <cstddef>
#include <vector>
#include <zpp_bits.h>

namespace SimPool {

class PhysicsEngine;

/**
 * Snapshot of one environment after a physics step.
 *
 * bodyPos is the torso (body 1) position. xpos/xquat hold every body,
 * 3 and 4 values each. actions is the control vector applied on the step.
 */
struct Observation {
    std::vector<double> bodyPos;
    std::vector<double> qpos;
    std::vector<double> qvel;
    std::vector<double> xpos;
    std::vector<double> xquat;
    double time = 0.0;
    std::vector<double> actions;
    std::vector<double> contacts;

    using serialize = zpp::bits::members<8>;
};

Observation captureObservation(const PhysicsEngine& engine);

bool isFinite(const Observation& observation);

/**
 * Flatten an observation into the fixed-size policy input:
 * torso position (3), qvel[0:3], qpos[7:28], qvel[6:27], zero-padded to size.
 */
std::vector<double> toPolicyInput(const Observation& observation, size_t size = 72);

} // namespace SimPool
