#pragma once

#include "PhysicsEngine.h"

namespace SimPool {

/**
 * Single hinged pole driven by one actuator.
 *
 * qpos[0] is the pole angle from upright (radians, positive toward +x).
 * Body 1 is the pole tip; applied forces on it act through the pole length.
 */
class PendulumEngine : public PhysicsEngine {
public:
    PendulumEngine();

    void step() override;
    void resetData() override;
    void forward() override;

    static constexpr double kLength = 0.6;
    static constexpr double kMass = 1.0;
    static constexpr double kInitialAngle = 0.05;
};

} // namespace SimPool
