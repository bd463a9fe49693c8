#pragma once

#include "PhysicsEngine.h"

#include <string>

namespace SimPool {

/**
 * Shape parameters for a floating-base articulated body.
 */
struct ArticulatedBodySpec {
    std::string name;
    int jointCount = 0;
    int legJointCount = 0; // The last legJointCount joints support the torso.
    double standingHeight = 1.0;
    double mass = 10.0;
    double jointLimit = 1.2;
};

/**
 * Floating torso carried by actuated hinge joints.
 *
 * qpos = [x, y, z, qw, qx, qy, qz, joint angles...]
 * qvel = [vx, vy, vz, wx, wy, wz, joint velocities...]
 *
 * Body 1 is the torso and body 2+j is the limb driven by joint j. Leg joints
 * set the support height and, when swung in alternation while grounded, push
 * the torso along x. Torso pitch is the only modeled rotation.
 */
class ArticulatedBodyEngine : public PhysicsEngine {
public:
    explicit ArticulatedBodyEngine(ArticulatedBodySpec spec);

    void step() override;
    void resetData() override;
    void forward() override;

    const ArticulatedBodySpec& spec() const { return spec_; }

    static ArticulatedBodySpec humanoidSpec();
    static ArticulatedBodySpec antSpec();
    static ArticulatedBodySpec cheetahSpec();

private:
    double supportHeight() const;
    double pitch() const;
    void setPitch(double angle);

    ArticulatedBodySpec spec_;
};

} // namespace SimPool
