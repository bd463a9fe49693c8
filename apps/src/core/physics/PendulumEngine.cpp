#include "PendulumEngine.h"

#include <cmath>

namespace SimPool {

namespace {

constexpr double kGravity = 9.81;
constexpr double kDamping = 0.1;
constexpr double kGear = 2.0;

PhysicsModel pendulumModel()
{
    PhysicsModel model;
    model.name = "pendulum";
    model.nq = 1;
    model.nv = 1;
    model.nu = 1;
    model.nbody = 2;
    model.timestep = 0.01;
    model.torsoBody = 1;
    model.contactCount = 0;
    return model;
}

} // namespace

PendulumEngine::PendulumEngine() : PhysicsEngine(pendulumModel())
{
    resetData();
}

void PendulumEngine::step()
{
    const double dt = model_.timestep;
    const double theta = data_.qpos[0];
    const double inertia = kMass * kLength * kLength;

    // Applied force on the tip acts through the lever arm; torque about y adds directly.
    const double rx = kLength * std::sin(theta);
    const double rz = kLength * std::cos(theta);
    const double* frc = &data_.xfrcApplied[6];
    const double externalTorque = rz * frc[0] - rx * frc[2] + frc[4];

    const double acceleration = (kGravity / kLength) * std::sin(theta) - kDamping * data_.qvel[0]
        + (kGear * data_.ctrl[0] + externalTorque) / inertia;

    // Semi-implicit Euler.
    data_.qvel[0] += acceleration * dt;
    data_.qpos[0] += data_.qvel[0] * dt;
    data_.qpos[0] = std::remainder(data_.qpos[0], 2.0 * M_PI);
    data_.time += dt;

    forward();
}

void PendulumEngine::resetData()
{
    clearData();
    data_.qpos[0] = kInitialAngle;
    forward();
}

void PendulumEngine::forward()
{
    const double theta = data_.qpos[0];

    data_.xpos[3] = kLength * std::sin(theta);
    data_.xpos[4] = 0.0;
    data_.xpos[5] = kLength * std::cos(theta);

    data_.xquat[4] = std::cos(theta / 2.0);
    data_.xquat[5] = 0.0;
    data_.xquat[6] = std::sin(theta / 2.0);
    data_.xquat[7] = 0.0;
}

} // namespace SimPool
