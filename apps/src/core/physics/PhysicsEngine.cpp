#include "PhysicsEngine.h"

#include <utility>

namespace SimPool {

PhysicsEngine::PhysicsEngine(PhysicsModel model) : model_(std::move(model))
{
    clearData();
}

void PhysicsEngine::clearData()
{
    data_.qpos.assign(model_.nq, 0.0);
    data_.qvel.assign(model_.nv, 0.0);
    data_.ctrl.assign(model_.nu, 0.0);
    data_.xpos.assign(3 * model_.nbody, 0.0);
    data_.xquat.assign(4 * model_.nbody, 0.0);
    data_.xfrcApplied.assign(6 * model_.nbody, 0.0);
    data_.contacts.assign(model_.contactCount, 0.0);
    data_.time = 0.0;

    // Identity orientation for every body.
    for (int body = 0; body < model_.nbody; ++body) {
        data_.xquat[4 * body] = 1.0;
    }
}

} // namespace SimPool
