#pragma once

#include <string>
#include <vector>

namespace SimPool {

/**
 * Static description of one simulated body system.
 */
struct PhysicsModel {
    std::string name;
    int nq = 0;    // Generalized position count.
    int nv = 0;    // Generalized velocity count.
    int nu = 0;    // Actuator count.
    int nbody = 0; // Body count, including the world body at index 0.
    double timestep = 0.01;
    int torsoBody = 1;
    int contactCount = 0;
};

/**
 * Mutable simulation state. Array sizes follow the owning model:
 * qpos[nq], qvel[nv], ctrl[nu], xpos[3*nbody], xquat[4*nbody] (w, x, y, z),
 * xfrcApplied[6*nbody] (force xyz, torque xyz), contacts[contactCount].
 */
struct PhysicsData {
    std::vector<double> qpos;
    std::vector<double> qvel;
    std::vector<double> ctrl;
    std::vector<double> xpos;
    std::vector<double> xquat;
    std::vector<double> xfrcApplied;
    std::vector<double> contacts;
    double time = 0.0;
};

/**
 * Interface for a physics engine instance hosting one body system.
 *
 * The contract mirrors the usual model/data split:
 * - step(): advance one timestep using ctrl and xfrcApplied.
 * - resetData(): restore the initial pose and clear time, velocity, ctrl and forces.
 * - forward(): recompute derived quantities (xpos, xquat, contacts) from qpos.
 */
class PhysicsEngine {
public:
    virtual ~PhysicsEngine() = default;

    virtual void step() = 0;
    virtual void resetData() = 0;
    virtual void forward() = 0;

    const PhysicsModel& model() const { return model_; }
    PhysicsData& data() { return data_; }
    const PhysicsData& data() const { return data_; }

protected:
    explicit PhysicsEngine(PhysicsModel model);

    void clearData();

    PhysicsModel model_;
    PhysicsData data_;
};

} // namespace SimPool
