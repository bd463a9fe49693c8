#include "ArticulatedBodyEngine.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace SimPool {

namespace {

constexpr double kGravity = 9.81;
constexpr double kGear = 5.0;
constexpr double kJointInertia = 0.5;
constexpr double kJointStiffness = 4.0;
constexpr double kJointDamping = 1.0;
constexpr double kGroundStiffness = 2000.0;
constexpr double kGroundDamping = 60.0;
constexpr double kContactTolerance = 0.02;
constexpr double kPropulsionGain = 0.6;
constexpr double kDrag = 1.5;
constexpr double kPitchStiffness = 20.0;
constexpr double kPitchDamping = 4.0;
constexpr double kLimbRadius = 0.25;
constexpr double kLimbLength = 0.15;

// Leg extension shrinks the support height by up to this fraction.
constexpr double kMaxCrouch = 0.35;

constexpr int kRootPosition = 0;
constexpr int kRootQuaternion = 3;
constexpr int kJointPositionOffset = 7;
constexpr int kRootAngularVelocity = 3;
constexpr int kJointVelocityOffset = 6;

PhysicsModel articulatedModel(const ArticulatedBodySpec& spec)
{
    PhysicsModel model;
    model.name = spec.name;
    model.nq = kJointPositionOffset + spec.jointCount;
    model.nv = kJointVelocityOffset + spec.jointCount;
    model.nu = spec.jointCount;
    model.nbody = 2 + spec.jointCount;
    model.timestep = 0.01;
    model.torsoBody = 1;
    model.contactCount = 2;
    return model;
}

} // namespace

ArticulatedBodyEngine::ArticulatedBodyEngine(ArticulatedBodySpec spec)
    : PhysicsEngine(articulatedModel(spec)), spec_(std::move(spec))
{
    resetData();
}

ArticulatedBodySpec ArticulatedBodyEngine::humanoidSpec()
{
    return ArticulatedBodySpec{ .name = "humanoid",
                                .jointCount = 21,
                                .legJointCount = 8,
                                .standingHeight = 1.4,
                                .mass = 40.0,
                                .jointLimit = 1.2 };
}

ArticulatedBodySpec ArticulatedBodyEngine::antSpec()
{
    return ArticulatedBodySpec{ .name = "ant",
                                .jointCount = 8,
                                .legJointCount = 8,
                                .standingHeight = 0.75,
                                .mass = 10.0,
                                .jointLimit = 1.0 };
}

ArticulatedBodySpec ArticulatedBodyEngine::cheetahSpec()
{
    return ArticulatedBodySpec{ .name = "cheetah",
                                .jointCount = 6,
                                .legJointCount = 6,
                                .standingHeight = 0.7,
                                .mass = 14.0,
                                .jointLimit = 1.0 };
}

void ArticulatedBodyEngine::step()
{
    const double dt = model_.timestep;
    const int jointCount = spec_.jointCount;
    auto& qpos = data_.qpos;
    auto& qvel = data_.qvel;

    // Translation treats every body as rigidly attached to the torso.
    double force[3] = { 0.0, 0.0, 0.0 };
    double pitchTorque = 0.0;
    for (int body = 1; body < model_.nbody; ++body) {
        const double* frc = &data_.xfrcApplied[6 * body];
        force[0] += frc[0];
        force[1] += frc[1];
        force[2] += frc[2];
        pitchTorque += frc[4];
    }

    for (int j = 0; j < jointCount; ++j) {
        double& angle = qpos[kJointPositionOffset + j];
        double& velocity = qvel[kJointVelocityOffset + j];

        const double limbTorque = data_.xfrcApplied[6 * (2 + j) + 4];
        const double torque = kGear * std::clamp(data_.ctrl[j], -1.0, 1.0) + limbTorque;
        const double acceleration =
            torque / kJointInertia - kJointStiffness * angle - kJointDamping * velocity;

        velocity += acceleration * dt;
        angle += velocity * dt;
        if (std::abs(angle) > spec_.jointLimit) {
            angle = std::copysign(spec_.jointLimit, angle);
            velocity = 0.0;
        }
    }

    // Vertical: gravity plus a spring-damper ground holding the torso at support height.
    const double support = supportHeight();
    double& z = qpos[kRootPosition + 2];
    double& vz = qvel[2];
    double az = -kGravity + force[2] / spec_.mass;
    if (z < support) {
        az += kGroundStiffness * (support - z) - kGroundDamping * vz;
    }
    vz += az * dt;
    z += vz * dt;
    if (z < 0.0) {
        z = 0.0;
        vz = std::max(vz, 0.0);
    }
    const bool grounded = z <= support + kContactTolerance;

    // Horizontal: alternating leg swing pushes the torso while grounded.
    double drive = 0.0;
    const int firstLeg = jointCount - spec_.legJointCount;
    for (int k = 0; k < spec_.legJointCount; ++k) {
        const double sign = (k % 2 == 0) ? 1.0 : -1.0;
        drive += sign * qvel[kJointVelocityOffset + firstLeg + k];
    }
    if (spec_.legJointCount > 0) {
        drive *= kPropulsionGain / spec_.legJointCount;
    }

    const double ax = (grounded ? drive : 0.0) - kDrag * qvel[0] + force[0] / spec_.mass;
    const double ay = -kDrag * qvel[1] + force[1] / spec_.mass;
    qvel[0] += ax * dt;
    qvel[1] += ay * dt;
    qpos[kRootPosition] += qvel[0] * dt;
    qpos[kRootPosition + 1] += qvel[1] * dt;

    // Pitch about y.
    double& pitchRate = qvel[kRootAngularVelocity + 1];
    const double pitchAngle = pitch();
    const double pitchAcceleration =
        -kPitchStiffness * pitchAngle - kPitchDamping * pitchRate + pitchTorque / spec_.mass;
    pitchRate += pitchAcceleration * dt;
    setPitch(pitchAngle + pitchRate * dt);

    data_.time += dt;
    forward();
}

void ArticulatedBodyEngine::resetData()
{
    clearData();
    data_.qpos[kRootPosition + 2] = spec_.standingHeight;
    setPitch(0.0);
    forward();
}

void ArticulatedBodyEngine::forward()
{
    const auto& qpos = data_.qpos;
    const int jointCount = spec_.jointCount;

    for (int axis = 0; axis < 3; ++axis) {
        data_.xpos[3 + axis] = qpos[kRootPosition + axis];
    }
    for (int i = 0; i < 4; ++i) {
        data_.xquat[4 + i] = qpos[kRootQuaternion + i];
    }

    for (int j = 0; j < jointCount; ++j) {
        const int body = 2 + j;
        const double angle = qpos[kJointPositionOffset + j];
        const double around = 2.0 * M_PI * j / jointCount;

        data_.xpos[3 * body] = qpos[0] + kLimbRadius * std::cos(around)
            + kLimbLength * std::sin(angle);
        data_.xpos[3 * body + 1] = qpos[1] + kLimbRadius * std::sin(around);
        data_.xpos[3 * body + 2] = qpos[2] - kLimbLength - kLimbLength * std::cos(angle);

        data_.xquat[4 * body] = std::cos(angle / 2.0);
        data_.xquat[4 * body + 1] = 0.0;
        data_.xquat[4 * body + 2] = std::sin(angle / 2.0);
        data_.xquat[4 * body + 3] = 0.0;
    }

    // Contact flags: the less-swung leg group carries the weight.
    const bool grounded = qpos[kRootPosition + 2] <= supportHeight() + kContactTolerance;
    double leftSwing = 0.0;
    double rightSwing = 0.0;
    const int firstLeg = jointCount - spec_.legJointCount;
    for (int k = 0; k < spec_.legJointCount; ++k) {
        const double swing = std::abs(qpos[kJointPositionOffset + firstLeg + k]);
        if (k % 2 == 0) {
            leftSwing += swing;
        }
        else {
            rightSwing += swing;
        }
    }
    const bool hasLegs = spec_.legJointCount > 0;
    data_.contacts[0] = (hasLegs && grounded && leftSwing <= rightSwing + 1e-9) ? 1.0 : 0.0;
    data_.contacts[1] = (hasLegs && grounded && rightSwing <= leftSwing + 1e-9) ? 1.0 : 0.0;
}

double ArticulatedBodyEngine::supportHeight() const
{
    if (spec_.legJointCount == 0) {
        return spec_.standingHeight;
    }

    double meanSwing = 0.0;
    const int firstLeg = spec_.jointCount - spec_.legJointCount;
    for (int k = 0; k < spec_.legJointCount; ++k) {
        meanSwing += std::abs(data_.qpos[kJointPositionOffset + firstLeg + k]);
    }
    meanSwing /= spec_.legJointCount;

    return spec_.standingHeight * (1.0 - kMaxCrouch * meanSwing / spec_.jointLimit);
}

double ArticulatedBodyEngine::pitch() const
{
    return 2.0
        * std::atan2(data_.qpos[kRootQuaternion + 2], data_.qpos[kRootQuaternion]);
}

void ArticulatedBodyEngine::setPitch(double angle)
{
    data_.qpos[kRootQuaternion] = std::cos(angle / 2.0);
    data_.qpos[kRootQuaternion + 1] = 0.0;
    data_.qpos[kRootQuaternion + 2] = std::sin(angle / 2.0);
    data_.qpos[kRootQuaternion + 3] = 0.0;
}

} // namespace SimPool
