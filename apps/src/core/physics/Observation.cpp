#include "Observation.h"
#include "PhysicsEngine.h"

#include <algorithm>
#include <cmath>

namespace SimPool {

namespace {

bool allFinite(const std::vector<double>& values)
{
    return std::all_of(values.begin(), values.end(), [](double v) { return std::isfinite(v); });
}

void appendRange(
    std::vector<double>& out, const std::vector<double>& source, size_t begin, size_t end)
{
    for (size_t i = begin; i < end; ++i) {
        out.push_back(i < source.size() ? source[i] : 0.0);
    }
}

} // namespace

Observation captureObservation(const PhysicsEngine& engine)
{
    const auto& model = engine.model();
    const auto& data = engine.data();

    Observation observation;
    const size_t torso = static_cast<size_t>(model.torsoBody);
    observation.bodyPos.assign(
        data.xpos.begin() + 3 * torso, data.xpos.begin() + 3 * torso + 3);
    observation.qpos = data.qpos;
    observation.qvel = data.qvel;
    observation.xpos = data.xpos;
    observation.xquat = data.xquat;
    observation.time = data.time;
    observation.actions = data.ctrl;
    observation.contacts = data.contacts;
    return observation;
}

bool isFinite(const Observation& observation)
{
    return std::isfinite(observation.time) && allFinite(observation.bodyPos)
        && allFinite(observation.qpos) && allFinite(observation.qvel)
        && allFinite(observation.xpos) && allFinite(observation.xquat)
        && allFinite(observation.actions) && allFinite(observation.contacts);
}

std::vector<double> toPolicyInput(const Observation& observation, size_t size)
{
    std::vector<double> input;
    input.reserve(std::max<size_t>(size, 48));

    appendRange(input, observation.bodyPos, 0, 3);
    appendRange(input, observation.qvel, 0, 3);
    appendRange(input, observation.qpos, 7, 28);
    appendRange(input, observation.qvel, 6, 27);

    input.resize(size, 0.0);
    return input;
}

} // namespace SimPool
