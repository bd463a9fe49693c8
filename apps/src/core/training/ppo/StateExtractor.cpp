#include "StateExtractor.h"

#include <cmath>

namespace SimPool::Ppo {

namespace {

void appendPadded(std::vector<double>& out, const std::vector<double>& values, size_t count)
{
    for (size_t i = 0; i < count; ++i) {
        const double v = i < values.size() ? values[i] : 0.0;
        out.push_back(std::isfinite(v) ? v : 0.0);
    }
}

} // namespace

StateExtractor::StateExtractor(size_t stateSize) : stateSize_(stateSize)
{}

std::vector<double> StateExtractor::extract(const Observation& observation) const
{
    std::vector<double> state;
    state.reserve(kDefaultSize);

    appendPadded(state, observation.qpos, kQposSize);
    appendPadded(state, observation.qvel, kQvelSize);
    appendPadded(state, observation.bodyPos, 3);

    // Torso is body 1; body 0 is the world.
    std::vector<double> rootQuat{ 1.0, 0.0, 0.0, 0.0 };
    if (observation.xquat.size() >= 8) {
        rootQuat.assign(observation.xquat.begin() + 4, observation.xquat.begin() + 8);
    }
    appendPadded(state, rootQuat, 4);
    appendPadded(state, observation.contacts, kContactSize);

    state.resize(stateSize_, 0.0);
    return state;
}

} // namespace SimPool::Ppo
