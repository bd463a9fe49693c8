#include "RolloutBuffer.h"

#include <utility>

namespace SimPool::Ppo {

void RolloutBuffer::add(int envId, Transition transition)
{
    trajectories_[envId].push_back(std::move(transition));
    size_++;
}

std::vector<Transition*> RolloutBuffer::flatten()
{
    std::vector<Transition*> all;
    all.reserve(size_);
    for (auto& [envId, trajectory] : trajectories_) {
        for (auto& transition : trajectory) {
            all.push_back(&transition);
        }
    }
    return all;
}

void RolloutBuffer::clear()
{
    trajectories_.clear();
    size_ = 0;
}

} // namespace SimPool::Ppo
