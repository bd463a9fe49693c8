#pragma once

#include <map>
#include <optional>
#include <vector>

namespace SimPool::Ppo {

struct Transition {
    std::vector<double> state;
    std::vector<double> action;
    double reward = 0.0;
    std::vector<double> nextState;
    bool done = false;
    double logProb = 0.0;
    double value = 0.0;

    // Filled in by the advantage pass.
    std::optional<double> advantage;
    std::optional<double> valueTarget;
};

/**
 * Per-environment trajectories collected since the last policy update.
 * Trajectories stay separate so advantages never bleed across environments.
 */
class RolloutBuffer {
public:
    void add(int envId, Transition transition);

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    std::map<int, std::vector<Transition>>& trajectories() { return trajectories_; }
    const std::map<int, std::vector<Transition>>& trajectories() const { return trajectories_; }

    // Every transition, in environment then time order.
    std::vector<Transition*> flatten();

    void clear();

private:
    std::map<int, std::vector<Transition>> trajectories_;
    size_t size_ = 0;
};

} // namespace SimPool::Ppo
