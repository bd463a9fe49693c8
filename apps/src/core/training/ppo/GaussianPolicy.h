#pragma once

#include "core/training/Mlp.h"

#include <random>
#include <vector>

namespace SimPool::Ppo {

struct PolicySample {
    std::vector<double> action;
    std::vector<double> mean;
    double logProb = 0.0;
};

/**
 * Diagonal Gaussian policy with a bounded mean.
 *
 * The mean is tanh of the network output. The log standard deviation is a
 * learned state-independent vector clamped to [minLogStd, maxLogStd].
 */
class GaussianPolicy {
public:
    GaussianPolicy() = default;
    GaussianPolicy(
        size_t stateSize,
        size_t actionSize,
        int hiddenSize,
        double initialLogStd,
        double minLogStd,
        double maxLogStd);

    void initialize(std::mt19937& rng);

    std::vector<double> mean(const std::vector<double>& state) const;
    std::vector<double> mean(const std::vector<double>& state, Mlp::Trace& trace) const;

    // Actions are clipped to +-kActionLimit after sampling.
    PolicySample sample(const std::vector<double>& state, std::mt19937& rng) const;

    double logProb(const std::vector<double>& action, const std::vector<double>& mean) const;
    double entropy() const;

    std::vector<double> logStd() const;
    std::vector<double>& rawLogStd() { return logStd_; }
    void setLogStd(std::vector<double> logStd);
    void clampLogStd();

    bool allFinite() const;

    Mlp& network() { return network_; }
    const Mlp& network() const { return network_; }
    size_t actionSize() const { return network_.outputSize(); }
    size_t stateSize() const { return network_.inputSize(); }

    static constexpr double kActionLimit = 1.0 - 1e-6;

private:
    Mlp network_;
    std::vector<double> logStd_;
    double initialLogStd_ = -0.5;
    double minLogStd_ = -5.0;
    double maxLogStd_ = 2.0;
};

} // namespace SimPool::Ppo
