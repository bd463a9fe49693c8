#include "GaussianPolicy.h"
#include "PpoMath.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace SimPool::Ppo {

GaussianPolicy::GaussianPolicy(
    size_t stateSize,
    size_t actionSize,
    int hiddenSize,
    double initialLogStd,
    double minLogStd,
    double maxLogStd)
    : network_(
          { static_cast<int>(stateSize), hiddenSize, hiddenSize, static_cast<int>(actionSize) },
          Activation::Tanh,
          Activation::Tanh),
      logStd_(actionSize, initialLogStd),
      initialLogStd_(initialLogStd),
      minLogStd_(minLogStd),
      maxLogStd_(maxLogStd)
{
    clampLogStd();
}

void GaussianPolicy::initialize(std::mt19937& rng)
{
    network_.initialize(rng);
    logStd_.assign(network_.outputSize(), initialLogStd_);
    clampLogStd();
}

std::vector<double> GaussianPolicy::mean(const std::vector<double>& state) const
{
    return network_.forward(state);
}

std::vector<double> GaussianPolicy::mean(const std::vector<double>& state, Mlp::Trace& trace) const
{
    return network_.forward(state, trace);
}

PolicySample GaussianPolicy::sample(const std::vector<double>& state, std::mt19937& rng) const
{
    PolicySample result;
    result.mean = mean(state);
    result.action.resize(result.mean.size());

    std::normal_distribution<double> noise(0.0, 1.0);
    for (size_t i = 0; i < result.mean.size(); ++i) {
        const double value = result.mean[i] + std::exp(logStd_[i]) * noise(rng);
        result.action[i] = std::clamp(value, -kActionLimit, kActionLimit);
    }
    result.logProb = logProb(result.action, result.mean);
    return result;
}

double GaussianPolicy::logProb(const std::vector<double>& action, const std::vector<double>& mean) const
{
    return gaussianLogProb(action, mean, logStd_);
}

double GaussianPolicy::entropy() const
{
    return gaussianEntropy(logStd_);
}

std::vector<double> GaussianPolicy::logStd() const
{
    return logStd_;
}

void GaussianPolicy::setLogStd(std::vector<double> logStd)
{
    if (logStd.size() != network_.outputSize()) {
        throw std::invalid_argument("logStd size does not match the action size");
    }
    logStd_ = std::move(logStd);
    clampLogStd();
}

void GaussianPolicy::clampLogStd()
{
    for (double& s : logStd_) {
        s = std::clamp(s, minLogStd_, maxLogStd_);
    }
}

bool GaussianPolicy::allFinite() const
{
    return network_.allFinite()
        && std::all_of(logStd_.begin(), logStd_.end(), [](double v) { return std::isfinite(v); });
}

} // namespace SimPool::Ppo
