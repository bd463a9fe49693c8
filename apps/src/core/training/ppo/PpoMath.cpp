#include "PpoMath.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace SimPool::Ppo {

namespace {

constexpr double kLogTwoPi = 1.8378770664093453;

} // namespace

GaeResult computeGae(
    const std::vector<double>& rewards,
    const std::vector<double>& values,
    const std::vector<bool>& dones,
    double lastValue,
    double gamma,
    double lambda)
{
    if (rewards.size() != values.size() || rewards.size() != dones.size()) {
        throw std::invalid_argument("computeGae: rewards, values and dones differ in length");
    }

    const size_t count = rewards.size();
    GaeResult result;
    result.advantages.assign(count, 0.0);
    result.returns.assign(count, 0.0);

    double nextAdvantage = 0.0;
    double nextValue = lastValue;
    for (size_t t = count; t-- > 0;) {
        const double notDone = dones[t] ? 0.0 : 1.0;
        const double delta = rewards[t] + gamma * nextValue * notDone - values[t];
        const double advantage = delta + gamma * lambda * nextAdvantage * notDone;

        result.advantages[t] = advantage;
        result.returns[t] = advantage + values[t];

        nextAdvantage = advantage;
        nextValue = values[t];
    }
    return result;
}

void standardize(std::vector<double>& values, double epsilon)
{
    if (values.empty()) {
        return;
    }
    const double mean =
        std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());

    double variance = 0.0;
    for (double v : values) {
        variance += (v - mean) * (v - mean);
    }
    variance /= static_cast<double>(values.size());
    const double stddev = std::sqrt(variance);

    for (double& v : values) {
        v = (v - mean) / (stddev + epsilon);
    }
}

double clippedSurrogate(double ratio, double advantage, double epsilon)
{
    const double clipped = std::clamp(ratio, 1.0 - epsilon, 1.0 + epsilon);
    return std::min(ratio * advantage, clipped * advantage);
}

double clippedSurrogateGradient(double ratio, double advantage, double epsilon)
{
    if (advantage >= 0.0 && ratio > 1.0 + epsilon) {
        return 0.0;
    }
    if (advantage < 0.0 && ratio < 1.0 - epsilon) {
        return 0.0;
    }
    return advantage;
}

double gaussianLogProb(
    const std::vector<double>& action,
    const std::vector<double>& mean,
    const std::vector<double>& logStd)
{
    if (action.size() != mean.size() || action.size() != logStd.size()) {
        throw std::invalid_argument("gaussianLogProb: dimension mismatch");
    }
    double logProb = 0.0;
    for (size_t i = 0; i < action.size(); ++i) {
        const double z = (action[i] - mean[i]) / std::exp(logStd[i]);
        logProb += -0.5 * z * z - logStd[i] - 0.5 * kLogTwoPi;
    }
    return logProb;
}

double gaussianEntropy(const std::vector<double>& logStd)
{
    double entropy = 0.0;
    for (double s : logStd) {
        entropy += 0.5 + 0.5 * kLogTwoPi + s;
    }
    return entropy;
}

double clipGradientNorm(std::vector<std::vector<double>*> gradients, double maxNorm)
{
    double sumSquares = 0.0;
    for (const auto* gradient : gradients) {
        for (double g : *gradient) {
            sumSquares += g * g;
        }
    }
    const double norm = std::sqrt(sumSquares);
    if (norm > maxNorm && norm > 0.0) {
        const double scale = maxNorm / norm;
        for (auto* gradient : gradients) {
            for (double& g : *gradient) {
                g *= scale;
            }
        }
    }
    return norm;
}

} // namespace SimPool::Ppo
