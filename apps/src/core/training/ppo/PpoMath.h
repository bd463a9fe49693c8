#pragma once

#include <vector>

namespace SimPool::Ppo {

struct GaeResult {
    std::vector<double> advantages;
    std::vector<double> returns;
};

/**
 * @brief Generalized advantage estimation over one trajectory segment.
 *
 * For t = T-1..0:
 *   delta_t = r_t + gamma * V(s_{t+1}) * (1 - done_t) - V(s_t)
 *   A_t     = delta_t + gamma * lambda * A_{t+1} * (1 - done_t)
 *   G_t     = A_t + V(s_t)
 * V(s_T) is lastValue. All input vectors must have the same length.
 */
GaeResult computeGae(
    const std::vector<double>& rewards,
    const std::vector<double>& values,
    const std::vector<bool>& dones,
    double lastValue,
    double gamma,
    double lambda);

// In place: zero mean, unit variance. Vectors shorter than 2 are only centered.
void standardize(std::vector<double>& values, double epsilon = 1e-8);

// min(ratio * A, clip(ratio, 1 - eps, 1 + eps) * A).
double clippedSurrogate(double ratio, double advantage, double epsilon);

// d clippedSurrogate / d ratio; zero where the clipped branch is active.
double clippedSurrogateGradient(double ratio, double advantage, double epsilon);

// Log density of a diagonal Gaussian, summed over dimensions.
double gaussianLogProb(
    const std::vector<double>& action,
    const std::vector<double>& mean,
    const std::vector<double>& logStd);

double gaussianEntropy(const std::vector<double>& logStd);

// Scales every gradient so the combined L2 norm is at most maxNorm. Returns the norm before clipping.
double clipGradientNorm(std::vector<std::vector<double>*> gradients, double maxNorm);

} // namespace SimPool::Ppo
