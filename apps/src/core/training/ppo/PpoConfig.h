#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace SimPool {

/**
 * Hyperparameters for the PPO trainer.
 */
struct PpoConfig {
    double gamma = 0.99;
    double lambda = 0.95;        // GAE smoothing.
    double clipEpsilon = 0.2;
    int epochs = 10;
    double learningRate = 3e-4;
    int hiddenSize = 256;        // Width of both hidden layers, actor and critic.
    double valueCoefficient = 0.5;
    double entropyCoefficient = 0.01;
    double maxGradNorm = 0.5;
    int rolloutSize = 2048;      // Transitions across all environments per update.
    int minibatchSize = 64;

    int stateSize = 83;
    double initialLogStd = -0.5;
    double minLogStd = -5.0;
    double maxLogStd = 2.0;
    double advantageEpsilon = 1e-8;

    std::string reward = "task"; // "task" or "standing".
    uint32_t seed = 42;
};

std::optional<std::string> validate(const PpoConfig& config);

void to_json(nlohmann::json& j, const PpoConfig& config);
void from_json(const nlohmann::json& j, PpoConfig& config);

} // namespace SimPool
