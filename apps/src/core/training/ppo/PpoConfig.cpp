#include "PpoConfig.h"

namespace SimPool {

std::optional<std::string> validate(const PpoConfig& config)
{
    if (config.gamma < 0.0 || config.gamma > 1.0 || config.lambda < 0.0 || config.lambda > 1.0) {
        return "gamma and lambda must be within [0, 1]";
    }
    if (config.clipEpsilon <= 0.0) {
        return "clipEpsilon must be positive";
    }
    if (config.epochs < 1 || config.rolloutSize < 1 || config.minibatchSize < 1) {
        return "epochs, rolloutSize and minibatchSize must be at least 1";
    }
    if (config.hiddenSize < 1 || config.stateSize < 1) {
        return "hiddenSize and stateSize must be at least 1";
    }
    if (config.minLogStd > config.maxLogStd) {
        return "minLogStd must not exceed maxLogStd";
    }
    if (config.reward != "task" && config.reward != "standing") {
        return "reward must be 'task' or 'standing'";
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, const PpoConfig& config)
{
    j = nlohmann::json{ { "gamma", config.gamma },
                        { "lambda", config.lambda },
                        { "clipEpsilon", config.clipEpsilon },
                        { "epochs", config.epochs },
                        { "learningRate", config.learningRate },
                        { "hiddenSize", config.hiddenSize },
                        { "valueCoefficient", config.valueCoefficient },
                        { "entropyCoefficient", config.entropyCoefficient },
                        { "maxGradNorm", config.maxGradNorm },
                        { "rolloutSize", config.rolloutSize },
                        { "minibatchSize", config.minibatchSize },
                        { "stateSize", config.stateSize },
                        { "initialLogStd", config.initialLogStd },
                        { "minLogStd", config.minLogStd },
                        { "maxLogStd", config.maxLogStd },
                        { "advantageEpsilon", config.advantageEpsilon },
                        { "reward", config.reward },
                        { "seed", config.seed } };
}

void from_json(const nlohmann::json& j, PpoConfig& config)
{
    config.gamma = j.value("gamma", config.gamma);
    config.lambda = j.value("lambda", config.lambda);
    config.clipEpsilon = j.value("clipEpsilon", config.clipEpsilon);
    config.epochs = j.value("epochs", config.epochs);
    config.learningRate = j.value("learningRate", config.learningRate);
    config.hiddenSize = j.value("hiddenSize", config.hiddenSize);
    config.valueCoefficient = j.value("valueCoefficient", config.valueCoefficient);
    config.entropyCoefficient = j.value("entropyCoefficient", config.entropyCoefficient);
    config.maxGradNorm = j.value("maxGradNorm", config.maxGradNorm);
    config.rolloutSize = j.value("rolloutSize", config.rolloutSize);
    config.minibatchSize = j.value("minibatchSize", config.minibatchSize);
    config.stateSize = j.value("stateSize", config.stateSize);
    config.initialLogStd = j.value("initialLogStd", config.initialLogStd);
    config.minLogStd = j.value("minLogStd", config.minLogStd);
    config.maxLogStd = j.value("maxLogStd", config.maxLogStd);
    config.advantageEpsilon = j.value("advantageEpsilon", config.advantageEpsilon);
    config.reward = j.value("reward", config.reward);
    config.seed = j.value("seed", config.seed);
}

} // namespace SimPool
