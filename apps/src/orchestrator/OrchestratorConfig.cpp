#include "OrchestratorConfig.h"

namespace SimPool {

std::optional<std::string> validate(const OrchestratorConfig& config)
{
    if (config.numEnvironments < 1) {
        return "numEnvironments must be at least 1";
    }
    if (config.numUnits < 1) {
        return "numUnits must be at least 1";
    }
    if (config.numUnits > config.numEnvironments) {
        return "numUnits must not exceed numEnvironments";
    }
    if (config.physicsHz <= 0.0 || config.renderHz <= 0.0) {
        return "physicsHz and renderHz must be positive";
    }
    if (config.requestTimeoutMs <= 0) {
        return "requestTimeoutMs must be positive";
    }
    if (config.maxEpisodeSteps < 1) {
        return "maxEpisodeSteps must be at least 1";
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, const OrchestratorConfig& config)
{
    j = nlohmann::json{ { "numEnvironments", config.numEnvironments },
                        { "numUnits", config.numUnits },
                        { "environmentType", config.environmentType },
                        { "physicsHz", config.physicsHz },
                        { "renderHz", config.renderHz },
                        { "requestTimeoutMs", config.requestTimeoutMs },
                        { "maxEpisodeSteps", config.maxEpisodeSteps },
                        { "policyNoise", config.policyNoise },
                        { "randomActionScale", config.randomActionScale },
                        { "seed", config.seed } };
}

void from_json(const nlohmann::json& j, OrchestratorConfig& config)
{
    config.numEnvironments = j.value("numEnvironments", config.numEnvironments);
    config.numUnits = j.value("numUnits", config.numUnits);
    if (j.contains("environmentType")) {
        j.at("environmentType").get_to(config.environmentType);
    }
    config.physicsHz = j.value("physicsHz", config.physicsHz);
    config.renderHz = j.value("renderHz", config.renderHz);
    config.requestTimeoutMs = j.value("requestTimeoutMs", config.requestTimeoutMs);
    config.maxEpisodeSteps = j.value("maxEpisodeSteps", config.maxEpisodeSteps);
    config.policyNoise = j.value("policyNoise", config.policyNoise);
    config.randomActionScale = j.value("randomActionScale", config.randomActionScale);
    config.seed = j.value("seed", config.seed);
}

} // namespace SimPool
