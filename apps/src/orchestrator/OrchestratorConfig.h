#pragma once

#include "core/physics/EnvironmentType.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace SimPool {

struct OrchestratorConfig {
    int numEnvironments = 4;
    int numUnits = 2;
    Environment::EnumType environmentType = Environment::EnumType::Humanoid;

    double physicsHz = 100.0; // Step commands per second.
    double renderHz = 30.0;   // Consumption ticks per second.

    int requestTimeoutMs = 5000;
    int maxEpisodeSteps = 1000; // Unit-side step budget per episode.

    double policyNoise = 0.05;       // Width of the uniform noise added to policy actions.
    double randomActionScale = 0.4;  // Width of the uniform random fallback actions.
    uint32_t seed = 42;
};

// Returns a description of the first invalid field, if any.
std::optional<std::string> validate(const OrchestratorConfig& config);

void to_json(nlohmann::json& j, const OrchestratorConfig& config);
void from_json(const nlohmann::json& j, OrchestratorConfig& config);

} // namespace SimPool
