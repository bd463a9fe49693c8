#pragma once

/**
 * \file
 * Type-safe environment kind identifier.
 * Each value selects one reference engine in PhysicsEngineFactory.
 */

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace SimPool::Environment {

enum class EnumType : uint8_t {
    Humanoid = 0,
    Pendulum,
    Ant,
    Cheetah,
};

// Wire name, e.g. "humanoid".
std::string toString(EnumType type);

std::optional<EnumType> fromString(const std::string& str);

void to_json(nlohmann::json& j, const EnumType& type);
void from_json(const nlohmann::json& j, EnumType& type);

} // namespace SimPool::Environment
