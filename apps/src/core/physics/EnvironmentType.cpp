#include "EnvironmentType.h"

#include <array>
#include <stdexcept>
#include <utility>

namespace SimPool::Environment {

namespace {

constexpr std::array<std::pair<EnumType, const char*>, 4> kNames{ {
    { EnumType::Humanoid, "humanoid" },
    { EnumType::Pendulum, "pendulum" },
    { EnumType::Ant, "ant" },
    { EnumType::Cheetah, "cheetah" },
} };

} // namespace

std::string toString(EnumType type)
{
    for (const auto& [value, name] : kNames) {
        if (value == type) {
            return name;
        }
    }
    return "unknown";
}

std::optional<EnumType> fromString(const std::string& str)
{
    for (const auto& [value, name] : kNames) {
        if (str == name) {
            return value;
        }
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, const EnumType& type)
{
    j = toString(type);
}

void from_json(const nlohmann::json& j, EnumType& type)
{
    if (!j.is_string()) {
        throw std::runtime_error("Environment type must be a string.");
    }

    const auto parsed = fromString(j.get<std::string>());
    if (!parsed.has_value()) {
        throw std::runtime_error("Invalid environment type: " + j.get<std::string>());
    }
    type = parsed.value();
}

} // namespace SimPool::Environment
