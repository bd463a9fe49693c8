#pragma once

#include "EnvironmentType.h"
#include "PhysicsEngine.h"

#include <functional>
#include <memory>

namespace SimPool {

// Builds the engine hosting one environment. May throw to refuse the environment.
using EngineFactory =
    std::function<std::unique_ptr<PhysicsEngine>(Environment::EnumType type, int envId)>;

std::unique_ptr<PhysicsEngine> createPhysicsEngine(Environment::EnumType type);

} // namespace SimPool
