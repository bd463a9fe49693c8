#include "PhysicsEngineFactory.h"
#include "ArticulatedBodyEngine.h"
#include "PendulumEngine.h"

#include <stdexcept>

namespace SimPool {

std::unique_ptr<PhysicsEngine> createPhysicsEngine(Environment::EnumType type)
{
    switch (type) {
        case Environment::EnumType::Humanoid:
            return std::make_unique<ArticulatedBodyEngine>(ArticulatedBodyEngine::humanoidSpec());
        case Environment::EnumType::Pendulum:
            return std::make_unique<PendulumEngine>();
        case Environment::EnumType::Ant:
            return std::make_unique<ArticulatedBodyEngine>(ArticulatedBodyEngine::antSpec());
        case Environment::EnumType::Cheetah:
            return std::make_unique<ArticulatedBodyEngine>(ArticulatedBodyEngine::cheetahSpec());
    }
    throw std::invalid_argument("Unhandled environment type");
}

} // namespace SimPool
