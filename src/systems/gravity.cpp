/**
 * @file gravity.cpp
 * @brief Implementation of the uniform gravity system
 */

#include "verlet/core/profile.hpp"
#include "verlet/systems/gravity.hpp"
#include "verlet/systems/verlet.hpp"
#include "verlet/components/basic.hpp"

namespace Systems {

GravitySystem::GravitySystem() = default;

void GravitySystem::update(entt::registry& registry, const SubstepContext& /*ctx*/) {
    PROFILE_SCOPE("GravitySystem");

    double const gravity = specificConfig.gravitationalAcceleration;

    for (auto [entity, acc] : registry.view<Components::Acceleration>().each()) {
        VerletIntegrationSystem::applyAcceleration(acc, 0.0, gravity);
    }
}

} // namespace Systems
