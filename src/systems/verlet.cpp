/**
 * @file verlet.cpp
 * @brief Implementation of the Verlet integration system
 */

#include "verlet/systems/verlet.hpp"
#include "verlet/systems/boundary.hpp"
#include "verlet/core/profile.hpp"

namespace Systems {

VerletIntegrationSystem::VerletIntegrationSystem() = default;

void VerletIntegrationSystem::applyAcceleration(Components::Acceleration& acc, double ax, double ay) {
    acc.x += ax;
    acc.y += ay;
}

Vector VerletIntegrationSystem::velocity(const Components::Position& pos,
                                         const Components::PreviousPosition& prev) {
    return {pos.x - prev.x, pos.y - prev.y};
}

void VerletIntegrationSystem::integrate(Components::Position& pos,
                                        Components::PreviousPosition& prev,
                                        Components::Acceleration& acc,
                                        const Components::Bounds& bounds,
                                        double dt,
                                        double friction,
                                        double bounce) {
    Vector const vel = velocity(pos, prev) * friction;

    prev.x = pos.x;
    prev.y = pos.y;

    pos.x += vel.x + acc.x * dt * dt;
    pos.y += vel.y + acc.y * dt * dt;

    acc.x = 0.0;
    acc.y = 0.0;

    BoundarySystem::constrain(pos, prev, bounds, friction, bounce);
}

void VerletIntegrationSystem::update(entt::registry &registry, const SubstepContext& ctx) {
    PROFILE_SCOPE("VerletIntegrationSystem");

    auto view = registry.view<Components::Position,
                              Components::PreviousPosition,
                              Components::Acceleration>();

    for (auto &&[entity, pos, prev, acc] : view.each()) {
        integrate(pos, prev, acc, ctx.bounds, ctx.dt, sysConfig.Friction, sysConfig.Bounce);
    }
}

} // namespace Systems
