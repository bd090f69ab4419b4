#pragma once

#include <entt/entt.hpp>
#include "verlet/components/basic.hpp"

namespace Entities {

/**
 * Factory for creating particles in the simulation registry.
 */
class EntityFactory {
public:
    /**
     * Creates a particle entity with Verlet state.
     *
     * The previous position is set to position - velocity, so the first
     * integration sees exactly the requested velocity (in units per substep).
     * The acceleration accumulator starts at zero.
     *
     * @param registry The entity registry
     * @param id Caller-assigned particle id, unique within the registry
     * @param position Initial position of the particle
     * @param velocity Initial displacement per substep
     * @param radius Radius of the particle
     * @param color Display tag, ignored by the solver
     * @return The created entity
     */
    static entt::entity createParticle(
        entt::registry& registry,
        int id,
        const Components::Position& position,
        const Vector& velocity = Vector(),
        double radius = 1.0,
        const Components::Color& color = Components::Color()
    );

    /**
     * Same as createParticle, with plain coordinates.
     */
    static entt::entity createParticle(
        entt::registry& registry,
        int id,
        double x, double y,
        double velocityX, double velocityY
    );
};

} // namespace Entities
