/**
 * @file verlet.hpp
 * @brief Position Verlet integrator
 *
 * This system handles:
 * - Deriving velocity from Position - PreviousPosition
 * - Damping it by Friction once per substep
 * - Moving the particle by velocity + acceleration * dt^2
 * - Clearing the acceleration accumulator
 * - Applying the boundary constraint
 *
 * Required components:
 * - Position (to modify)
 * - PreviousPosition (to modify)
 * - Acceleration (to read and clear)
 */

#ifndef VERLET_INTEGRATION_SYSTEM_HPP
#define VERLET_INTEGRATION_SYSTEM_HPP

#include <entt/entt.hpp>
#include "verlet/components/basic.hpp"
#include "verlet/components/bounds.hpp"
#include "verlet/systems/i_system.hpp"

namespace Systems {

/**
 * @class VerletIntegrationSystem
 * @brief Advances every particle by one substep
 */
class VerletIntegrationSystem : public ISystem {
public:
    VerletIntegrationSystem();
    ~VerletIntegrationSystem() override = default;

    void update(entt::registry &registry, const SubstepContext& ctx) override;

    /**
     * @brief Adds an acceleration into the accumulator.
     *
     * Can be called several times before integrate() to superpose forces.
     */
    static void applyAcceleration(Components::Acceleration& acc, double ax, double ay);

    /**
     * @brief One Verlet substep for a single particle.
     *
     * Friction is applied to the implicit velocity here, once per substep,
     * so total damping depends on the substep count.
     */
    static void integrate(Components::Position& pos,
                          Components::PreviousPosition& prev,
                          Components::Acceleration& acc,
                          const Components::Bounds& bounds,
                          double dt,
                          double friction,
                          double bounce);

    /**
     * @brief Implicit velocity (per substep, not per second).
     */
    static Vector velocity(const Components::Position& pos,
                           const Components::PreviousPosition& prev);
};

} // namespace Systems

#endif
