/**
 * @file gravity.hpp
 * @brief Uniform gravity for the particle solver
 *
 * Adds a constant vertical acceleration into every particle's accumulator
 * once per substep. The integrator consumes and clears it.
 *
 * Required components:
 * - Acceleration (to modify)
 */

#ifndef VERLET_GRAVITY_SYSTEM_HPP
#define VERLET_GRAVITY_SYSTEM_HPP

#include <entt/entt.hpp>
#include "verlet/core/constants.hpp"
#include "verlet/systems/i_system.hpp"

namespace Systems {

/**
 * @struct GravityConfig
 * @brief Configuration parameters specific to the gravity system
 */
struct GravityConfig {
    // Vertical acceleration in simulation units/s^2 (negative is down)
    double gravitationalAcceleration = SimulatorConstants::Gravity;
};

/**
 * @class GravitySystem
 * @brief System that applies uniform gravitational acceleration
 */
class GravitySystem : public ConfigurableSystem<GravityConfig> {
public:
    GravitySystem();
    ~GravitySystem() override = default;

    void update(entt::registry& registry, const SubstepContext& ctx) override;
};

} // namespace Systems

#endif
