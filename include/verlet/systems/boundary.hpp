/**
 * @file boundary.hpp
 * @brief Rectangular boundary constraint for Verlet particles
 *
 * This system handles:
 * - Clamping a particle back onto the edge it crossed
 * - Reflecting the implicit velocity by rewriting PreviousPosition
 * - Attenuating the reflection with Friction and Bounce
 *
 * The constraint is called by the Verlet integrator after every move, and
 * the system itself runs as the last pass of a substep to catch particles
 * pushed out by collision correction.
 *
 * Required components:
 * - Position (to read/modify)
 * - PreviousPosition (to read/modify)
 */

#ifndef VERLET_BOUNDARY_SYSTEM_HPP
#define VERLET_BOUNDARY_SYSTEM_HPP

#include <entt/entt.hpp>
#include "verlet/components/basic.hpp"
#include "verlet/components/bounds.hpp"
#include "verlet/systems/i_system.hpp"

namespace Systems {

enum class Axis {
    Horizontal,
    Vertical
};

/**
 * @class BoundarySystem
 * @brief Keeps particles inside the simulation bounds
 */
class BoundarySystem : public ISystem {
public:
    BoundarySystem();
    ~BoundarySystem() override = default;

    /**
     * @brief Constrains every particle; no-op for particles already inside.
     */
    void update(entt::registry &registry, const SubstepContext& ctx) override;

    /**
     * @brief Constrains one axis of one particle.
     *
     * On overshoot past max (or min) the position is clamped to the edge and
     * the previous position is placed on the far side of it:
     *   previous = edge + (position - previous) * friction * bounce
     * so the next implicit velocity points back inside. The velocity is
     * taken from the raw delta at clamp time.
     *
     * Friction is applied here even though the integrator already damped the
     * same velocity this substep. Both applications are intended.
     *
     * @return true if the particle was clamped
     */
    static bool constrainAxis(Components::Position& pos,
                              Components::PreviousPosition& prev,
                              const Components::Bounds& bounds,
                              Axis axis,
                              double friction,
                              double bounce);

    /**
     * @brief Horizontal axis, then vertical axis.
     * @return number of axes clamped (0-2)
     */
    static int constrain(Components::Position& pos,
                         Components::PreviousPosition& prev,
                         const Components::Bounds& bounds,
                         double friction,
                         double bounce);
};

} // namespace Systems

#endif
