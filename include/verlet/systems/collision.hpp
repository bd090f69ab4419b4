/**
 * @file collision.hpp
 * @brief Pairwise circle collision with positional correction
 *
 * This system handles:
 * - Exhaustive O(n^2) overlap checks between every unordered particle pair
 * - Pushing overlapping pairs apart along the contact normal
 *
 * No velocities or masses are involved. All particles weigh the same and
 * each member of a pair moves half of the (friction-scaled) penetration.
 * Because velocity is implicit, the displacement also changes the velocity
 * seen by the next integration.
 *
 * Pairs are visited in ascending ParticleId order, (i, j) with i < j, so a
 * run is reproducible regardless of registry storage order.
 *
 * Required components:
 * - ParticleId (ordering)
 * - Position (to modify)
 * - Radius (to read)
 */

#ifndef VERLET_COLLISION_SYSTEM_HPP
#define VERLET_COLLISION_SYSTEM_HPP

#include <entt/entt.hpp>
#include "verlet/components/basic.hpp"
#include "verlet/core/constants.hpp"
#include "verlet/systems/i_system.hpp"

namespace Systems {

/**
 * @brief What to do with two particles whose centres coincide.
 */
enum class DegenerateContactPolicy {
    SeparateAlongX,  // use normal (1, 0); the first particle of the pair moves to +x
    Skip             // leave the pair untouched
};

/**
 * @struct CollisionConfig
 * @brief Configuration parameters specific to the collision system
 */
struct CollisionConfig {
    DegenerateContactPolicy degeneratePolicy = DegenerateContactPolicy::SeparateAlongX;

    // Centre distance below which the normal is considered undefined
    double degenerateDistance = SimulatorConstants::Epsilon;
};

/**
 * @class CollisionSystem
 * @brief Detects and resolves overlapping particle pairs
 */
class CollisionSystem : public ConfigurableSystem<CollisionConfig> {
public:
    CollisionSystem();
    ~CollisionSystem() override = default;

    void update(entt::registry &registry, const SubstepContext& ctx) override;

    static double distance(const Components::Position& a, const Components::Position& b);

    /**
     * @brief True when the circles strictly overlap (touching is not a collision).
     */
    static bool colliding(const Components::Position& a, double radiusA,
                          const Components::Position& b, double radiusB);

    /**
     * @brief Separates an overlapping pair.
     *
     * a += 0.5 * delta * n * friction, b -= 0.5 * delta * n * friction,
     * where n = (a - b) / distance and delta = radiusA + radiusB - distance.
     *
     * @return false if the pair was left untouched (degenerate pair under
     *         DegenerateContactPolicy::Skip)
     */
    static bool resolve(Components::Position& a, double radiusA,
                        Components::Position& b, double radiusB,
                        double friction,
                        const CollisionConfig& config = CollisionConfig());
};

} // namespace Systems

#endif
