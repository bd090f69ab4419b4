/**
 * @file particle_pile.hpp
 * @brief A staggered grid of particles dropped into a box
 */

#pragma once

#include "verlet/scenarios/i_scenario.hpp"

/**
 * @class ParticlePileScenario
 *
 * Rows of particles, every other row shifted by half a spacing, so they
 * land on each other and exercise the collision pass.
 */
class ParticlePileScenario : public IScenario {
public:
    ParticlePileScenario() = default;
    ~ParticlePileScenario() override = default;

    ScenarioSystemConfig getSystemsConfig() const override;
    Components::Bounds getBounds() const override;
    void createEntities(entt::registry &registry) const override;

    static constexpr int KRows = 5;
    static constexpr int KColumns = 6;
};
