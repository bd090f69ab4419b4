/**
 * @file free_fall.hpp
 * @brief A single particle dropped onto the floor under strong gravity
 */

#pragma once

#include "verlet/scenarios/i_scenario.hpp"

/**
 * @class FreeFallScenario
 *
 * One particle at rest at (0, 50) with gravity -100 and the floor at y = -12.
 * The bounce decays and the particle ends up resting on the floor.
 */
class FreeFallScenario : public IScenario {
public:
    FreeFallScenario() = default;
    ~FreeFallScenario() override = default;

    ScenarioSystemConfig getSystemsConfig() const override;
    Components::Bounds getBounds() const override;
    void createEntities(entt::registry &registry) const override;
};
