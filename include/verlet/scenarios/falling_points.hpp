/**
 * @file falling_points.hpp
 * @brief One point thrown sideways into a tall box, with a new point every few seconds
 */

#pragma once

#include "verlet/scenarios/i_scenario.hpp"

/**
 * @class FallingPointsScenario
 *
 * A 21 x 50 box. A blue point starts at (5, 20) moving right, and a red
 * point is dropped from (0, 20) every 5 seconds with ids counting up from 10.
 */
class FallingPointsScenario : public IScenario {
public:
    FallingPointsScenario() = default;
    ~FallingPointsScenario() override = default;

    ScenarioSystemConfig getSystemsConfig() const override;
    Components::Bounds getBounds() const override;
    SpawnConfig getSpawnConfig() const override;
    void createEntities(entt::registry &registry) const override;
};
