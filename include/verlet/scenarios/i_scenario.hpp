#ifndef VERLET_I_SCENARIO_HPP
#define VERLET_I_SCENARIO_HPP

#include <entt/entt.hpp>
#include "verlet/components/bounds.hpp"
#include "verlet/scenarios/scenario_config.hpp"
#include "verlet/spawning/spawn_scheduler.hpp"

/**
 * @brief Abstract base class for any simulation scenario
 *
 * Each scenario must provide:
 *  - getSystemsConfig() returning ScenarioSystemConfig
 *  - getBounds() for the container the particles live in
 *  - createEntities() that spawns the initial particles
 */
class IScenario {
public:
    virtual ~IScenario() = default;

    virtual ScenarioSystemConfig getSystemsConfig() const = 0;

    virtual Components::Bounds getBounds() const = 0;

    /**
     * @brief Periodic spawning; disabled unless a scenario overrides it.
     */
    virtual SpawnConfig getSpawnConfig() const { return SpawnConfig(); }

    /**
     * @brief Creates scenario-specific particles in the registry
     */
    virtual void createEntities(entt::registry &registry) const = 0;
};

#endif // VERLET_I_SCENARIO_HPP
