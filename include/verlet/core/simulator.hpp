/**
 * @file simulator.hpp
 * @brief Frame stepper that runs the solver systems over a caller-owned registry.
 */

#pragma once

#include <memory>
#include <vector>
#include <entt/entt.hpp>
#include "verlet/components/bounds.hpp"
#include "verlet/scenarios/scenario_config.hpp"
#include "verlet/systems/i_system.hpp"

/**
 * @class VerletSimulator
 * @brief Splits a frame into substeps and runs the active systems on each.
 *
 * The simulator owns its systems and configuration only. Particles live in
 * the registry passed to step(), and the bounds are passed with it, so the
 * same simulator can advance any number of independent registries.
 *
 * Per substep, with the default pipeline:
 *   1. gravity is added to every accumulator
 *   2. every particle is integrated (and constrained to the bounds)
 *   3. every unordered pair is checked and resolved
 *   4. particles pushed out by step 3 are constrained again
 * All particles finish a stage before the next stage starts.
 *
 * Particles must not be added or removed while step() runs.
 */
class VerletSimulator {
public:
    VerletSimulator();
    ~VerletSimulator();

    /**
     * @brief Validates the configuration and rebuilds the system pipeline.
     * @throws std::invalid_argument on an invalid configuration; the previous
     *         configuration stays in effect
     */
    void applyConfig(const ScenarioSystemConfig& cfg);

    /**
     * @brief Advances all particles by one frame.
     * @param registry Particles to advance
     * @param bounds Rectangle the particles are kept inside
     * @param dtFrame Frame duration in seconds
     */
    void step(entt::registry& registry, const Components::Bounds& bounds, double dtFrame);

    const ScenarioSystemConfig& getConfig() const { return currentConfig; }

    /**
     * @brief Active systems in execution order.
     */
    const std::vector<std::unique_ptr<Systems::ISystem>>& getSystems() const { return systems; }

private:
    void createSystems();

    ScenarioSystemConfig currentConfig;
    std::vector<std::unique_ptr<Systems::ISystem>> systems;
};
