/**
 * @file scenario_config.hpp
 * @brief Solver configuration a scenario hands to the simulator.
 */

#pragma once

#include "verlet/core/system_config.hpp"
#include "verlet/systems/collision.hpp"
#include "verlet/systems/gravity.hpp"

/**
 * @struct ScenarioSystemConfig
 * @brief Shared solver parameters plus the system-specific configurations
 */
struct ScenarioSystemConfig {
    // Shared parameters used by all systems
    SharedSystemConfig sharedConfig;

    // System-specific configurations with sensible defaults
    Systems::GravityConfig gravityConfig;
    Systems::CollisionConfig collisionConfig;
};

/**
 * @brief Rejects configurations the solver cannot run.
 * @throws std::invalid_argument if Substeps < 1, Friction or Bounce is
 *         negative, or no system is active
 */
void validateScenarioSystemConfig(const ScenarioSystemConfig& cfg);
