#pragma once

#include <vector>
#include "verlet/core/constants.hpp"
#include "verlet/systems/systems.hpp"

/**
 * @struct SharedSystemConfig
 * @brief Holds the solver parameters shared by all systems.
 */
struct SharedSystemConfig {
    // Per-substep velocity damping, also reapplied on wall reflection
    double Friction = SimulatorConstants::Friction;

    // Fraction of reflected velocity kept after a wall bounce
    double Bounce = SimulatorConstants::Bounce;

    int Substeps = SimulatorConstants::Substeps;

    std::vector<Systems::SystemType> activeSystems = Systems::getDefaultSystems();
};
