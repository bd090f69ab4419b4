#pragma once

#include <string>
#include <vector>

/**
 * @brief Defines available ECS systems for the particle solver.
 */
namespace Systems {

/**
 * @enum SystemType
 * @brief The solver passes that can be activated in a scenario.
 *
 * Active systems run once per substep in the order they are listed.
 */
enum class SystemType {
    GRAVITY,
    VERLET_INTEGRATION,
    COLLISION,
    BOUNDARY,
};

/**
 * @brief The canonical substep pipeline: forces, integration, then
 *        pairwise collisions, then boundary containment.
 */
std::vector<SystemType> getDefaultSystems();

std::string getSystemName(SystemType type);

} // namespace Systems
