/**
 * @file i_system.hpp
 * @brief Interface for all ECS systems in the particle solver
 */

#pragma once

#include <entt/entt.hpp>
#include "verlet/components/bounds.hpp"
#include "verlet/core/system_config.hpp"

namespace Systems {

/**
 * @struct SubstepContext
 * @brief Per-substep inputs handed to every system by the simulator.
 */
struct SubstepContext {
    Components::Bounds bounds;
    double dt = 0.0;  // substep duration in seconds
};

/**
 * @class ISystem
 * @brief Base interface for all ECS systems
 *
 * This interface ensures all systems have a common way to be updated and configured.
 * Systems are run by VerletSimulator once per substep, in pipeline order.
 */
class ISystem {
protected:
    SharedSystemConfig sysConfig;  // Common configuration all systems have

public:
    /**
     * @brief Virtual destructor for proper cleanup of derived classes
     */
    virtual ~ISystem() = default;

    /**
     * @brief Updates the system for one substep
     *
     * @param registry EnTT registry containing all particles
     * @param ctx Boundary and substep duration
     */
    virtual void update(entt::registry& registry, const SubstepContext& ctx) = 0;

    /**
     * @brief Sets the system configuration
     *
     * @param config System configuration parameters
     */
    virtual void setSystemConfig(const SharedSystemConfig& config) {
        sysConfig = config;
    }

    /**
     * @brief Gets the system configuration
     *
     * @return Current system configuration
     */
    virtual const SharedSystemConfig& getSystemConfig() const {
        return sysConfig;
    }
};

/**
 * @brief Template for system-specific configurations
 *
 * This template can be used by derived systems that need additional
 * configuration beyond the basic SharedSystemConfig.
 */
template<typename SpecificConfig>
class ConfigurableSystem : public ISystem {
protected:
    SpecificConfig specificConfig;

public:
    /**
     * @brief Sets the system-specific configuration
     *
     * @param config System-specific configuration parameters
     */
    void setSpecificConfig(const SpecificConfig& config) {
        specificConfig = config;
    }

    /**
     * @brief Gets the system-specific configuration
     *
     * @return Current system-specific configuration
     */
    const SpecificConfig& getSpecificConfig() const {
        return specificConfig;
    }
};

} // namespace Systems
