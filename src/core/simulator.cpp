/**
 * @file simulator.cpp
 * @brief Implementation of VerletSimulator.
 */

#include "verlet/core/simulator.hpp"

#include <memory>

#include "verlet/core/debug.hpp"
#include "verlet/core/profile.hpp"
#include "verlet/systems/boundary.hpp"
#include "verlet/systems/collision.hpp"
#include "verlet/systems/gravity.hpp"
#include "verlet/systems/verlet.hpp"

VerletSimulator::VerletSimulator() {
  createSystems();
}

VerletSimulator::~VerletSimulator() = default;

void VerletSimulator::applyConfig(const ScenarioSystemConfig& cfg) {
  validateScenarioSystemConfig(cfg);

  currentConfig = cfg;
  createSystems();
}

void VerletSimulator::createSystems() {
  systems.clear();

  for (auto type : currentConfig.sharedConfig.activeSystems) {
    switch (type) {
      case Systems::SystemType::GRAVITY: {
        auto gravity = std::make_unique<Systems::GravitySystem>();
        gravity->setSpecificConfig(currentConfig.gravityConfig);
        systems.push_back(std::move(gravity));
        break;
      }
      case Systems::SystemType::VERLET_INTEGRATION:
        systems.push_back(std::make_unique<Systems::VerletIntegrationSystem>());
        break;
      case Systems::SystemType::COLLISION: {
        auto collision = std::make_unique<Systems::CollisionSystem>();
        collision->setSpecificConfig(currentConfig.collisionConfig);
        systems.push_back(std::move(collision));
        break;
      }
      case Systems::SystemType::BOUNDARY:
        systems.push_back(std::make_unique<Systems::BoundarySystem>());
        break;
    }
  }

  // Configure all systems
  for (auto& system : systems) {
    system->setSystemConfig(currentConfig.sharedConfig);
  }
}

void VerletSimulator::step(entt::registry& registry, const Components::Bounds& bounds, double dtFrame) {
  PROFILE_SCOPE("VerletSimulator::step");

  const int substeps = currentConfig.sharedConfig.Substeps;
  const Systems::SubstepContext ctx{bounds, dtFrame / substeps};

  DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[VerletSimulator] frame dt=" << dtFrame
            << " substeps=" << substeps << " sub_dt=" << ctx.dt << "\n");

  for (int i = 0; i < substeps; ++i) {
    for (auto& system : systems) {
      system->update(registry, ctx);
    }
  }
}
