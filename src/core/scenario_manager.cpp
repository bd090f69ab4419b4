/**
 * @fileoverview scenario_manager.cpp
 * @brief Implementation of ScenarioManager.
 */

#include <vector>

#include "verlet/core/scenario_manager.hpp"
#include "verlet/scenarios/falling_points.hpp"
#include "verlet/scenarios/free_fall.hpp"
#include "verlet/scenarios/particle_pile.hpp"

void ScenarioManager::buildScenarioList() {
  scenarioList.clear();
  for (auto s : SimulatorConstants::getAllScenarios()) {
    scenarioList.emplace_back(s, SimulatorConstants::getScenarioName(s));
  }
}

const std::vector<std::pair<SimulatorConstants::SimulationType, std::string>>&
ScenarioManager::getScenarioList() const {
  return scenarioList;
}

void ScenarioManager::setInitialScenario(SimulatorConstants::SimulationType scenario) {
  currentScenario = scenario;
}

SimulatorConstants::SimulationType ScenarioManager::getCurrentScenario() const {
  return currentScenario;
}

std::unique_ptr<IScenario> ScenarioManager::createScenario(
    SimulatorConstants::SimulationType scenarioType) const {
  switch (scenarioType) {
    case SimulatorConstants::SimulationType::FALLING_POINTS:
      return std::make_unique<FallingPointsScenario>();

    case SimulatorConstants::SimulationType::FREE_FALL:
      return std::make_unique<FreeFallScenario>();

    case SimulatorConstants::SimulationType::PARTICLE_PILE:
      return std::make_unique<ParticlePileScenario>();

    default:
      return std::make_unique<FallingPointsScenario>();
  }
}
