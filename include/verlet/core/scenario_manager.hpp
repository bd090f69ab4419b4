/**
 * @fileoverview scenario_manager.hpp
 * @brief Maintains the list of available scenarios and creates scenario objects.
 */

#ifndef VERLET_SCENARIO_MANAGER_HPP
#define VERLET_SCENARIO_MANAGER_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "verlet/core/constants.hpp"
#include "verlet/scenarios/i_scenario.hpp"

/**
 * @class ScenarioManager
 * @brief Catalog of available scenarios and a factory to create them.
 */
class ScenarioManager {
 public:
  /**
   * @brief Builds an internal list of all available scenarios.
   */
  void buildScenarioList();

  const std::vector<std::pair<SimulatorConstants::SimulationType, std::string>>&
  getScenarioList() const;

  void setInitialScenario(SimulatorConstants::SimulationType scenario);

  SimulatorConstants::SimulationType getCurrentScenario() const;

  /**
   * @brief Creates a new scenario object of the specified type.
   * @param scenarioType The chosen scenario type.
   * @return A unique_ptr to a newly constructed scenario.
   */
  std::unique_ptr<IScenario> createScenario(
      SimulatorConstants::SimulationType scenarioType) const;

 private:
  std::vector<std::pair<SimulatorConstants::SimulationType, std::string>> scenarioList;
  SimulatorConstants::SimulationType currentScenario =
      SimulatorConstants::SimulationType::FALLING_POINTS;
};

#endif  // VERLET_SCENARIO_MANAGER_HPP
