/**
 * @fileoverview sim_manager.hpp
 * @brief Headless host: owns the particles, the bounds and the spawner, and
 *        drives the simulator frame by frame.
 */

#pragma once

#include <iosfwd>
#include <memory>

#include <SFML/System/Time.hpp>
#include <entt/entt.hpp>

#include "verlet/components/bounds.hpp"
#include "verlet/core/coordinates.hpp"
#include "verlet/core/scenario_manager.hpp"
#include "verlet/core/simulator.hpp"
#include "verlet/spawning/spawn_scheduler.hpp"

/**
 * @class SimManager
 * @brief Runs a scenario with a fixed frame time and reports particle state.
 *
 * Each frame the spawner runs first, then the simulator steps the whole
 * registry. Spawning therefore never happens in the middle of a step.
 */
class SimManager {
 public:
  explicit SimManager(std::ostream& out);

  /**
   * @brief Loads a scenario, replacing all particles.
   * @throws std::invalid_argument if the scenario's bounds or configuration
   *         are invalid
   */
  void selectScenario(SimulatorConstants::SimulationType scenario);

  /**
   * @brief Runs the given number of frames, printing particle positions every
   *        reportInterval frames and timing/contact statistics at the end.
   */
  void run(unsigned int frames);

  /**
   * @brief Advances one frame: spawn, then step.
   */
  void tick();

  /**
   * @brief Prints every particle's id and position in display units.
   */
  void printParticles() const;

  void setReportInterval(unsigned int frames) { reportInterval = frames; }
  void setFrameTime(sf::Time dt) { frameTime = dt; }
  sf::Time getFrameTime() const { return frameTime; }

  entt::registry& getRegistry() { return registry; }
  const entt::registry& getRegistry() const { return registry; }
  const Components::Bounds& getBounds() const { return bounds; }
  const VerletSimulator& getSimulator() const { return simulator; }
  const SpawnScheduler& getSpawner() const { return *spawner; }
  unsigned long getFrameCount() const { return frameCount; }
  SimulatorConstants::SimulationType getCurrentScenarioType() const;

 private:
  std::ostream& out;

  entt::registry registry;
  Components::Bounds bounds;
  VerletSimulator simulator;
  ScenarioManager scenarioManager;
  std::unique_ptr<SpawnScheduler> spawner;
  Simulation::Coordinates coordinates;

  sf::Time frameTime;
  unsigned int reportInterval;
  unsigned long frameCount;
};
