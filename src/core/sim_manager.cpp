/**
 * @fileoverview sim_manager.cpp
 * @brief Implementation of SimManager.
 */

#include "verlet/core/sim_manager.hpp"

#include <iomanip>
#include <ostream>
#include <stdexcept>
#include <utility>

#include <SFML/System/Clock.hpp>

#include "verlet/components/basic.hpp"
#include "verlet/core/debug.hpp"
#include "verlet/core/profile.hpp"
#include "verlet/systems/systems.hpp"

SimManager::SimManager(std::ostream& out)
    : out(out),
      spawner(std::make_unique<SpawnScheduler>()),
      coordinates(SimulatorConstants::GameScale),
      // sf::Time counts whole microseconds, so a 60 Hz frame is 16666 us and
      // 60 frames fall 40 us short of a second. Timers crossing an exact
      // second boundary fire one frame later than real time.
      frameTime(sf::microseconds(1000000 / SimulatorConstants::StepsPerSecond)),
      reportInterval(SimulatorConstants::StepsPerSecond),
      frameCount(0)
{
  scenarioManager.buildScenarioList();
}

void SimManager::selectScenario(SimulatorConstants::SimulationType scenario) {
  auto scenarioPtr = scenarioManager.createScenario(scenario);

  Components::Bounds const newBounds = scenarioPtr->getBounds();
  if (!newBounds.isValid()) {
    throw std::invalid_argument("Scenario " + SimulatorConstants::getScenarioName(scenario) +
                                " has inverted bounds");
  }

  // Both throw before any state changes if the scenario is rejected
  auto newSpawner = std::make_unique<SpawnScheduler>(scenarioPtr->getSpawnConfig());
  simulator.applyConfig(scenarioPtr->getSystemsConfig());

  scenarioManager.setInitialScenario(scenario);
  bounds = newBounds;
  spawner = std::move(newSpawner);
  frameCount = 0;

  registry.clear();
  scenarioPtr->createEntities(registry);

  DebugStats::reset();
  Profiling::Profiler::reset();

  out << "Loaded scenario " << SimulatorConstants::getScenarioName(scenario)
      << " with " << registry.view<Components::ParticleId>().size() << " particles" << std::endl;

  const auto& shared = simulator.getConfig().sharedConfig;
  out << "Pipeline (" << shared.Substeps << " substeps):";
  for (auto type : shared.activeSystems) {
    out << " " << Systems::getSystemName(type);
  }
  out << std::endl;
}

void SimManager::tick() {
  PROFILE_SCOPE("SimManager::tick");

  // Spawns land between frames so the particle set is fixed during a step
  spawner->tick(registry, frameTime);
  simulator.step(registry, bounds, frameTime.asSeconds());
  frameCount++;
}

void SimManager::run(unsigned int frames) {
  sf::Clock wallClock;

  for (unsigned int i = 0; i < frames; ++i) {
    tick();
    if (reportInterval > 0 && frameCount % reportInterval == 0) {
      printParticles();
    }
  }

  sf::Time const wall = wallClock.getElapsedTime();
  double const tps = wall > sf::Time::Zero ? frames / static_cast<double>(wall.asSeconds()) : 0.0;

  std::ios_base::fmtflags const flags = out.flags();
  std::streamsize const precision = out.precision();

  out << "\nRan " << frames << " frames (" << frames * frameTime.asSeconds()
      << " s simulated) in " << wall.asMilliseconds() << " ms, "
      << std::fixed << std::setprecision(1) << tps << " frames/s" << std::endl;
  out.flags(flags);
  out.precision(precision);

  DebugStats::printContactStats(out);
  Profiling::Profiler::printStats(out);
}

void SimManager::printParticles() const {
  std::ios_base::fmtflags const flags = out.flags();
  std::streamsize const precision = out.precision();

  out << "[frame " << frameCount << "]" << std::endl;

  auto view = registry.view<const Components::ParticleId,
                            const Components::Position,
                            const Components::Radius>();
  for (auto [entity, id, pos, radius] : view.each()) {
    Position const display = coordinates.unitsToDisplay(pos);
    out << "  id=" << std::setw(3) << id.value
        << " pos=(" << std::fixed << std::setprecision(2) << display.x << ", " << display.y << ")"
        << " r=" << coordinates.unitsToDisplay(radius.value) << std::endl;
  }
  out.flags(flags);
  out.precision(precision);
}

SimulatorConstants::SimulationType SimManager::getCurrentScenarioType() const {
  return scenarioManager.getCurrentScenario();
}
