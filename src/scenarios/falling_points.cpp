#include "verlet/scenarios/falling_points.hpp"
#include "verlet/entities/entity_factory.hpp"

#include <iostream>

static constexpr double KBoxWidth  = 21.0;
static constexpr double KBoxHeight = 50.0;

static constexpr int KFirstPointId = 0;
static constexpr int KFirstSpawnId = 10;

ScenarioSystemConfig FallingPointsScenario::getSystemsConfig() const
{
    // Solver defaults: gravity -9.8, friction 0.99, bounce 0.95, 8 substeps
    return ScenarioSystemConfig{};
}

Components::Bounds FallingPointsScenario::getBounds() const
{
    return {0.0, 0.0, KBoxWidth, KBoxHeight};
}

SpawnConfig FallingPointsScenario::getSpawnConfig() const
{
    SpawnConfig spawn;
    spawn.enabled = true;
    spawn.interval = sf::seconds(5.f);
    spawn.firstId = KFirstSpawnId;
    spawn.origin = Components::Position(0.0, 20.0);
    spawn.initialVelocity = Vector(0.05, 0.0);
    spawn.color = Components::Color(220, 40, 40);
    return spawn;
}

void FallingPointsScenario::createEntities(entt::registry &registry) const
{
    Entities::EntityFactory::createParticle(registry, KFirstPointId,
                                            Components::Position(5.0, 20.0),
                                            Vector(0.1, 0.0),
                                            1.0,
                                            Components::Color(40, 80, 220));

    std::cerr << "Falling points scenario ready (" << KBoxWidth << " x " << KBoxHeight
              << " box, spawning every 5 s)." << std::endl;
}
