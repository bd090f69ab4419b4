#include "verlet/scenarios/free_fall.hpp"
#include "verlet/entities/entity_factory.hpp"

static constexpr double KGravity = -100.0;
static constexpr double KFloor   = -12.0;

ScenarioSystemConfig FreeFallScenario::getSystemsConfig() const
{
    ScenarioSystemConfig cfg;
    cfg.gravityConfig.gravitationalAcceleration = KGravity;
    return cfg;
}

Components::Bounds FreeFallScenario::getBounds() const
{
    return {-10.0, KFloor, 10.0, 60.0};
}

void FreeFallScenario::createEntities(entt::registry &registry) const
{
    Entities::EntityFactory::createParticle(registry, 0, 0.0, 50.0, 0.0, 0.0);
}
