#include "verlet/scenarios/particle_pile.hpp"
#include "verlet/entities/entity_factory.hpp"

#include <iostream>

static constexpr double KBoxWidth  = 21.0;
static constexpr double KBoxHeight = 50.0;
static constexpr double KSpacing   = 3.0;
static constexpr double KGravity   = -60.0;

ScenarioSystemConfig ParticlePileScenario::getSystemsConfig() const
{
    ScenarioSystemConfig cfg;
    cfg.gravityConfig.gravitationalAcceleration = KGravity;
    return cfg;
}

Components::Bounds ParticlePileScenario::getBounds() const
{
    return {0.0, 0.0, KBoxWidth, KBoxHeight};
}

void ParticlePileScenario::createEntities(entt::registry &registry) const
{
    int id = 0;
    for (int row = 0; row < KRows; ++row) {
        // Stagger odd rows so particles land on the gaps below
        double const offset = (row % 2 == 0) ? 0.0 : KSpacing * 0.5;
        double const y = KBoxHeight * 0.5 + row * KSpacing;

        for (int col = 0; col < KColumns; ++col) {
            double const x = 2.0 + offset + col * KSpacing;

            // Alternate colours per row
            Components::Color const color = (row % 2 == 0)
                ? Components::Color(40, 80, 220)
                : Components::Color(220, 40, 40);

            Entities::EntityFactory::createParticle(registry, id++,
                                                    Components::Position(x, y),
                                                    Vector(), 1.0, color);
        }
    }
    std::cerr << "Created " << id << " particles in pile scenario." << std::endl;
}
