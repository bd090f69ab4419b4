#include "verlet/spawning/spawn_scheduler.hpp"

#include <stdexcept>

#include "verlet/core/debug.hpp"
#include "verlet/entities/entity_factory.hpp"

SpawnScheduler::SpawnScheduler(const SpawnConfig& config)
    : config(config)
    , elapsed(sf::Time::Zero)
    , nextId(config.firstId)
{
    if (config.enabled && config.interval <= sf::Time::Zero) {
        throw std::invalid_argument("Spawn interval must be positive");
    }
}

int SpawnScheduler::tick(entt::registry& registry, sf::Time dt) {
    if (!config.enabled) {
        return 0;
    }

    elapsed += dt;

    int spawned = 0;
    while (elapsed >= config.interval) {
        elapsed -= config.interval;

        if (config.maxParticles > 0 &&
            registry.view<Components::ParticleId>().size() >= config.maxParticles) {
            DEBUG_MSG(DEBUG_LEVEL_BASIC, "[SpawnScheduler] Particle cap "
                      << config.maxParticles << " reached, not spawning\n");
            continue;
        }

        Entities::EntityFactory::createParticle(registry, nextId, config.origin,
                                                config.initialVelocity, config.radius,
                                                config.color);
        DEBUG_MSG(DEBUG_LEVEL_BASIC, "[SpawnScheduler] Spawned particle " << nextId << "\n");
        ++nextId;
        ++spawned;
    }
    return spawned;
}
