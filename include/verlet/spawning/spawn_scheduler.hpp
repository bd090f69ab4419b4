/**
 * @file spawn_scheduler.hpp
 * @brief Periodic particle spawner run by the host between frames.
 */

#pragma once

#include <cstddef>
#include <SFML/System/Time.hpp>
#include <entt/entt.hpp>

#include "verlet/components/basic.hpp"

/**
 * @struct SpawnConfig
 * @brief Where, how often and with what state new particles appear.
 */
struct SpawnConfig {
    bool enabled = false;

    // Repeating timer period
    sf::Time interval = sf::seconds(5.f);

    // Id given to the first spawned particle; later ones count up from it
    int firstId = 10;

    Components::Position origin{0.0, 20.0};
    Vector initialVelocity{0.05, 0.0};
    double radius = 1.0;
    Components::Color color{220, 40, 40};

    // Stop spawning once the registry holds this many particles (0 = no cap)
    std::size_t maxParticles = 0;
};

/**
 * @class SpawnScheduler
 * @brief Repeating timer that adds particles through EntityFactory.
 *
 * tick() must be called between simulation steps, never during one.
 */
class SpawnScheduler {
public:
    /**
     * @throws std::invalid_argument if the config is enabled with a
     *         non-positive interval
     */
    explicit SpawnScheduler(const SpawnConfig& config = SpawnConfig());

    /**
     * @brief Advances the timer and spawns one particle per elapsed period.
     * @return number of particles created
     */
    int tick(entt::registry& registry, sf::Time dt);

    int getNextId() const { return nextId; }
    sf::Time getElapsed() const { return elapsed; }
    const SpawnConfig& getConfig() const { return config; }

private:
    SpawnConfig config;
    sf::Time elapsed;
    int nextId;
};
