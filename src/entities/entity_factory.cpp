#include "verlet/entities/entity_factory.hpp"

namespace Entities {

entt::entity EntityFactory::createParticle(
    entt::registry& registry,
    int id,
    const Components::Position& position,
    const Vector& velocity,
    double radius,
    const Components::Color& color)
{
    auto entity = registry.create();
    registry.emplace<Components::ParticleId>(entity, id);
    registry.emplace<Components::Position>(entity, position.x, position.y);
    registry.emplace<Components::PreviousPosition>(entity,
                                                   position.x - velocity.x,
                                                   position.y - velocity.y);
    registry.emplace<Components::Acceleration>(entity, 0.0, 0.0);
    registry.emplace<Components::Radius>(entity, radius);
    registry.emplace<Components::Color>(entity, color);
    return entity;
}

entt::entity EntityFactory::createParticle(
    entt::registry& registry,
    int id,
    double x, double y,
    double velocityX, double velocityY)
{
    return createParticle(registry, id, Components::Position(x, y), Vector(velocityX, velocityY));
}

} // namespace Entities
