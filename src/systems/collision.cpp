#include "verlet/systems/collision.hpp"
#include "verlet/core/debug.hpp"
#include "verlet/core/profile.hpp"

#include <algorithm>
#include <vector>

namespace Systems {

namespace {

struct PairBody {
    int id;
    Components::Position* pos;
    double radius;
};

} // namespace

CollisionSystem::CollisionSystem() = default;

double CollisionSystem::distance(const Components::Position& a, const Components::Position& b) {
    return a.dist(b);
}

bool CollisionSystem::colliding(const Components::Position& a, double radiusA,
                                const Components::Position& b, double radiusB) {
    return radiusA + radiusB > distance(a, b);
}

bool CollisionSystem::resolve(Components::Position& a, double radiusA,
                              Components::Position& b, double radiusB,
                              double friction,
                              const CollisionConfig& config) {
    double const dist = distance(a, b);

    Vector normal;
    if (dist < config.degenerateDistance) {
        bool const skip = config.degeneratePolicy == DegenerateContactPolicy::Skip;
        DebugStats::recordDegenerateContact(skip);
        if (skip) {
            DEBUG_MSG(DEBUG_LEVEL_BASIC, "[CollisionSystem] Skipping coincident pair at ("
                      << a.x << ", " << a.y << ")\n");
            return false;
        }
        normal = Vector(1.0, 0.0);
    } else {
        normal = (a - b) / dist;
    }

    double const delta = radiusA + radiusB - dist;
    Vector const correction = normal * (0.5 * delta * friction);

    a += correction;
    b -= correction;
    return true;
}

void CollisionSystem::update(entt::registry &registry, const SubstepContext& /*ctx*/) {
    PROFILE_SCOPE("CollisionSystem");

    auto view = registry.view<Components::ParticleId, Components::Position, Components::Radius>();

    std::vector<PairBody> bodies;
    for (auto &&[entity, id, pos, radius] : view.each()) {
        bodies.push_back({id.value, &pos, radius.value});
    }
    std::sort(bodies.begin(), bodies.end(), [](const PairBody& l, const PairBody& r) {
        return l.id < r.id;
    });

    const double friction = sysConfig.Friction;

    for (size_t i = 0; i < bodies.size(); ++i) {
        for (size_t j = i + 1; j < bodies.size(); ++j) {
            PairBody& a = bodies[i];
            PairBody& b = bodies[j];

            if (!colliding(*a.pos, a.radius, *b.pos, b.radius)) {
                DebugStats::recordContactCheck(false, 0.0);
                continue;
            }

            double const penetration = a.radius + b.radius - distance(*a.pos, *b.pos);
            bool const moved = resolve(*a.pos, a.radius, *b.pos, b.radius, friction, specificConfig);
            DebugStats::recordContactCheck(moved, penetration);
        }
    }
}

} // namespace Systems
