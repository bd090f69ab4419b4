#include "verlet/systems/boundary.hpp"
#include "verlet/core/debug.hpp"
#include "verlet/core/profile.hpp"

namespace Systems {

BoundarySystem::BoundarySystem() = default;

bool BoundarySystem::constrainAxis(Components::Position& pos,
                                   Components::PreviousPosition& prev,
                                   const Components::Bounds& bounds,
                                   Axis axis,
                                   double friction,
                                   double bounce) {
    double& p = (axis == Axis::Horizontal) ? pos.x : pos.y;
    double& old = (axis == Axis::Horizontal) ? prev.x : prev.y;
    double const lo = (axis == Axis::Horizontal) ? bounds.minX : bounds.minY;
    double const hi = (axis == Axis::Horizontal) ? bounds.maxX : bounds.maxY;

    if (p > hi) {
        double const vel = (p - old) * friction;
        p = hi;
        old = hi + vel * bounce;
    } else if (p < lo) {
        double const vel = (p - old) * friction;
        p = lo;
        old = lo + vel * bounce;
    } else {
        return false;
    }

    DebugStats::recordBoundaryClamp();
    return true;
}

int BoundarySystem::constrain(Components::Position& pos,
                              Components::PreviousPosition& prev,
                              const Components::Bounds& bounds,
                              double friction,
                              double bounce) {
    int clamped = 0;
    if (constrainAxis(pos, prev, bounds, Axis::Horizontal, friction, bounce)) {
        ++clamped;
    }
    if (constrainAxis(pos, prev, bounds, Axis::Vertical, friction, bounce)) {
        ++clamped;
    }
    return clamped;
}

void BoundarySystem::update(entt::registry &registry, const SubstepContext& ctx) {
    PROFILE_SCOPE("BoundarySystem");

    const double friction = sysConfig.Friction;
    const double bounce = sysConfig.Bounce;

    auto view = registry.view<Components::Position, Components::PreviousPosition>();
    for (auto &&[entity, pos, prev] : view.each()) {
        constrain(pos, prev, ctx.bounds, friction, bounce);
    }
}

} // namespace Systems
