#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include "verlet/core/simulator.hpp"
#include "verlet/components/basic.hpp"
#include "verlet/core/debug.hpp"
#include "verlet/entities/entity_factory.hpp"
#include "verlet/systems/collision.hpp"
#include "verlet/systems/gravity.hpp"

class SimulatorTest : public ::testing::Test {
protected:
    entt::registry registry;
    VerletSimulator simulator;

    static constexpr double FrameDt = 1.0 / 60.0;

    entt::entity createParticle(int id, double x, double y, double vx = 0.0, double vy = 0.0) {
        return Entities::EntityFactory::createParticle(registry, id, x, y, vx, vy);
    }

    // Staggered block of particles dropped into a 21 x 50 box
    static void fillPile(entt::registry& reg) {
        int id = 0;
        for (int row = 0; row < 5; ++row) {
            double const offset = (row % 2 == 0) ? 0.0 : 1.5;
            for (int col = 0; col < 6; ++col) {
                Entities::EntityFactory::createParticle(reg, id++,
                                                        2.0 + offset + col * 3.0,
                                                        25.0 + row * 3.0,
                                                        0.0, 0.0);
            }
        }
    }

    void SetUp() override {
        DebugStats::reset();
    }
};

TEST_F(SimulatorTest, DefaultPipeline) {
    const auto& cfg = simulator.getConfig();
    EXPECT_EQ(cfg.sharedConfig.Substeps, 8);
    EXPECT_DOUBLE_EQ(cfg.sharedConfig.Friction, 0.99);
    EXPECT_DOUBLE_EQ(cfg.sharedConfig.Bounce, 0.95);
    EXPECT_DOUBLE_EQ(cfg.gravityConfig.gravitationalAcceleration, -9.8);
    EXPECT_EQ(simulator.getSystems().size(), 4u);
}

TEST_F(SimulatorTest, ApplyConfigReachesEverySystem) {
    ScenarioSystemConfig cfg;
    cfg.sharedConfig.Friction = 0.9;
    cfg.sharedConfig.Bounce = 0.5;
    cfg.sharedConfig.Substeps = 3;
    cfg.gravityConfig.gravitationalAcceleration = -60.0;
    cfg.collisionConfig.degeneratePolicy = Systems::DegenerateContactPolicy::Skip;
    simulator.applyConfig(cfg);

    const auto& systems = simulator.getSystems();
    ASSERT_EQ(systems.size(), 4u);
    for (const auto& system : systems) {
        EXPECT_DOUBLE_EQ(system->getSystemConfig().Friction, 0.9);
        EXPECT_DOUBLE_EQ(system->getSystemConfig().Bounce, 0.5);
        EXPECT_EQ(system->getSystemConfig().Substeps, 3);
    }

    auto* gravity = dynamic_cast<Systems::GravitySystem*>(systems[0].get());
    ASSERT_NE(gravity, nullptr);
    EXPECT_DOUBLE_EQ(gravity->getSpecificConfig().gravitationalAcceleration, -60.0);

    auto* collision = dynamic_cast<Systems::CollisionSystem*>(systems[2].get());
    ASSERT_NE(collision, nullptr);
    EXPECT_EQ(collision->getSpecificConfig().degeneratePolicy,
              Systems::DegenerateContactPolicy::Skip);
}

TEST_F(SimulatorTest, EmptyRegistryIsNoOp) {
    simulator.step(registry, Components::Bounds(0.0, 0.0, 21.0, 50.0), FrameDt);
    EXPECT_TRUE(registry.view<Components::Position>().empty());
    EXPECT_EQ(DebugStats::contactsChecked(), 0);
}

TEST_F(SimulatorTest, FreeFallSettlesOnFloor) {
    ScenarioSystemConfig cfg;
    cfg.gravityConfig.gravitationalAcceleration = -100.0;
    simulator.applyConfig(cfg);

    Components::Bounds bounds(-10.0, -12.0, 10.0, 60.0);
    auto e = createParticle(0, 0.0, 50.0);

    double lastY = 50.0;
    for (int frame = 0; frame < 120; ++frame) {
        simulator.step(registry, bounds, FrameDt);
        double const y = registry.get<Components::Position>(e).y;
        EXPECT_LT(y, lastY);
        lastY = y;
    }
    EXPECT_NEAR(lastY, 12.629931039867738, 1e-9);

    for (int frame = 120; frame < 600; ++frame) {
        simulator.step(registry, bounds, FrameDt);
        EXPECT_TRUE(bounds.contains(registry.get<Components::Position>(e)));
    }

    const auto& pos = registry.get<Components::Position>(e);
    const auto& prev = registry.get<Components::PreviousPosition>(e);
    EXPECT_DOUBLE_EQ(pos.y, -12.0);
    EXPECT_DOUBLE_EQ(pos.x, 0.0);
    // Resting: what is left of the implicit velocity is one gravity kick
    EXPECT_LT(std::abs(pos.y - prev.y), 1e-3);
}

TEST_F(SimulatorTest, FrictionCompoundsPerSubstep) {
    ScenarioSystemConfig cfg;
    cfg.sharedConfig.Substeps = 4;
    cfg.gravityConfig.gravitationalAcceleration = 0.0;
    simulator.applyConfig(cfg);

    auto e = createParticle(0, 0.0, 0.0, 0.01, 0.0);
    simulator.step(registry, Components::Bounds(-10.0, -10.0, 10.0, 10.0), FrameDt);

    const auto& pos = registry.get<Components::Position>(e);
    const auto& prev = registry.get<Components::PreviousPosition>(e);
    EXPECT_NEAR(pos.x - prev.x, 0.01 * std::pow(0.99, 4), 1e-15);
}

TEST_F(SimulatorTest, IntegrationThenCollisionOrdering) {
    // One substep, no gravity, dt = 1: both particles move first, then the
    // overlapping pair is separated
    ScenarioSystemConfig cfg;
    cfg.sharedConfig.Substeps = 1;
    cfg.gravityConfig.gravitationalAcceleration = 0.0;
    simulator.applyConfig(cfg);

    auto p1 = createParticle(0, 0.0, 0.0, 0.5, 0.0);
    auto p2 = createParticle(1, 2.5, 0.0, -0.5, 0.0);

    simulator.step(registry, Components::Bounds(-100.0, -100.0, 100.0, 100.0), 1.0);

    EXPECT_NEAR(registry.get<Components::Position>(p1).x, 0.25245, 1e-12);
    EXPECT_NEAR(registry.get<Components::Position>(p2).x, 2.24755, 1e-12);
    EXPECT_DOUBLE_EQ(registry.get<Components::PreviousPosition>(p1).x, 0.0);
    EXPECT_DOUBLE_EQ(registry.get<Components::PreviousPosition>(p2).x, 2.5);
    EXPECT_EQ(DebugStats::contactsResolved(), 1);
}

TEST_F(SimulatorTest, PileStaysInsideBounds) {
    ScenarioSystemConfig cfg;
    cfg.gravityConfig.gravitationalAcceleration = -60.0;
    simulator.applyConfig(cfg);

    Components::Bounds bounds(0.0, 0.0, 21.0, 50.0);
    fillPile(registry);

    for (int frame = 0; frame < 300; ++frame) {
        simulator.step(registry, bounds, FrameDt);
        for (auto [entity, pos] : registry.view<Components::Position>().each()) {
            ASSERT_FALSE(std::isnan(pos.x));
            ASSERT_FALSE(std::isnan(pos.y));
            ASSERT_TRUE(bounds.contains(pos)) << "frame " << frame
                                              << " at (" << pos.x << ", " << pos.y << ")";
        }
    }
    EXPECT_GT(DebugStats::contactsResolved(), 0);
}

TEST_F(SimulatorTest, StepIsDeterministic) {
    Components::Bounds bounds(0.0, 0.0, 21.0, 50.0);

    entt::registry other;
    fillPile(registry);
    fillPile(other);

    VerletSimulator otherSimulator;
    for (int frame = 0; frame < 120; ++frame) {
        simulator.step(registry, bounds, FrameDt);
        otherSimulator.step(other, bounds, FrameDt);
    }

    auto view = registry.view<Components::ParticleId, Components::Position>();
    auto otherView = other.view<Components::ParticleId, Components::Position>();
    for (auto [entity, id, pos] : view.each()) {
        bool found = false;
        for (auto [otherEntity, otherId, otherPos] : otherView.each()) {
            if (otherId.value == id.value) {
                EXPECT_EQ(pos.x, otherPos.x);
                EXPECT_EQ(pos.y, otherPos.y);
                found = true;
            }
        }
        EXPECT_TRUE(found);
    }
}

TEST_F(SimulatorTest, InvalidConfigIsRejected) {
    ScenarioSystemConfig noSubsteps;
    noSubsteps.sharedConfig.Substeps = 0;
    EXPECT_THROW(simulator.applyConfig(noSubsteps), std::invalid_argument);

    ScenarioSystemConfig negativeFriction;
    negativeFriction.sharedConfig.Friction = -0.5;
    EXPECT_THROW(simulator.applyConfig(negativeFriction), std::invalid_argument);

    ScenarioSystemConfig negativeBounce;
    negativeBounce.sharedConfig.Bounce = -0.1;
    EXPECT_THROW(simulator.applyConfig(negativeBounce), std::invalid_argument);

    ScenarioSystemConfig nothingActive;
    nothingActive.sharedConfig.activeSystems.clear();
    EXPECT_THROW(simulator.applyConfig(nothingActive), std::invalid_argument);

    // The previous configuration is still in effect
    EXPECT_EQ(simulator.getConfig().sharedConfig.Substeps, 8);
    EXPECT_EQ(simulator.getSystems().size(), 4u);
}

TEST_F(SimulatorTest, OnlyActiveSystemsRun) {
    ScenarioSystemConfig cfg;
    cfg.sharedConfig.activeSystems = {Systems::SystemType::VERLET_INTEGRATION};
    cfg.sharedConfig.Friction = 1.0;
    cfg.sharedConfig.Substeps = 2;
    simulator.applyConfig(cfg);
    ASSERT_EQ(simulator.getSystems().size(), 1u);

    // No gravity and no collisions: two overlapping particles drift freely
    auto a = createParticle(0, 0.0, 10.0, 0.1, 0.0);
    auto b = createParticle(1, 0.5, 10.0, 0.1, 0.0);
    simulator.step(registry, Components::Bounds(-100.0, -100.0, 100.0, 100.0), FrameDt);

    EXPECT_NEAR(registry.get<Components::Position>(a).x, 0.2, 1e-12);
    EXPECT_NEAR(registry.get<Components::Position>(b).x, 0.7, 1e-12);
    EXPECT_DOUBLE_EQ(registry.get<Components::Position>(a).y, 10.0);
    EXPECT_EQ(DebugStats::contactsChecked(), 0);
}
