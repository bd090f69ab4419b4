#include <gtest/gtest.h>
#include <cmath>
#include "verlet/systems/verlet.hpp"
#include "verlet/systems/gravity.hpp"
#include "verlet/components/basic.hpp"
#include "verlet/entities/entity_factory.hpp"

using namespace Systems;

class VerletTest : public ::testing::Test {
protected:
    entt::registry registry;

    // Large enough that no test particle reaches a wall
    Components::Bounds openBounds{-1000.0, -1000.0, 1000.0, 1000.0};

    entt::entity createParticle(int id, double x, double y, double vx, double vy) {
        return Entities::EntityFactory::createParticle(registry, id, x, y, vx, vy);
    }
};

TEST_F(VerletTest, FactoryDerivesPreviousPositionFromVelocity) {
    auto e = createParticle(7, 5.0, 20.0, 0.1, -0.2);

    const auto& pos = registry.get<Components::Position>(e);
    const auto& prev = registry.get<Components::PreviousPosition>(e);
    const auto& acc = registry.get<Components::Acceleration>(e);

    EXPECT_EQ(registry.get<Components::ParticleId>(e).value, 7);
    EXPECT_DOUBLE_EQ(pos.x, 5.0);
    EXPECT_DOUBLE_EQ(pos.y, 20.0);
    EXPECT_DOUBLE_EQ(prev.x, 4.9);
    EXPECT_DOUBLE_EQ(prev.y, 20.2);
    EXPECT_DOUBLE_EQ(acc.x, 0.0);
    EXPECT_DOUBLE_EQ(acc.y, 0.0);
    EXPECT_DOUBLE_EQ(registry.get<Components::Radius>(e).value, 1.0);

    Vector v = VerletIntegrationSystem::velocity(pos, prev);
    EXPECT_NEAR(v.x, 0.1, 1e-12);
    EXPECT_NEAR(v.y, -0.2, 1e-12);
}

TEST_F(VerletTest, AccelerationsSuperpose) {
    Components::Acceleration acc;
    VerletIntegrationSystem::applyAcceleration(acc, 1.0, -9.8);
    VerletIntegrationSystem::applyAcceleration(acc, 0.5, 2.0);
    VerletIntegrationSystem::applyAcceleration(acc, 0.0, 0.0);

    EXPECT_DOUBLE_EQ(acc.x, 1.5);
    EXPECT_DOUBLE_EQ(acc.y, -7.8);
}

TEST_F(VerletTest, IntegrateAppliesFrictionAndAcceleration) {
    Components::Position pos(1.0, 2.0);
    Components::PreviousPosition prev(0.5, 2.0);
    Components::Acceleration acc(0.0, -10.0);

    VerletIntegrationSystem::integrate(pos, prev, acc, openBounds, 0.1, 0.99, 0.95);

    // velocity 0.5 damped to 0.495, plus -10 * 0.1^2 vertically
    EXPECT_NEAR(pos.x, 1.495, 1e-12);
    EXPECT_NEAR(pos.y, 1.9, 1e-12);
    EXPECT_DOUBLE_EQ(prev.x, 1.0);
    EXPECT_DOUBLE_EQ(prev.y, 2.0);
}

TEST_F(VerletTest, IntegrateClearsAccumulator) {
    Components::Position pos(0.0, 0.0);
    Components::PreviousPosition prev(0.0, 0.0);
    Components::Acceleration acc(3.0, -4.0);

    VerletIntegrationSystem::integrate(pos, prev, acc, openBounds, 0.01, 0.99, 0.95);
    EXPECT_DOUBLE_EQ(acc.x, 0.0);
    EXPECT_DOUBLE_EQ(acc.y, 0.0);

    // A second integration without new forces only carries momentum
    Vector before = VerletIntegrationSystem::velocity(pos, prev);
    VerletIntegrationSystem::integrate(pos, prev, acc, openBounds, 0.01, 0.99, 0.95);
    Vector after = VerletIntegrationSystem::velocity(pos, prev);
    EXPECT_NEAR(after.x, before.x * 0.99, 1e-15);
    EXPECT_NEAR(after.y, before.y * 0.99, 1e-15);
}

TEST_F(VerletTest, RestingParticleWithoutForcesStaysPut) {
    Components::Position pos(3.0, 4.0);
    Components::PreviousPosition prev(3.0, 4.0);
    Components::Acceleration acc;

    for (int i = 0; i < 100; ++i) {
        VerletIntegrationSystem::integrate(pos, prev, acc, openBounds, 1.0 / 480.0, 0.99, 0.95);
    }
    EXPECT_DOUBLE_EQ(pos.x, 3.0);
    EXPECT_DOUBLE_EQ(pos.y, 4.0);
}

TEST_F(VerletTest, IntegrateConstrainsToBounds) {
    Components::Bounds box{0.0, 0.0, 21.0, 50.0};
    Components::Position pos(20.5, 10.0);
    Components::PreviousPosition prev(19.5, 10.0);
    Components::Acceleration acc;

    VerletIntegrationSystem::integrate(pos, prev, acc, box, 1.0 / 480.0, 0.99, 0.95);

    // Moves to 21.49, is clamped to 21 and reflected with friction applied again
    EXPECT_DOUBLE_EQ(pos.x, 21.0);
    EXPECT_NEAR(prev.x, 21.0 + 0.99 * 0.99 * 0.95, 1e-12);
    EXPECT_DOUBLE_EQ(pos.y, 10.0);
    EXPECT_DOUBLE_EQ(prev.y, 10.0);
    EXPECT_LT(VerletIntegrationSystem::velocity(pos, prev).x, 0.0);
}

TEST_F(VerletTest, SubstepsMatchClosedForm) {
    // Free flight from rest under constant acceleration a for n substeps of h:
    //   v_n = a h^2 (1 - f^n) / (1 - f)
    //   x_n = x_0 + a h^2 / (1 - f) * (n - f (1 - f^n) / (1 - f))
    const double f = 0.99;
    const double a = -9.8;
    const int n = 8;
    const double h = (1.0 / 60.0) / n;

    auto e = createParticle(0, 0.0, 20.0, 0.0, 0.0);

    GravitySystem gravity;
    VerletIntegrationSystem verlet;
    SubstepContext ctx{openBounds, h};
    for (int i = 0; i < n; ++i) {
        gravity.update(registry, ctx);
        verlet.update(registry, ctx);
    }

    const double fn = std::pow(f, n);
    const double expectedVel = a * h * h * (1.0 - fn) / (1.0 - f);
    const double expectedY = 20.0 + a * h * h / (1.0 - f) * (n - f * (1.0 - fn) / (1.0 - f));

    const auto& pos = registry.get<Components::Position>(e);
    const auto& prev = registry.get<Components::PreviousPosition>(e);
    EXPECT_NEAR(pos.y, expectedY, 1e-12);
    EXPECT_NEAR(pos.y - prev.y, expectedVel, 1e-12);
    EXPECT_DOUBLE_EQ(pos.x, 0.0);
}

TEST_F(VerletTest, SystemUsesSharedFriction) {
    auto e = createParticle(0, 0.0, 0.0, 1.0, 0.0);

    VerletIntegrationSystem verlet;
    SharedSystemConfig cfg;
    cfg.Friction = 0.5;
    verlet.setSystemConfig(cfg);

    verlet.update(registry, SubstepContext{openBounds, 0.01});

    EXPECT_NEAR(registry.get<Components::Position>(e).x, 0.5, 1e-12);
}
