/**
 * @file TestPhysics.cpp
 * @brief Integration, ground clamp and movement tests.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "GameTestHelpers.hpp"
#include "dz/game/components/Input.hpp"
#include "dz/game/components/Physics.hpp"
#include "dz/game/components/Transform.hpp"
#include "dz/game/systems/PhysicsSystem.hpp"
#include "dz/game/systems/PlayerMovementSystem.hpp"

#include <cmath>
#include <numbers>

namespace dz::game {

using Catch::Matchers::WithinAbs;

TEST_CASE("A falling body settles on the ground", "[game][physics]")
{
    ecs::World world{ecs::World::Settings{1.0f / 60.0f}};
    world.emplaceSystem<PhysicsSystem>();

    const auto body = world.createEntity("Crate");
    world.emplaceComponent<TransformComponent>(body, math::Vec3f{0.0f, 5.0f, 0.0f});
    world.emplaceComponent<PhysicsComponent>(body);

    bool wentNegative = false;
    for (int i = 0; i < 120; ++i)
    {
        world.update(1.0f / 60.0f);
        wentNegative = wentNegative || world.getComponent<TransformComponent>(body)->position.y < 0.0f;
    }

    const auto& pos = world.getComponent<TransformComponent>(body)->position;
    const auto& vel = world.getComponent<PhysicsComponent>(body)->velocity;
    REQUIRE(pos.y == 0.0f);
    REQUIRE(vel.y == 0.0f);
    REQUIRE_FALSE(wentNegative);
    REQUIRE_FALSE(std::isnan(pos.x));
    REQUIRE_FALSE(std::isnan(pos.z));
    REQUIRE_FALSE(std::isnan(vel.x));
}

TEST_CASE("Static bodies are not integrated", "[game][physics]")
{
    ecs::World world;
    world.emplaceSystem<PhysicsSystem>();

    const auto wall = world.createEntity("Wall");
    world.emplaceComponent<TransformComponent>(wall, math::Vec3f{0.0f, 3.0f, 0.0f});
    world.emplaceComponent<PhysicsComponent>(wall)->isStatic = true;

    test::advance(world, 1.0f, 0.1f);
    REQUIRE(world.getComponent<TransformComponent>(wall)->position.y == 3.0f);
}

TEST_CASE("Grounded bodies slide and lose horizontal speed to friction", "[game][physics]")
{
    ecs::World world;
    world.emplaceSystem<PhysicsSystem>();

    const auto puck = world.createEntity("Puck");
    world.emplaceComponent<TransformComponent>(puck);
    world.emplaceComponent<PhysicsComponent>(puck)->velocity = {10.0f, 0.0f, 0.0f};

    world.update(0.1f);

    const auto* physics = world.getComponent<PhysicsComponent>(puck);
    REQUIRE_THAT(world.getComponent<TransformComponent>(puck)->position.x, WithinAbs(1.0, 1e-5));
    REQUIRE_THAT(physics->velocity.x, WithinAbs(9.8, 1e-5));
    REQUIRE(physics->velocity.y == 0.0f);
}

TEST_CASE("Movement follows input, sprint, look and jump", "[game][movement]")
{
    ecs::World world;
    world.emplaceSystem<PlayerMovementSystem>();

    const auto player = world.createEntity("Player");
    auto* transform = world.emplaceComponent<TransformComponent>(player);
    auto* physics   = world.emplaceComponent<PhysicsComponent>(player);
    auto* input     = world.emplaceComponent<InputComponent>(player);

    SECTION("forward walks along -Z")
    {
        input->state.forward = true;
        world.update(0.016f);
        REQUIRE_THAT(physics->velocity.z, WithinAbs(-5.0, 1e-5));
        REQUIRE_THAT(physics->velocity.x, WithinAbs(0.0, 1e-5));
    }

    SECTION("sprint uses the faster speed and diagonals are normalised")
    {
        input->state.forward = true;
        input->state.right   = true;
        input->state.sprint  = true;
        world.update(0.016f);
        const core::f32 expected = 8.0f / std::sqrt(2.0f);
        REQUIRE_THAT(physics->velocity.x, WithinAbs(expected, 1e-4));
        REQUIRE_THAT(physics->velocity.z, WithinAbs(-expected, 1e-4));
    }

    SECTION("idle damps horizontal velocity")
    {
        physics->velocity = {2.0f, 0.0f, -4.0f};
        world.update(0.016f);
        REQUIRE_THAT(physics->velocity.x, WithinAbs(1.8, 1e-5));
        REQUIRE_THAT(physics->velocity.z, WithinAbs(-3.6, 1e-5));
    }

    SECTION("look turns the body once and is consumed")
    {
        input->state.lookX   = std::numbers::pi_v<core::f32> / 2.0f;
        input->state.forward = true;
        world.update(0.016f);
        REQUIRE(input->state.lookX == 0.0f);

        world.update(0.016f);
        const math::Vec3f facing = transform->rotation.rotate({0.0f, 0.0f, -1.0f});
        REQUIRE_THAT(facing.x, WithinAbs(-1.0, 1e-4));
        REQUIRE_THAT(physics->velocity.x, WithinAbs(-5.0, 1e-4));
    }

    SECTION("jump only from rest")
    {
        input->state.jump = true;
        world.update(0.016f);
        REQUIRE(physics->velocity.y == 8.0f);

        physics->velocity.y = 3.0f;
        world.update(0.016f);
        REQUIRE(physics->velocity.y == 3.0f);
    }
}

} // namespace dz::game
