/**
 * @file TestPresentation.cpp
 * @brief Input, camera and render bridges, plus the spawn prefabs.
 */

#include <catch2/catch_test_macros.hpp>

#include "GameTestHelpers.hpp"
#include "dz/game/Prefabs.hpp"
#include "dz/game/components/AI.hpp"
#include "dz/game/components/Camera.hpp"
#include "dz/game/components/Collision.hpp"
#include "dz/game/components/Input.hpp"
#include "dz/game/components/Render.hpp"
#include "dz/game/components/Transform.hpp"
#include "dz/game/systems/CameraSystem.hpp"
#include "dz/game/systems/InputSystem.hpp"
#include "dz/game/systems/RenderSystem.hpp"

namespace dz::game {

using ecs::ComponentId;

TEST_CASE("Prefabs assemble fighters, loot and cameras", "[game][prefab]")
{
    ecs::World world;

    const auto player = prefab::spawnPlayer(world, {1.0f, 0.0f, 2.0f});
    const auto bot    = prefab::spawnBot(world, "Bot_1", {}, WeaponType::Shotgun);
    const auto loot   = prefab::spawnLoot(world, {}, LootKind::Health, 25);
    const auto cam    = prefab::spawnFollowCamera(world, player);

    REQUIRE(world.getEntity(player)->name == "Player");
    REQUIRE(world.hasComponent(player, ComponentId::Progression));
    REQUIRE_FALSE(world.hasComponent(player, ComponentId::AI));
    REQUIRE(world.getComponent<TransformComponent>(player)->position == math::Vec3f{1.0f, 0.0f, 2.0f});

    REQUIRE(world.getEntity(bot)->name == "Bot_1");
    REQUIRE(world.hasComponent(bot, ComponentId::AI));
    REQUIRE_FALSE(world.hasComponent(bot, ComponentId::Progression));
    REQUIRE(world.getComponent<WeaponComponent>(bot)->type() == WeaponType::Shotgun);

    const auto* body = world.getComponent<CollisionComponent>(bot);
    REQUIRE(body->radius == prefab::kBodyRadius);
    REQUIRE_FALSE(body->isProjectile);

    REQUIRE(world.getComponent<LootComponent>(loot)->kind == LootKind::Health);
    REQUIRE(world.getComponent<LootComponent>(loot)->amount == 25);
    REQUIRE(world.getComponent<CameraComponent>(cam)->target == player);
}

TEST_CASE("InputSystem feeds players and leaves bots alone", "[game][input]")
{
    ecs::World world;
    input::InputState source;
    world.emplaceSystem<InputSystem>(source);

    const auto player = prefab::spawnPlayer(world, {});
    const auto bot    = prefab::spawnBot(world, "Bot", {});

    source.forward = true;
    source.lookX   = 0.25f;
    world.update(0.1f);

    REQUIRE(world.getComponent<InputComponent>(player)->state == source);
    REQUIRE_FALSE(world.getComponent<InputComponent>(bot)->state.forward);

    source.forward = false;
    world.update(0.1f);
    REQUIRE_FALSE(world.getComponent<InputComponent>(player)->state.forward);
}

TEST_CASE("CameraSystem follows its target until it disappears", "[game][camera]")
{
    ecs::World world;
    test::RecordingCamera controller;
    world.emplaceSystem<CameraSystem>(&controller);

    const auto target = world.createEntity("Target");
    world.emplaceComponent<TransformComponent>(target, math::Vec3f{1.0f, 0.0f, 2.0f});
    const auto cam = prefab::spawnFollowCamera(world, target);

    world.update(0.1f);
    REQUIRE(controller.calls == 1);
    REQUIRE(controller.position == math::Vec3f{1.0f, 5.0f, -8.0f});
    REQUIRE(controller.target == math::Vec3f{1.0f, 0.0f, 2.0f});

    world.getComponent<CameraComponent>(cam)->mode = CameraMode::Free;
    world.update(0.1f);
    REQUIRE(controller.calls == 1);

    world.getComponent<CameraComponent>(cam)->mode = CameraMode::Follow;
    world.destroyEntity(target);
    world.update(0.1f);
    REQUIRE(controller.calls == 1);
}

TEST_CASE("CameraSystem without a controller is inert", "[game][camera]")
{
    ecs::World world;
    auto& system = world.emplaceSystem<CameraSystem>(nullptr);

    const auto target = world.createEntity("Target");
    world.emplaceComponent<TransformComponent>(target, math::Vec3f{});
    prefab::spawnFollowCamera(world, target);
    world.update(0.1f);

    test::RecordingCamera controller;
    system.setController(&controller);
    world.update(0.1f);
    REQUIRE(controller.calls == 1);
}

TEST_CASE("RenderSystem mirrors visible entities into the scene", "[game][render]")
{
    ecs::World world;
    test::RecordingScene scene;
    auto& system = world.emplaceSystem<RenderSystem>(&scene);

    const auto a = prefab::spawnLoot(world, {1.0f, 2.0f, 3.0f}, LootKind::Ammo, 30);
    const auto b = prefab::spawnLoot(world, {}, LootKind::Armor, 1);
    const auto hidden = world.createEntity("Marker");
    world.emplaceComponent<TransformComponent>(hidden, math::Vec3f{});

    world.update(0.1f);
    REQUIRE(system.submittedInstances() == 2);
    REQUIRE(scene.instances.size() == 2);
    REQUIRE(scene.instances.at(a).mesh == render::MeshKind::Sphere);
    REQUIRE(scene.instances.at(a).position == math::Vec3f{1.0f, 2.0f, 3.0f});

    world.getComponent<RenderComponent>(b)->visible = false;
    world.update(0.1f);
    REQUIRE(system.submittedInstances() == 1);
    REQUIRE(scene.instances.count(b) == 0);
    REQUIRE(scene.removals == 1);

    world.getComponent<TransformComponent>(a)->position = {4.0f, 0.0f, 0.0f};
    world.update(0.1f);
    REQUIRE(scene.instances.at(a).position == math::Vec3f{4.0f, 0.0f, 0.0f});

    world.destroyEntity(a);
    world.update(0.1f);
    REQUIRE(scene.instances.empty());
    REQUIRE(scene.removals == 2);
}

} // namespace dz::game
