/**
 * @file Prefabs.cpp
 * @brief Entity assemblies.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/game/Prefabs.hpp>
#include <dz/game/components/AI.hpp>
#include <dz/game/components/Audio.hpp>
#include <dz/game/components/BattleRoyale.hpp>
#include <dz/game/components/Camera.hpp>
#include <dz/game/components/Collision.hpp>
#include <dz/game/components/Health.hpp>
#include <dz/game/components/Input.hpp>
#include <dz/game/components/Physics.hpp>
#include <dz/game/components/Progression.hpp>
#include <dz/game/components/Render.hpp>
#include <dz/game/components/Transform.hpp>

#include <utility>

namespace dz::game::prefab {

namespace {

constexpr core::u32 kPlayerColor = 0x00ff00;
constexpr core::u32 kBotColor    = 0xff0000;
constexpr core::u32 kLootColor   = 0x00aaff;

void addFighter(ecs::World& world, ecs::EntityId id, const math::Vec3f& position, WeaponType weapon, core::u32 color)
{
    world.emplaceComponent<TransformComponent>(id, position);
    world.emplaceComponent<PhysicsComponent>(id);
    world.emplaceComponent<InputComponent>(id);
    world.emplaceComponent<HealthComponent>(id);
    world.emplaceComponent<WeaponComponent>(id, weapon);
    world.emplaceComponent<CollisionComponent>(id, kBodyRadius, false, 0.0f);
    world.emplaceComponent<BattleRoyaleComponent>(id);
    world.emplaceComponent<AudioComponent>(id);
    world.emplaceComponent<RenderComponent>(id, render::MeshKind::Cube, color);
}

} // namespace

ecs::EntityId spawnPlayer(ecs::World& world, const math::Vec3f& position, WeaponType weapon)
{
    const auto id = world.createEntity("Player");
    if (!id.isValid())
        return id;

    addFighter(world, id, position, weapon, kPlayerColor);
    world.emplaceComponent<ProgressionComponent>(id);
    return id;
}

ecs::EntityId spawnBot(ecs::World& world, std::string name, const math::Vec3f& position, WeaponType weapon)
{
    const auto id = world.createEntity(std::move(name));
    if (!id.isValid())
        return id;

    addFighter(world, id, position, weapon, kBotColor);
    world.emplaceComponent<AIComponent>(id);
    return id;
}

ecs::EntityId spawnLoot(ecs::World& world, const math::Vec3f& position, LootKind kind, core::u32 amount)
{
    const auto id = world.createEntity("Loot");
    if (!id.isValid())
        return id;

    world.emplaceComponent<TransformComponent>(id, position);
    world.emplaceComponent<RenderComponent>(id, render::MeshKind::Sphere, kLootColor);
    world.emplaceComponent<LootComponent>(id, kind, amount);
    return id;
}

ecs::EntityId spawnFollowCamera(ecs::World& world, ecs::EntityId target)
{
    const auto id = world.createEntity("Camera");
    if (!id.isValid())
        return id;

    if (auto* camera = world.emplaceComponent<CameraComponent>(id))
        camera->target = target;
    return id;
}

} // namespace dz::game::prefab
