/**
 * @file DestructionSystem.cpp
 * @brief DestructionSystem implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/game/systems/DestructionSystem.hpp>
#include <dz/game/components/Collision.hpp>
#include <dz/game/components/Destructible.hpp>
#include <dz/game/components/Physics.hpp>
#include <dz/game/components/Render.hpp>
#include <dz/game/components/Transform.hpp>
#include <dz/ecs/World.hpp>

#include <algorithm>
#include <random>
#include <string>

namespace dz::game {

using ecs::ComponentId;

namespace {

constexpr core::u32 kDebrisColor = 0x8b4513;
constexpr core::u32 kPropColor   = 0x654321;

constexpr core::u32 kWallSegments   = 5;
constexpr core::f32 kWallFill       = 0.8f;
constexpr core::f32 kWallThickness  = 0.5f;
constexpr core::u32 kBuildingFloors = 3;

} // namespace

DestructionSystem::DestructionSystem(ecs::World& world)
    : System(world, "DestructionSystem", ecs::SystemPriority::kNormal,
             ecs::Query::with({ComponentId::Transform, ComponentId::Destructible}))
{}

core::Expected<void> DestructionSystem::onUpdate(core::f32 /*dt*/)
{
    for (auto id : activeEntities())
    {
        const auto* transform    = world().getComponent<TransformComponent>(id);
        const auto* destructible = world().getComponent<DestructibleComponent>(id);
        if (!transform || !destructible || !destructible->destroyed)
            continue;

        spawnDebris(transform->position, *destructible);
        world().destroyEntity(id);
    }
    return {};
}

void DestructionSystem::spawnDebris(const math::Vec3f& origin, const DestructibleComponent& destructible)
{
    auto& rng = world().random();
    std::uniform_real_distribution<core::f32> unit{0.0f, 1.0f};
    const core::f32 size = destructible.debrisSize;

    for (core::u32 i = 0; i < destructible.debrisCount; ++i)
    {
        const auto debris = world().createEntity("Debris_" + std::to_string(i));
        if (!debris.isValid())
            return;

        const math::Vec3f offset{(unit(rng) - 0.5f) * 2.0f, unit(rng) * 2.0f, (unit(rng) - 0.5f) * 2.0f};
        world().emplaceComponent<TransformComponent>(debris, origin + offset, math::Quatf::identity(),
                                                     math::Vec3f{size, size, size});
        world().emplaceComponent<RenderComponent>(debris, render::MeshKind::Cube, kDebrisColor);

        if (auto* physics = world().emplaceComponent<PhysicsComponent>(debris))
        {
            physics->velocity    = {(unit(rng) - 0.5f) * 10.0f, unit(rng) * 5.0f + 2.0f, (unit(rng) - 0.5f) * 10.0f};
            physics->mass        = 0.5f;
            physics->restitution = 0.3f;
            physics->friction    = 0.8f;
        }
        ++_debrisSpawned;
    }
}

bool DestructionSystem::triggerDestruction(ecs::EntityId id, core::f32 damage)
{
    auto* destructible = world().getComponent<DestructibleComponent>(id);
    if (!destructible)
        return false;
    return destructible->takeDamage(damage);
}

// ========================================================================== //
//  Factories                                                                 //
// ========================================================================== //

ecs::EntityId DestructionSystem::createDestructibleObject(const math::Vec3f& position, const math::Vec3f& size,
                                                          core::f32 health)
{
    const auto id = world().createEntity("Destructible");
    if (!id.isValid())
        return id;

    world().emplaceComponent<TransformComponent>(id, position, math::Quatf::identity(), size);
    world().emplaceComponent<RenderComponent>(id, render::MeshKind::Cube, kPropColor);
    if (auto* physics = world().emplaceComponent<PhysicsComponent>(id))
        physics->isStatic = true;
    world().emplaceComponent<DestructibleComponent>(id, health);
    world().emplaceComponent<CollisionComponent>(id, std::max(size.x, size.z) * 0.5f, false, 0.0f);
    return id;
}

std::vector<ecs::EntityId> DestructionSystem::createDestructibleWall(const math::Vec3f& start, const math::Vec3f& end,
                                                                     core::f32 height, core::f32 health)
{
    std::vector<ecs::EntityId> segments;
    segments.reserve(kWallSegments);

    const math::Vec3f span   = end - start;
    const core::f32   length = span.length() / static_cast<core::f32>(kWallSegments);

    for (core::u32 i = 0; i < kWallSegments; ++i)
    {
        const math::Vec3f at = start + span * (static_cast<core::f32>(i) / static_cast<core::f32>(kWallSegments));
        const auto id = createDestructibleObject(at, {length * kWallFill, height, kWallThickness}, health);
        if (id.isValid())
            segments.push_back(id);
    }
    return segments;
}

std::vector<ecs::EntityId> DestructionSystem::createDestructibleBuilding(const math::Vec3f& position,
                                                                         const math::Vec3f& size, core::f32 health)
{
    std::vector<ecs::EntityId> floors;
    floors.reserve(kBuildingFloors);

    const core::f32 floorHeight = size.y / static_cast<core::f32>(kBuildingFloors);
    const core::f32 floorHealth = health / static_cast<core::f32>(kBuildingFloors);

    for (core::u32 i = 0; i < kBuildingFloors; ++i)
    {
        math::Vec3f at = position;
        at.y += static_cast<core::f32>(i) * floorHeight;
        const auto id = createDestructibleObject(at, {size.x, floorHeight, size.z}, floorHealth);
        if (id.isValid())
            floors.push_back(id);
    }
    return floors;
}

} // namespace dz::game
