/**
 * @file PhysicsSystem.cpp
 * @brief PhysicsSystem implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/game/systems/PhysicsSystem.hpp>
#include <dz/game/components/Physics.hpp>
#include <dz/game/components/Transform.hpp>
#include <dz/ecs/World.hpp>

namespace dz::game {

using ecs::ComponentId;

PhysicsSystem::PhysicsSystem(ecs::World& world)
    : PhysicsSystem(world, Settings{})
{}

PhysicsSystem::PhysicsSystem(ecs::World& world, Settings settings)
    : System(world, "PhysicsSystem", ecs::SystemPriority::kHigh,
             ecs::Query::with({ComponentId::Transform, ComponentId::Physics}))
    , _settings{settings}
{}

core::Expected<void> PhysicsSystem::onUpdate(core::f32 dt)
{
    for (auto id : activeEntities())
    {
        auto* transform = world().getComponent<TransformComponent>(id);
        auto* physics   = world().getComponent<PhysicsComponent>(id);
        if (!transform || !physics || physics->isStatic)
            continue;

        physics->acceleration.y = _settings.gravity;
        physics->velocity      += physics->acceleration * dt;

        auto& pos = transform->position;
        const core::f32 nextY = pos.y + physics->velocity.y * dt;
        if (nextY < 0.0f)
        {
            pos.y               = 0.0f;
            physics->velocity.y = 0.0f;
        }
        else
        {
            pos.y = nextY;
        }
        pos.x += physics->velocity.x * dt;
        pos.z += physics->velocity.z * dt;

        physics->velocity.x *= _settings.groundFriction;
        physics->velocity.z *= _settings.groundFriction;
    }
    return {};
}

} // namespace dz::game
