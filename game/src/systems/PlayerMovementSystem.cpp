/**
 * @file PlayerMovementSystem.cpp
 * @brief PlayerMovementSystem implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/game/systems/PlayerMovementSystem.hpp>
#include <dz/game/components/Input.hpp>
#include <dz/game/components/Physics.hpp>
#include <dz/game/components/Transform.hpp>
#include <dz/ecs/World.hpp>

#include <cmath>

namespace dz::game {

using ecs::ComponentId;

namespace {

constexpr core::f32 kLookDeadZone = 0.001f;

} // namespace

PlayerMovementSystem::PlayerMovementSystem(ecs::World& world)
    : PlayerMovementSystem(world, Settings{})
{}

PlayerMovementSystem::PlayerMovementSystem(ecs::World& world, Settings settings)
    : System(world, "PlayerMovementSystem", ecs::SystemPriority::kHigh,
             ecs::Query::with({ComponentId::Transform, ComponentId::Input, ComponentId::Physics}))
    , _settings{settings}
{}

core::Expected<void> PlayerMovementSystem::onUpdate(core::f32 /*dt*/)
{
    for (auto id : activeEntities())
    {
        auto* transform = world().getComponent<TransformComponent>(id);
        auto* input     = world().getComponent<InputComponent>(id);
        auto* physics   = world().getComponent<PhysicsComponent>(id);
        if (!transform || !input || !physics)
            continue;

        auto& state = input->state;

        math::Vec3f dir{};
        if (state.forward)  dir.z -= 1.0f;
        if (state.backward) dir.z += 1.0f;
        if (state.left)     dir.x -= 1.0f;
        if (state.right)    dir.x += 1.0f;

        if (!dir.isZero())
        {
            const core::f32 speed = state.sprint ? _settings.sprintSpeed : _settings.moveSpeed;
            dir = transform->rotation.rotate(dir.normalize());
            physics->velocity.x = dir.x * speed;
            physics->velocity.z = dir.z * speed;
        }
        else
        {
            physics->velocity.x *= _settings.idleDamping;
            physics->velocity.z *= _settings.idleDamping;
        }

        if (std::abs(state.lookX) > kLookDeadZone)
        {
            transform->rotation = transform->rotation.rotatedY(state.lookX);
            state.lookX = 0.0f;
        }

        if (state.jump && physics->velocity.y == 0.0f)
            physics->velocity.y = _settings.jumpForce;
    }
    return {};
}

} // namespace dz::game
