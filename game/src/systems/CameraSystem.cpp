/**
 * @file CameraSystem.cpp
 * @brief CameraSystem implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/game/systems/CameraSystem.hpp>
#include <dz/game/components/Camera.hpp>
#include <dz/game/components/Transform.hpp>
#include <dz/ecs/World.hpp>

namespace dz::game {

using ecs::ComponentId;

CameraSystem::CameraSystem(ecs::World& world, render::ICameraController* controller)
    : System(world, "CameraSystem", ecs::SystemPriority::kHigh,
             ecs::Query::with({ComponentId::Camera}))
    , _controller{controller}
{}

core::Expected<void> CameraSystem::onLateUpdate(core::f32 /*dt*/)
{
    if (!_controller)
        return {};

    for (auto id : activeEntities())
    {
        const auto* camera = world().getComponent<CameraComponent>(id);
        if (!camera || camera->mode != CameraMode::Follow || !world().isActive(camera->target))
            continue;

        const auto* target = world().getComponent<TransformComponent>(camera->target);
        if (!target)
            continue;

        _controller->setPosition(target->position + camera->offset);
        _controller->setTarget(target->position);
    }
    return {};
}

} // namespace dz::game
