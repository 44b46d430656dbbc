/**
 * @file RenderSystem.cpp
 * @brief RenderSystem implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/game/systems/RenderSystem.hpp>
#include <dz/game/components/Render.hpp>
#include <dz/game/components/Transform.hpp>
#include <dz/ecs/World.hpp>

namespace dz::game {

using ecs::ComponentId;

RenderSystem::RenderSystem(ecs::World& world, render::IRenderScene* scene)
    : System(world, "RenderSystem", ecs::SystemPriority::kNormal,
             ecs::Query::with({ComponentId::Transform, ComponentId::Render}))
    , _scene{scene}
{}

core::Expected<void> RenderSystem::onUpdate(core::f32 /*dt*/)
{
    _submitted = 0;
    if (!_scene)
        return {};

    for (auto id : activeEntities())
    {
        const auto* transform = world().getComponent<TransformComponent>(id);
        const auto* render    = world().getComponent<RenderComponent>(id);
        if (!transform || !render)
            continue;

        if (!render->visible)
        {
            _scene->removeInstance(id);
            continue;
        }

        _scene->upsertInstance(id, render::RenderInstance{
            render->mesh, render->color, transform->position, transform->rotation, transform->scale});
        ++_submitted;
    }
    return {};
}

void RenderSystem::onEntityRemoved(ecs::EntityId id)
{
    if (_scene)
        _scene->removeInstance(id);
}

} // namespace dz::game
