/**
 * @file InputSystem.cpp
 * @brief InputSystem implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/game/systems/InputSystem.hpp>
#include <dz/game/components/Input.hpp>
#include <dz/ecs/World.hpp>

namespace dz::game {

using ecs::ComponentId;

InputSystem::InputSystem(ecs::World& world, const input::InputState& source)
    : System(world, "InputSystem", ecs::SystemPriority::kCritical,
             ecs::Query::with({ComponentId::Input}).without({ComponentId::AI}))
    , _source{source}
{}

core::Expected<void> InputSystem::onUpdate(core::f32 /*dt*/)
{
    for (auto id : activeEntities())
    {
        if (auto* input = world().getComponent<InputComponent>(id))
            input->state = _source;
    }
    return {};
}

} // namespace dz::game
