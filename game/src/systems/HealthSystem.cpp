/**
 * @file HealthSystem.cpp
 * @brief HealthSystem implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/game/systems/HealthSystem.hpp>
#include <dz/game/components/Health.hpp>
#include <dz/ecs/World.hpp>
#include <dz/core/Log.hpp>

#include <utility>

namespace dz::game {

using ecs::ComponentId;

HealthSystem::HealthSystem(ecs::World& world)
    : HealthSystem(world, Settings{})
{}

HealthSystem::HealthSystem(ecs::World& world, Settings settings)
    : System(world, "HealthSystem", ecs::SystemPriority::kNormal,
             ecs::Query::with({ComponentId::Health}))
    , _settings{std::move(settings)}
{}

core::Expected<void> HealthSystem::onUpdate(core::f32 /*dt*/)
{
    const core::TimeMs now = world().timeMs();

    for (auto id : activeEntities())
    {
        auto* health = world().getComponent<HealthComponent>(id);
        if (!health)
            continue;

        if (!health->isDead())
        {
            _reported.erase(id);
            continue;
        }

        const ecs::Entity* entity = world().getEntity(id);
        if (entity && entity->name == _settings.playerName)
        {
            if (_reported.insert(id).second)
                core::Log::info("HealthSystem", entity->name + " died");
            continue;
        }

        if (now - health->diedAt() >= _settings.corpseLingerMs)
            world().destroyEntity(id);
    }
    return {};
}

void HealthSystem::onEntityRemoved(ecs::EntityId id)
{
    _reported.erase(id);
}

} // namespace dz::game
