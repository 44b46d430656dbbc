/**
 * @file ProgressionSystem.cpp
 * @brief ProgressionSystem implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/game/systems/ProgressionSystem.hpp>
#include <dz/ecs/World.hpp>

namespace dz::game {

using ecs::ComponentId;

ProgressionSystem::ProgressionSystem(ecs::World& world)
    : System(world, "ProgressionSystem", ecs::SystemPriority::kLow,
             ecs::Query::with({ComponentId::Progression}))
{}

core::Expected<void> ProgressionSystem::onUpdate(core::f32 dt)
{
    for (auto id : activeEntities())
    {
        if (auto* progression = world().getComponent<ProgressionComponent>(id))
            progression->stats().playTime += dt;
    }
    return {};
}

bool ProgressionSystem::addXP(ecs::EntityId player, core::u64 amount)
{
    auto* progression = world().getComponent<ProgressionComponent>(player);
    return progression && progression->addXP(amount);
}

bool ProgressionSystem::updatePlayerStats(ecs::EntityId player, const PlayerStats& stats)
{
    auto* progression = world().getComponent<ProgressionComponent>(player);
    if (!progression)
        return false;
    progression->updateStats(stats);
    return true;
}

bool ProgressionSystem::unlockItem(ecs::EntityId player, std::string_view itemId)
{
    auto* progression = world().getComponent<ProgressionComponent>(player);
    return progression && progression->unlockItem(itemId);
}

bool ProgressionSystem::equipItem(ecs::EntityId player, std::string_view itemId)
{
    auto* progression = world().getComponent<ProgressionComponent>(player);
    return progression && progression->equipItem(itemId);
}

core::Expected<ProgressSummary> ProgressionSystem::playerProgress(ecs::EntityId player) const
{
    const auto* progression = world().getComponent<ProgressionComponent>(player);
    if (!progression)
        return core::makeError(core::ErrorCode::kComponentMissing, "entity has no progression");
    return progression->summary();
}

} // namespace dz::game
