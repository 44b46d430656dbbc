/**
 * @file ProgressionSystem.hpp
 * @brief Play-time accounting and entity-addressed progression calls.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_SYSTEMS_PROGRESSIONSYSTEM_HPP
    #define DZ_GAME_SYSTEMS_PROGRESSIONSYSTEM_HPP

#include <dz/ecs/System.hpp>
#include <dz/game/components/Progression.hpp>

#include <string_view>

namespace dz::game {

class ProgressionSystem final : public ecs::System
{
public:
    explicit ProgressionSystem(ecs::World& world);

    /** @return true if the player gained a level. */
    bool addXP(ecs::EntityId player, core::u64 amount);

    /** @return false when @p player has no progression. */
    bool updatePlayerStats(ecs::EntityId player, const PlayerStats& stats);

    bool unlockItem(ecs::EntityId player, std::string_view itemId);
    bool equipItem(ecs::EntityId player, std::string_view itemId);

    [[nodiscard]] core::Expected<ProgressSummary> playerProgress(ecs::EntityId player) const;

protected:
    core::Expected<void> onUpdate(core::f32 dt) override;
};

} // namespace dz::game

#endif // DZ_GAME_SYSTEMS_PROGRESSIONSYSTEM_HPP
