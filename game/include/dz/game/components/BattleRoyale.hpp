/**
 * @file BattleRoyale.hpp
 * @brief Per-player match record and the shared match/zone state types.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_COMPONENTS_BATTLEROYALE_HPP
    #define DZ_GAME_COMPONENTS_BATTLEROYALE_HPP

#include <dz/ecs/Component.hpp>
#include <dz/ecs/Entity.hpp>
#include <dz/math/Vec3.hpp>
#include <dz/core/Types.hpp>

#include <string_view>

namespace dz::game {

struct ZonePhase
{
    core::u32    phase{0};
    math::Vec3f  center{};
    core::f32    radius{1000.0f};
    core::f32    damagePerTick{0.0f};
    core::TimeMs durationMs{300000.0};
    core::TimeMs startTime{0.0};
    core::TimeMs endTime{0.0};
};

enum class MatchPhase : core::u8
{
    Waiting = 0,
    Dropping,
    Active,
    Finished
};

[[nodiscard]] constexpr std::string_view matchPhaseName(MatchPhase phase) noexcept
{
    switch (phase)
    {
    case MatchPhase::Waiting:  return "waiting";
    case MatchPhase::Dropping: return "dropping";
    case MatchPhase::Active:   return "active";
    case MatchPhase::Finished: return "finished";
    }
    return "unknown";
}

struct MatchState
{
    MatchPhase    phase{MatchPhase::Waiting};
    core::TimeMs  startTime{0.0};
    core::TimeMs  endTime{0.0};
    core::u32     currentPhase{0};
    core::u32     playersAlive{0};
    core::u32     totalPlayers{0};
    ZonePhase     zone{};
    ZonePhase     safeZone{};
    math::Vec3f   dropZone{};
    ecs::EntityId winner{};
};

struct BattleRoyaleComponent final : ecs::ComponentBase<ecs::ComponentId::BattleRoyale>
{
    core::u32    placement{0};
    core::u32    kills{0};
    core::f32    damageDealt{0.0f};
    core::f32    timeAlive{0.0f};        ///< Seconds.
    core::TimeMs lastZoneDamage{0.0};
    bool         eliminated{false};
};

} // namespace dz::game

#endif // DZ_GAME_COMPONENTS_BATTLEROYALE_HPP
