/**
 * @file AI.hpp
 * @brief Bot brain state: perception snapshot, finite state and patrol route.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_COMPONENTS_AI_HPP
    #define DZ_GAME_COMPONENTS_AI_HPP

#include <dz/ecs/Component.hpp>
#include <dz/ecs/Entity.hpp>
#include <dz/math/Vec3.hpp>
#include <dz/core/Types.hpp>

#include <limits>
#include <optional>
#include <string_view>
#include <vector>

namespace dz::game {

enum class AIState : core::u8
{
    Patrol = 0,
    Search,
    Combat,
    Retreat,
    Loot
};

[[nodiscard]] constexpr std::string_view aiStateName(AIState state) noexcept
{
    switch (state)
    {
    case AIState::Patrol:  return "patrol";
    case AIState::Search:  return "search";
    case AIState::Combat:  return "combat";
    case AIState::Retreat: return "retreat";
    case AIState::Loot:    return "loot";
    }
    return "unknown";
}

struct AIPerception
{
    static constexpr core::f32 kFar = std::numeric_limits<core::f32>::infinity();

    ecs::EntityId              nearestEnemy{};
    core::f32                  nearestEnemyDistance{kFar};
    math::Vec3f                nearestEnemyDirection{};
    ecs::EntityId              nearestLoot{};
    core::f32                  nearestLootDistance{kFar};
    core::f32                  health{100.0f};
    core::u32                  ammo{30};
    bool                       isUnderFire{false};
    std::optional<math::Vec3f> lastKnownEnemyPosition;
};

struct AIComponent final : ecs::ComponentBase<ecs::ComponentId::AI>
{
    AIState                  state{AIState::Patrol};
    AIPerception             perception{};
    core::TimeMs             reactionTimeMs{200.0};
    core::f32                accuracy{0.7f};
    core::f32                aggression{0.8f};
    core::TimeMs             lastDecisionTime{0.0};
    std::vector<math::Vec3f> patrolPoints;
    core::usize              patrolIndex{0};
    core::TimeMs             searchTimeout{0.0};
    core::TimeMs             combatTimeout{0.0};
};

} // namespace dz::game

#endif // DZ_GAME_COMPONENTS_AI_HPP
