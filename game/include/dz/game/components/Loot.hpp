/**
 * @file Loot.hpp
 * @brief Pickup lying in the world. Bots path to these in the loot state.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_COMPONENTS_LOOT_HPP
    #define DZ_GAME_COMPONENTS_LOOT_HPP

#include <dz/ecs/Component.hpp>
#include <dz/core/Types.hpp>

#include <string_view>

namespace dz::game {

enum class LootKind : core::u8
{
    Ammo = 0,
    Health,
    Weapon,
    Armor
};

[[nodiscard]] constexpr std::string_view lootName(LootKind kind) noexcept
{
    switch (kind)
    {
    case LootKind::Ammo:   return "ammo";
    case LootKind::Health: return "health";
    case LootKind::Weapon: return "weapon";
    case LootKind::Armor:  return "armor";
    }
    return "unknown";
}

struct LootComponent final : ecs::ComponentBase<ecs::ComponentId::Loot>
{
    LootKind  kind{LootKind::Ammo};
    core::u32 amount{1};

    LootComponent() = default;
    LootComponent(LootKind k, core::u32 n) : kind{k}, amount{n} {}
};

} // namespace dz::game

#endif // DZ_GAME_COMPONENTS_LOOT_HPP
