/**
 * @file Prefabs.hpp
 * @brief Ready-made entity assemblies for players, bots, loot and cameras.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_PREFABS_HPP
    #define DZ_GAME_PREFABS_HPP

#include <dz/game/components/Loot.hpp>
#include <dz/game/components/Weapon.hpp>
#include <dz/ecs/World.hpp>
#include <dz/math/Vec3.hpp>

#include <string>

namespace dz::game::prefab {

inline constexpr core::f32 kBodyRadius = 0.5f;

/**
 * @brief Human-controlled fighter named "Player". Its InputComponent is fed
 *        by the InputSystem.
 * @return Null id if the world is full.
 */
ecs::EntityId spawnPlayer(ecs::World& world, const math::Vec3f& position,
                          WeaponType weapon = WeaponType::Rifle);

/** @brief AI-controlled fighter. */
ecs::EntityId spawnBot(ecs::World& world, std::string name, const math::Vec3f& position,
                       WeaponType weapon = WeaponType::Pistol);

ecs::EntityId spawnLoot(ecs::World& world, const math::Vec3f& position, LootKind kind, core::u32 amount);

/** @brief Follow camera tracking @p target. */
ecs::EntityId spawnFollowCamera(ecs::World& world, ecs::EntityId target);

} // namespace dz::game::prefab

#endif // DZ_GAME_PREFABS_HPP
