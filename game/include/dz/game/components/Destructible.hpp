/**
 * @file Destructible.hpp
 * @brief Breakable scenery that turns into debris at zero health.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_COMPONENTS_DESTRUCTIBLE_HPP
    #define DZ_GAME_COMPONENTS_DESTRUCTIBLE_HPP

#include <dz/ecs/Component.hpp>
#include <dz/core/Types.hpp>

namespace dz::game {

struct DestructibleComponent final : ecs::ComponentBase<ecs::ComponentId::Destructible>
{
    core::f32 health;
    core::f32 maxHealth;
    core::u32 fracturePoints;
    core::u32 debrisCount;
    core::f32 debrisSize{0.5f};
    bool      destroyed{false};

    explicit DestructibleComponent(core::f32 hp = 100.0f, core::u32 fractures = 8, core::u32 debris = 5)
        : health{hp}, maxHealth{hp}, fracturePoints{fractures}, debrisCount{debris}
    {}

    /** @return true only on the hit that destroys the object. */
    bool takeDamage(core::f32 amount) noexcept
    {
        health -= amount;
        if (health <= 0.0f && !destroyed)
        {
            destroyed = true;
            return true;
        }
        return false;
    }
};

} // namespace dz::game

#endif // DZ_GAME_COMPONENTS_DESTRUCTIBLE_HPP
