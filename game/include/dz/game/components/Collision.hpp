/**
 * @file Collision.hpp
 * @brief Sphere collider. Projectiles carry damage, a lifetime and the
 *        shooter that gets the credit.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_COMPONENTS_COLLISION_HPP
    #define DZ_GAME_COMPONENTS_COLLISION_HPP

#include <dz/ecs/Component.hpp>
#include <dz/ecs/Entity.hpp>
#include <dz/core/Constants.hpp>
#include <dz/core/Types.hpp>

namespace dz::game {

struct CollisionComponent final : ecs::ComponentBase<ecs::ComponentId::Collision>
{
    core::f32     radius{0.5f};
    bool          isProjectile{false};
    core::f32     damage{25.0f};
    core::TimeMs  lifetimeMs{core::kProjectileLifetimeMs};
    core::TimeMs  createdAt{0.0};
    ecs::EntityId owner{};

    CollisionComponent() = default;
    CollisionComponent(core::f32 r, bool projectile, core::f32 dmg,
                       core::TimeMs created = 0.0, ecs::EntityId shooter = {})
        : radius{r}, isProjectile{projectile}, damage{dmg}, createdAt{created}, owner{shooter}
    {}

    [[nodiscard]] bool expired(core::TimeMs now) const noexcept
    {
        return isProjectile && now - createdAt > lifetimeMs;
    }
};

} // namespace dz::game

#endif // DZ_GAME_COMPONENTS_COLLISION_HPP
