/**
 * @file CollisionSystem.hpp
 * @brief Sphere overlap tests and projectile impact resolution.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_SYSTEMS_COLLISIONSYSTEM_HPP
    #define DZ_GAME_SYSTEMS_COLLISIONSYSTEM_HPP

#include <dz/ecs/System.hpp>

namespace dz::game {

struct CollisionComponent;

/**
 * @class CollisionSystem
 * @brief Brute-force pair scan over every collider.
 *
 * Quadratic in the member count. A projectile overlapping a non-projectile
 * damages it (destructible and health alike), credits its owner through
 * the BattleRoyaleSystem when one is registered, and is destroyed.
 */
class CollisionSystem final : public ecs::System
{
public:
    explicit CollisionSystem(ecs::World& world);

    /** @brief Projectile impacts resolved since construction. */
    [[nodiscard]] core::u64 hits() const noexcept { return _hits; }

protected:
    core::Expected<void> onUpdate(core::f32 dt) override;

private:
    void resolveHit(ecs::EntityId projectile, ecs::EntityId target, const CollisionComponent& shot);

    core::u64 _hits{0};
};

} // namespace dz::game

#endif // DZ_GAME_SYSTEMS_COLLISIONSYSTEM_HPP
