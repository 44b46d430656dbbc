/**
 * @file DestructionSystem.hpp
 * @brief Breaks destroyed scenery into debris and builds destructible props.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_SYSTEMS_DESTRUCTIONSYSTEM_HPP
    #define DZ_GAME_SYSTEMS_DESTRUCTIONSYSTEM_HPP

#include <dz/ecs/System.hpp>
#include <dz/math/Vec3.hpp>

#include <vector>

namespace dz::game {

struct DestructibleComponent;

class DestructionSystem final : public ecs::System
{
public:
    explicit DestructionSystem(ecs::World& world);

    /**
     * @brief Applies @p damage to the destructible component of @p id.
     * @return true on the hit that destroys it. The entity breaks apart on
     *         the next update.
     */
    bool triggerDestruction(ecs::EntityId id, core::f32 damage);

    /** @brief Static breakable box of @p size centred on @p position. */
    ecs::EntityId createDestructibleObject(const math::Vec3f& position, const math::Vec3f& size,
                                           core::f32 health = 100.0f);

    /** @brief Five wall segments from @p start towards @p end. */
    std::vector<ecs::EntityId> createDestructibleWall(const math::Vec3f& start, const math::Vec3f& end,
                                                      core::f32 height = 3.0f, core::f32 health = 150.0f);

    /** @brief Three stacked floors sharing @p health evenly. */
    std::vector<ecs::EntityId> createDestructibleBuilding(const math::Vec3f& position, const math::Vec3f& size,
                                                          core::f32 health = 300.0f);

    /** @brief Debris entities spawned since construction. */
    [[nodiscard]] core::u64 debrisSpawned() const noexcept { return _debrisSpawned; }

protected:
    core::Expected<void> onUpdate(core::f32 dt) override;

private:
    void spawnDebris(const math::Vec3f& origin, const DestructibleComponent& destructible);

    core::u64 _debrisSpawned{0};
};

} // namespace dz::game

#endif // DZ_GAME_SYSTEMS_DESTRUCTIONSYSTEM_HPP
