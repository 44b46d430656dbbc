/**
 * @file Health.hpp
 * @brief Hit points with a post-hit invulnerability window.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_COMPONENTS_HEALTH_HPP
    #define DZ_GAME_COMPONENTS_HEALTH_HPP

#include <dz/ecs/Component.hpp>
#include <dz/core/Types.hpp>

#include <limits>

namespace dz::game {

class HealthComponent final : public ecs::ComponentBase<ecs::ComponentId::Health>
{
public:
    static constexpr core::TimeMs kNever = -std::numeric_limits<core::TimeMs>::infinity();

    explicit HealthComponent(core::f32 maxHealth = 100.0f);

    /**
     * @brief Applies @p amount damage unless still invulnerable.
     * @return true only on the hit that kills.
     */
    bool takeDamage(core::f32 amount, core::TimeMs now);

    /** @brief Restores health up to the maximum. No effect once dead. */
    void heal(core::f32 amount) noexcept;

    /** @brief Brings a dead entity back at full health. */
    void revive() noexcept;

    [[nodiscard]] core::f32 percentage() const noexcept;

    [[nodiscard]] core::f32    current()        const noexcept { return _current; }
    [[nodiscard]] core::f32    max()            const noexcept { return _max; }
    [[nodiscard]] bool         isDead()         const noexcept { return _dead; }
    [[nodiscard]] core::TimeMs lastDamageTime() const noexcept { return _lastDamageTime; }
    [[nodiscard]] core::TimeMs diedAt()         const noexcept { return _diedAt; }

    core::TimeMs invulnerabilityMs{500.0};

private:
    core::f32    _current;
    core::f32    _max;
    bool         _dead{false};
    core::TimeMs _lastDamageTime{kNever};
    core::TimeMs _diedAt{kNever};
};

} // namespace dz::game

#endif // DZ_GAME_COMPONENTS_HEALTH_HPP
