/**
 * @file Weapon.hpp
 * @brief Weapon archetypes, magazine bookkeeping and fire-rate gating.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_COMPONENTS_WEAPON_HPP
    #define DZ_GAME_COMPONENTS_WEAPON_HPP

#include <dz/ecs/Component.hpp>
#include <dz/core/Types.hpp>

#include <limits>
#include <string_view>

namespace dz::game {

enum class WeaponType : core::u8
{
    Pistol = 0,
    Rifle,
    Shotgun,
    Sniper,
    Smg,
    Lmg
};

[[nodiscard]] constexpr std::string_view weaponName(WeaponType type) noexcept
{
    switch (type)
    {
    case WeaponType::Pistol:  return "pistol";
    case WeaponType::Rifle:   return "rifle";
    case WeaponType::Shotgun: return "shotgun";
    case WeaponType::Sniper:  return "sniper";
    case WeaponType::Smg:     return "smg";
    case WeaponType::Lmg:     return "lmg";
    }
    return "unknown";
}

struct WeaponStats
{
    core::f32 damage;
    core::f32 fireRate;         ///< Rounds per second.
    core::f32 range;
    core::f32 accuracy;         ///< [0, 1].
    core::f32 reloadTime;       ///< Seconds.
    core::u32 magazineSize;
    core::f32 projectileSpeed;
    core::f32 spread;           ///< Degrees.
};

/** @brief Archetype table. Unknown values fall back to the pistol. */
[[nodiscard]] WeaponStats weaponStats(WeaponType type) noexcept;

class WeaponComponent final : public ecs::ComponentBase<ecs::ComponentId::Weapon>
{
public:
    static constexpr core::u32 kReserveMagazines = 3;

    explicit WeaponComponent(WeaponType type = WeaponType::Pistol);

    /** @brief Not reloading, magazine not empty and the fire interval elapsed. */
    [[nodiscard]] bool canFire(core::TimeMs now) const noexcept;

    /**
     * @brief Consumes one round. Emptying the magazine starts a reload.
     * @return false when canFire() does not hold.
     */
    bool fire(core::TimeMs now);

    /** @brief Ignored while reloading or with a full magazine. */
    void startReload(core::TimeMs now) noexcept;

    /** @brief Completes a pending reload once reloadTime has elapsed. */
    void updateReload(core::TimeMs now) noexcept;

    [[nodiscard]] WeaponType         type()            const noexcept { return _type; }
    [[nodiscard]] const WeaponStats& stats()           const noexcept { return _stats; }
    [[nodiscard]] core::u32          currentAmmo()     const noexcept { return _currentAmmo; }
    [[nodiscard]] core::u32          reserveAmmo()     const noexcept { return _reserveAmmo; }
    [[nodiscard]] bool               isReloading()     const noexcept { return _reloading; }
    [[nodiscard]] core::TimeMs       lastFireTime()    const noexcept { return _lastFireTime; }
    [[nodiscard]] core::TimeMs       reloadStartTime() const noexcept { return _reloadStartTime; }

    void setReserveAmmo(core::u32 rounds) noexcept { _reserveAmmo = rounds; }

private:
    WeaponType   _type;
    WeaponStats  _stats;
    core::u32    _currentAmmo;
    core::u32    _reserveAmmo;
    bool         _reloading{false};
    core::TimeMs _lastFireTime{-std::numeric_limits<core::TimeMs>::infinity()};
    core::TimeMs _reloadStartTime{0.0};
};

} // namespace dz::game

#endif // DZ_GAME_COMPONENTS_WEAPON_HPP
