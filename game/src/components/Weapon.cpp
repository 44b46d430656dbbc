/**
 * @file Weapon.cpp
 * @brief WeaponComponent implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/game/components/Weapon.hpp>

#include <algorithm>

namespace dz::game {

WeaponStats weaponStats(WeaponType type) noexcept
{
    switch (type)
    {
    case WeaponType::Rifle:   return {35.0f,  8.0f, 100.0f, 0.90f, 2.0f,  30, 400.0f,  1.0f};
    case WeaponType::Shotgun: return {15.0f,  1.0f,  20.0f, 0.60f, 3.0f,   8, 200.0f, 15.0f};
    case WeaponType::Sniper:  return {100.0f, 0.5f, 200.0f, 0.95f, 2.5f,   5, 600.0f,  0.5f};
    case WeaponType::Smg:     return {20.0f, 12.0f,  60.0f, 0.70f, 1.8f,  25, 350.0f,  3.0f};
    case WeaponType::Lmg:     return {30.0f, 10.0f, 120.0f, 0.60f, 4.0f, 100, 450.0f,  4.0f};
    case WeaponType::Pistol:
    default:                  return {25.0f,  2.0f,  50.0f, 0.80f, 1.5f,  12, 300.0f,  2.0f};
    }
}

WeaponComponent::WeaponComponent(WeaponType type)
    : _type{type}
    , _stats{weaponStats(type)}
    , _currentAmmo{_stats.magazineSize}
    , _reserveAmmo{_stats.magazineSize * kReserveMagazines}
{}

bool WeaponComponent::canFire(core::TimeMs now) const noexcept
{
    return !_reloading
        && _currentAmmo > 0
        && now - _lastFireTime >= 1000.0 / static_cast<core::f64>(_stats.fireRate);
}

bool WeaponComponent::fire(core::TimeMs now)
{
    if (!canFire(now))
    {
        return false;
    }

    --_currentAmmo;
    _lastFireTime = now;

    if (_currentAmmo == 0)
    {
        startReload(now);
    }
    return true;
}

void WeaponComponent::startReload(core::TimeMs now) noexcept
{
    if (_reloading || _currentAmmo == _stats.magazineSize)
    {
        return;
    }
    _reloading       = true;
    _reloadStartTime = now;
}

void WeaponComponent::updateReload(core::TimeMs now) noexcept
{
    if (!_reloading)
    {
        return;
    }
    if (now - _reloadStartTime < static_cast<core::f64>(_stats.reloadTime) * 1000.0)
    {
        return;
    }

    const core::u32 needed = _stats.magazineSize - _currentAmmo;
    const core::u32 added  = std::min(needed, _reserveAmmo);
    _currentAmmo += added;
    _reserveAmmo -= added;
    _reloading    = false;
}

} // namespace dz::game
