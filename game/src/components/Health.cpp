/**
 * @file Health.cpp
 * @brief HealthComponent implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <dz/game/components/Health.hpp>

#include <algorithm>

namespace dz::game {

HealthComponent::HealthComponent(core::f32 maxHealth)
    : _current{maxHealth}
    , _max{maxHealth}
{}

bool HealthComponent::takeDamage(core::f32 amount, core::TimeMs now)
{
    if (_dead || amount <= 0.0f)
    {
        return false;
    }
    if (now - _lastDamageTime < invulnerabilityMs)
    {
        return false;
    }

    _current        = std::max(0.0f, _current - amount);
    _lastDamageTime = now;

    if (_current <= 0.0f)
    {
        _dead   = true;
        _diedAt = now;
        return true;
    }
    return false;
}

void HealthComponent::heal(core::f32 amount) noexcept
{
    if (_dead || amount <= 0.0f)
    {
        return;
    }
    _current = std::min(_max, _current + amount);
}

void HealthComponent::revive() noexcept
{
    _dead           = false;
    _current        = _max;
    _lastDamageTime = kNever;
    _diedAt         = kNever;
}

core::f32 HealthComponent::percentage() const noexcept
{
    return _max > 0.0f ? _current / _max : 0.0f;
}

} // namespace dz::game
