/**
 * @file WeaponSystem.hpp
 * @brief Reload and trigger handling, projectile spawning and fire sounds.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef DZ_GAME_SYSTEMS_WEAPONSYSTEM_HPP
    #define DZ_GAME_SYSTEMS_WEAPONSYSTEM_HPP

#include <dz/ecs/System.hpp>
#include <dz/audio/IAudioEngine.hpp>

namespace dz::game {

class WeaponComponent;
struct TransformComponent;

class WeaponSystem final : public ecs::System
{
public:
    WeaponSystem(ecs::World& world, audio::IAudioEngine* audio);

    void setAudio(audio::IAudioEngine* audio) noexcept { _audio = audio; }

    /** @brief Projectiles spawned since construction. */
    [[nodiscard]] core::u64 shotsFired() const noexcept { return _shotsFired; }

protected:
    core::Expected<void> onUpdate(core::f32 dt) override;

private:
    void fire(ecs::EntityId shooter, const TransformComponent& transform, WeaponComponent& weapon, core::TimeMs now);

    audio::IAudioEngine* _audio;
    core::u64            _shotsFired{0};
};

} // namespace dz::game

#endif // DZ_GAME_SYSTEMS_WEAPONSYSTEM_HPP
